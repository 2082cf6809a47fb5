// File: src/NetBotClientMain.cpp
//
// A headless input peer that plays via RandomContestant. Connects to the
// server's /input endpoint, reads SnapshotMsg frames and answers with InputMsg.
//

#include <atomic>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Types.hpp"
#include "core/State.hpp"
#include "core/Actions.hpp"
#include "core/Exception.hpp"
#include "core/RandomContestant.hpp"
#include "debug/AuditLogger.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url {"ws://127.0.0.1:9002/input"};
        std::uint64_t seed {424242ULL};
        std::vector<robotrace::core::PlayerId> seats {robotrace::core::PlayerId::P1, robotrace::core::PlayerId::P2};
        std::uint8_t level {0};   // 0: never leave the menu on our own
        int matches {1};
    };

    auto parse_uint(std::string_view s, std::uint64_t& out) -> bool
    {
        auto res = std::from_chars(s.data(), s.data() + s.size(), out);
        return res.ec == std::errc{} && res.ptr == s.data() + s.size();
    }

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view k = argv[i];
            std::uint64_t v{};
            if (k == "--url" && i + 1 < argc)
            {
                c.url = argv[++i];
            }
            else if (k == "--seed" && i + 1 < argc)
            {
                if (parse_uint(argv[++i], v)) c.seed = v;
            }
            else if (k == "--seat" && i + 1 < argc)
            {
                std::string_view const s = argv[++i];
                if (s == "1") c.seats = {robotrace::core::PlayerId::P1};
                else if (s == "2") c.seats = {robotrace::core::PlayerId::P2};
            }
            else if (k == "--level" && i + 1 < argc)
            {
                if (parse_uint(argv[++i], v)) c.level = static_cast<std::uint8_t>(v);
            }
            else if (k == "--matches" && i + 1 < argc)
            {
                if (parse_uint(argv[++i], v)) c.matches = static_cast<int>(v);
            }
        }
        return c;
    }

} // anon

static auto Play(CmdLine const& cfg) -> int
{
    using namespace robotrace;

    std::print("[bot] Connecting to {} | seed={} seats={} level={}\n",
               cfg.url, cfg.seed, cfg.seats.size(), static_cast<int>(cfg.level));

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.init_asio();

    std::shared_ptr<websocketpp::connection_hdl> hdl_ptr = std::make_shared<websocketpp::connection_hdl>();
    std::atomic<bool> opened {false};

    std::vector<core::RandomContestant> bots;
    for (core::PlayerId const seat : cfg.seats)
    {
        bots.emplace_back(seat, cfg.seed + 1337u * core::IndexOf(seat));
    }

    std::uint64_t msg_id {1};
    int matches_done {0};
    std::optional<core::Phase> last_phase {};

    auto send = [&](core::PlayerAction const& act)
    {
        auto const buf = net::BuildInput(act, msg_id++);
        websocketpp::lib::error_code ec;
        c.send(*hdl_ptr, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[bot] send() failed: {}\n", ec.message());
            return;
        }
        std::print("[bot] sent {}\n", core::debug::to_string(act));
    };

    c.set_message_handler([&](websocketpp::connection_hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        auto snap = net::DecodeSnapshot(bytes);
        if (!snap)
        {
            std::print("[bot] dropped frame: {}\n", snap.error().message);
            return;
        }

        core::Phase const phase = snap->phase;
        bool const entered = !last_phase || *last_phase != phase;
        last_phase = phase;

        if (entered && phase == core::Phase::Finished)
        {
            ++matches_done;
            std::print("[bot] match over ({}/{}): P1={} P2={}\n", matches_done, cfg.matches,
                       snap->players[0].score, snap->players[1].score);
            if (matches_done >= cfg.matches)
            {
                c.close(*hdl_ptr, websocketpp::close::status::normal, "done");
                return;
            }
            send(core::RestartAction{});
            return;
        }

        if (entered && phase == core::Phase::Menu && cfg.level != 0)
        {
            send(core::SelectLevelAction{cfg.level});
            return;
        }

        for (core::RandomContestant& bot : bots)
        {
            if (std::optional<core::PlayerAction> const act = bot.Play(*snap))
            {
                send(*act);
            }
        }
    });

    c.set_open_handler([&](websocketpp::connection_hdl hdl)
    {
        *hdl_ptr = hdl;
        opened = true;
        std::print("[bot] Connected.\n");
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[bot] Closed.\n");
    });

    c.set_fail_handler([&](websocketpp::connection_hdl hdl)
    {
        std::print("[bot] Connection failed: {}\n", c.get_con_from_hdl(hdl)->get_ec().message());
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        RR_THROW(core::error::Code::Network, std::format("bad url {}: {}", cfg.url, ec.message()));
    }

    c.connect(con);

    // Run the client loop (blocking)
    c.run();

    if (!opened)
    {
        RR_THROW(core::error::Code::Network, std::format("could not reach {}", cfg.url));
    }
    return matches_done >= cfg.matches ? 0 : 1;
}

int main(int argc, char** argv)
{
    try
    {
        return Play(parse_args(argc, argv));
    }
    catch (robotrace::core::OmegaException<robotrace::core::error::Code> const& e)
    {
        std::print(stderr, "[bot] fatal: {}", e);
        return 1;
    }
    catch (std::exception const& e)
    {
        std::print(stderr, "[bot] fatal: {}\n", e.what());
        return 1;
    }
}
