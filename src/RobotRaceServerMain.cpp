//
// Created by Malik T on 13/08/2025.
//

//
// RobotRaceServerMain.cpp: authoritative quiz host using WebSocket++
//

#include <chrono>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/QuestionBank.hpp"
#include "core/RoundPolicy.hpp"
#include "core/SessionController.hpp"
#include "core/SimulatedActuator.hpp"
#include "debug/AuditLogger.hpp"
#include "io/CatalogReader.hpp"
#include "net/PeerChannel.hpp"
#include "net/RemoteActuator.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = robotrace::net::WsServer;
    using Hdl      = robotrace::net::Hdl;

    volatile std::sig_atomic_t g_stop = 0;

    enum class RobotMode : std::uint8_t
    {
        Simulated,
        Remote
    };

    struct ServerConfig
    {
        std::uint16_t port{9002};
        robotrace::core::Config game{};
        std::string catalog{};
        RobotMode robot{RobotMode::Simulated};
        std::string audit{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        using robotrace::core::error::Code;

        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_str = [&]() -> std::string_view
            {
                if (i + 1 >= argc) RR_THROW(Code::Config, std::format("{} needs a value", arg));
                return argv[++i];
            };

            auto next_uint = [&](std::uint64_t const max) -> std::uint64_t
            {
                std::string_view const s = next_str();
                std::uint64_t out{};
                auto res = std::from_chars(s.data(), s.data() + s.size(), out);
                if (res.ec != std::errc{} || res.ptr != s.data() + s.size() || out > max)
                    RR_THROW(Code::Config, std::format("{} expects a number up to {}, got '{}'", arg, max, s));
                return out;
            };

            auto next_ms = [&](robotrace::core::Millis& out)
            {
                out = robotrace::core::Millis(next_uint(24ull * 3600 * 1000));
            };

            if (arg == "--port")
            {
                cfg.port = static_cast<std::uint16_t>(next_uint(UINT16_MAX));
            }
            else if (arg == "--seed")
            {
                cfg.game.seed = next_uint(UINT64_MAX);
            }
            else if (arg == "--variant")
            {
                std::string_view const v = next_str();
                if (v == "buzzer") cfg.game.variant = robotrace::core::RuleVariant::BuzzerRace;
                else if (v == "open") cfg.game.variant = robotrace::core::RuleVariant::OpenAnswer;
                else RR_THROW(Code::Config, std::format("unknown variant '{}' (buzzer|open)", v));
            }
            else if (arg == "--catalog")
            {
                cfg.catalog = std::string{next_str()};
            }
            else if (arg == "--reading_ms") { next_ms(cfg.game.reading_time); }
            else if (arg == "--buzzer_ms")  { next_ms(cfg.game.buzzer_window); }
            else if (arg == "--answer_ms")  { next_ms(cfg.game.answer_time); }
            else if (arg == "--question_ms") { next_ms(cfg.game.question_time); }
            else if (arg == "--result_ms")  { next_ms(cfg.game.result_pause); }
            else if (arg == "--increment")
            {
                cfg.game.position_increment = static_cast<int>(next_uint(100));
            }
            else if (arg == "--robot")
            {
                std::string_view const v = next_str();
                if (v == "sim") cfg.robot = RobotMode::Simulated;
                else if (v == "remote") cfg.robot = RobotMode::Remote;
                else RR_THROW(Code::Config, std::format("unknown robot mode '{}' (sim|remote)", v));
            }
            else if (arg == "--audit")
            {
                cfg.audit = std::string{next_str()};
            }
            else
            {
                std::println(stderr, "[robotraced] ignoring unknown flag {}", arg);
            }
        }
        return cfg;
    }

    auto LoadRecords(std::string const& path) -> std::vector<robotrace::core::QuestionRecord>
    {
        if (path.empty())
        {
            std::println("[catalog] no --catalog given, using built-in questions");
            return {};
        }

        auto rows = robotrace::io::ReadCatalog(path);
        if (!rows)
        {
            std::println(stderr, "[catalog] {} (line {}), using built-in questions",
                         rows.error().message, rows.error().line);
            return {};
        }
        return std::move(*rows);
    }

    void BroadcastSnapshot(robotrace::core::SessionController const& session,
                           robotrace::net::PeerHub& hub,
                           robotrace::core::TimePoint now,
                           std::uint64_t msg_id)
    {
        auto const buf = robotrace::net::BuildSnapshot(*session.SnapshotFor(now), msg_id);
        hub.Broadcast(robotrace::net::PeerRole::Display, robotrace::net::AsBytes(buf));
        hub.Broadcast(robotrace::net::PeerRole::Input, robotrace::net::AsBytes(buf));
    }

    // Game loop; returns once a stop signal arrives
    auto Serve(ServerConfig const& sc, robotrace::net::PeerHub& hub) -> void
    {
        using namespace robotrace;
        using namespace robotrace::core;

        QuestionBank bank(sc.game.seed);
        std::vector<QuestionRecord> const records = LoadRecords(sc.catalog);
        std::size_t const loaded = bank.LoadOrDefault(records);
        std::println("[catalog] {} question(s): L1={} L2={} L3={}", loaded,
                     bank.CountForLevel(1), bank.CountForLevel(2), bank.CountForLevel(3));

        std::unique_ptr<ActuatorPort> robot;
        if (sc.robot == RobotMode::Remote)
        {
            robot = std::make_unique<net::RemoteActuator>([&hub](std::span<std::byte const> bytes)
            {
                return hub.Broadcast(net::PeerRole::Robot, bytes);
            });
        }
        else
        {
            robot = std::make_unique<SimulatedActuator>();
        }

        SessionController session(sc.game, std::move(bank), MakePolicy(sc.game.variant), std::move(robot));

        std::optional<debug::AuditLogger> audit;
        if (!sc.audit.empty())
        {
            audit.emplace(sc.audit);
            if (!audit->is_open())
            {
                std::println(stderr, "[robotraced] cannot write audit file {}", sc.audit);
                audit.reset();
            }
            else
            {
                audit->start(sc.game);
            }
        }

        constexpr auto frame = std::chrono::microseconds(16'667); // 60 Hz
        constexpr auto refresh = std::chrono::milliseconds(100);

        std::uint64_t msg_counter{1};
        TimePoint next = Clock::now();
        TimePoint last_broadcast{};

        while (g_stop == 0)
        {
            TimePoint const now = Clock::now();

            std::vector<PlayerAction> inputs;
            for (std::vector<uint8_t> const& f : hub.DrainInputs())
            {
                std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(f.data()), f.size()};
                auto decoded = net::DecodeInput(bytes);
                if (!decoded)
                {
                    std::println(stderr, "[robotraced] dropped input frame: {}", decoded.error().message);
                    continue;
                }
                inputs.push_back(std::move(*decoded));
            }

            TickReport const report = session.Tick(now, inputs);

            if (audit)
            {
                for (std::size_t i = 0; i < inputs.size(); ++i) audit->input(inputs[i], report.inputs[i]);
            }

            std::vector<SessionEvent> const events = session.TakeEvents();
            for (SessionEvent const& e : events)
            {
                std::println("[session] {}", describe(e));
            }
            if (audit)
            {
                audit->events(events);
                if (report.match_ended) audit->end(session);
            }

            if (!events.empty() || now - last_broadcast >= refresh)
            {
                BroadcastSnapshot(session, hub, now, msg_counter++);
                last_broadcast = now;
            }

            next += frame;
            std::this_thread::sleep_until(next);
        }

        std::println("[robotraced] shutting down");
        if (audit) audit->flush();
    }

    auto Run(ServerConfig const& sc) -> int
    {
        using namespace robotrace;
        using namespace robotrace::core;

        std::println("[robotraced] starting on port {} | variant={} seed={}",
                     sc.port, sc.game.variant == RuleVariant::BuzzerRace ? "buzzer" : "open", sc.game.seed);

        auto ep = std::make_shared<WsServer>();
        ep->clear_access_channels(websocketpp::log::alevel::all);
        ep->clear_error_channels(websocketpp::log::elevel::all);

        ep->init_asio();
        ep->set_reuse_addr(true);

        net::PeerHub hub{ep};

        ep->set_open_handler([&](Hdl hdl)
        {
            auto con = ep->get_con_from_hdl(hdl);
            std::optional<net::PeerRole> const role = net::RoleFromResource(con->get_resource());
            if (!role)
            {
                ep->close(hdl, websocketpp::close::status::policy_violation, "use /display, /input or /robot");
                return;
            }
            hub.Open(hdl, *role);
            std::println("[robotraced] {} peer connected", net::to_string(*role));
        });

        ep->set_close_handler([&](Hdl hdl)
        {
            if (std::optional<net::PeerRole> const role = hub.Close(hdl))
            {
                std::println("[robotraced] {} peer disconnected", net::to_string(*role));
            }
        });

        ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
        {
            std::shared_ptr<net::PeerChannel> const chan = hub.Find(hdl);
            if (!chan || chan->role != net::PeerRole::Input)
            {
                return;
            }
            if (msg->get_opcode() != websocketpp::frame::opcode::binary)
            {
                return;
            }

            auto const& payload = msg->get_payload();
            hub.EnqueueInput(std::vector<uint8_t>(payload.begin(), payload.end()));
        });

        ep->listen(sc.port);
        ep->start_accept();
        net::IoThread io{ep};

        Serve(sc, hub);
        io.Stop();
        return 0;
    }
}

int main(int argc, char** argv)
{
    std::signal(SIGINT, [](int) { g_stop = 1; });
    std::signal(SIGTERM, [](int) { g_stop = 1; });

    try
    {
        ServerConfig const sc = ParseArgs(argc, argv);
        return Run(sc);
    }
    catch (robotrace::core::error::ConfigError const& e)
    {
        std::println(stderr, "[robotraced] bad arguments: {}", e.what());
        return 2;
    }
    catch (robotrace::core::OmegaException<robotrace::core::error::Code> const& e)
    {
        std::print(stderr, "[robotraced] fatal: {}", e);
        return 1;
    }
    catch (std::exception const& e)
    {
        std::println(stderr, "[robotraced] fatal: {}", e.what());
        return 1;
    }
}
