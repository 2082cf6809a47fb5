//
// PeerChannel.hpp: server-side WebSocket++ peers (display, input, robot bridge)
//

#ifndef ROBOTRACE_PEERCHANNEL_HPP
#define ROBOTRACE_PEERCHANNEL_HPP

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

namespace robotrace::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    enum class PeerRole : std::uint8_t
    {
        Display, // receives snapshots
        Input,   // sends inputs, receives snapshots
        Robot    // receives actuator commands
    };

    // "/display", "/input", "/robot"; anything else is refused
    auto RoleFromResource(std::string_view resource) -> std::optional<PeerRole>;
    auto to_string(PeerRole r) -> std::string_view;

    struct PeerChannel
    {
        std::weak_ptr<WsServer>          ep;
        Hdl                              hdl;
        PeerRole                         role{PeerRole::Display};

        std::atomic<bool>                connected{false};

        bool SendBinary(std::span<const std::byte> bytes)
        {
            auto ep_sp = ep.lock();
            if (!ep_sp || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(hdl,
                        reinterpret_cast<const void*>(bytes.data()),
                        bytes.size(),
                        websocketpp::frame::opcode::binary,
                        ec);
            return !ec;
        }
    };

    // Every connected peer, keyed by connection. Touched from the WebSocket++
    // I/O thread (open/close/message) and the tick thread (drain/broadcast).
    class PeerHub
    {
    public:
        explicit PeerHub(std::weak_ptr<WsServer> ep) : ep_(std::move(ep)) {}

        auto Open(Hdl hdl, PeerRole role) -> std::shared_ptr<PeerChannel>;
        auto Close(Hdl const& hdl) -> std::optional<PeerRole>;
        auto Find(Hdl const& hdl) -> std::shared_ptr<PeerChannel>;

        // Returns the number of peers the frame reached
        auto Broadcast(PeerRole role, std::span<const std::byte> bytes) -> std::size_t;

        // One inbox for all input peers so arrival order survives across peers
        auto EnqueueInput(std::vector<uint8_t> bytes) -> void;
        auto DrainInputs() -> std::vector<std::vector<uint8_t>>;
        auto CountOf(PeerRole role) -> std::size_t;

    private:
        std::weak_ptr<WsServer> ep_;
        std::mutex mtx_;
        std::map<Hdl, std::shared_ptr<PeerChannel>, std::owner_less<Hdl>> peers_;
        std::deque<std::vector<uint8_t>> inbox_;
    };

    // Runs the endpoint's I/O loop on its own thread. Stops the endpoint and
    // joins on destruction, so unwinding past it never leaves a joinable thread.
    class IoThread
    {
    public:
        explicit IoThread(std::shared_ptr<WsServer> ep);
        ~IoThread();

        IoThread(IoThread const&) = delete;
        IoThread& operator=(IoThread const&) = delete;

        auto Stop() -> void;
        auto Running() const noexcept -> bool { return thr_.joinable(); }

    private:
        std::shared_ptr<WsServer> ep_;
        std::thread thr_;
    };
}

#endif // ROBOTRACE_PEERCHANNEL_HPP
