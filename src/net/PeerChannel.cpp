//
// PeerChannel.cpp
//

#include "net/PeerChannel.hpp"

#include <iterator>

namespace robotrace::net
{
    auto RoleFromResource(std::string_view const resource) -> std::optional<PeerRole>
    {
        std::string_view r = resource;
        if (auto const q = r.find('?'); q != std::string_view::npos) r = r.substr(0, q);

        if (r == "/display") return PeerRole::Display;
        if (r == "/input") return PeerRole::Input;
        if (r == "/robot") return PeerRole::Robot;
        return std::nullopt;
    }

    auto to_string(PeerRole const r) -> std::string_view
    {
        switch (r)
        {
        case PeerRole::Display: return "display";
        case PeerRole::Input: return "input";
        case PeerRole::Robot: return "robot";
        }
        return "?";
    }

    auto PeerHub::Open(Hdl hdl, PeerRole const role) -> std::shared_ptr<PeerChannel>
    {
        auto chan = std::make_shared<PeerChannel>();
        chan->ep = ep_;
        chan->hdl = hdl;
        chan->role = role;
        chan->connected = true;

        std::lock_guard<std::mutex> lock(mtx_);
        peers_[hdl] = chan;
        return chan;
    }

    auto PeerHub::Close(Hdl const& hdl) -> std::optional<PeerRole>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = peers_.find(hdl);
        if (it == peers_.end()) return std::nullopt;

        PeerRole const role = it->second->role;
        it->second->connected = false;
        peers_.erase(it);
        return role;
    }

    auto PeerHub::Find(Hdl const& hdl) -> std::shared_ptr<PeerChannel>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = peers_.find(hdl);
        return it == peers_.end() ? nullptr : it->second;
    }

    auto PeerHub::Broadcast(PeerRole const role, std::span<const std::byte> bytes) -> std::size_t
    {
        std::vector<std::shared_ptr<PeerChannel>> targets;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto const& [hdl, chan] : peers_)
            {
                if (chan->role == role) targets.push_back(chan);
            }
        }

        std::size_t sent = 0;
        for (auto const& chan : targets)
        {
            sent += chan->SendBinary(bytes) ? 1u : 0u;
        }
        return sent;
    }

    auto PeerHub::EnqueueInput(std::vector<uint8_t> bytes) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        inbox_.emplace_back(std::move(bytes));
    }

    auto PeerHub::DrainInputs() -> std::vector<std::vector<uint8_t>>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::vector<uint8_t>> frames(std::make_move_iterator(inbox_.begin()),
                                                 std::make_move_iterator(inbox_.end()));
        inbox_.clear();
        return frames;
    }

    auto PeerHub::CountOf(PeerRole const role) -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t n = 0;
        for (auto const& [hdl, chan] : peers_) n += (chan->role == role);
        return n;
    }

    IoThread::IoThread(std::shared_ptr<WsServer> ep) :
        ep_(std::move(ep)),
        thr_([ep = ep_] { ep->run(); })
    {
    }

    IoThread::~IoThread()
    {
        Stop();
    }

    auto IoThread::Stop() -> void
    {
        websocketpp::lib::error_code ec;
        ep_->stop_listening(ec); // not listening is fine here
        ep_->stop();
        if (thr_.joinable())
        {
            thr_.join();
        }
    }
}
