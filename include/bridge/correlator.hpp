#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>
#include <unordered_map>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "bridge/wire.hpp"

namespace nub::bridge
{
class ILink;

// Invoked exactly once, with the reply's Arguments on success.
using ReplyHandler = std::function<void(std::error_code ec, const nlohmann::json& arguments)>;

// Matches bridge-initiated requests to the hook's replies by request_id.
class Correlator
{
public:
    Correlator(asio::io_context& io, ILink& link, std::chrono::milliseconds timeout);
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    int64_t Send(Function function, nlohmann::json arguments, ReplyHandler handler);

    // Returns false when the reply matched nothing and was dropped.
    bool DispatchReply(const InboundMessage& message);

    // Fails every pending request with `ec`. Requests sent afterwards fail with connection_closed.
    void FailAll(std::error_code ec);

    size_t Pending() const { return m_pending.size(); }

private:
    struct PendingRequest
    {
        Function function;
        ReplyHandler handler;
        std::unique_ptr<asio::steady_timer> timer;
    };

    void Expire(int64_t id);

private:
    asio::io_context& m_io;
    ILink& m_link;
    std::chrono::milliseconds m_timeout;

    std::unordered_map<int64_t, PendingRequest> m_pending;
    int64_t m_nextId = 1;
    bool m_closed = false;

    // Timer completions outlive the correlator, they check this before touching it.
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};

}  // namespace nub::bridge
