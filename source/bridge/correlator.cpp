#include "nub_common.hpp"
#include "bridge/correlator.hpp"

#include "bridge/errors.hpp"
#include "bridge/link.hpp"

using json = nlohmann::json;

namespace nub::bridge
{

Correlator::Correlator(asio::io_context& io, ILink& link, std::chrono::milliseconds timeout)
    : m_io(io), m_link(link), m_timeout(timeout)
{
}

Correlator::~Correlator()
{
    for (auto& entry : m_pending)
    {
        entry.second.timer->cancel();
    }
}

int64_t Correlator::Send(Function function, json arguments, ReplyHandler handler)
{
    int64_t id = m_nextId++;

    if (m_closed)
    {
        asio::post(m_io, [handler = std::move(handler)]() { handler(errc::connection_closed, json()); });
        return id;
    }

    if (!arguments.is_object())
    {
        arguments = json::object();
    }
    arguments["request_id"] = id;

    auto timer = std::make_unique<asio::steady_timer>(m_io, m_timeout);
    std::weak_ptr<bool> alive = m_alive;
    timer->async_wait(
        [this, alive, id](const asio::error_code& ec)
        {
            if (ec == asio::error::operation_aborted || alive.expired()) return;
            Expire(id);
        });

    m_pending.emplace(id, PendingRequest{function, std::move(handler), std::move(timer)});
    m_link.Write(EncodeRequest(function, arguments));

    return id;
}

bool Correlator::DispatchReply(const InboundMessage& message)
{
    auto idIt = message.arguments.find("request_id");
    if (idIt == message.arguments.end() || !idIt->is_number_integer())
    {
        Log::Warn("Dropping {} reply without request_id", FunctionName(message.function));
        return false;
    }

    auto it = m_pending.find(idIt->get<int64_t>());
    if (it == m_pending.end())
    {
        Log::Debug("Dropping {} reply for unknown request {}", FunctionName(message.function), idIt->get<int64_t>());
        return false;
    }

    if (it->second.function != message.function)
    {
        Log::Warn("Reply to request {} names {}, expected {}",
                  it->first,
                  FunctionName(message.function),
                  FunctionName(it->second.function));
    }

    ReplyHandler handler = std::move(it->second.handler);
    it->second.timer->cancel();
    m_pending.erase(it);

    handler({}, message.arguments);
    return true;
}

void Correlator::FailAll(std::error_code ec)
{
    m_closed = true;

    std::unordered_map<int64_t, PendingRequest> pending;
    pending.swap(m_pending);

    if (!pending.empty())
    {
        Log::Info("Failing {} pending request(s): {}", pending.size(), ec.message());
    }

    for (auto& entry : pending)
    {
        entry.second.timer->cancel();
        entry.second.handler(ec, json());
    }
}

void Correlator::Expire(int64_t id)
{
    auto it = m_pending.find(id);
    if (it == m_pending.end()) return;

    Log::Warn("Request {} ({}) timed out", id, FunctionName(it->second.function));

    ReplyHandler handler = std::move(it->second.handler);
    m_pending.erase(it);

    handler(errc::timed_out, json());
}

}  // namespace nub::bridge
