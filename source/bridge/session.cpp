#include "nub_common.hpp"
#include "bridge/session.hpp"

#include <magic_enum/magic_enum.hpp>

#include "bridge/errors.hpp"
#include "bridge/link.hpp"

namespace nub::bridge
{

const std::unordered_map<MessageType, std::unordered_map<Function, Session::MessageHandler>> Session::HANDLERS = {
    {MessageType::Notify, {{Function::Break, &Session::HandleBreak}}},
    {MessageType::Request,
     {
         {Function::Initialize, &Session::HandleInitialize},
         {Function::GetCommand, &Session::HandleGetCommand},
     }},
    {MessageType::Reply,
     {
         {Function::ClearLineBreakpoints, &Session::HandleReply},
         {Function::SetLineBreakpoint, &Session::HandleReply},
         {Function::StackTrace, &Session::HandleReply},
         {Function::Variables, &Session::HandleReply},
         {Function::Evaluate, &Session::HandleReply},
         {Function::Execute, &Session::HandleReply},
     }},
};

Session::Session(asio::io_context& io, ILink& link, ISessionObserver& observer, std::chrono::milliseconds requestTimeout)
    : m_link(link), m_observer(observer), m_correlator(io, link, requestTimeout), m_breakpoints(m_correlator)
{
    SetState(SessionState::AwaitingInit);
}

Session::~Session()
{
    if (m_correlator.Pending() > 0)
    {
        m_correlator.FailAll(errc::connection_closed);
    }
}

void Session::OnRecord(const std::string& record)
{
    auto message = ParseRecord(record);
    if (!message) return;

    try
    {
        OnMessage(*message);
    }
    catch (const nlohmann::json::exception& e)
    {
        Log::Error("Dropping record after a JSON error ({}): {}", e.what(), record);
    }
}

void Session::OnMessage(const InboundMessage& message)
{
    auto byType = HANDLERS.find(message.type);
    if (byType != HANDLERS.end())
    {
        auto handler = byType->second.find(message.function);
        if (handler != byType->second.end())
        {
            (this->*(handler->second))(message);
            return;
        }
    }

    Log::Warn("Ignoring {} {} from Vim", magic_enum::enum_name(message.type), FunctionName(message.function));
}

void Session::OnDisconnected()
{
    if (m_closed) return;
    m_closed = true;

    m_slot.Drop();
    m_correlator.FailAll(errc::connection_closed);
    SetState(SessionState::Terminated);

    m_observer.OnSessionTerminated();
}

std::error_code Session::ConfigurationDone()
{
    std::error_code ec = m_slot.Reply(m_link, Function::Initialize, "cont");
    if (ec) return ec;

    SetState(SessionState::Running);
    return {};
}

std::error_code Session::Step(StepCommand command)
{
    static constexpr std::string_view COMMANDS[] = {"cont", "next", "step", "finish"};

    std::error_code ec = m_slot.Reply(m_link, Function::GetCommand, COMMANDS[static_cast<size_t>(command)]);
    if (ec) return ec;

    m_stepping = command != StepCommand::Continue;
    SetState(SessionState::Running);
    return {};
}

std::error_code Session::Pause()
{
    if (m_state == SessionState::Paused) return {};
    if (m_state != SessionState::Running) return errc::not_running;

    // Vim is not in a long-poll, so there is nothing to reply to. Interrupt it and wait for GetCommand.
    m_link.Write(EncodePush(PushMode::Ex, "breakint"));
    m_pauseRequested = true;
    return {};
}

void Session::Quit(bool force)
{
    if (m_slot.IsOpen(Function::GetCommand))
    {
        std::error_code ec = m_slot.Reply(m_link, Function::GetCommand, force ? ":qa!" : "quit");
        if (ec)
        {
            Log::Error("Could not answer the pending command request: {}", ec.message());
        }
    }
    else
    {
        m_link.Write(EncodePush(PushMode::Ex, force ? "qa!" : "quit"));
    }

    SetState(SessionState::Terminated);
}

void Session::HandleBreak(const InboundMessage& message)
{
    m_breakReason = TextField(message.arguments, "reason");
}

void Session::HandleInitialize(const InboundMessage& message)
{
    if (m_state != SessionState::AwaitingInit)
    {
        Log::Warn("Ignoring Initialize while {}", magic_enum::enum_name(m_state));
        return;
    }

    if (m_slot.Open(message.envelopeId, message.function)) return;

    SetState(SessionState::Ready);
    m_observer.OnSessionInitialized();
}

void Session::HandleGetCommand(const InboundMessage& message)
{
    if (m_slot.IsOpen())
    {
        const CommandSlot& open = *m_slot.Current();
        Log::Error("Rejecting GetCommand long-poll {}, {} long-poll {} is still open",
                   message.envelopeId,
                   FunctionName(open.function),
                   open.envelopeId);
        return;
    }

    if (m_state != SessionState::Running)
    {
        Log::Warn("Ignoring GetCommand while {}", magic_enum::enum_name(m_state));
        return;
    }

    if (m_slot.Open(message.envelopeId, message.function)) return;

    m_references.Reset();
    SetState(SessionState::Paused);
    m_observer.OnSessionStopped(TakeStopReason());
}

void Session::HandleReply(const InboundMessage& message) { m_correlator.DispatchReply(message); }

void Session::SetState(SessionState state)
{
    if (m_state == state) return;

    Log::Debug("Session {} -> {}", magic_enum::enum_name(m_state), magic_enum::enum_name(state));
    m_state = state;
}

std::string Session::TakeStopReason()
{
    std::string reason;
    if (!m_breakReason.empty())
    {
        reason = m_breakReason;
    }
    else if (m_pauseRequested)
    {
        reason = "pause";
    }
    else if (m_stepping)
    {
        reason = "step";
    }
    else
    {
        reason = "breakpoint";
    }

    m_breakReason.clear();
    m_pauseRequested = false;
    m_stepping = false;

    return reason;
}

}  // namespace nub::bridge
