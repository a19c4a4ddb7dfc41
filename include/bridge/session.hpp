#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <unordered_map>

#include <asio.hpp>

#include "bridge/breakpoint_manager.hpp"
#include "bridge/command_slot.hpp"
#include "bridge/correlator.hpp"
#include "bridge/variable_references.hpp"
#include "bridge/wire.hpp"

namespace nub::bridge
{
class ILink;

enum class SessionState : uint8_t
{
    Disconnected = 0,
    AwaitingInit,
    Ready,
    Running,
    Paused,
    Terminated
};

enum class StepCommand : uint8_t
{
    Continue,
    Next,
    StepIn,
    StepOut
};

class ISessionObserver
{
public:
    virtual ~ISessionObserver() = default;

    // The hook asked for configuration, breakpoints can be set now.
    virtual void OnSessionInitialized() = 0;
    virtual void OnSessionStopped(const std::string& reason) = 0;
    virtual void OnSessionTerminated() = 0;
};

// State of one connected hook. Created when the hook connects, destroyed when the link closes.
class Session
{
public:
    Session(asio::io_context& io, ILink& link, ISessionObserver& observer, std::chrono::milliseconds requestTimeout);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void OnRecord(const std::string& record);
    void OnMessage(const InboundMessage& message);
    void OnDisconnected();

    // Editor decisions
    std::error_code ConfigurationDone();
    std::error_code Step(StepCommand command);
    std::error_code Pause();
    // Ends the interpreter: `force` discards its state, otherwise a plain quit is requested.
    void Quit(bool force);

    SessionState State() const { return m_state; }
    bool StartedByBridge() const { return m_startedByBridge; }
    void SetStartedByBridge(bool started) { m_startedByBridge = started; }

    Correlator& Requests() { return m_correlator; }
    BreakpointManager& Breakpoints() { return m_breakpoints; }
    VariableReferenceTable& References() { return m_references; }
    const CommandSlotRegister& Slot() const { return m_slot; }

private:
    using MessageHandler = void (Session::*)(const InboundMessage& message);

    void HandleBreak(const InboundMessage& message);
    void HandleInitialize(const InboundMessage& message);
    void HandleGetCommand(const InboundMessage& message);
    void HandleReply(const InboundMessage& message);

    void SetState(SessionState state);
    std::string TakeStopReason();

private:
    static const std::unordered_map<MessageType, std::unordered_map<Function, MessageHandler>> HANDLERS;

    ILink& m_link;
    ISessionObserver& m_observer;

    Correlator m_correlator;
    CommandSlotRegister m_slot;
    VariableReferenceTable m_references;
    BreakpointManager m_breakpoints;

    SessionState m_state = SessionState::Disconnected;
    bool m_startedByBridge = false;
    bool m_closed = false;

    std::string m_breakReason;
    bool m_pauseRequested = false;
    bool m_stepping = false;
};

}  // namespace nub::bridge
