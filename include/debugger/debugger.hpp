#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "bridge/link.hpp"
#include "bridge/session.hpp"

namespace nub
{
struct Configuration;
}

namespace nub::debugger
{

class IEditorChannel;

using LinkFactory = std::function<std::shared_ptr<bridge::ILink>(bridge::ILinkListener& listener)>;

// Serves the debug adapter protocol for one editor connection and drives the hook's session.
class Debugger : public bridge::ILinkListener, public bridge::ISessionObserver
{
public:
    Debugger(asio::io_context& io, const Configuration& configuration, IEditorChannel& editor, LinkFactory linkFactory);
    ~Debugger() override;

    Debugger(const Debugger&) = delete;
    Debugger& operator=(const Debugger&) = delete;

    void HandleRequest(const nlohmann::json& request);

    // Stops listening for the hook and drops its connection.
    void Shutdown();

    bridge::Session* GetSession() { return m_session.get(); }

    // bridge::ILinkListener
    void OnLinkConnected() override;
    void OnLinkRecord(const std::string& record) override;
    void OnLinkDisconnected() override;

    // bridge::ISessionObserver
    void OnSessionInitialized() override;
    void OnSessionStopped(const std::string& reason) override;
    void OnSessionTerminated() override;

private:
    using RequestHandler = void (Debugger::*)(const nlohmann::json& request);

    void HandleInitialize(const nlohmann::json& request);
    void HandleLaunch(const nlohmann::json& request);
    void HandleAttach(const nlohmann::json& request);
    void HandleSetBreakpoints(const nlohmann::json& request);
    void HandleSetFunctionBreakpoints(const nlohmann::json& request);
    void HandleConfigurationDone(const nlohmann::json& request);
    void HandleThreads(const nlohmann::json& request);
    void HandleStackTrace(const nlohmann::json& request);
    void HandleScopes(const nlohmann::json& request);
    void HandleVariables(const nlohmann::json& request);
    void HandlePause(const nlohmann::json& request);
    void HandleContinue(const nlohmann::json& request);
    void HandleNext(const nlohmann::json& request);
    void HandleStepIn(const nlohmann::json& request);
    void HandleStepOut(const nlohmann::json& request);
    void HandleEvaluate(const nlohmann::json& request);
    void HandleDisconnect(const nlohmann::json& request);
    void HandleTerminate(const nlohmann::json& request);

    void Step(const nlohmann::json& request, bridge::StepCommand command, const nlohmann::json& body);
    std::error_code StartListening(const nlohmann::json& arguments);
    void StartHandshakeTimer();
    void OnHandshakeTimeout();

    // Sends a no_session error and returns nullptr when the hook is not connected.
    bridge::Session* RequireSession(const nlohmann::json& request);

private:
    static constexpr int THREAD_ID = 1;
    static const std::unordered_map<std::string, RequestHandler> HANDLERS;

    asio::io_context& m_io;
    const Configuration& m_configuration;
    IEditorChannel& m_editor;
    LinkFactory m_linkFactory;

    std::shared_ptr<bridge::ILink> m_link;
    std::unique_ptr<bridge::Session> m_session;

    asio::steady_timer m_handshakeTimer;
    bool m_handshakeDone = false;
    bool m_startedByBridge = false;

    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};
}  // namespace nub::debugger
