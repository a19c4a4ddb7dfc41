#include "nub_common.hpp"
#include "debugger/debugger.hpp"

#include <algorithm>
#include <filesystem>

#include "configuration.hpp"
#include "bridge/errors.hpp"
#include "bridge/stack_frame.hpp"
#include "debugger/editor_channel.hpp"

using json = nlohmann::json;

namespace nub::debugger
{

namespace
{
json Arguments(const json& request)
{
    auto it = request.find("arguments");
    if (it == request.end() || !it->is_object()) return json::object();
    return *it;
}

std::string FileName(const std::string& path)
{
    return path.empty() ? "" : std::filesystem::path(path).filename().string();
}
}  // namespace

const std::unordered_map<std::string, Debugger::RequestHandler> Debugger::HANDLERS = {
    {"initialize", &Debugger::HandleInitialize},
    {"launch", &Debugger::HandleLaunch},
    {"attach", &Debugger::HandleAttach},
    {"setBreakpoints", &Debugger::HandleSetBreakpoints},
    {"setFunctionBreakpoints", &Debugger::HandleSetFunctionBreakpoints},
    {"configurationDone", &Debugger::HandleConfigurationDone},
    {"threads", &Debugger::HandleThreads},
    {"stackTrace", &Debugger::HandleStackTrace},
    {"scopes", &Debugger::HandleScopes},
    {"variables", &Debugger::HandleVariables},
    {"pause", &Debugger::HandlePause},
    {"continue", &Debugger::HandleContinue},
    {"next", &Debugger::HandleNext},
    {"stepIn", &Debugger::HandleStepIn},
    {"stepOut", &Debugger::HandleStepOut},
    {"evaluate", &Debugger::HandleEvaluate},
    {"disconnect", &Debugger::HandleDisconnect},
    {"terminate", &Debugger::HandleTerminate},
};

Debugger::Debugger(asio::io_context& io, const Configuration& configuration, IEditorChannel& editor, LinkFactory linkFactory)
    : m_io(io),
      m_configuration(configuration),
      m_editor(editor),
      m_linkFactory(std::move(linkFactory)),
      m_handshakeTimer(io)
{
}

Debugger::~Debugger() { Shutdown(); }

void Debugger::HandleRequest(const json& request)
{
    std::string command = request.value("command", "");

    auto it = HANDLERS.find(command);
    if (it == HANDLERS.end())
    {
        Log::Warn("Unhandled DAP command: {}", command);
        m_editor.SendErrorResponse(request, errc::unknown_command);
        return;
    }

    try
    {
        (this->*(it->second))(request);
    }
    catch (const json::exception& e)
    {
        Log::Error("Malformed '{}' request: {}", command, e.what());
        m_editor.SendErrorResponse(request, errc::malformed_request);
    }
}

void Debugger::Shutdown()
{
    m_handshakeTimer.cancel();

    if (m_link)
    {
        m_link->Stop();
        m_link.reset();
    }
}

void Debugger::OnLinkConnected()
{
    if (m_session)
    {
        Log::Warn("Vim connected while a session is still active");
        return;
    }

    m_session = std::make_unique<bridge::Session>(m_io,
                                                  *m_link,
                                                  *this,
                                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                                      m_configuration.requestTimeout));
    m_session->SetStartedByBridge(m_startedByBridge);
}

void Debugger::OnLinkRecord(const std::string& record)
{
    if (!m_session)
    {
        Log::Warn("Dropping record without a session: {}", record);
        return;
    }

    m_session->OnRecord(record);
}

void Debugger::OnLinkDisconnected()
{
    if (!m_session) return;

    // Taken out first: the session notifies us while it tears down.
    std::unique_ptr<bridge::Session> session = std::move(m_session);
    session->OnDisconnected();
}

void Debugger::OnSessionInitialized()
{
    m_handshakeDone = true;
    m_handshakeTimer.cancel();

    m_editor.SendEvent("initialized");
}

void Debugger::OnSessionStopped(const std::string& reason)
{
    m_editor.SendEvent("stopped", {{"reason", reason}, {"threadId", THREAD_ID}, {"allThreadsStopped", true}});
}

void Debugger::OnSessionTerminated() { m_editor.SendEvent("terminated"); }

void Debugger::HandleInitialize(const json& request)
{
    json capabilities = {{"supportsConfigurationDoneRequest", true},
                         {"supportsEvaluateForHovers", true},
                         {"supportsFunctionBreakpoints", true},
                         {"supportTerminateDebuggee", true},
                         {"supportsTerminateRequest", true}};

    m_editor.SendResponse(request, capabilities);
}

void Debugger::HandleLaunch(const json& request)
{
    json arguments = Arguments(request);

    if (std::error_code ec = StartListening(arguments))
    {
        m_editor.SendErrorResponse(request, ec);
        return;
    }

    std::string interpreter = arguments.value("vim", m_configuration.interpreter);

    json runArguments = {{"kind", "integrated"},
                         {"title", "Vim"},
                         {"cwd", arguments.value("cwd", "")},
                         {"args", json::array({interpreter, "--cmd", "source " + m_configuration.nubScript})}};
    if (arguments.contains("env") && arguments["env"].is_object())
    {
        runArguments["env"] = arguments["env"];
    }

    m_editor.SendRequest("runInTerminal",
                         runArguments,
                         [this, request](const json& response)
                         {
                             if (!response.value("success", false))
                             {
                                 Log::Error("runInTerminal failed: {}", response.value("message", std::string("no message")));
                                 m_editor.SendErrorResponse(request, errc::launch_failed);
                                 return;
                             }

                             m_startedByBridge = true;
                             if (m_session)
                             {
                                 m_session->SetStartedByBridge(true);
                             }

                             m_editor.SendResponse(request, json::object());
                         });

    StartHandshakeTimer();
}

void Debugger::HandleAttach(const json& request)
{
    if (std::error_code ec = StartListening(Arguments(request)))
    {
        m_editor.SendErrorResponse(request, ec);
        return;
    }

    m_startedByBridge = false;
    m_editor.SendResponse(request, json::object());

    StartHandshakeTimer();
}

void Debugger::HandleSetBreakpoints(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    json arguments = Arguments(request);
    json source = arguments.at("source");
    std::string path = source.at("path").get<std::string>();

    std::vector<int64_t> lines;
    if (arguments.contains("breakpoints"))
    {
        for (const json& breakpoint : arguments["breakpoints"])
        {
            lines.push_back(breakpoint.at("line").get<int64_t>());
        }
    }
    else if (arguments.contains("lines"))
    {
        lines = arguments["lines"].get<std::vector<int64_t>>();
    }

    json reportedSource = {{"name", source.value("name", FileName(path))}, {"path", path}};

    session->Breakpoints().SetBreakpoints(path,
                                          lines,
                                          [this, request, reportedSource, lines](std::error_code ec)
                                          {
                                              if (ec)
                                              {
                                                  m_editor.SendErrorResponse(request, ec);
                                                  return;
                                              }

                                              // Vim does not confirm individual lines, every requested line is reported verified.
                                              json breakpoints = json::array();
                                              for (int64_t line : lines)
                                              {
                                                  breakpoints.push_back(
                                                      {{"verified", true}, {"line", line}, {"source", reportedSource}});
                                              }

                                              m_editor.SendResponse(request, {{"breakpoints", breakpoints}});
                                          });
}

void Debugger::HandleSetFunctionBreakpoints(const json& request)
{
    json arguments = Arguments(request);

    json breakpoints = json::array();
    if (arguments.contains("breakpoints") && arguments["breakpoints"].is_array())
    {
        for (size_t i = 0; i < arguments["breakpoints"].size(); i++)
        {
            breakpoints.push_back({{"verified", false}});
        }
    }

    m_editor.SendResponse(request, {{"breakpoints", breakpoints}});
}

void Debugger::HandleConfigurationDone(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    if (std::error_code ec = session->ConfigurationDone())
    {
        m_editor.SendErrorResponse(request, ec);
        return;
    }

    m_editor.SendResponse(request, json::object());
}

void Debugger::HandleThreads(const json& request)
{
    m_editor.SendResponse(request, {{"threads", {{{"id", THREAD_ID}, {"name", "Vim"}}}}});
}

void Debugger::HandleStackTrace(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    json arguments = Arguments(request);
    int64_t startFrame = arguments.value("startFrame", int64_t{0});
    int64_t levels = arguments.value("levels", int64_t{0});

    session->Requests().Send(
        bridge::Function::StackTrace,
        json::object(),
        [this, request, startFrame, levels](std::error_code ec, const json& reply)
        {
            std::vector<bridge::StackFrame> frames;
            if (!ec)
            {
                ec = bridge::ParseStackFrames(reply, frames);
            }

            if (ec)
            {
                m_editor.SendErrorResponse(request, ec);
                return;
            }

            size_t first = static_cast<size_t>(std::max<int64_t>(startFrame, 0));
            size_t last = levels > 0 ? std::min(frames.size(), first + static_cast<size_t>(levels)) : frames.size();

            json stackFrames = json::array();
            for (size_t i = first; i < last; i++)
            {
                const bridge::StackFrame& frame = frames[i];

                json entry = {{"id", frame.level}, {"name", frame.name}, {"line", frame.line}, {"column", 1}};
                if (!frame.file.empty())
                {
                    entry["source"] = {{"name", FileName(frame.file)}, {"path", frame.file}};
                }

                stackFrames.push_back(std::move(entry));
            }

            m_editor.SendResponse(request, {{"stackFrames", stackFrames}, {"totalFrames", frames.size()}});
        });
}

void Debugger::HandleScopes(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    int64_t frameId = Arguments(request).at("frameId").get<int64_t>();

    session->Requests().Send(bridge::Function::StackTrace,
                             json::object(),
                             [this, request, frameId](std::error_code ec, const json& reply)
                             {
                                 std::vector<bridge::StackFrame> frames;
                                 if (!ec)
                                 {
                                     ec = bridge::ParseStackFrames(reply, frames);
                                 }

                                 if (ec)
                                 {
                                     m_editor.SendErrorResponse(request, ec);
                                     return;
                                 }

                                 // A successful reply was dispatched by the live session.
                                 for (const bridge::StackFrame& frame : frames)
                                 {
                                     if (frame.level != frameId) continue;

                                     json scopes = json::array();
                                     for (const bridge::ScopeHandle& scope : m_session->References().ScopesFor(frame, frameId))
                                     {
                                         scopes.push_back({{"name", scope.name},
                                                           {"variablesReference", scope.handle},
                                                           {"expensive", scope.expensive}});
                                     }

                                     m_editor.SendResponse(request, {{"scopes", scopes}});
                                     return;
                                 }

                                 m_editor.SendErrorResponse(request, errc::invalid_frame);
                             });
}

void Debugger::HandleVariables(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    int64_t handle = Arguments(request).at("variablesReference").get<int64_t>();

    session->References().VariablesFor(session->Requests(),
                                       handle,
                                       [this, request](std::error_code ec, const json& variables)
                                       {
                                           if (ec)
                                           {
                                               m_editor.SendErrorResponse(request, ec);
                                               return;
                                           }

                                           m_editor.SendResponse(request, {{"variables", variables}});
                                       });
}

void Debugger::HandlePause(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    if (std::error_code ec = session->Pause())
    {
        m_editor.SendErrorResponse(request, ec);
        return;
    }

    m_editor.SendResponse(request, json::object());
}

void Debugger::HandleContinue(const json& request)
{
    Step(request, bridge::StepCommand::Continue, {{"allThreadsContinued", true}});
}

void Debugger::HandleNext(const json& request) { Step(request, bridge::StepCommand::Next, json::object()); }

void Debugger::HandleStepIn(const json& request) { Step(request, bridge::StepCommand::StepIn, json::object()); }

void Debugger::HandleStepOut(const json& request) { Step(request, bridge::StepCommand::StepOut, json::object()); }

void Debugger::HandleEvaluate(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    json arguments = Arguments(request);

    json evaluateArguments = {{"expression", arguments.at("expression").get<std::string>()}};
    if (arguments.contains("frameId"))
    {
        evaluateArguments["stack_level"] = arguments["frameId"];
    }

    // The REPL runs commands, every other context only reads an expression.
    bridge::Function function =
        arguments.value("context", "") == "repl" ? bridge::Function::Execute : bridge::Function::Evaluate;

    session->Requests().Send(function,
                             std::move(evaluateArguments),
                             [this, request](std::error_code ec, const json& reply)
                             {
                                 if (ec)
                                 {
                                     m_editor.SendErrorResponse(request, ec);
                                     return;
                                 }

                                 std::string result =
                                     reply.contains("error") ? bridge::TextField(reply, "error") : bridge::TextField(reply, "result");

                                 m_editor.SendResponse(request, {{"result", result}, {"variablesReference", 0}});
                             });
}

void Debugger::HandleDisconnect(const json& request)
{
    if (m_session)
    {
        bool terminate = Arguments(request).value("terminateDebuggee", false);
        m_session->Quit(terminate || m_session->StartedByBridge());
    }

    m_editor.SendResponse(request, json::object());
}

void Debugger::HandleTerminate(const json& request)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    session->Quit(true);
    m_editor.SendResponse(request, json::object());
}

void Debugger::Step(const json& request, bridge::StepCommand command, const json& body)
{
    bridge::Session* session = RequireSession(request);
    if (!session) return;

    if (std::error_code ec = session->Step(command))
    {
        m_editor.SendErrorResponse(request, ec);
        return;
    }

    m_editor.SendResponse(request, body);
}

std::error_code Debugger::StartListening(const json& arguments)
{
    uint16_t port = arguments.value("port", m_configuration.hookPort);

    if (!m_link)
    {
        m_link = m_linkFactory(*this);
    }

    return m_link->Listen(m_configuration.hookAddress, port);
}

void Debugger::StartHandshakeTimer()
{
    if (m_session && m_session->State() != bridge::SessionState::AwaitingInit) return;

    m_handshakeDone = false;
    m_handshakeTimer.expires_after(m_configuration.handshakeTimeout);

    std::weak_ptr<bool> alive = m_alive;
    m_handshakeTimer.async_wait(
        [this, alive](const asio::error_code& ec)
        {
            if (ec == asio::error::operation_aborted || alive.expired()) return;
            OnHandshakeTimeout();
        });
}

void Debugger::OnHandshakeTimeout()
{
    if (m_handshakeDone) return;

    std::string message =
        fmt::format("Vim did not complete the handshake within {} seconds\n", m_configuration.handshakeTimeout.count());
    Log::Error("{}", message);
    m_editor.SendEvent("output", {{"category", "stderr"}, {"output", message}});

    // A hook that connects later would start a session the editor was already told is over.
    bool connected = m_link && m_link->Connected();
    if (m_link)
    {
        m_link->Stop();
        m_link.reset();
    }

    // A connected hook reports terminated through OnLinkDisconnected.
    if (!connected)
    {
        m_editor.SendEvent("terminated");
    }
}

bridge::Session* Debugger::RequireSession(const json& request)
{
    if (!m_session)
    {
        m_editor.SendErrorResponse(request, errc::no_session);
        return nullptr;
    }

    return m_session.get();
}

}  // namespace nub::debugger
