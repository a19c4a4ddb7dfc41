#pragma once
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/link.hpp"
#include "bridge/session.hpp"
#include "debugger/editor_channel.hpp"

namespace nub::test
{

using json = nlohmann::json;

// Records what the bridge writes to the hook and lets a test feed records back.
class FakeLink : public bridge::ILink
{
public:
    explicit FakeLink(bridge::ILinkListener* listener = nullptr) : m_listener(listener) {}

    std::error_code Listen(const std::string& address, uint16_t port) override
    {
        listening = true;
        listenAddress = address;
        listenPort = port;
        return listenError;
    }

    void Write(const json& record) override { written.push_back(record); }

    void Close() override
    {
        if (!connected) return;
        connected = false;
        if (m_listener) m_listener->OnLinkDisconnected();
    }

    void Stop() override
    {
        Close();
        listening = false;
    }

    bool Connected() const override { return connected; }

    // Only a listening link accepts a hook.
    void Connect()
    {
        if (!listening) return;
        connected = true;
        if (m_listener) m_listener->OnLinkConnected();
    }

    void Receive(const json& record)
    {
        if (m_listener) m_listener->OnLinkRecord(record.dump());
    }

    // Requests written by the correlator since `from`.
    std::vector<json> RequestsSince(size_t from) const
    {
        std::vector<json> out;
        for (size_t i = from; i < written.size(); i++)
        {
            if (written[i].is_array() && written[i].size() == 2 && written[i][0] == 0 && written[i][1].is_object() &&
                written[i][1].value("Message_type", "") == "Request")
            {
                out.push_back(written[i]);
            }
        }
        return out;
    }

    std::vector<json> written;
    bool connected = false;
    bool listening = false;
    std::string listenAddress;
    uint16_t listenPort = 0;
    std::error_code listenError;

private:
    bridge::ILinkListener* m_listener;
};

class FakeEditor : public debugger::IEditorChannel
{
public:
    struct Response
    {
        json request;
        bool success;
        json body;
        std::error_code error;
    };

    struct ReverseRequest
    {
        std::string command;
        json arguments;
        ResponseHandler handler;
    };

    void SendResponse(const json& request, const json& body) override { responses.push_back({request, true, body, {}}); }

    void SendErrorResponse(const json& request, std::error_code ec) override
    {
        responses.push_back({request, false, json(), ec});
    }

    void SendEvent(const std::string& event, const json& body = {}) override { events.emplace_back(event, body); }

    void SendRequest(const std::string& command, const json& arguments, ResponseHandler handler) override
    {
        requests.push_back({command, arguments, std::move(handler)});
    }

    const Response* ResponseTo(int64_t seq) const
    {
        for (const Response& response : responses)
        {
            if (response.request.value("seq", int64_t{-1}) == seq) return &response;
        }
        return nullptr;
    }

    size_t CountEvents(const std::string& name) const
    {
        size_t count = 0;
        for (const auto& event : events)
        {
            if (event.first == name) count++;
        }
        return count;
    }

    std::vector<Response> responses;
    std::vector<std::pair<std::string, json>> events;
    std::vector<ReverseRequest> requests;
};

class FakeObserver : public bridge::ISessionObserver
{
public:
    void OnSessionInitialized() override { initialized++; }
    void OnSessionStopped(const std::string& reason) override { stops.push_back(reason); }
    void OnSessionTerminated() override { terminated++; }

    int initialized = 0;
    std::vector<std::string> stops;
    int terminated = 0;
};

inline json HookRecord(int64_t id, const std::string& type, const std::string& function, const json& arguments = json::object())
{
    return json::array({id, {{"Message_type", type}, {"Function", function}, {"Arguments", arguments}}});
}

// Builds the hook's reply to a request record the bridge wrote.
inline json ReplyTo(const json& request, json arguments = json::object())
{
    arguments["request_id"] = request[1]["Arguments"]["request_id"];
    return HookRecord(0, "Reply", request[1]["Function"].get<std::string>(), arguments);
}

inline bridge::InboundMessage ReplyMessage(const json& request, json arguments = json::object())
{
    arguments["request_id"] = request[1]["Arguments"]["request_id"];

    bridge::InboundMessage message;
    message.type = bridge::MessageType::Reply;
    message.function = *bridge::FunctionFromName(request[1]["Function"].get<std::string>());
    message.arguments = arguments;
    return message;
}

inline json DapRequest(int64_t seq, const std::string& command, const json& arguments = json::object())
{
    return {{"seq", seq}, {"type", "request"}, {"command", command}, {"arguments", arguments}};
}

}  // namespace nub::test
