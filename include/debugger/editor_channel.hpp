#pragma once
#include <functional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace nub::debugger
{

// The editor end of the debug adapter protocol, as seen by the Debugger.
class IEditorChannel
{
public:
    using ResponseHandler = std::function<void(const nlohmann::json& response)>;

    IEditorChannel() = default;
    virtual ~IEditorChannel() = default;

    virtual void SendResponse(const nlohmann::json& request, const nlohmann::json& body) = 0;
    virtual void SendErrorResponse(const nlohmann::json& request, std::error_code ec) = 0;
    virtual void SendEvent(const std::string& event, const nlohmann::json& body = {}) = 0;

    // Reverse request, answered by the editor (runInTerminal).
    virtual void SendRequest(const std::string& command, const nlohmann::json& arguments, ResponseHandler handler) = 0;
};
}  // namespace nub::debugger
