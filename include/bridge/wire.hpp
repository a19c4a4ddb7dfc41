#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace nub::bridge
{

enum class MessageType : uint8_t
{
    Notify,
    Request,
    Reply
};

// Every operation the hook and the bridge name on the wire.
enum class Function : uint8_t
{
    Break,
    Initialize,
    GetCommand,
    ClearLineBreakpoints,
    SetLineBreakpoint,
    StackTrace,
    Variables,
    Evaluate,
    Execute
};

// Unsolicited pushes are executed by the hook as if typed in that mode.
enum class PushMode : uint8_t
{
    Ex,
    Normal
};

struct InboundMessage
{
    int64_t envelopeId = 0;
    MessageType type = MessageType::Notify;
    Function function = Function::Break;
    nlohmann::json arguments = nlohmann::json::object();
};

std::optional<Function> FunctionFromName(std::string_view name);
std::string_view FunctionName(Function function);

// Parses one `[id, payload]` record. Malformed records are logged and yield nullopt.
std::optional<InboundMessage> ParseRecord(std::string_view record);

// Reads `key` of a reply object as text; non-string values are rendered as JSON.
std::string TextField(const nlohmann::json& object, const char* key);

nlohmann::json EncodeRequest(Function function, const nlohmann::json& arguments);
nlohmann::json EncodeReply(int64_t envelopeId, Function function, const nlohmann::json& arguments);
nlohmann::json EncodePush(PushMode mode, std::string_view command);

}  // namespace nub::bridge
