#include "nub_common.hpp"
#include "bridge/wire.hpp"

#include <array>
#include <utility>

#include <magic_enum/magic_enum.hpp>

using json = nlohmann::json;

namespace nub::bridge
{

namespace
{
constexpr std::array<std::pair<std::string_view, Function>, 9> FUNCTION_NAMES = {{
    {"Break", Function::Break},
    {"Initialize", Function::Initialize},
    {"GetCommand", Function::GetCommand},
    {"clearLineBreakpoints", Function::ClearLineBreakpoints},
    {"setLineBreakpoint", Function::SetLineBreakpoint},
    {"stackTrace", Function::StackTrace},
    {"variables", Function::Variables},
    {"evaluate", Function::Evaluate},
    {"execute", Function::Execute},
}};

json Payload(MessageType type, Function function, const json& arguments)
{
    return {{"Message_type", std::string(magic_enum::enum_name(type))},
            {"Function", std::string(FunctionName(function))},
            {"Arguments", arguments}};
}
}  // namespace

std::optional<Function> FunctionFromName(std::string_view name)
{
    for (const auto& entry : FUNCTION_NAMES)
    {
        if (entry.first == name) return entry.second;
    }

    return std::nullopt;
}

std::string_view FunctionName(Function function)
{
    for (const auto& entry : FUNCTION_NAMES)
    {
        if (entry.second == function) return entry.first;
    }

    return "";
}

std::optional<InboundMessage> ParseRecord(std::string_view record)
{
    json parsed = json::parse(record.begin(), record.end(), nullptr, false);
    if (parsed.is_discarded())
    {
        Log::Warn("Dropping unparsable record from Vim: {}", record);
        return std::nullopt;
    }

    if (!parsed.is_array() || parsed.size() != 2 || !parsed[0].is_number_integer() || !parsed[1].is_object())
    {
        Log::Warn("Dropping record with unexpected shape: {}", record);
        return std::nullopt;
    }

    const json& payload = parsed[1];
    auto typeIt = payload.find("Message_type");
    auto functionIt = payload.find("Function");
    if (typeIt == payload.end() || !typeIt->is_string() || functionIt == payload.end() || !functionIt->is_string())
    {
        Log::Warn("Dropping record without Message_type/Function: {}", record);
        return std::nullopt;
    }

    auto type = magic_enum::enum_cast<MessageType>(typeIt->get<std::string>());
    if (!type)
    {
        Log::Warn("Dropping record with unknown Message_type '{}'", typeIt->get<std::string>());
        return std::nullopt;
    }

    auto function = FunctionFromName(functionIt->get<std::string>());
    if (!function)
    {
        Log::Warn("Dropping record with unknown Function '{}'", functionIt->get<std::string>());
        return std::nullopt;
    }

    InboundMessage message;
    message.envelopeId = parsed[0].get<int64_t>();
    message.type = *type;
    message.function = *function;

    auto argumentsIt = payload.find("Arguments");
    if (argumentsIt != payload.end() && argumentsIt->is_object())
    {
        message.arguments = *argumentsIt;
    }

    return message;
}

std::string TextField(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

json EncodeRequest(Function function, const json& arguments)
{
    return json::array({0, Payload(MessageType::Request, function, arguments)});
}

json EncodeReply(int64_t envelopeId, Function function, const json& arguments)
{
    return json::array({envelopeId, Payload(MessageType::Reply, function, arguments)});
}

json EncodePush(PushMode mode, std::string_view command)
{
    return json::array({mode == PushMode::Ex ? "ex" : "normal", std::string(command)});
}

}  // namespace nub::bridge
