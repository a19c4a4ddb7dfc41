#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace nub::bridge
{

enum class FrameKind : uint8_t
{
    Function,
    Script,
    Other
};

// A frame as the hook reports it. Fetched fresh on every request, never cached.
struct StackFrame
{
    int64_t level = 0;
    std::string name;
    int64_t line = 0;
    std::string file;
    FrameKind kind = FrameKind::Other;
};

// Reads `Arguments.frames` of a stackTrace reply.
std::error_code ParseStackFrames(const nlohmann::json& arguments, std::vector<StackFrame>& frames);

}  // namespace nub::bridge
