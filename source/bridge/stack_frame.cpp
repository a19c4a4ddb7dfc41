#include "nub_common.hpp"
#include "bridge/stack_frame.hpp"

#include "bridge/errors.hpp"
#include "bridge/wire.hpp"

using json = nlohmann::json;

std::error_code nub::bridge::ParseStackFrames(const json& arguments, std::vector<StackFrame>& frames)
{
    auto framesIt = arguments.find("frames");
    if (framesIt == arguments.end() || !framesIt->is_array())
    {
        Log::Error("stackTrace reply has no frames: {}", arguments.dump());
        return errc::malformed_reply;
    }

    frames.clear();
    frames.reserve(framesIt->size());

    for (const json& entry : *framesIt)
    {
        if (!entry.is_object() || !entry.contains("stack_level") || !entry["stack_level"].is_number_integer())
        {
            Log::Error("Malformed stack frame: {}", entry.dump());
            return errc::malformed_reply;
        }

        StackFrame frame;
        frame.level = entry["stack_level"].get<int64_t>();
        frame.name = TextField(entry, "name");
        frame.file = TextField(entry, "source_file");
        if (entry.contains("source_line") && entry["source_line"].is_number_integer())
        {
            frame.line = entry["source_line"].get<int64_t>();
        }

        std::string type = TextField(entry, "type");
        if (type == "UFUNC")
        {
            frame.kind = FrameKind::Function;
        }
        else if (type == "SCRIPT")
        {
            frame.kind = FrameKind::Script;
        }

        frames.push_back(std::move(frame));
    }

    return {};
}
