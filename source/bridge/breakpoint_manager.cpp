#include "nub_common.hpp"
#include "bridge/breakpoint_manager.hpp"

#include "bridge/correlator.hpp"
#include "bridge/errors.hpp"

using json = nlohmann::json;

namespace
{
struct BreakpointBatch
{
    size_t remaining = 0;
    std::error_code firstError;
    nub::bridge::BreakpointManager::CompletionHandler handler;
};
}  // namespace

void nub::bridge::BreakpointManager::SetBreakpoints(const std::string& file,
                                                    const std::vector<int64_t>& lines,
                                                    CompletionHandler handler)
{
    auto batch = std::make_shared<BreakpointBatch>();
    batch->remaining = lines.size() + 1;
    batch->handler = std::move(handler);

    auto onReply = [batch, file](std::error_code ec, const json& reply)
    {
        if (!ec && reply.contains("error"))
        {
            Log::Error("Vim rejected a breakpoint change in {}: {}", file, TextField(reply, "error"));
            ec = errc::remote_error;
        }

        if (ec && !batch->firstError)
        {
            batch->firstError = ec;
        }

        if (--batch->remaining == 0)
        {
            batch->handler(batch->firstError);
        }
    };

    m_correlator.Send(Function::ClearLineBreakpoints, {{"file", file}}, onReply);

    for (int64_t line : lines)
    {
        m_correlator.Send(Function::SetLineBreakpoint, {{"file", file}, {"line", line}}, onReply);
    }
}
