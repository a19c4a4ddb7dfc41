#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace nub::bridge
{
class Correlator;

// The hook owns the breakpoint registry; this only turns an editor breakpoint set for one file into
// clearLineBreakpoints + setLineBreakpoint calls.
class BreakpointManager
{
public:
    using CompletionHandler = std::function<void(std::error_code ec)>;

    explicit BreakpointManager(Correlator& correlator) : m_correlator(correlator) {}

    // All calls are in flight at once; `handler` runs after the last one completed.
    void SetBreakpoints(const std::string& file, const std::vector<int64_t>& lines, CompletionHandler handler);

private:
    Correlator& m_correlator;
};

}  // namespace nub::bridge
