#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/stack_frame.hpp"

namespace nub::bridge
{
class Correlator;

// Namespace tags the hook understands, sent on the wire as a single letter.
enum class ScopeCode : char
{
    Local = 'l',
    Script = 's',
    Global = 'g',
    Buffer = 'b',
    Window = 'w',
    Tab = 't',
    Interpreter = 'v'
};

struct VariableReference
{
    int64_t stackLevel;
    ScopeCode scope;
};

struct ScopeHandle
{
    std::string name;
    int64_t handle;
    bool expensive;
};

using VariablesHandler = std::function<void(std::error_code ec, const nlohmann::json& variables)>;

// Handles are positions in an append-only table. The table is recycled for every pause; handle
// numbering keeps counting so that a handle from an earlier pause never resolves to a new entry.
class VariableReferenceTable
{
public:
    std::vector<ScopeHandle> ScopesFor(const StackFrame& frame, int64_t stackLevel);
    std::optional<VariableReference> Resolve(int64_t handle) const;

    // Fetches the variables behind `handle` and hands them over as DAP variables.
    void VariablesFor(Correlator& correlator, int64_t handle, VariablesHandler handler) const;

    void Reset();
    size_t Size() const { return m_references.size(); }

private:
    int64_t Append(int64_t stackLevel, ScopeCode scope);

private:
    std::vector<VariableReference> m_references;
    // Handles issued before the last Reset(). Handle 0 means "no children" in DAP, so numbering starts at 1.
    int64_t m_base = 0;
};

}  // namespace nub::bridge
