#include "nub_common.hpp"
#include "bridge/variable_references.hpp"

#include "bridge/correlator.hpp"
#include "bridge/errors.hpp"

using json = nlohmann::json;

namespace nub::bridge
{

std::vector<ScopeHandle> VariableReferenceTable::ScopesFor(const StackFrame& frame, int64_t stackLevel)
{
    std::vector<ScopeHandle> scopes;

    if (frame.kind == FrameKind::Function)
    {
        scopes.push_back({frame.name, Append(stackLevel, ScopeCode::Local), false});
    }

    scopes.push_back({"Script", Append(stackLevel, ScopeCode::Script), true});
    scopes.push_back({"Global", Append(stackLevel, ScopeCode::Global), true});
    scopes.push_back({"Buffer", Append(stackLevel, ScopeCode::Buffer), true});
    scopes.push_back({"Window", Append(stackLevel, ScopeCode::Window), true});
    scopes.push_back({"Tab", Append(stackLevel, ScopeCode::Tab), true});
    scopes.push_back({"Vim", Append(stackLevel, ScopeCode::Interpreter), true});

    return scopes;
}

std::optional<VariableReference> VariableReferenceTable::Resolve(int64_t handle) const
{
    if (handle <= m_base) return std::nullopt;

    int64_t index = handle - m_base - 1;
    if (index >= static_cast<int64_t>(m_references.size()))
    {
        return std::nullopt;
    }

    return m_references[static_cast<size_t>(index)];
}

void VariableReferenceTable::VariablesFor(Correlator& correlator, int64_t handle, VariablesHandler handler) const
{
    auto reference = Resolve(handle);
    if (!reference)
    {
        handler(errc::invalid_reference, json());
        return;
    }

    json arguments = {{"stack_level", reference->stackLevel}, {"scope", std::string(1, static_cast<char>(reference->scope))}};

    correlator.Send(Function::Variables,
                    std::move(arguments),
                    [handler = std::move(handler)](std::error_code ec, const json& reply)
                    {
                        if (ec)
                        {
                            handler(ec, json());
                            return;
                        }

                        auto varsIt = reply.find("vars");
                        if (varsIt == reply.end() || !varsIt->is_array())
                        {
                            Log::Error("variables reply has no vars: {}", reply.dump());
                            handler(errc::malformed_reply, json());
                            return;
                        }

                        json variables = json::array();
                        for (const json& var : *varsIt)
                        {
                            if (!var.is_object() || !var.contains("name")) continue;

                            variables.push_back({{"name", TextField(var, "name")},
                                                 {"value", TextField(var, "value")},
                                                 {"type", TextField(var, "type")},
                                                 {"variablesReference", 0}});
                        }

                        handler({}, variables);
                    });
}

void VariableReferenceTable::Reset()
{
    m_base += static_cast<int64_t>(m_references.size());
    m_references.clear();
}

int64_t VariableReferenceTable::Append(int64_t stackLevel, ScopeCode scope)
{
    m_references.push_back({stackLevel, scope});
    return m_base + static_cast<int64_t>(m_references.size());
}

}  // namespace nub::bridge
