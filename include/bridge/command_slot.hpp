#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

#include "bridge/wire.hpp"

namespace nub::bridge
{
class ILink;

// The hook's outstanding long-poll: it stays blocked until this envelope is answered.
struct CommandSlot
{
    int64_t envelopeId;
    Function function;
};

class CommandSlotRegister
{
public:
    // Fails with slot_busy when a slot is already open; the open slot is kept.
    std::error_code Open(int64_t envelopeId, Function function);

    // Answers the open slot with `command` and closes it. The slot must be of kind `expected`.
    std::error_code Reply(ILink& link, Function expected, std::string_view command);

    void Drop() { m_slot.reset(); }

    bool IsOpen() const { return m_slot.has_value(); }
    bool IsOpen(Function function) const { return m_slot && m_slot->function == function; }
    const std::optional<CommandSlot>& Current() const { return m_slot; }

private:
    std::optional<CommandSlot> m_slot;
};

}  // namespace nub::bridge
