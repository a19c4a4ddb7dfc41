#include "nub_common.hpp"
#include "bridge/command_slot.hpp"

#include "bridge/errors.hpp"
#include "bridge/link.hpp"

std::error_code nub::bridge::CommandSlotRegister::Open(int64_t envelopeId, Function function)
{
    if (m_slot)
    {
        Log::Error("Rejecting {} long-poll {}, {} long-poll {} is still open",
                   FunctionName(function),
                   envelopeId,
                   FunctionName(m_slot->function),
                   m_slot->envelopeId);
        return errc::slot_busy;
    }

    m_slot = CommandSlot{envelopeId, function};
    return {};
}

std::error_code nub::bridge::CommandSlotRegister::Reply(ILink& link, Function expected, std::string_view command)
{
    if (!m_slot)
    {
        return expected == Function::Initialize ? errc::not_configuring : errc::not_paused;
    }

    if (m_slot->function != expected)
    {
        return errc::slot_mismatch;
    }

    CommandSlot slot = *m_slot;
    m_slot.reset();

    link.Write(EncodeReply(slot.envelopeId, slot.function, {{"Command", std::string(command)}}));
    return {};
}
