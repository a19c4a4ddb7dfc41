#include <gtest/gtest.h>

#include "bridge/command_slot.hpp"
#include "bridge/errors.hpp"
#include "fakes.hpp"

using namespace nub;
using namespace nub::bridge;
using nub::test::FakeLink;
using json = nlohmann::json;

TEST(CommandSlot, AtMostOneSlotIsOpen)
{
    CommandSlotRegister slots;

    EXPECT_FALSE(slots.Open(7, Function::GetCommand));
    EXPECT_EQ(slots.Open(8, Function::GetCommand), errc::slot_busy);
    EXPECT_EQ(slots.Open(9, Function::Initialize), errc::slot_busy);

    ASSERT_TRUE(slots.Current().has_value());
    EXPECT_EQ(slots.Current()->envelopeId, 7);
    EXPECT_EQ(slots.Current()->function, Function::GetCommand);
}

TEST(CommandSlot, ReplyAnswersEnvelopeAndCloses)
{
    CommandSlotRegister slots;
    FakeLink link;

    ASSERT_FALSE(slots.Open(7, Function::GetCommand));
    EXPECT_FALSE(slots.Reply(link, Function::GetCommand, "next"));

    ASSERT_EQ(link.written.size(), 1u);
    EXPECT_EQ(link.written[0],
              json::parse(R"([7,{"Message_type":"Reply","Function":"GetCommand","Arguments":{"Command":"next"}}])"));
    EXPECT_FALSE(slots.IsOpen());

    EXPECT_FALSE(slots.Open(8, Function::GetCommand));
}

TEST(CommandSlot, ReplyWithoutSlotIsASequencingError)
{
    CommandSlotRegister slots;
    FakeLink link;

    EXPECT_EQ(slots.Reply(link, Function::GetCommand, "cont"), errc::not_paused);
    EXPECT_EQ(slots.Reply(link, Function::Initialize, "cont"), errc::not_configuring);
    EXPECT_TRUE(link.written.empty());
}

TEST(CommandSlot, KindsAreNotInterchangeable)
{
    CommandSlotRegister slots;
    FakeLink link;

    ASSERT_FALSE(slots.Open(1, Function::Initialize));
    EXPECT_EQ(slots.Reply(link, Function::GetCommand, "next"), errc::slot_mismatch);
    EXPECT_TRUE(slots.IsOpen(Function::Initialize));
    EXPECT_TRUE(link.written.empty());

    EXPECT_FALSE(slots.Reply(link, Function::Initialize, "cont"));
    EXPECT_EQ(link.written.back()[0], 1);
    EXPECT_EQ(link.written.back()[1]["Function"], "Initialize");
}

TEST(CommandSlot, DropForgetsSlotWithoutWriting)
{
    CommandSlotRegister slots;
    FakeLink link;

    ASSERT_FALSE(slots.Open(3, Function::GetCommand));
    slots.Drop();

    EXPECT_FALSE(slots.IsOpen());
    EXPECT_EQ(slots.Reply(link, Function::GetCommand, "cont"), errc::not_paused);
    EXPECT_TRUE(link.written.empty());
}
