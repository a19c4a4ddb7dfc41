#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "bridge/correlator.hpp"
#include "bridge/errors.hpp"
#include "fakes.hpp"

using namespace nub;
using namespace nub::bridge;
using nub::test::FakeLink;
using nub::test::ReplyMessage;
using json = nlohmann::json;

namespace
{
struct Outcome
{
    int calls = 0;
    std::error_code ec;
    json arguments;
};

ReplyHandler Record(Outcome& outcome)
{
    return [&outcome](std::error_code ec, const json& arguments)
    {
        outcome.calls++;
        outcome.ec = ec;
        outcome.arguments = arguments;
    };
}
}  // namespace

class CorrelatorTest : public ::testing::Test
{
protected:
    asio::io_context io;
    FakeLink link;
    Correlator correlator{io, link, std::chrono::seconds(10)};
};

TEST_F(CorrelatorTest, WritesRequestWithFreshId)
{
    int64_t first = correlator.Send(Function::StackTrace, json::object(), [](std::error_code, const json&) {});
    int64_t second = correlator.Send(Function::Variables, {{"scope", "g"}}, [](std::error_code, const json&) {});

    EXPECT_LT(first, second);
    ASSERT_EQ(link.written.size(), 2u);
    EXPECT_EQ(link.written[0][0], 0);
    EXPECT_EQ(link.written[0][1]["Message_type"], "Request");
    EXPECT_EQ(link.written[0][1]["Function"], "stackTrace");
    EXPECT_EQ(link.written[0][1]["Arguments"]["request_id"], first);
    EXPECT_EQ(link.written[1][1]["Arguments"]["request_id"], second);
    EXPECT_EQ(link.written[1][1]["Arguments"]["scope"], "g");
    EXPECT_EQ(correlator.Pending(), 2u);
}

TEST_F(CorrelatorTest, ShuffledRepliesResolveTheirOwnRequest)
{
    constexpr size_t COUNT = 32;
    std::vector<Outcome> outcomes(COUNT);

    for (size_t i = 0; i < COUNT; i++)
    {
        correlator.Send(Function::Evaluate, {{"expression", std::to_string(i)}}, Record(outcomes[i]));
    }

    std::vector<json> requests = link.written;
    std::mt19937 generator(1234);
    std::shuffle(requests.begin(), requests.end(), generator);

    for (const json& request : requests)
    {
        json reply = {{"result", request[1]["Arguments"]["expression"]}};
        EXPECT_TRUE(correlator.DispatchReply(ReplyMessage(request, reply)));
    }

    for (size_t i = 0; i < COUNT; i++)
    {
        EXPECT_EQ(outcomes[i].calls, 1);
        EXPECT_FALSE(outcomes[i].ec);
        EXPECT_EQ(outcomes[i].arguments["result"], std::to_string(i));
    }
    EXPECT_EQ(correlator.Pending(), 0u);
}

TEST_F(CorrelatorTest, UnknownAndDuplicateRepliesAreDropped)
{
    Outcome outcome;
    correlator.Send(Function::StackTrace, json::object(), Record(outcome));
    json request = link.written.back();

    InboundMessage stranger;
    stranger.type = MessageType::Reply;
    stranger.function = Function::StackTrace;
    stranger.arguments = {{"request_id", 999}};
    EXPECT_FALSE(correlator.DispatchReply(stranger));

    InboundMessage anonymous = stranger;
    anonymous.arguments = json::object();
    EXPECT_FALSE(correlator.DispatchReply(anonymous));
    EXPECT_EQ(outcome.calls, 0);

    EXPECT_TRUE(correlator.DispatchReply(ReplyMessage(request)));
    EXPECT_FALSE(correlator.DispatchReply(ReplyMessage(request)));
    EXPECT_EQ(outcome.calls, 1);
}

TEST_F(CorrelatorTest, FailAllFailsEveryPendingRequest)
{
    std::vector<Outcome> outcomes(5);
    for (Outcome& outcome : outcomes)
    {
        correlator.Send(Function::Variables, json::object(), Record(outcome));
    }

    correlator.FailAll(errc::connection_closed);

    for (const Outcome& outcome : outcomes)
    {
        EXPECT_EQ(outcome.calls, 1);
        EXPECT_EQ(outcome.ec, errc::connection_closed);
    }
    EXPECT_EQ(correlator.Pending(), 0u);

    // Nothing left to resolve afterwards.
    EXPECT_FALSE(correlator.DispatchReply(ReplyMessage(link.written.front())));
    io.poll();
    for (const Outcome& outcome : outcomes)
    {
        EXPECT_EQ(outcome.calls, 1);
    }
}

TEST_F(CorrelatorTest, SendAfterCloseFailsAsynchronously)
{
    correlator.FailAll(errc::connection_closed);

    Outcome outcome;
    correlator.Send(Function::StackTrace, json::object(), Record(outcome));
    EXPECT_EQ(outcome.calls, 0);
    EXPECT_TRUE(link.written.empty());

    io.poll();
    EXPECT_EQ(outcome.calls, 1);
    EXPECT_EQ(outcome.ec, errc::connection_closed);
}

TEST(CorrelatorTimeout, ExpiredRequestFailsAndLateReplyIsDropped)
{
    asio::io_context io;
    FakeLink link;
    Correlator correlator(io, link, std::chrono::milliseconds(1));

    Outcome outcome;
    correlator.Send(Function::Evaluate, json::object(), Record(outcome));
    json request = link.written.back();

    io.run();

    EXPECT_EQ(outcome.calls, 1);
    EXPECT_EQ(outcome.ec, errc::timed_out);
    EXPECT_EQ(correlator.Pending(), 0u);

    EXPECT_FALSE(correlator.DispatchReply(ReplyMessage(request)));
    EXPECT_EQ(outcome.calls, 1);
}

TEST(CorrelatorTimeout, ReplyCancelsTimeout)
{
    asio::io_context io;
    FakeLink link;
    Correlator correlator(io, link, std::chrono::milliseconds(1));

    Outcome outcome;
    correlator.Send(Function::Evaluate, json::object(), Record(outcome));
    EXPECT_TRUE(correlator.DispatchReply(ReplyMessage(link.written.back())));

    io.run();

    EXPECT_EQ(outcome.calls, 1);
    EXPECT_FALSE(outcome.ec);
}
