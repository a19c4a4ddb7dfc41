#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <set>

#include "bridge/breakpoint_manager.hpp"
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
// Applies breakpoint calls in arrival order, as the hook does, and replies in a shuffled order.
class FakeRegistry
{
public:
    void Serve(FakeLink& link, Correlator& correlator)
    {
        std::vector<json> requests = link.RequestsSince(m_cursor);
        m_cursor = link.written.size();

        for (const json& request : requests)
        {
            const json& arguments = request[1]["Arguments"];
            std::string file = arguments["file"];

            if (request[1]["Function"] == "clearLineBreakpoints")
            {
                lines[file].clear();
            }
            else if (request[1]["Function"] == "setLineBreakpoint")
            {
                lines[file].insert(arguments["line"].get<int64_t>());
            }
        }

        std::shuffle(requests.begin(), requests.end(), m_generator);
        for (const json& request : requests)
        {
            correlator.DispatchReply(ReplyMessage(request));
        }
    }

    std::map<std::string, std::set<int64_t>> lines;

private:
    size_t m_cursor = 0;
    std::mt19937 m_generator{99};
};
}  // namespace

class BreakpointManagerTest : public ::testing::Test
{
protected:
    asio::io_context io;
    FakeLink link;
    Correlator correlator{io, link, std::chrono::seconds(10)};
    BreakpointManager manager{correlator};
    FakeRegistry registry;
};

TEST_F(BreakpointManagerTest, NewSetReplacesOldLines)
{
    int completions = 0;
    auto onDone = [&](std::error_code ec)
    {
        EXPECT_FALSE(ec);
        completions++;
    };

    manager.SetBreakpoints("/src/plugin.vim", {10, 20}, onDone);
    registry.Serve(link, correlator);
    EXPECT_EQ(registry.lines["/src/plugin.vim"], (std::set<int64_t>{10, 20}));

    manager.SetBreakpoints("/src/plugin.vim", {30}, onDone);
    registry.Serve(link, correlator);
    EXPECT_EQ(registry.lines["/src/plugin.vim"], (std::set<int64_t>{30}));

    EXPECT_EQ(completions, 2);
}

TEST_F(BreakpointManagerTest, IssuesOneClearPlusOneSetPerLine)
{
    manager.SetBreakpoints("/src/a.vim", {1, 2, 3}, [](std::error_code) {});

    std::vector<json> requests = link.RequestsSince(0);
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[0][1]["Function"], "clearLineBreakpoints");
    EXPECT_EQ(requests[0][1]["Arguments"]["file"], "/src/a.vim");
    for (size_t i = 1; i < requests.size(); i++)
    {
        EXPECT_EQ(requests[i][1]["Function"], "setLineBreakpoint");
        EXPECT_EQ(requests[i][1]["Arguments"]["line"], static_cast<int64_t>(i));
    }
}

TEST_F(BreakpointManagerTest, CompletesAfterTheLastReply)
{
    int completions = 0;
    manager.SetBreakpoints("/src/a.vim", {5, 6}, [&](std::error_code) { completions++; });

    std::vector<json> requests = link.RequestsSince(0);
    ASSERT_EQ(requests.size(), 3u);

    correlator.DispatchReply(ReplyMessage(requests[2]));
    correlator.DispatchReply(ReplyMessage(requests[0]));
    EXPECT_EQ(completions, 0);

    correlator.DispatchReply(ReplyMessage(requests[1]));
    EXPECT_EQ(completions, 1);
}

TEST_F(BreakpointManagerTest, EmptySetOnlyClears)
{
    registry.lines["/src/a.vim"] = {4, 8};
    registry.lines["/src/b.vim"] = {15};

    int completions = 0;
    manager.SetBreakpoints("/src/a.vim", {}, [&](std::error_code) { completions++; });
    registry.Serve(link, correlator);

    EXPECT_EQ(completions, 1);
    EXPECT_TRUE(registry.lines["/src/a.vim"].empty());
    EXPECT_EQ(registry.lines["/src/b.vim"], (std::set<int64_t>{15}));
}

TEST_F(BreakpointManagerTest, RejectedLineFailsTheWholeSet)
{
    std::error_code result;
    int completions = 0;
    manager.SetBreakpoints("/src/a.vim",
                           {1, 2},
                           [&](std::error_code ec)
                           {
                               completions++;
                               result = ec;
                           });

    std::vector<json> requests = link.RequestsSince(0);
    correlator.DispatchReply(ReplyMessage(requests[0]));
    correlator.DispatchReply(ReplyMessage(requests[1], {{"error", "E16: Invalid range"}}));
    correlator.DispatchReply(ReplyMessage(requests[2]));

    EXPECT_EQ(completions, 1);
    EXPECT_EQ(result, errc::remote_error);
}

TEST_F(BreakpointManagerTest, ConnectionLossFailsOnce)
{
    std::error_code result;
    int completions = 0;
    manager.SetBreakpoints("/src/a.vim",
                           {1, 2, 3},
                           [&](std::error_code ec)
                           {
                               completions++;
                               result = ec;
                           });

    correlator.FailAll(errc::connection_closed);

    EXPECT_EQ(completions, 1);
    EXPECT_EQ(result, errc::connection_closed);
}
