#include "commands.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "simulation_transport.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}

class SimulatedCommandTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    std::ostringstream err_;
    Console console_{out_, err_, false, false};
    SimulationTransport transport_;
    JiraClient client_{transport_};
    CommandRunner runner_{client_, console_};
};

TEST_F(SimulatedCommandTest, StatusChangeResolvesCannedTransition) {
    runner_.status("PROJ-123", std::string("Done"), false);

    const auto& history = transport_.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].method, HttpMethod::GET);
    EXPECT_EQ(history[0].endpoint, "issue/PROJ-123/transitions");
    EXPECT_EQ(history[1].method, HttpMethod::POST);
    EXPECT_EQ(history[1].endpoint, "issue/PROJ-123/transitions");
    EXPECT_EQ((*history[1].body)["transition"]["id"], "21");
    EXPECT_EQ(history[2].endpoint, "issue/PROJ-123");

    EXPECT_TRUE(contains(out_.str(), "SUCCESS: Issue PROJ-123 transitioned to: In Progress"));
}

TEST_F(SimulatedCommandTest, StatusNameIsCaseInsensitive) {
    runner_.status("https://company.atlassian.net/browse/PROJ-123", std::string("to do"), false);

    EXPECT_EQ((*transport_.history().at(1).body)["transition"]["id"], "31");
}

TEST_F(SimulatedCommandTest, StatusWithoutTargetListsTransitions) {
    runner_.status("PROJ-123", std::nullopt, false);

    std::string text = out_.str();
    EXPECT_TRUE(contains(text, "Current Status: In Progress"));
    EXPECT_TRUE(contains(text, "  - Done (ID: 21)"));
    EXPECT_TRUE(contains(text, "  - In Progress (ID: 11)"));
    EXPECT_TRUE(contains(text, "  - To Do (ID: 31)"));
    for (const auto& req : transport_.history()) {
        EXPECT_EQ(req.method, HttpMethod::GET);
    }
}

TEST_F(SimulatedCommandTest, ListFlagWinsOverTarget) {
    runner_.status("PROJ-123", std::string("Done"), true);

    EXPECT_EQ(transport_.history().size(), 2u);
    EXPECT_TRUE(contains(out_.str(), "Available Transitions for PROJ-123"));
}

TEST_F(SimulatedCommandTest, UnknownStatusStopsBeforeSubmitting) {
    EXPECT_THROW(runner_.status("PROJ-123", std::string("Blocked"), false), NoMatchingTransitionError);
    EXPECT_EQ(transport_.history().size(), 1u);
}

TEST_F(SimulatedCommandTest, CommentReportsCreatedComment) {
    runner_.comment("PROJ-123", "Bug fix applied");

    const ApiRequest& req = transport_.history().at(0);
    EXPECT_EQ(req.endpoint, "issue/PROJ-123/comment");
    EXPECT_EQ((*req.body)["body"]["content"][0]["content"][0]["text"], "Bug fix applied");

    std::string text = out_.str();
    EXPECT_TRUE(contains(text, "Comment added successfully!"));
    EXPECT_TRUE(contains(text, "Comment ID:  10123"));
    EXPECT_TRUE(contains(text, "Author:      Test User"));
}

TEST_F(SimulatedCommandTest, CommentWithLatin1BytesStillSucceeds) {
    EXPECT_NO_THROW(runner_.comment("PROJ-1", "caf\xe9"));

    EXPECT_TRUE(contains(out_.str(), "Comment added successfully!"));
    EXPECT_EQ(transport_.history().size(), 1u);
}

TEST_F(SimulatedCommandTest, WorklogWithLatin1BytesStillSucceeds) {
    EXPECT_NO_THROW(runner_.log_time("PROJ-1", "15m", "r\xe9union"));

    EXPECT_TRUE(contains(out_.str(), "Worklog added successfully!"));
}

TEST_F(SimulatedCommandTest, TimeLogsParsedSeconds) {
    runner_.log_time("PROJ-123", "2h 30m", "Development work completed");

    const ApiRequest& req = transport_.history().at(0);
    EXPECT_EQ(req.endpoint, "issue/PROJ-123/worklog");
    EXPECT_EQ((*req.body)["timeSpentSeconds"], 9000);

    std::string text = out_.str();
    EXPECT_TRUE(contains(text, "Worklog added successfully!"));
    EXPECT_TRUE(contains(text, "2h 30m (9000s)"));
    EXPECT_TRUE(contains(text, "Remaining Est.:   4h"));
    EXPECT_TRUE(contains(text, "Title:   Test Issue Summary"));
}

TEST_F(SimulatedCommandTest, BadDurationSendsNothing) {
    EXPECT_THROW(runner_.log_time("PROJ-123", "2x", "work"), InvalidDurationError);
    EXPECT_TRUE(transport_.history().empty());
}

TEST_F(SimulatedCommandTest, BadKeySendsNothing) {
    EXPECT_THROW(runner_.get("no-key-here", false), InvalidKeyError);
    EXPECT_TRUE(transport_.history().empty());
}

TEST_F(SimulatedCommandTest, GetRendersIssue) {
    runner_.get("PROJ-123", false);

    std::string text = out_.str();
    EXPECT_TRUE(contains(text, "Summary:      Test Issue Summary"));
    EXPECT_TRUE(contains(text, "Story Points: 5"));
    EXPECT_EQ(transport_.history().at(0).query.at("expand"), "renderedFields");
}

TEST_F(SimulatedCommandTest, GetRawDumpsJson) {
    runner_.get("PROJ-123", true);

    auto dumped = nlohmann::json::parse(out_.str());
    EXPECT_EQ(dumped["key"], "PROJ-123");
}

TEST(CommandFailureTest, HttpErrorStopsStatusChange) {
    FakeTransport transport;
    transport.enqueue(200, R"({"transitions":[{"id":"21","to":{"name":"Done"}}]})");
    transport.enqueue(403, R"({"errorMessages":["You do not have permission to transition this issue."]})");

    std::ostringstream out, err;
    Console console(out, err, false, false);
    JiraClient client(transport);
    CommandRunner runner(client, console);

    try {
        runner.status("PROJ-9", std::string("done"), false);
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 403);
        EXPECT_EQ(e.message(), "You do not have permission to transition this issue.");
    }
    EXPECT_EQ(transport.requests().size(), 2u);
    EXPECT_TRUE(out.str().empty());
}

TEST(CommandFailureTest, RawGetPassesNonJsonBodyThrough) {
    FakeTransport transport;
    transport.enqueue(200, "<html><body>Single sign-on required</body></html>");

    std::ostringstream out, err;
    Console console(out, err, false, false);
    JiraClient client(transport);
    CommandRunner runner(client, console);

    runner.get("PROJ-9", true);
    EXPECT_EQ(out.str(), "<html><body>Single sign-on required</body></html>\n");
}
