#include "errors.hpp"
#include "live_transport.hpp"
#include "simulation_transport.hpp"
#include <gtest/gtest.h>

namespace {

ApiRequest make_request(HttpMethod method, const std::string& endpoint) {
    ApiRequest req;
    req.method = method;
    req.endpoint = endpoint;
    return req;
}

}

TEST(SimulationTransportTest, TransitionListForRead) {
    SimulationTransport transport;
    ApiResponse response = transport.send(make_request(HttpMethod::GET, "issue/PROJ-1/transitions"));

    EXPECT_EQ(response.status, 200);
    auto body = nlohmann::json::parse(response.body);
    ASSERT_EQ(body["transitions"].size(), 3u);
    EXPECT_EQ(body["transitions"][0]["id"], "21");
    EXPECT_EQ(body["transitions"][0]["to"]["name"], "Done");
}

TEST(SimulationTransportTest, EmptyBodyForTransitionSubmission) {
    SimulationTransport transport;
    ApiResponse response = transport.send(make_request(HttpMethod::POST, "issue/PROJ-1/transitions"));

    EXPECT_LT(response.status, 400);
    EXPECT_TRUE(response.body.empty());
}

TEST(SimulationTransportTest, CommentAndWorklogCreation) {
    SimulationTransport transport;

    auto comment = nlohmann::json::parse(transport.send(make_request(HttpMethod::POST, "issue/PROJ-1/comment")).body);
    EXPECT_EQ(comment["id"], "10123");

    auto worklog = nlohmann::json::parse(transport.send(make_request(HttpMethod::POST, "issue/PROJ-1/worklog")).body);
    EXPECT_EQ(worklog["id"], "10456");
    EXPECT_EQ(worklog["issue"]["fields"]["timeestimate"], 14400);
}

TEST(SimulationTransportTest, IssueBodyByDefault) {
    SimulationTransport transport;

    for (auto req : {make_request(HttpMethod::GET, "issue/PROJ-1"),
                     make_request(HttpMethod::GET, "issue/PROJ-1/comment"),
                     make_request(HttpMethod::PUT, "issue/PROJ-1")}) {
        auto body = nlohmann::json::parse(transport.send(req).body);
        EXPECT_EQ(body["key"], "PROJ-123");
        EXPECT_EQ(body["fields"]["status"]["name"], "In Progress");
    }
    EXPECT_EQ(transport.history().size(), 3u);
}

TEST(SimulationTransportTest, QueryDoesNotAffectRouting) {
    SimulationTransport transport;
    ApiRequest req = make_request(HttpMethod::GET, "issue/PROJ-1");
    req.query["expand"] = "renderedFields";

    auto body = nlohmann::json::parse(transport.send(req).body);
    EXPECT_EQ(body["renderedFields"]["description"].is_string(), true);
}

TEST(LiveTransportTest, MissingCredentialsFailBeforeNetwork) {
    Credentials credentials{"https://example.atlassian.net", "", "token"};
    LiveTransport transport(credentials);

    try {
        transport.send(make_request(HttpMethod::GET, "issue/PROJ-1"));
        FAIL() << "expected MissingCredentialsError";
    } catch (const MissingCredentialsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MISSING_CREDENTIALS);
        EXPECT_EQ(e.missing(), std::vector<std::string>{"JIRA_EMAIL"});
    }
}

TEST(LiveTransportTest, BuildsVersionedUrl) {
    Credentials credentials{"https://example.atlassian.net", "me@example.com", "token"};
    LiveTransport transport(credentials);

    ApiRequest req = make_request(HttpMethod::GET, "issue/PROJ-1/transitions");
    EXPECT_EQ(transport.url_for(req), "https://example.atlassian.net/rest/api/3/issue/PROJ-1/transitions");

    req.version = ApiVersion::V2;
    EXPECT_EQ(transport.url_for(req), "https://example.atlassian.net/rest/api/2/issue/PROJ-1/transitions");
}

TEST(LiveTransportTest, ConnectionRefusedIsNetworkFailure) {
    Credentials credentials{"http://127.0.0.1:1", "me@example.com", "token"};
    LiveTransport transport(credentials);

    EXPECT_THROW(transport.send(make_request(HttpMethod::GET, "issue/PROJ-1")), NetworkError);
}

TEST(TransportFactoryTest, TestModeSelectsSimulation) {
    Config config;
    config.test_mode = true;

    auto transport = make_transport(config);
    EXPECT_NE(dynamic_cast<SimulationTransport*>(transport.get()), nullptr);
    EXPECT_NO_THROW(transport->send(make_request(HttpMethod::GET, "issue/PROJ-1")));
}

TEST(TransportFactoryTest, LiveByDefault) {
    Config config;

    auto transport = make_transport(config);
    EXPECT_NE(dynamic_cast<LiveTransport*>(transport.get()), nullptr);
    EXPECT_THROW(transport->send(make_request(HttpMethod::GET, "issue/PROJ-1")), MissingCredentialsError);
}
