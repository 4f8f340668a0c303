/// @file test_dispatcher.cpp
/// Unit tests for dispatcher.hpp — per-project update loop, classification,
/// rate-limit retry and summary counts.

#include "dispatcher.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace snyk_freq;
using snyk_freq::testing_support::FakeTransport;
using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {

Project makeProject(const std::string& id, const std::string& name = "") {
    Project p;
    p.id   = id;
    p.name = name.empty() ? "proj-" + id : name;
    return p;
}

std::string patchedId(const HttpRequest& req) {
    return json::parse(req.body)["data"]["id"].get<std::string>();
}

class DispatcherTest : public ::testing::Test {
protected:
    FakeTransport             transport;
    std::vector<milliseconds> sleeps;
    SnykClient                client{transport, ApiSettings{}, "tok"};
    RequestPacer              pacer{milliseconds(50), milliseconds(10000),
                                    [this](milliseconds d) { sleeps.push_back(d); }};

    std::size_t rateLimitSleeps() const {
        std::size_t n = 0;
        for (const auto& d : sleeps) {
            if (d == milliseconds(10000)) ++n;
        }
        return n;
    }
};

} // namespace

// ============================================================================
// classifyStatus
// ============================================================================

TEST(ClassifyStatus, OkIsSuccess) {
    EXPECT_EQ(UpdateDispatcher::classifyStatus(200), UpdateOutcome::Success);
}

TEST(ClassifyStatus, TooManyRequestsIsRateLimited) {
    EXPECT_EQ(UpdateDispatcher::classifyStatus(429), UpdateOutcome::RateLimited);
}

TEST(ClassifyStatus, EverythingElseFails) {
    for (unsigned int status : {0u, 201u, 204u, 301u, 400u, 401u, 403u, 404u,
                                409u, 422u, 500u, 502u, 503u}) {
        EXPECT_EQ(UpdateDispatcher::classifyStatus(status), UpdateOutcome::Failed)
            << "status " << status;
    }
}

// ============================================================================
// Basic runs
// ============================================================================

TEST_F(DispatcherTest, TwoProjectsBothSucceed) {
    transport.enqueue(200);
    transport.enqueue(200);
    UpdateDispatcher dispatcher(client, pacer);

    auto summary = dispatcher.updateAll({makeProject("a"), makeProject("b")},
                                        "org-1", Frequency::Weekly);

    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(patchedId(transport.requests[0]), "a");
    EXPECT_EQ(patchedId(transport.requests[1]), "b");
    EXPECT_EQ(json::parse(transport.requests[0].body)["data"]["attributes"]["test_frequency"],
              "weekly");

    EXPECT_EQ(summary.updated, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.fetched, 2u);
    EXPECT_EQ(summary.rateLimitRetries, 0u);
}

TEST_F(DispatcherTest, ProjectWithoutIdFailsWithoutRequest) {
    UpdateDispatcher dispatcher(client, pacer);

    auto summary = dispatcher.updateAll({Project{}}, "org-1", Frequency::Weekly);

    EXPECT_TRUE(transport.requests.empty());
    EXPECT_EQ(summary.updated, 0u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.total, 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(DispatcherTest, EmptyInputGivesZeroSummary) {
    UpdateDispatcher dispatcher(client, pacer);

    auto summary = dispatcher.updateAll({}, "org-1", Frequency::Never);

    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(summary.updated + summary.failed, 0u);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(DispatcherTest, FailuresAreIsolatedAndCountsAddUp) {
    transport.enqueue(200);
    transport.enqueue(404, R"({"errors":[{"detail":"Project not found"}]})");
    transport.enqueueNetworkError("connection reset");
    transport.enqueue(500, "boom");
    transport.enqueue(200);
    UpdateDispatcher dispatcher(client, pacer);

    std::vector<Project> projects = {
        makeProject("a"), makeProject("b"), Project{}, makeProject("c"),
        makeProject("d"), makeProject("e")
    };
    auto summary = dispatcher.updateAll(projects, "org-1", Frequency::Daily);

    EXPECT_EQ(transport.requests.size(), 5u);
    EXPECT_EQ(summary.updated, 2u);
    EXPECT_EQ(summary.failed, 4u);
    EXPECT_EQ(summary.total, projects.size());
    EXPECT_EQ(summary.updated + summary.failed, summary.total);
}

TEST_F(DispatcherTest, ShortPauseBetweenRequestsOnly) {
    transport.enqueue(200);
    transport.enqueue(500);
    transport.enqueue(200);
    UpdateDispatcher dispatcher(client, pacer);

    dispatcher.updateAll({makeProject("a"), makeProject("b"), makeProject("c")},
                         "org-1", Frequency::Weekly);

    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], milliseconds(50));
    EXPECT_EQ(sleeps[1], milliseconds(50));
}

// ============================================================================
// Rate limiting
// ============================================================================

TEST_F(DispatcherTest, RateLimitedOnceThenSuccess) {
    transport.enqueue(429);
    transport.enqueue(200);
    UpdateDispatcher dispatcher(client, pacer);

    auto summary = dispatcher.updateAll({makeProject("a")}, "org-1", Frequency::Weekly);

    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(patchedId(transport.requests[0]), "a");
    EXPECT_EQ(patchedId(transport.requests[1]), "a");
    EXPECT_EQ(rateLimitSleeps(), 1u);
    EXPECT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(summary.updated, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.total, 1u);
    EXPECT_EQ(summary.rateLimitRetries, 1u);
}

TEST_F(DispatcherTest, RateLimitNeverChangesCountersUntilResolved) {
    transport.enqueue(200);           // a
    transport.enqueue(429);           // b
    transport.enqueue(429);           // b
    transport.enqueue(429);           // b
    transport.enqueue(403);           // b -> failed
    transport.enqueue(200);           // c
    UpdateDispatcher dispatcher(client, pacer);

    std::vector<UpdateDispatcher::Progress> events;
    dispatcher.setProgressCallback([&](const UpdateDispatcher::Progress& p) {
        events.push_back(p);
    });

    // Progress::project points into this vector.
    const std::vector<Project> projects = {makeProject("a"), makeProject("b"), makeProject("c")};
    auto summary = dispatcher.updateAll(projects, "org-1", Frequency::Never);

    EXPECT_EQ(summary.updated, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.rateLimitRetries, 3u);
    EXPECT_EQ(rateLimitSleeps(), 3u);

    // a:success, b:3x rate-limited, b:failed, c:success
    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(events[0].outcome, UpdateOutcome::Success);
    for (int i = 1; i <= 3; ++i) {
        EXPECT_EQ(events[i].outcome, UpdateOutcome::RateLimited);
        EXPECT_EQ(events[i].project->id, "b");
        EXPECT_EQ(events[i].attempt, i);
    }
    EXPECT_EQ(events[4].outcome, UpdateOutcome::Failed);
    EXPECT_EQ(events[4].httpStatus, 403u);
    EXPECT_EQ(events[4].attempt, 4);
    EXPECT_EQ(events[5].outcome, UpdateOutcome::Success);
    EXPECT_EQ(events[5].index, 2u);
}

TEST_F(DispatcherTest, NoShortPauseStackedOnRateLimitPause) {
    transport.enqueue(200);   // a
    transport.enqueue(429);   // b
    transport.enqueue(200);   // b
    UpdateDispatcher dispatcher(client, pacer);

    dispatcher.updateAll({makeProject("a"), makeProject("b")}, "org-1", Frequency::Weekly);

    // short pause before b, long pause before b's retry
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], milliseconds(50));
    EXPECT_EQ(sleeps[1], milliseconds(10000));
}

TEST_F(DispatcherTest, RetryCapTurnsSustainedRateLimitIntoFailure) {
    transport.enqueue(429);
    transport.enqueue(429);
    transport.enqueue(429);
    transport.enqueue(200);   // next project
    UpdateDispatcher dispatcher(client, pacer, /*maxRateLimitRetries=*/2);

    auto summary = dispatcher.updateAll({makeProject("a"), makeProject("b")},
                                        "org-1", Frequency::Weekly);

    ASSERT_EQ(transport.requests.size(), 4u);
    EXPECT_EQ(patchedId(transport.requests[3]), "b");
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.updated, 1u);
    EXPECT_EQ(summary.rateLimitRetries, 2u);
    EXPECT_EQ(rateLimitSleeps(), 2u);
}

TEST_F(DispatcherTest, UncappedRetryKeepsGoing) {
    for (int i = 0; i < 25; ++i) transport.enqueue(429);
    transport.enqueue(200);
    UpdateDispatcher dispatcher(client, pacer);

    auto summary = dispatcher.updateAll({makeProject("a")}, "org-1", Frequency::Weekly);

    EXPECT_EQ(transport.requests.size(), 26u);
    EXPECT_EQ(summary.updated, 1u);
    EXPECT_EQ(summary.rateLimitRetries, 25u);
    EXPECT_EQ(transport.pending(), 0u);
}

// ============================================================================
// Progress reporting
// ============================================================================

TEST_F(DispatcherTest, ProgressReportsMissingIdAndFailureMessage) {
    transport.enqueue(422, R"({"errors":[{"detail":"daily not allowed for sast"}]})");
    UpdateDispatcher dispatcher(client, pacer);

    std::vector<UpdateDispatcher::Progress> events;
    dispatcher.setProgressCallback([&](const UpdateDispatcher::Progress& p) {
        events.push_back(p);
    });

    dispatcher.updateAll({Project{}, makeProject("s")}, "org-1", Frequency::Daily);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].outcome, UpdateOutcome::Failed);
    EXPECT_EQ(events[0].attempt, 0);
    EXPECT_EQ(events[0].total, 2u);
    EXPECT_EQ(events[1].outcome, UpdateOutcome::Failed);
    EXPECT_EQ(events[1].httpStatus, 422u);
    EXPECT_NE(events[1].message.find("daily not allowed"), std::string::npos);
}
