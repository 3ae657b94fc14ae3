#include <filesystem>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "server/config.hpp"
#include "test/assertions.hpp"
#include "test/memory_assignment_store.hpp"
#include "test/mock_execution_service.hpp"
#include "worker.hpp"

using namespace std;
using namespace nlohmann;
using namespace gradeguard;
using namespace gradeguard::server;
using ::testing::_;
using ::testing::Return;

class WorkerTest : public ::testing::Test {
protected:
    mock::execution_service sandbox;
    mock::memory_assignment_store store;
    language_catalogue catalogue;
    code_validator validator;
    execution_orchestrator orchestrator{sandbox, catalogue};
    grade_aggregator aggregator{store};
    grading_service service{validator, orchestrator, aggregator, nullptr};
};

TEST_F(WorkerTest, EnvelopeWithoutIdIsDropped) {
    EXPECT_TRUE(process_envelope(service, R"({"caller": "alice", "type": "execute", "body": {}})"_json).is_null());
    EXPECT_TRUE(process_envelope(service, R"({"id": 42, "caller": "alice"})"_json).is_null());
    EXPECT_TRUE(process_envelope(service, json::array()).is_null());
}

TEST_F(WorkerTest, EnvelopeIsAnswered) {
    EXPECT_CALL(sandbox, execute(_)).WillOnce(Return(mock::run_success("5")));

    json response = process_envelope(service, R"js({
        "id": "req-1",
        "caller": "alice",
        "type": "execute",
        "body": {
            "code": "def add(a, b):\n    return a + b\n",
            "language": "python",
            "testCases": [{"input": "add(2, 3)", "expectedOutput": "5"}]
        }
    })js"_json);
    EXPECT_EQ(response.at("id"), "req-1");
    EXPECT_EQ(response.at("status"), 200);
    EXPECT_EQ(response.at("body").at("allPassed"), true);
}

TEST_F(WorkerTest, EnvelopeWithoutCallerIsUnauthorized) {
    EXPECT_CALL(sandbox, execute(_)).Times(0);
    json response = process_envelope(service, R"({"id": "req-2", "type": "submit", "body": {"assignmentId": "a1"}})"_json);
    EXPECT_EQ(response.at("id"), "req-2");
    EXPECT_EQ(response.at("status"), 403);
}

TEST(ConfigTest, LoadConfig) {
    auto path = filesystem::temp_directory_path() / "gradeguard-config-test.json";
    {
        ofstream fout(path);
        fout << R"({
            "redis": {"host": "redis.local", "port": 6380},
            "sandbox": {"url": "http://piston:2000", "languages": {"Python": {"language": "python", "version": "3.12.0"}}},
            "rateLimits": {"execute": 5, "dailyQuota": 0},
            "responseChannel": "gradeguard:responses"
        })";
    }

    service_config config = load_config(path.string());
    filesystem::remove(path);

    EXPECT_EQ(config.redis_config.host, "redis.local");
    EXPECT_EQ(config.redis_config.port, 6380);
    EXPECT_EQ(config.redis_config.retry_interval, 1000u);
    EXPECT_EQ(config.sandbox.url, "http://piston:2000");
    ASSERT_EQ(config.sandbox.runtimes.count(language::PYTHON), 1u);
    EXPECT_EQ(config.sandbox.runtimes.at(language::PYTHON).version, "3.12.0");
    EXPECT_EQ(config.rate_limits.execute, 5);
    EXPECT_EQ(config.rate_limits.submit, 10);
    EXPECT_EQ(config.rate_limits.daily_quota, 0);
    EXPECT_EQ(config.request_queue, "gradeguard:requests");
    EXPECT_EQ(config.response_channel, "gradeguard:responses");
}

TEST(ConfigTest, MissingOrMalformedConfig) {
    EXPECT_THROW(load_config("/nonexistent/gradeguard.json"), internal_error);

    auto path = filesystem::temp_directory_path() / "gradeguard-bad-config-test.json";
    {
        ofstream fout(path);
        fout << R"({"sandbox": {"languages": {"ruby": {"language": "ruby", "version": "3.0.1"}}}})";
    }
    EXPECT_THROW(load_config(path.string()), internal_error);
    filesystem::remove(path);
}
