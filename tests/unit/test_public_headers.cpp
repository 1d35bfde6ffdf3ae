#include <gtest/gtest.h>
#include "config.h"
#include "engine.h"
#include "execution_types.h"
#include "language_registry.h"
#include "result.h"
#include "workspace_store.h"
#include <json/json.h>

// Built with only include/ on the path, so an internal header pulled in by a
// public one fails here first.

namespace runbox {
namespace {

class PublicHeadersTest : public ::testing::Test {};

TEST_F(PublicHeadersTest, PolicyDefaultsComeFromTheLibrary) {
    SecurityPolicy policy;

    EXPECT_EQ(policy.default_timeout_seconds, 10);
    EXPECT_EQ(policy.max_timeout_seconds, 60);
    EXPECT_EQ(policy.memory_limit_bytes, 256ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(policy.cpu_limit, 0.5);
    EXPECT_EQ(policy.pids_limit, 50);
    EXPECT_EQ(policy.grace_period.count(), 2000);
    EXPECT_EQ(policy.max_output_bytes, 1024u * 1024u);
    EXPECT_TRUE(policy.verification_auto_detect);
    EXPECT_NO_THROW(policy.validate());
}

TEST_F(PublicHeadersTest, ConfigParsesThroughPublicApi) {
    Json::Value root(Json::objectValue);
    root["runtime"] = "local";
    root["policy"]["max_timeout_seconds"] = 30;

    EngineConfig config = parse_engine_config(root);

    EXPECT_EQ(config.runtime.kind, RuntimeKind::Local);
    EXPECT_EQ(config.policy.max_timeout_seconds, 30);
    EXPECT_TRUE(config.languages.contains("python"));
}

} // namespace
} // namespace runbox
