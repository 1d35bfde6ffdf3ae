#include <gtest/gtest.h>
#include "config.h"
#include "constants.h"
#include <json/json.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace runbox {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("runbox_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    Json::Value parse(const std::string& text) {
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream stream(text);
        EXPECT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;
        return root;
    }

    std::string write_config(const std::string& text) {
        std::string path = (dir_ / "runbox.json").string();
        std::ofstream(path) << text;
        return path;
    }

    std::filesystem::path dir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigTest, EmptyDocument_KeepsDefaults) {
    EngineConfig config = parse_engine_config(parse("{}"));

    EXPECT_EQ(config.workspace_root, "./workspaces");
    EXPECT_EQ(config.runtime.kind, RuntimeKind::Docker);
    EXPECT_TRUE(config.runtime.strict_isolation);
    EXPECT_EQ(config.policy.default_timeout_seconds, DEFAULT_TIMEOUT_SECONDS);
    EXPECT_EQ(config.policy.max_timeout_seconds, MAX_TIMEOUT_SECONDS);
    EXPECT_EQ(config.policy.memory_limit_bytes, DEFAULT_MEMORY_LIMIT_BYTES);
    EXPECT_EQ(config.policy.grace_period.count(), DEFAULT_GRACE_PERIOD_MS);
    EXPECT_GT(config.languages.size(), 0u);
}

TEST_F(ConfigTest, NullSections_AreTreatedAsAbsent) {
    EngineConfig config = parse_engine_config(
        parse(R"({"runtime": null, "policy": null, "workspace_root": null})"));
    EXPECT_EQ(config.runtime.kind, RuntimeKind::Docker);
    EXPECT_EQ(config.workspace_root, "./workspaces");
}

TEST_F(ConfigTest, TopLevelMustBeObject) {
    EXPECT_THROW(parse_engine_config(parse("[1, 2]")), ConfigError);
}

// ============================================================================
// Runtime Section
// ============================================================================

TEST_F(ConfigTest, Runtime_AcceptsShortString) {
    EngineConfig config = parse_engine_config(parse(R"({"runtime": "local"})"));
    EXPECT_EQ(config.runtime.kind, RuntimeKind::Local);
}

TEST_F(ConfigTest, Runtime_AcceptsObject) {
    EngineConfig config = parse_engine_config(parse(R"({
        "runtime": {
            "kind": "local",
            "scratch_root": "/var/tmp/units",
            "strict_isolation": false
        }
    })"));
    EXPECT_EQ(config.runtime.kind, RuntimeKind::Local);
    EXPECT_EQ(config.runtime.scratch_root, "/var/tmp/units");
    EXPECT_FALSE(config.runtime.strict_isolation);
    EXPECT_EQ(config.runtime.docker_binary, "docker");
}

TEST_F(ConfigTest, Runtime_RejectsUnknownKind) {
    EXPECT_THROW(parse_engine_config(parse(R"({"runtime": "podman"})")), ConfigError);
    EXPECT_THROW(parse_engine_config(parse(R"({"runtime": 3})")), ConfigError);
    EXPECT_THROW(parse_engine_config(parse(R"({"runtime": {"strict_isolation": "yes"}})")),
                 ConfigError);
}

// ============================================================================
// Policy Section
// ============================================================================

TEST_F(ConfigTest, Policy_ReadsEveryField) {
    SecurityPolicy policy = parse_security_policy(parse(R"({
        "default_timeout_seconds": 5,
        "max_timeout_seconds": 20,
        "memory_limit_bytes": 134217728,
        "cpu_limit": 1.5,
        "pids_limit": 10,
        "grace_period_ms": 500,
        "max_output_bytes": 4096,
        "verification_tolerance": 0.01,
        "verification_auto_detect": false,
        "retained_executions": 8
    })"));

    EXPECT_EQ(policy.default_timeout_seconds, 5);
    EXPECT_EQ(policy.max_timeout_seconds, 20);
    EXPECT_EQ(policy.memory_limit_bytes, 134217728u);
    EXPECT_DOUBLE_EQ(policy.cpu_limit, 1.5);
    EXPECT_EQ(policy.pids_limit, 10);
    EXPECT_EQ(policy.grace_period.count(), 500);
    EXPECT_EQ(policy.max_output_bytes, 4096u);
    EXPECT_DOUBLE_EQ(policy.verification_tolerance, 0.01);
    EXPECT_FALSE(policy.verification_auto_detect);
    EXPECT_EQ(policy.retained_executions, 8u);
}

TEST_F(ConfigTest, Policy_RejectsWrongTypes) {
    EXPECT_THROW(parse_security_policy(parse(R"({"max_timeout_seconds": "60"})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"memory_limit_bytes": -1})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"cpu_limit": "half"})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"verification_auto_detect": 1})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse("[]")), ConfigError);
}

TEST_F(ConfigTest, Policy_RejectsOutOfRangeValues) {
    // Default above the ceiling
    EXPECT_THROW(parse_security_policy(
                     parse(R"({"default_timeout_seconds": 30, "max_timeout_seconds": 10})")),
                 ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"max_timeout_seconds": 0})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"memory_limit_bytes": 1024})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"cpu_limit": 0})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"pids_limit": 0})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"grace_period_ms": -1})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"max_output_bytes": 0})")), ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"verification_tolerance": -0.5})")),
                 ConfigError);
    EXPECT_THROW(parse_security_policy(parse(R"({"retained_executions": 0})")), ConfigError);
}

TEST_F(ConfigTest, ConfigError_MessageIsPrefixed) {
    try {
        parse_security_policy(parse(R"({"pids_limit": 0})"));
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("Configuration error: ", 0), 0u);
        EXPECT_NE(message.find("pids_limit"), std::string::npos);
    }
}

// ============================================================================
// Languages Section
// ============================================================================

TEST_F(ConfigTest, Languages_ReplaceBuiltinTable) {
    EngineConfig config = parse_engine_config(parse(R"({
        "languages": {
            "lua": {"image": "nickblah/lua:5.4", "file_ext": "lua", "cmd": ["lua", "{file}"]}
        }
    })"));

    EXPECT_EQ(config.languages.size(), 1u);
    EXPECT_TRUE(config.languages.resolve("lua"));
    EXPECT_FALSE(config.languages.resolve("python"));
}

TEST_F(ConfigTest, Languages_EmptyTableIsRejected) {
    EXPECT_THROW(parse_engine_config(parse(R"({"languages": {}})")), ConfigError);
}

// ============================================================================
// Loading From Disk
// ============================================================================

TEST_F(ConfigTest, Load_ReadsFile) {
    std::string path = write_config(R"({"workspace_root": "/srv/runbox", "runtime": "local"})");

    EngineConfig config = load_engine_config(path);

    EXPECT_EQ(config.workspace_root, "/srv/runbox");
    EXPECT_EQ(config.runtime.kind, RuntimeKind::Local);
}

TEST_F(ConfigTest, Load_MissingFileThrows) {
    EXPECT_THROW(load_engine_config((dir_ / "absent.json").string()), ConfigError);
}

TEST_F(ConfigTest, Load_MalformedJsonThrows) {
    std::string path = write_config("{\"runtime\": ");
    try {
        load_engine_config(path);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("failed to parse"), std::string::npos);
    }
}

TEST_F(ConfigTest, RuntimeKindNames) {
    EXPECT_STREQ(runtime_kind_to_string(RuntimeKind::Docker), "docker");
    EXPECT_STREQ(runtime_kind_to_string(RuntimeKind::Local), "local");
}

} // namespace
} // namespace runbox
