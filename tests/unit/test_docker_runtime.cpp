#include <gtest/gtest.h>
#include "docker_runtime.h"
#include <json/json.h>
#include <algorithm>
#include <sstream>

namespace runbox {
namespace {

class DockerRuntimeTest : public ::testing::Test {
protected:
    UnitSpec spec() {
        UnitSpec unit;
        unit.name = "runbox_exec_0123456789abcdef";
        unit.image = "python:3.11-slim";
        unit.command = {"python", "-u", "main.py"};
        unit.mounts = {
            {"/srv/ws/alice/code", "/code", true},
            {"/srv/ws/alice/data", "/data", true},
            {"/srv/ws/alice/output", "/output", false},
        };
        unit.env = {{"PYTHONUNBUFFERED", "1"}, {"HOME", "/tmp"}};
        unit.working_dir = "/code";
        unit.memory_limit_bytes = 128ULL * 1024 * 1024;
        unit.cpu_limit = 0.5;
        unit.pids_limit = 50;
        unit.cpu_time_backstop = std::chrono::seconds(11);
        return unit;
    }

    static bool has_pair(const std::vector<std::string>& args, const std::string& flag,
                         const std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); i++) {
            if (args[i] == flag && args[i + 1] == value) {
                return true;
            }
        }
        return false;
    }

    static bool has(const std::vector<std::string>& args, const std::string& value) {
        return std::find(args.begin(), args.end(), value) != args.end();
    }

    DockerRuntime runtime{"docker"};
};

// ============================================================================
// Create Arguments
// ============================================================================

TEST_F(DockerRuntimeTest, CreateArguments_ApplyHardening) {
    auto args = runtime.create_arguments(spec());
    ASSERT_TRUE(args);

    EXPECT_EQ(args->front(), "create");
    EXPECT_TRUE(has_pair(*args, "--name", "runbox_exec_0123456789abcdef"));
    EXPECT_TRUE(has_pair(*args, "--network", "none"));
    EXPECT_TRUE(has_pair(*args, "--cap-drop", "ALL"));
    EXPECT_TRUE(has_pair(*args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(has(*args, "--read-only"));
    EXPECT_TRUE(has_pair(*args, "--label", "runbox.managed=1"));
    EXPECT_TRUE(has_pair(*args, "--label", "runbox.owner=" + runtime.owner()));
}

TEST_F(DockerRuntimeTest, CreateArguments_ApplyLimits) {
    auto args = runtime.create_arguments(spec());
    ASSERT_TRUE(args);

    EXPECT_TRUE(has_pair(*args, "--memory", "134217728"));
    EXPECT_TRUE(has_pair(*args, "--memory-swap", "134217728")) << "No swap beyond the limit";
    EXPECT_TRUE(has_pair(*args, "--cpus", "0.5"));
    EXPECT_TRUE(has_pair(*args, "--pids-limit", "50"));
}

TEST_F(DockerRuntimeTest, CreateArguments_MountsAndCommand) {
    auto args = runtime.create_arguments(spec());
    ASSERT_TRUE(args);

    EXPECT_TRUE(has_pair(*args, "--mount",
                         "type=bind,source=/srv/ws/alice/code,target=/code,readonly"));
    EXPECT_TRUE(has_pair(*args, "--mount",
                         "type=bind,source=/srv/ws/alice/data,target=/data,readonly"));
    EXPECT_TRUE(has_pair(*args, "--mount",
                         "type=bind,source=/srv/ws/alice/output,target=/output"));
    EXPECT_TRUE(has_pair(*args, "-w", "/code"));
    EXPECT_TRUE(has_pair(*args, "-e", "PYTHONUNBUFFERED=1"));

    // Image followed by the command, last
    ASSERT_GE(args->size(), 4u);
    std::vector<std::string> tail(args->end() - 4, args->end());
    std::vector<std::string> expected = {"python:3.11-slim", "python", "-u", "main.py"};
    EXPECT_EQ(tail, expected);
}

TEST_F(DockerRuntimeTest, CreateArguments_RejectCommaInMountPath) {
    UnitSpec unit = spec();
    unit.mounts[0].host_path = "/srv/ws/a,b/code";

    auto args = runtime.create_arguments(unit);

    ASSERT_FALSE(args);
    EXPECT_EQ(args.error().kind, ErrorKind::Infrastructure);
}

// ============================================================================
// Image Builds
// ============================================================================

TEST_F(DockerRuntimeTest, RenderDockerfile_UsesExecForm) {
    std::string dockerfile = DockerRuntime::render_dockerfile(
        "python:3.11-slim", {"pip", "install", "numpy", "pandas==2.1"});

    std::istringstream lines(dockerfile);
    std::string from, run;
    std::getline(lines, from);
    std::getline(lines, run);
    EXPECT_EQ(from, "FROM python:3.11-slim");
    ASSERT_EQ(run.rfind("RUN ", 0), 0u);

    Json::Value argv;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream json(run.substr(4));
    ASSERT_TRUE(Json::parseFromStream(builder, json, &argv, &errors)) << errors;
    ASSERT_TRUE(argv.isArray());
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[0].asString(), "pip");
    EXPECT_EQ(argv[3].asString(), "pandas==2.1");
}

// ============================================================================
// Availability
// ============================================================================

TEST_F(DockerRuntimeTest, Available_FalseForMissingBinary) {
    DockerRuntime missing("/nonexistent/docker-binary");
    EXPECT_FALSE(missing.available());
    EXPECT_EQ(missing.name(), "docker");
}

} // namespace
} // namespace runbox
