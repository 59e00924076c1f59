#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/docker_runtime.hpp"

namespace runbox::runtime {
namespace {

using ::testing::ElementsAre;

TEST(DockerRuntimeTest, CreateArgsCarryLimitsAndMounts) {
    CreateOptions options{};
    options.image = "python:3.13-slim";
    options.command = {"sh", "-c", "python 'main.py'"};
    options.mounts.push_back(Mount{"/tmp/runbox-1", "/code", true});
    options.working_dir = "/code";

    EXPECT_THAT(DockerRuntime::BuildCreateArgs(options),
                ElementsAre("run", "-d", "--label", "runbox.managed=true",
                            "--cpu-quota", "50000", "--cpu-period", "100000", "--memory", "128m",
                            "--network", "none",
                            "-v", "/tmp/runbox-1:/code:ro",
                            "-w", "/code",
                            "python:3.13-slim", "sh", "-c", "python 'main.py'"));
}

TEST(DockerRuntimeTest, NetworkedSandboxOmitsNetworkFlag) {
    CreateOptions options{};
    options.image = "python:3.13-slim";
    options.limits.network_disabled = false;
    options.limits.memory = "256m";

    EXPECT_THAT(DockerRuntime::BuildCreateArgs(options),
                ElementsAre("run", "-d", "--label", "runbox.managed=true",
                            "--cpu-quota", "50000", "--cpu-period", "100000", "--memory", "256m",
                            "python:3.13-slim"));
}

TEST(DockerRuntimeTest, ParsesContainerStates) {
    EXPECT_EQ(ParseSandboxState("running"), SandboxState::kRunning);
    EXPECT_EQ(ParseSandboxState("exited"), SandboxState::kExited);
    EXPECT_EQ(ParseSandboxState("created"), SandboxState::kCreated);
    EXPECT_EQ(ParseSandboxState("removing"), SandboxState::kUnknown);
    EXPECT_STREQ(ToString(SandboxState::kDead), "dead");
}

TEST(DockerRuntimeTest, MissingBinaryIsRuntimeError) {
    config::RuntimeConfig config{};
    config.docker_binary = "runbox-no-such-docker-binary";
    DockerRuntime runtime(config);
    EXPECT_THROW(runtime.Status(SandboxHandle{"c1"}), RuntimeError);
}

}  // namespace
}  // namespace runbox::runtime
