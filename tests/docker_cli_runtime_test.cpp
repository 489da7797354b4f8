#include "sandcell/runtime/docker_cli_runtime.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>

using namespace sandcell::runtime;
namespace fs = std::filesystem;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

bool HasArg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

AdapterErrorKind KindOf(const std::function<void()>& call) {
    try {
        call();
    }
    catch (const ContainerRuntimeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ContainerRuntimeError";
    return AdapterErrorKind::EXEC_FAILED;
}

} // namespace

// ============================================================================
// Command construction and output interpretation
// ============================================================================

TEST(DockerCliArgsTest, CreateCarriesLimitsAndHardening) {
    ContainerSpec spec;
    spec.name = "sandcell_20250101_120000_4242";
    spec.image = "alpine:latest";
    spec.capabilities_add = {"SETUID"};
    spec.tmpfs["/tmp"] = "rw,size=64m,noexec";
    spec.labels["sandcell.managed"] = "true";

    auto args = DockerCliRuntime::BuildCreateArgs(spec);

    EXPECT_EQ(args.front(), "create");
    EXPECT_TRUE(HasPair(args, "--name", "sandcell_20250101_120000_4242"));
    EXPECT_TRUE(HasPair(args, "--memory", "512m"));
    EXPECT_TRUE(HasPair(args, "--memory-swap", "512m"));
    EXPECT_TRUE(HasPair(args, "--cpus", "0.5"));
    EXPECT_TRUE(HasPair(args, "--pids-limit", "100"));
    EXPECT_TRUE(HasPair(args, "--network", "none"));
    EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(HasPair(args, "--cap-add", "SETUID"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(HasPair(args, "--tmpfs", "/tmp:rw,size=64m,noexec"));
    EXPECT_TRUE(HasPair(args, "--label", "sandcell.managed=true"));
    EXPECT_TRUE(HasArg(args, "--read-only"));
    EXPECT_TRUE(HasArg(args, "--init"));

    // Image, then the keep-alive command, close the list
    std::vector<std::string> tail(args.end() - 4, args.end());
    EXPECT_EQ(tail, (std::vector<std::string>{"alpine:latest", "tail", "-f", "/dev/null"}));
}

TEST(DockerCliArgsTest, CreateOmitsDisabledOptions) {
    ContainerSpec spec;
    spec.image = "debian:bookworm-slim";
    spec.read_only_rootfs = false;
    spec.init_process = false;
    spec.network = "bridge";

    auto args = DockerCliRuntime::BuildCreateArgs(spec);

    EXPECT_FALSE(HasArg(args, "--read-only"));
    EXPECT_FALSE(HasArg(args, "--init"));
    EXPECT_FALSE(HasArg(args, "--name"));
    EXPECT_TRUE(HasPair(args, "--network", "bridge"));
}

TEST(DockerCliArgsTest, ExecIsInteractiveOnlyWithStdin) {
    ExecRequest request;
    request.command = {"/bin/sh", "-c", "echo ready"};
    request.user = "nobody";
    request.working_dir = "/tmp";
    request.env["HOME"] = "/tmp";

    auto args = DockerCliRuntime::BuildExecArgs("abc123", request);
    EXPECT_EQ(args, (std::vector<std::string>{"exec", "--user", "nobody", "--workdir", "/tmp",
                                              "--env", "HOME=/tmp", "abc123",
                                              "/bin/sh", "-c", "echo ready"}));

    request.stdin_data = "print(1)";
    args = DockerCliRuntime::BuildExecArgs("abc123", request);
    EXPECT_EQ(args[1], "--interactive");
}

TEST(DockerCliArgsTest, ClassifiesCliErrors) {
    EXPECT_EQ(DockerCliRuntime::ClassifyCliError(
                  "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. "
                  "Is the docker daemon running?"),
              AdapterErrorKind::ENGINE_UNAVAILABLE);
    EXPECT_EQ(DockerCliRuntime::ClassifyCliError(
                  "Error response from daemon: pull access denied for nosuch/image"),
              AdapterErrorKind::IMAGE_NOT_FOUND);
    EXPECT_EQ(DockerCliRuntime::ClassifyCliError("Error: No such image: nosuch:latest"),
              AdapterErrorKind::IMAGE_NOT_FOUND);
    EXPECT_FALSE(DockerCliRuntime::ClassifyCliError("Error response from daemon: Conflict.").has_value());
}

TEST(DockerCliArgsTest, TellsEngineDiagnosticsFromProgramOutput) {
    EXPECT_TRUE(DockerCliRuntime::IsEngineDiagnostic(
        "Error response from daemon: container abc is not running\n"));
    EXPECT_TRUE(DockerCliRuntime::IsEngineDiagnostic(
        "OCI runtime exec failed: exec failed: unable to start container process\n"));
    EXPECT_FALSE(DockerCliRuntime::IsEngineDiagnostic(
        "Traceback (most recent call last):\n  File \"main.py\", line 1\n"));
    EXPECT_FALSE(DockerCliRuntime::IsEngineDiagnostic(""));
}

TEST(DockerCliArgsTest, ParsesInspectState) {
    auto status = DockerCliRuntime::ParseInspectState(
        R"({"Status":"exited","Running":false,"OOMKilled":true,"ExitCode":137,"Pid":0})");
    EXPECT_TRUE(status.exists);
    EXPECT_FALSE(status.running);
    EXPECT_TRUE(status.oom_killed);
    EXPECT_EQ(status.exit_code, 137);
    EXPECT_EQ(status.status, "exited");
}

// ============================================================================
// Against a stand-in docker executable
// ============================================================================

class DockerCliRuntimeTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "sandcell-docker-XXXXXX").string();
        ASSERT_NE(::mkdtemp(pattern.data()), nullptr);
        dir_ = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Installs a fake `docker` that runs `body` and returns a runtime using it
    DockerCliRuntime FakeDocker(const std::string& body, const std::string& host = "") {
        fs::path script = dir_ / "docker";
        {
            std::ofstream out(script);
            out << "#!/bin/sh\n"
                << "printf '%s\\n' \"$@\" > '" << (dir_ / "args").string() << "'\n"
                << body << "\n";
        }
        fs::permissions(script, fs::perms::owner_all);

        DockerCliOptions options;
        options.binary = script.string();
        options.host = host;
        options.command_timeout = std::chrono::seconds(10);
        return DockerCliRuntime(options);
    }

    std::vector<std::string> LastArgs() const {
        std::ifstream in(dir_ / "args");
        std::vector<std::string> args;
        std::string line;
        while (std::getline(in, line)) {
            args.push_back(line);
        }
        return args;
    }
};

TEST_F(DockerCliRuntimeTest, PingReturnsServerVersion) {
    auto docker = FakeDocker("echo 24.0.7");
    EXPECT_EQ(docker.Ping(), "24.0.7");
    EXPECT_EQ(LastArgs(), (std::vector<std::string>{"version", "--format", "{{.Server.Version}}"}));
}

TEST_F(DockerCliRuntimeTest, HostIsPassedBeforeTheCommand) {
    auto docker = FakeDocker("echo 24.0.7", "tcp://10.0.0.5:2375");
    docker.Ping();
    auto args = LastArgs();
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[0], "--host");
    EXPECT_EQ(args[1], "tcp://10.0.0.5:2375");
    EXPECT_EQ(args[2], "version");
}

TEST_F(DockerCliRuntimeTest, UnreachableDaemonIsEngineUnavailable) {
    auto docker = FakeDocker(
        "echo 'Cannot connect to the Docker daemon at unix:///var/run/docker.sock. "
        "Is the docker daemon running?' >&2; exit 1");
    EXPECT_EQ(KindOf([&] { docker.Ping(); }), AdapterErrorKind::ENGINE_UNAVAILABLE);
    EXPECT_EQ(KindOf([&] { docker.ImageExists("alpine:latest"); }), AdapterErrorKind::ENGINE_UNAVAILABLE);
}

TEST_F(DockerCliRuntimeTest, MissingCliIsEngineUnavailable) {
    DockerCliOptions options;
    options.binary = (dir_ / "no-such-docker").string();
    DockerCliRuntime docker(options);
    EXPECT_EQ(KindOf([&] { docker.Ping(); }), AdapterErrorKind::ENGINE_UNAVAILABLE);
}

TEST_F(DockerCliRuntimeTest, ImageExistsIsFalseForUnknownImage) {
    auto docker = FakeDocker("echo 'Error: No such image: nosuch:latest' >&2; exit 1");
    EXPECT_FALSE(docker.ImageExists("nosuch:latest"));
}

TEST_F(DockerCliRuntimeTest, FailedPullIsImageNotFound) {
    auto docker = FakeDocker(
        "echo 'Error response from daemon: pull access denied for nosuch, repository does not exist' >&2; exit 1");
    EXPECT_EQ(KindOf([&] { docker.PullImage("nosuch"); }), AdapterErrorKind::IMAGE_NOT_FOUND);
}

TEST_F(DockerCliRuntimeTest, CreateReturnsLastLineAsId) {
    auto docker = FakeDocker("printf 'noise\\n3f4e5d6c7b8a9f00\\n'");
    ContainerSpec spec;
    spec.image = "alpine:latest";
    EXPECT_EQ(docker.CreateContainer(spec), "3f4e5d6c7b8a9f00");
    EXPECT_EQ(LastArgs().front(), "create");
}

TEST_F(DockerCliRuntimeTest, RejectedCreateIsContainerCreateFailed) {
    auto docker = FakeDocker(
        "echo 'Error response from daemon: Conflict. The container name is already in use' >&2; exit 1");
    ContainerSpec spec;
    spec.image = "alpine:latest";
    EXPECT_EQ(KindOf([&] { docker.CreateContainer(spec); }), AdapterErrorKind::CONTAINER_CREATE_FAILED);
}

TEST_F(DockerCliRuntimeTest, ExecPassesStdinAndKeepsStreamsApart) {
    auto docker = FakeDocker("cat; echo 'warning: something' >&2; exit 3");
    ExecRequest request;
    request.command = {"python3", "-"};
    request.stdin_data = "print('hi')";

    auto outcome = docker.Exec("abc123", request);
    EXPECT_EQ(outcome.stdout_output, "print('hi')");
    EXPECT_EQ(outcome.stderr_output, "warning: something\n");
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_FALSE(outcome.timed_out);
}

TEST_F(DockerCliRuntimeTest, ExecEngineErrorIsExecFailed) {
    auto docker = FakeDocker(
        "case \"$1\" in\n"
        "  inspect) echo '{\"Status\":\"exited\",\"Running\":false,\"ExitCode\":0}' ;;\n"
        "  *) echo 'Error response from daemon: container abc123 is not running' >&2; exit 1 ;;\n"
        "esac");
    ExecRequest request;
    request.command = {"true"};
    EXPECT_EQ(KindOf([&] { docker.Exec("abc123", request); }), AdapterErrorKind::EXEC_FAILED);
}

TEST_F(DockerCliRuntimeTest, ExecCannotStartCommandIsExecFailed) {
    auto docker = FakeDocker(
        "echo 'OCI runtime exec failed: exec failed: unable to start container process' >&2; exit 126");
    ExecRequest request;
    request.command = {"/missing/interpreter"};
    EXPECT_EQ(KindOf([&] { docker.Exec("abc123", request); }), AdapterErrorKind::EXEC_FAILED);
}

TEST_F(DockerCliRuntimeTest, ProgramPrintingDaemonLikeErrorIsNotAnEngineFailure) {
    auto docker = FakeDocker(
        "case \"$1\" in\n"
        "  inspect) echo '{\"Status\":\"running\",\"Running\":true,\"ExitCode\":0}' ;;\n"
        "  *) echo 'Error response from daemon: x' >&2; exit 1 ;;\n"
        "esac");
    ExecRequest request;
    request.command = {"python3", "-"};
    request.stdin_data = "import sys; sys.stderr.write('Error response from daemon: x\\n'); sys.exit(1)";

    ExecOutcome outcome;
    ASSERT_NO_THROW(outcome = docker.Exec("abc123", request));
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(outcome.stderr_output, "Error response from daemon: x\n");
    EXPECT_EQ(LastArgs().front(), "inspect");
}

TEST_F(DockerCliRuntimeTest, ExecTimeoutIsReportedNotThrown) {
    auto docker = FakeDocker("sleep 5");
    ExecRequest request;
    request.command = {"sleep", "5"};
    request.timeout = std::chrono::milliseconds(200);

    auto outcome = docker.Exec("abc123", request);
    EXPECT_TRUE(outcome.timed_out);
}

TEST_F(DockerCliRuntimeTest, InspectParsesRunningState) {
    auto docker = FakeDocker(R"(echo '{"Status":"running","Running":true,"OOMKilled":false,"ExitCode":0}')");
    auto status = docker.Inspect("abc123");
    EXPECT_TRUE(status.exists);
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.status, "running");
}

TEST_F(DockerCliRuntimeTest, InspectOfRemovedContainer) {
    auto docker = FakeDocker("echo 'Error: No such object: abc123' >&2; exit 1");
    auto status = docker.Inspect("abc123");
    EXPECT_FALSE(status.exists);
    EXPECT_FALSE(status.running);
}

TEST_F(DockerCliRuntimeTest, RemovingMissingContainerSucceeds) {
    auto docker = FakeDocker("echo 'Error: No such container: abc123' >&2; exit 1");
    EXPECT_NO_THROW(docker.RemoveContainer("abc123", true));
    EXPECT_NO_THROW(docker.StopContainer("abc123", std::chrono::seconds(1)));
}

TEST_F(DockerCliRuntimeTest, RemoveUsesForceFlag) {
    auto docker = FakeDocker("exit 0");
    docker.RemoveContainer("abc123", true);
    EXPECT_EQ(LastArgs(), (std::vector<std::string>{"rm", "--force", "abc123"}));
}

TEST_F(DockerCliRuntimeTest, RejectedRemoveIsRemoveFailed) {
    auto docker = FakeDocker(
        "echo 'Error response from daemon: removal of container abc123 is already in progress' >&2; exit 1");
    EXPECT_EQ(KindOf([&] { docker.RemoveContainer("abc123", true); }), AdapterErrorKind::REMOVE_FAILED);
}

TEST_F(DockerCliRuntimeTest, DisconnectNamesNetworkAndContainer) {
    auto docker = FakeDocker("exit 0");
    docker.DisconnectNetwork("abc123", "bridge");
    EXPECT_EQ(LastArgs(), (std::vector<std::string>{"network", "disconnect", "--force", "bridge", "abc123"}));
}
