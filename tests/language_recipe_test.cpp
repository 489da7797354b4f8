#include "sandcell/core/language_recipe.hpp"
#include "sandcell/utils/process_runner.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <string>
#include <thread>

using namespace sandcell::core;
using sandcell::utils::ProcessOptions;
using sandcell::utils::ProcessResult;
using sandcell::utils::RunProcess;
namespace fs = std::filesystem;

TEST(LanguageRecipeTest, ParsesNamesAndAliases) {
    EXPECT_EQ(ParseLanguage("python"), Language::PYTHON);
    EXPECT_EQ(ParseLanguage("Python3"), Language::PYTHON);
    EXPECT_EQ(ParseLanguage(" py "), Language::PYTHON);
    EXPECT_EQ(ParseLanguage("node"), Language::JAVASCRIPT);
    EXPECT_EQ(ParseLanguage("JS"), Language::JAVASCRIPT);
    EXPECT_EQ(ParseLanguage("sh"), Language::SHELL);
}

TEST(LanguageRecipeTest, RejectsUnknownNames) {
    EXPECT_FALSE(ParseLanguage("cobol").has_value());
    EXPECT_FALSE(ParseLanguage("").has_value());
}

TEST(LanguageRecipeTest, TableCoversEveryLanguage) {
    EXPECT_EQ(LanguageTable().size(), 3u);
    EXPECT_EQ(LanguageName(Language::PYTHON), "python");
    EXPECT_EQ(LanguageName(Language::JAVASCRIPT), "javascript");
    EXPECT_EQ(LanguageName(Language::SHELL), "shell");
}

TEST(LanguageRecipeTest, ShellCannotBeInstalled) {
    EXPECT_TRUE(CanBootstrap(GetRecipe(Language::PYTHON)));
    EXPECT_TRUE(CanBootstrap(GetRecipe(Language::JAVASCRIPT)));
    EXPECT_FALSE(CanBootstrap(GetRecipe(Language::SHELL)));
}

TEST(LanguageRecipeTest, ProbeListsCandidatesAfterScriptName) {
    const auto& python = GetRecipe(Language::PYTHON);
    auto command = BuildProbeCommand(python);

    ASSERT_EQ(command.size(), 4 + python.interpreter_candidates.size());
    EXPECT_EQ(command[0], "/bin/sh");
    EXPECT_EQ(command[1], "-c");
    EXPECT_EQ(command[3], "sandcell-probe");
    EXPECT_EQ(command[4], "/usr/bin/python3");
}

TEST(LanguageRecipeTest, BootstrapPassesPackageLists) {
    auto command = BuildBootstrapCommand(GetRecipe(Language::JAVASCRIPT));
    ASSERT_EQ(command.size(), 6u);
    EXPECT_EQ(command[3], "sandcell-bootstrap");
    EXPECT_EQ(command[4], "nodejs");
    EXPECT_EQ(command[5], "nodejs");
}

TEST(LanguageRecipeTest, VersionCommandIsEmptyForShell) {
    EXPECT_TRUE(BuildVersionCommand(GetRecipe(Language::SHELL), "/bin/sh").empty());
    EXPECT_EQ(BuildVersionCommand(GetRecipe(Language::PYTHON), "/usr/bin/python3"),
              (std::vector<std::string>{"/usr/bin/python3", "--version"}));
}

TEST(LanguageRecipeTest, RunCommandKeepsCodeOffTheCommandLine) {
    auto command = BuildRunCommand(GetRecipe(Language::PYTHON), "/usr/bin/python3",
                                   "/tmp/.sandcell-run-7");
    EXPECT_EQ(command, (std::vector<std::string>{"/bin/sh", "-c", command[2], "sandcell-run",
                                                 "/tmp/.sandcell-run-7", "main.py",
                                                 "/usr/bin/python3"}));
    EXPECT_NE(command[2].find("exit 125"), std::string::npos);
}

TEST(LanguageRecipeTest, KillCommandTargetsRunDirectory) {
    auto command = BuildKillCommand("/tmp/.sandcell-run-7");
    ASSERT_EQ(command.size(), 5u);
    EXPECT_EQ(command[3], "sandcell-kill");
    EXPECT_EQ(command[4], "/tmp/.sandcell-run-7");
    EXPECT_NE(command[2].find("kill -s KILL"), std::string::npos);
}

// ============================================================================
// Helper scripts under a real /bin/sh
// ============================================================================

class HelperScriptTest : public ::testing::Test {
protected:
    fs::path dir_;
    fs::path run_dir_;

    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "sandcell-helpers-XXXXXX").string();
        ASSERT_NE(::mkdtemp(pattern.data()), nullptr);
        dir_ = pattern;
        run_dir_ = dir_ / ".sandcell-run-1";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    ProcessResult RunShellCode(const std::string& code, int timeout_ms = 10000) {
        ProcessOptions options;
        options.stdin_data = code;
        options.timeout = std::chrono::milliseconds(timeout_ms);
        return RunProcess(BuildRunCommand(GetRecipe(Language::SHELL), "/bin/sh", run_dir_.string()),
                          options);
    }

    ProcessResult Kill() {
        ProcessOptions options;
        options.timeout = std::chrono::milliseconds(10000);
        return RunProcess(BuildKillCommand(run_dir_.string()), options);
    }

    bool WaitForFile(const fs::path& path) {
        for (int i = 0; i < 500; ++i) {
            if (fs::exists(path)) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

TEST_F(HelperScriptTest, RunSeparatesStreamsAndRemovesRunDirectory) {
    auto result = RunShellCode("echo out; echo err >&2; exit 3");

    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(fs::exists(run_dir_));
}

TEST_F(HelperScriptTest, RunStagesSourceAsFile) {
    auto result = RunShellCode("echo \"$0\"");
    EXPECT_EQ(result.stdout_output, (run_dir_ / "main.sh").string() + "\n");
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(HelperScriptTest, KillTerminatesLoopingProgram) {
    ProcessResult run;
    std::thread runner([&] { run = RunShellCode("while :; do :; done", 20000); });

    ASSERT_TRUE(WaitForFile(run_dir_ / "pid"));
    std::string pid;
    std::ifstream(run_dir_ / "pid") >> pid;

    auto kill = Kill();
    runner.join();

    EXPECT_EQ(kill.exit_code, 0) << kill.stderr_output;
    EXPECT_FALSE(run.timed_out);
    EXPECT_EQ(run.exit_code, 137);
    EXPECT_NE(::kill(std::stoi(pid), 0), 0);
}

TEST_F(HelperScriptTest, KillBeforeLaunchPreventsTheRun) {
    fs::path started = dir_ / "started";

    auto kill = Kill();
    EXPECT_EQ(kill.exit_code, 0) << kill.stderr_output;

    auto run = RunShellCode("touch '" + started.string() + "'");
    EXPECT_EQ(run.exit_code, 137);
    EXPECT_FALSE(fs::exists(started));
    EXPECT_FALSE(fs::exists(run_dir_));
}

TEST_F(HelperScriptTest, KillAfterRunFinishedSucceeds) {
    RunShellCode("exit 0");
    EXPECT_EQ(Kill().exit_code, 0);
}

TEST_F(HelperScriptTest, ProbeFindsShell) {
    auto result = RunProcess(BuildProbeCommand(GetRecipe(Language::SHELL)));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "/bin/sh\n");
}

TEST_F(HelperScriptTest, ProbeRejectsMissingCandidates) {
    LanguageRecipe recipe = GetRecipe(Language::PYTHON);
    recipe.interpreter_candidates = {"/nonexistent/python9", "sandcell-no-such-interpreter"};

    auto result = RunProcess(BuildProbeCommand(recipe));
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stdout_output, "");
}

TEST_F(HelperScriptTest, ProbeResolvesNamesThroughPath) {
    LanguageRecipe recipe = GetRecipe(Language::SHELL);
    recipe.interpreter_candidates = {"/nonexistent/sh", "sh"};

    auto result = RunProcess(BuildProbeCommand(recipe));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output.front(), '/');
}

TEST_F(HelperScriptTest, BootstrapWithoutPackagesReportsNoPackageManager) {
    auto result = RunProcess(BuildBootstrapCommand(GetRecipe(Language::SHELL)));
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_output.find("no supported package manager"), std::string::npos);
}
