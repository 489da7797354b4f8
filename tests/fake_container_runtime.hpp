#pragma once

#include "sandcell/core/language_recipe.hpp"
#include "sandcell/runtime/container_runtime.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sandcell {
namespace test {

// Scripted in-memory engine. Understands the controller's helper commands
// (probe, bootstrap, version, smoke check, run, kill) and records every call.
class FakeContainerRuntime : public runtime::ContainerRuntime {
public:
    struct Call {
        std::string method;
        std::string container_id;
        runtime::ExecRequest request;
    };

    using RunHandler = std::function<runtime::ExecOutcome(const runtime::ExecRequest&)>;

    // Knobs; set before handing the fake to a controller
    bool engine_available = true;
    bool image_present = true;
    bool pull_succeeds = true;
    bool fail_start = false;
    bool start_throws_unexpected = false;  // std::runtime_error instead of an adapter error
    bool fail_disconnect = false;
    bool fail_stop = false;
    bool fail_remove = false;
    bool fail_kill = false;
    bool installable = true;
    bool running = true;
    std::map<core::Language, std::string> interpreters{
        {core::Language::PYTHON, "/usr/bin/python3"},
        {core::Language::SHELL, "/bin/sh"}};
    RunHandler run_handler;

    std::string Ping() override;
    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const runtime::ContainerSpec& spec) override;
    void StartContainer(const std::string& container_id) override;
    runtime::ExecOutcome Exec(const std::string& container_id, const runtime::ExecRequest& request) override;
    runtime::ContainerStatus Inspect(const std::string& container_id) override;
    void DisconnectNetwork(const std::string& container_id, const std::string& network) override;
    void StopContainer(const std::string& container_id, std::chrono::seconds grace) override;
    void RemoveContainer(const std::string& container_id, bool force) override;

    std::vector<Call> Calls() const;
    size_t CountCalls(const std::string& method) const;
    // Exec calls whose helper name ($0) matches, e.g. "sandcell-run"
    std::vector<runtime::ExecRequest> ExecsNamed(const std::string& name) const;
    std::vector<runtime::ContainerSpec> CreatedSpecs() const;
    std::vector<std::string> RemovedContainers() const;

    // Hold every run exec until ReleaseRuns()
    void BlockRuns();
    void WaitUntilRunStarted();
    void ReleaseRuns();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Call> calls_;
    std::vector<runtime::ContainerSpec> specs_;
    std::vector<std::string> removed_;
    int next_id_ = 1;
    bool block_runs_ = false;
    bool run_started_ = false;

    void Record(const std::string& method, const std::string& container_id,
                const runtime::ExecRequest& request = {});
    runtime::ExecOutcome RunHelper(const runtime::ExecRequest& request);
};

// Helper name of a controller command ("sandcell-run", ...), or "" if none
std::string HelperName(const runtime::ExecRequest& request);

} // namespace test
} // namespace sandcell
