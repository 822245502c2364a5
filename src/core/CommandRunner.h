#pragma once
#include "CommandResult.h"
#include <chrono>
#include <sys/types.h>
#include <string>
#include <vector>

namespace host_audit {

struct RunOptions {
    bool suppress_error_output = false; // failures are an expected outcome for this call
    std::chrono::milliseconds timeout{0}; // 0 = runner default
};

// Single entry point for best-effort external probes. run() never throws;
// callers only ever see a CommandResult.
class CommandRunner {
public:
    explicit CommandRunner(std::chrono::milliseconds default_timeout = std::chrono::seconds(10))
        : default_timeout_(default_timeout) {}
    virtual ~CommandRunner() = default;

    CommandResult run(const std::vector<std::string>& argv, const RunOptions& opts = RunOptions());
protected:
    virtual CommandResult execute(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
private:
    std::chrono::milliseconds default_timeout_;
};

// Human readable one-line description of a failure for the diagnostic channel.
std::string describe(const CommandFailure& failure);

// Owns a forked child until it has been reaped. Destruction kills the
// child's process group and waits for it, so no exit path leaks a process.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid): pid_(pid) {}
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;
    ~ChildGuard(){ kill_and_reap(); }

    void kill_and_reap();
    void release(){ pid_ = -1; } // already reaped by the owner
    pid_t pid() const { return pid_; }
private:
    pid_t pid_;
};

// fork/execvp runner: no shell, stdout/stderr captured through pipes,
// child placed in its own process group and killed with it on timeout.
class ProcessCommandRunner : public CommandRunner {
public:
    using CommandRunner::CommandRunner;
    static constexpr size_t kMaxCapture = 1 * 1024 * 1024;
protected:
    CommandResult execute(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
};

}
