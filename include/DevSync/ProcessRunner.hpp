// =================================================================
// include/DevSync/ProcessRunner.hpp
// =================================================================
// Defines the seam for running external processes. One real implementation
// exists; tests provide scripted fakes.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief Outcome of one finished (or killed) process
 */
struct ProcessResult {
    int exit_code = -1;          ///< Exit status, -1 if terminated by a signal
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;      ///< True if the process was killed on timeout
    long duration_ms = 0;

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a program to completion, blocking the caller.
     * @param args Program name followed by its arguments (no shell involved).
     * @param working_dir Directory the process starts in; empty keeps ours.
     * @param timeout Upper bound on run time; zero or negative means none.
     * @return Captured output and exit status. Throws std::runtime_error if
     *         the process could not be started at all.
     */
    virtual ProcessResult run(const std::vector<std::string>& args,
                              const std::string& working_dir,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief fork/exec implementation with separate stdout/stderr pipes
 *
 * The child runs in its own process group so that a timeout terminates the
 * whole tree (git-subtree is a shell script that spawns further git
 * processes). SIGTERM is sent first, SIGKILL after a short grace period.
 */
class SystemProcessRunner : public ProcessRunner {
public:
    explicit SystemProcessRunner(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(2000));

    ProcessResult run(const std::vector<std::string>& args,
                      const std::string& working_dir,
                      std::chrono::milliseconds timeout) override;

private:
    std::chrono::milliseconds m_kill_grace;
};

/**
 * @brief Renders an argument vector the way a user would type it
 */
std::string formatCommandLine(const std::vector<std::string>& args);

/**
 * @brief Milliseconds argument for poll(2): remaining time clamped to [0, INT_MAX]
 */
int pollTimeout(std::chrono::milliseconds remaining);

} // namespace DevSync
