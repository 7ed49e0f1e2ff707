// =================================================================
// include/DevSync/GitExecutor.hpp
// =================================================================
// Runs git porcelain commands through a ProcessRunner and turns failures
// into SyncError exceptions.

#pragma once

#include "DevSync/ProcessRunner.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace DevSync {

class GitExecutor {
public:
    /**
     * @brief Constructs an executor bound to a process runner.
     * @param runner Runner used for every invocation; must outlive the executor.
     * @param timeout Limit applied to ordinary local commands.
     * @param long_timeout Limit for network and subtree commands.
     */
    GitExecutor(ProcessRunner& runner,
                std::chrono::milliseconds timeout = std::chrono::seconds(30),
                std::chrono::milliseconds long_timeout = std::chrono::seconds(600));

    /**
     * @brief Runs `git <args>` in working_dir with the default timeout.
     * @return Captured stdout. Throws SyncError (git operation) on a non-zero
     *         exit, a timeout or a launch failure.
     */
    std::string execute(const std::vector<std::string>& args, const std::string& working_dir);

    /**
     * @brief Same as above with an explicit timeout.
     */
    std::string execute(const std::vector<std::string>& args, const std::string& working_dir,
                        std::chrono::milliseconds timeout);

    /**
     * @brief Runs `git <args>` and reports only whether it exited zero.
     *
     * Only a failure to launch git at all is an error.
     */
    bool probe(const std::vector<std::string>& args, const std::string& working_dir);

    /**
     * @brief Runs `git <args>` and returns the raw result without interpreting
     *        the exit status. Used where stderr has to be classified.
     */
    ProcessResult run(const std::vector<std::string>& args, const std::string& working_dir,
                      std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout() const { return m_timeout; }
    std::chrono::milliseconds longTimeout() const { return m_long_timeout; }

    /**
     * @brief Builds the error thrown for a failed invocation
     */
    static std::string describeFailure(const std::vector<std::string>& args, const ProcessResult& result);

private:
    ProcessRunner& m_runner;
    std::chrono::milliseconds m_timeout;
    std::chrono::milliseconds m_long_timeout;
};

} // namespace DevSync
