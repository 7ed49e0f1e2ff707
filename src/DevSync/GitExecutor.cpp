// =================================================================
// src/DevSync/GitExecutor.cpp
// =================================================================
// Implementation for git command execution.

#include "DevSync/GitExecutor.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <stdexcept>

namespace DevSync {

namespace {

std::vector<std::string> withGit(const std::vector<std::string>& args) {
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back("git");
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

} // namespace

GitExecutor::GitExecutor(ProcessRunner& runner,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds long_timeout)
    : m_runner(runner), m_timeout(timeout), m_long_timeout(long_timeout) {}

std::string GitExecutor::execute(const std::vector<std::string>& args, const std::string& working_dir) {
    return execute(args, working_dir, m_timeout);
}

std::string GitExecutor::execute(const std::vector<std::string>& args, const std::string& working_dir,
                                 std::chrono::milliseconds timeout) {
    ProcessResult result = run(args, working_dir, timeout);
    if (!result.succeeded()) {
        throw SyncError::gitOperation(describeFailure(args, result),
                                      result.timed_out
                                          ? "Increase timeout_seconds or long_timeout_seconds in the configuration file"
                                          : "Check the git output above and the repository state");
    }
    return result.stdout_output;
}

bool GitExecutor::probe(const std::vector<std::string>& args, const std::string& working_dir) {
    return run(args, working_dir, m_timeout).succeeded();
}

ProcessResult GitExecutor::run(const std::vector<std::string>& args, const std::string& working_dir,
                               std::chrono::milliseconds timeout) {
    const auto command = withGit(args);
    ProcessResult result;
    try {
        result = m_runner.run(command, working_dir, timeout);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Git", std::string("Failed to launch git: ") + e.what());
        throw SyncError::gitOperation(std::string("Failed to execute git: ") + e.what(),
                                      "Make sure git is installed and available in PATH");
    }

    Logger::getInstance().logCommand(formatCommandLine(command), result.exit_code, result.duration_ms);
    if (result.timed_out) {
        LOG_WARNING("Git", "Command timed out: " + formatCommandLine(command));
    }
    return result;
}

std::string GitExecutor::describeFailure(const std::vector<std::string>& args, const ProcessResult& result) {
    const std::string command_line = formatCommandLine(withGit(args));
    if (result.timed_out) {
        return "Git command timed out: " + command_line;
    }
    return "Git command failed: " + command_line + "\nError: " + trimTrailing(result.stderr_output);
}

} // namespace DevSync
