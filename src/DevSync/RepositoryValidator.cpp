// =================================================================
// src/DevSync/RepositoryValidator.cpp
// =================================================================

#include "DevSync/RepositoryValidator.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <filesystem>
#include <utility>

namespace DevSync {

namespace {

std::string firstLine(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

} // namespace

RepositoryValidator::RepositoryValidator(GitExecutor& git, std::string working_dir)
    : m_git(git), m_working_dir(std::move(working_dir)) {}

void RepositoryValidator::validateGitRepository(const std::string& path) const {
    const std::string dir = path.empty() ? m_working_dir : path;
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(dir) / ".git", ec)) {
        LOG_DEBUG("Validator", "No .git entry in " + dir);
        throw SyncError::notGitRepository();
    }
    if (!m_git.probe({"rev-parse", "--git-dir"}, dir)) {
        throw SyncError::notGitRepository();
    }
}

void RepositoryValidator::validateHasCommits() const {
    if (!m_git.probe({"rev-parse", "HEAD"}, m_working_dir)) {
        throw SyncError::noCommitsFound();
    }
}

bool RepositoryValidator::checkExistingRemote(const std::string& name) const {
    return m_git.probe({"remote", "get-url", name}, m_working_dir);
}

bool RepositoryValidator::checkExistingBranch(const std::string& name) const {
    return m_git.probe({"show-ref", "--verify", "--quiet", "refs/heads/" + name}, m_working_dir);
}

std::string RepositoryValidator::currentBranch() const {
    std::string branch = firstLine(m_git.execute({"rev-parse", "--abbrev-ref", "HEAD"}, m_working_dir));
    if (branch.empty() || branch == "HEAD") {
        throw SyncError::repository("HEAD is detached; no branch is checked out",
                                    "Check out the branch the devcontainer should live on");
    }
    return branch;
}

bool RepositoryValidator::hasUncommittedChanges() const {
    const std::string status = m_git.execute({"status", "--porcelain", "--untracked-files=no"}, m_working_dir);
    return status.find_first_not_of(" \r\n\t") != std::string::npos;
}

bool RepositoryValidator::hasStagedChanges() const {
    return !m_git.probe({"diff", "--cached", "--quiet"}, m_working_dir);
}

} // namespace DevSync
