// =================================================================
// src/DevSync/SubtreeManager.cpp
// =================================================================
// Implementation for subtree management.

#include "DevSync/SubtreeManager.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <filesystem>
#include <utility>

namespace DevSync {

SubtreeManager::SubtreeManager(GitExecutor& git, std::string working_dir)
    : m_git(git), m_working_dir(std::move(working_dir)) {}

void SubtreeManager::splitSubtree(const std::string& prefix, const std::string& new_branch) {
    m_git.execute({"subtree", "split", "--prefix=" + prefix, "-b", new_branch},
                  m_working_dir, m_git.longTimeout());
    LOG_INFO("Subtree", "Split " + prefix + " into " + new_branch);
}

void SubtreeManager::addSubtree(const std::string& prefix, const std::string& branch, bool squash) {
    std::vector<std::string> args = {"subtree", "add", "--prefix=" + prefix, branch};
    if (squash) {
        args.push_back("--squash");
    }
    args.push_back("-m");
    args.push_back("Add '" + prefix + "/' from branch '" + branch + "'");
    m_git.execute(args, m_working_dir, m_git.longTimeout());
    LOG_INFO("Subtree", "Added " + branch + " at " + prefix);
}

void SubtreeManager::updateSubtree(const std::string& prefix, const std::string& repository,
                                   const std::string& branch) {
    m_git.execute({"subtree", "pull", "--prefix=" + prefix, repository, branch, "--squash",
                   "-m", "Update '" + prefix + "/' from " + repository + " " + branch},
                  m_working_dir, m_git.longTimeout());
    LOG_INFO("Subtree", "Pulled " + repository + " " + branch + " into " + prefix);
}

void SubtreeManager::mergeSubtree(const std::string& prefix, const std::string& branch) {
    m_git.execute({"subtree", "merge", "--prefix=" + prefix, branch, "--squash",
                   "-m", "Merge '" + prefix + "/' from branch '" + branch + "'"},
                  m_working_dir, m_git.longTimeout());
    LOG_INFO("Subtree", "Merged " + branch + " into " + prefix);
}

bool SubtreeManager::removeSubtree(const std::string& prefix) {
    const std::filesystem::path target = std::filesystem::path(m_working_dir) / prefix;
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        LOG_DEBUG("Subtree", "Nothing to remove at " + target.string());
        return false;
    }

    std::filesystem::remove_all(target, ec);
    if (ec) {
        throw SyncError::fileSystem("Failed to remove " + target.string() + ": " + ec.message(),
                                    "Check the permissions of the directory");
    }

    // Untracked content under the prefix leaves nothing to stage
    m_git.execute({"rm", "-r", "-q", "--cached", "--ignore-unmatch", "--", prefix}, m_working_dir);
    LOG_INFO("Subtree", "Removed and staged deletion of " + prefix);
    return true;
}

} // namespace DevSync
