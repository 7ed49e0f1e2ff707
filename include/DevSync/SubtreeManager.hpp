// =================================================================
// include/DevSync/SubtreeManager.hpp
// =================================================================
// Wraps the git-subtree commands for the synchronized prefix.

#pragma once

#include "DevSync/GitExecutor.hpp"
#include <string>

namespace DevSync {

class SubtreeManager {
public:
    SubtreeManager(GitExecutor& git, std::string working_dir);

    /**
     * @brief Extracts the history of prefix into new_branch
     *        (`git subtree split --prefix=<prefix> -b <new_branch>`).
     */
    void splitSubtree(const std::string& prefix, const std::string& new_branch);

    /**
     * @brief Adds branch as a subtree at prefix, optionally squashed.
     */
    void addSubtree(const std::string& prefix, const std::string& branch, bool squash = true);

    /**
     * @brief Pulls branch of repository into an existing prefix (squashed).
     */
    void updateSubtree(const std::string& prefix, const std::string& repository, const std::string& branch);

    /**
     * @brief Merges a local branch into an existing prefix (squashed).
     */
    void mergeSubtree(const std::string& prefix, const std::string& branch);

    /**
     * @brief Deletes prefix from the working tree and stages the deletion.
     * @return False when the prefix did not exist; nothing is staged then.
     *
     * The caller is responsible for committing.
     */
    bool removeSubtree(const std::string& prefix);

private:
    GitExecutor& m_git;
    std::string m_working_dir;
};

} // namespace DevSync
