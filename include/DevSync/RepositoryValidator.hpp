// =================================================================
// include/DevSync/RepositoryValidator.hpp
// =================================================================
// Precondition checks run before any workflow touches the repository.

#pragma once

#include "DevSync/GitExecutor.hpp"
#include <string>

namespace DevSync {

class RepositoryValidator {
public:
    RepositoryValidator(GitExecutor& git, std::string working_dir);

    /**
     * @brief Fails unless <path>/.git exists and git recognises the directory.
     * @param path Directory to check; empty means the working directory.
     */
    void validateGitRepository(const std::string& path = "") const;

    /**
     * @brief Fails if HEAD does not resolve to a commit.
     */
    void validateHasCommits() const;

    bool checkExistingRemote(const std::string& name) const;
    bool checkExistingBranch(const std::string& name) const;

    /**
     * @brief Name of the checked-out branch. Throws on a detached HEAD.
     */
    std::string currentBranch() const;

    /**
     * @brief True if tracked files have staged or unstaged modifications
     */
    bool hasUncommittedChanges() const;

    bool hasStagedChanges() const;

private:
    GitExecutor& m_git;
    std::string m_working_dir;
};

} // namespace DevSync
