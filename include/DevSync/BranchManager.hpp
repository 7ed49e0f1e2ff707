// =================================================================
// include/DevSync/BranchManager.hpp
// =================================================================
// Local branch operations used by the sync workflows.

#pragma once

#include "DevSync/GitExecutor.hpp"
#include "DevSync/RepositoryValidator.hpp"
#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief A local branch as listed by `git branch -vv`
 */
struct Branch {
    std::string name;
    bool is_current = false;
    std::string upstream;   ///< Empty when no tracking information is shown
};

class BranchManager {
public:
    BranchManager(GitExecutor& git, std::string working_dir);

    /**
     * @brief Creates a branch from source. Throws if the branch already exists.
     */
    void createBranch(const std::string& name, const std::string& source);

    /**
     * @brief Creates or moves a branch to source (`git branch -f`).
     */
    void forceCreateBranch(const std::string& name, const std::string& source);

    void checkoutBranch(const std::string& name);

    /**
     * @brief Force-deletes a branch. Throws if the branch does not exist.
     */
    void deleteBranch(const std::string& name);

    /**
     * @brief Resets the checked-out branch and working tree to target.
     */
    void resetHard(const std::string& target);

    std::vector<Branch> listBranches();

    static std::vector<Branch> parseBranchListing(const std::string& output);

private:
    GitExecutor& m_git;
    std::string m_working_dir;
    RepositoryValidator m_validator;
};

} // namespace DevSync
