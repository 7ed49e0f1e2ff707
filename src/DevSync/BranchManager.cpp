// =================================================================
// src/DevSync/BranchManager.cpp
// =================================================================
// Implementation for branch management.

#include "DevSync/BranchManager.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <sstream>
#include <utility>

namespace DevSync {

BranchManager::BranchManager(GitExecutor& git, std::string working_dir)
    : m_git(git), m_working_dir(std::move(working_dir)), m_validator(git, m_working_dir) {}

void BranchManager::createBranch(const std::string& name, const std::string& source) {
    if (m_validator.checkExistingBranch(name)) {
        throw SyncError::repository("Branch '" + name + "' already exists",
                                    "Delete the branch or run 'devcontainer-sync remove' first");
    }
    m_git.execute({"branch", name, source}, m_working_dir);
    LOG_INFO("Branch", "Created " + name + " from " + source);
}

void BranchManager::forceCreateBranch(const std::string& name, const std::string& source) {
    m_git.execute({"branch", "-f", name, source}, m_working_dir);
    LOG_INFO("Branch", "Pointed " + name + " at " + source);
}

void BranchManager::checkoutBranch(const std::string& name) {
    m_git.execute({"checkout", name}, m_working_dir);
}

void BranchManager::deleteBranch(const std::string& name) {
    if (!m_validator.checkExistingBranch(name)) {
        throw SyncError::repository("Branch '" + name + "' does not exist",
                                    "Run 'devcontainer-sync init' first");
    }
    m_git.execute({"branch", "-D", name}, m_working_dir);
    LOG_INFO("Branch", "Deleted " + name);
}

void BranchManager::resetHard(const std::string& target) {
    m_git.execute({"reset", "--hard", target}, m_working_dir);
}

std::vector<Branch> BranchManager::listBranches() {
    return parseBranchListing(m_git.execute({"branch", "-vv"}, m_working_dir));
}

std::vector<Branch> BranchManager::parseBranchListing(const std::string& output) {
    std::vector<Branch> branches;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.size() < 3) {
            continue;
        }

        Branch branch;
        branch.is_current = line[0] == '*';

        // Two-column marker area, then "<name> <sha> [<upstream>: ...] subject"
        std::string rest = line.substr(2);
        size_t name_end = rest.find(' ');
        branch.name = rest.substr(0, name_end);
        if (branch.name.empty() || branch.name[0] == '(') {
            continue; // "(HEAD detached at ...)"
        }

        if (name_end != std::string::npos) {
            std::string tail = rest.substr(name_end);
            size_t sha_start = tail.find_first_not_of(' ');
            size_t sha_end = sha_start == std::string::npos ? std::string::npos : tail.find(' ', sha_start);
            if (sha_end != std::string::npos) {
                size_t after_sha = tail.find_first_not_of(' ', sha_end);
                if (after_sha != std::string::npos && tail[after_sha] == '[') {
                    size_t close = tail.find(']', after_sha);
                    if (close != std::string::npos) {
                        std::string annotation = tail.substr(after_sha + 1, close - after_sha - 1);
                        branch.upstream = annotation.substr(0, annotation.find(':'));
                    }
                }
            }
        }

        branches.push_back(branch);
    }
    return branches;
}

} // namespace DevSync
