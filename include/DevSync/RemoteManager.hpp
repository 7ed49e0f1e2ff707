// =================================================================
// include/DevSync/RemoteManager.hpp
// =================================================================
// Add, remove, fetch and list git remotes.

#pragma once

#include "DevSync/GitExecutor.hpp"
#include "DevSync/RepositoryValidator.hpp"
#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief A configured remote; names are unique within a repository
 */
struct Remote {
    std::string name;
    std::string url;
};

class RemoteManager {
public:
    RemoteManager(GitExecutor& git, std::string working_dir);

    /**
     * @brief Adds a remote and verifies that git reports the expected URL.
     */
    void addRemote(const std::string& name, const std::string& url);

    /**
     * @brief Points an existing remote at a new URL.
     */
    void setRemoteUrl(const std::string& name, const std::string& url);

    /**
     * @brief Removes a remote. Throws if it does not exist.
     */
    void removeRemote(const std::string& name);

    /**
     * @brief Fetches a remote. Connectivity failures are reported as network
     *        errors, everything else as git-operation errors.
     */
    void fetchRemote(const std::string& name);

    std::vector<Remote> listRemotes();

    /**
     * @brief Parses `git remote -v` output, keeping the first entry per name.
     */
    static std::vector<Remote> parseRemoteListing(const std::string& output);

    /**
     * @brief True if git's stderr points at a connectivity problem
     */
    static bool isNetworkFailure(const std::string& stderr_output);

private:
    GitExecutor& m_git;
    std::string m_working_dir;
    RepositoryValidator m_validator;

    void requireRemote(const std::string& name) const;
};

} // namespace DevSync
