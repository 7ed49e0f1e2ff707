// =================================================================
// src/DevSync/RemoteManager.cpp
// =================================================================
// Implementation for remote management.

#include "DevSync/RemoteManager.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <utility>

namespace DevSync {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

RemoteManager::RemoteManager(GitExecutor& git, std::string working_dir)
    : m_git(git), m_working_dir(std::move(working_dir)), m_validator(git, m_working_dir) {}

void RemoteManager::addRemote(const std::string& name, const std::string& url) {
    m_git.execute({"remote", "add", name, url}, m_working_dir);

    std::string actual;
    try {
        actual = trim(m_git.execute({"remote", "get-url", name}, m_working_dir));
    } catch (const SyncError&) {
        actual.clear();
    }
    if (actual != url) {
        throw SyncError::gitOperation("Failed to add remote '" + name + "' with URL '" + url + "'",
                                      "Check the remote configuration with 'git remote -v'");
    }
    LOG_INFO("Remote", "Added remote " + name + " -> " + url);
}

void RemoteManager::setRemoteUrl(const std::string& name, const std::string& url) {
    requireRemote(name);
    m_git.execute({"remote", "set-url", name, url}, m_working_dir);
    LOG_INFO("Remote", "Updated URL of remote " + name + " -> " + url);
}

void RemoteManager::removeRemote(const std::string& name) {
    requireRemote(name);
    m_git.execute({"remote", "remove", name}, m_working_dir);
    LOG_INFO("Remote", "Removed remote " + name);
}

void RemoteManager::fetchRemote(const std::string& name) {
    requireRemote(name);

    const std::vector<std::string> args = {"fetch", name};
    ProcessResult result = m_git.run(args, m_working_dir, m_git.longTimeout());
    if (result.succeeded()) {
        return;
    }

    const std::string details = GitExecutor::describeFailure(args, result);
    if (result.timed_out || isNetworkFailure(result.stderr_output)) {
        throw SyncError::network("Failed to fetch from remote '" + name + "'\n" + details,
                                 "Check your network connection and the upstream URL");
    }
    throw SyncError::gitOperation(details, "Verify that the upstream branch exists");
}

std::vector<Remote> RemoteManager::listRemotes() {
    return parseRemoteListing(m_git.execute({"remote", "-v"}, m_working_dir));
}

std::vector<Remote> RemoteManager::parseRemoteListing(const std::string& output) {
    std::vector<Remote> remotes;
    std::set<std::string> seen;
    std::istringstream stream(output);
    std::string line;

    // Each remote appears twice: "<name>\t<url> (fetch)" and "(push)"
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        Remote remote;
        if (!(fields >> remote.name >> remote.url)) {
            continue;
        }
        if (seen.insert(remote.name).second) {
            remotes.push_back(remote);
        }
    }
    return remotes;
}

bool RemoteManager::isNetworkFailure(const std::string& stderr_output) {
    static const char* const markers[] = {
        "could not resolve host",
        "connection refused",
        "connection timed out",
        "unable to access",
        "network is unreachable",
    };
    const std::string lowered = toLower(stderr_output);
    for (const char* marker : markers) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void RemoteManager::requireRemote(const std::string& name) const {
    if (!m_validator.checkExistingRemote(name)) {
        throw SyncError::repository("Remote '" + name + "' does not exist",
                                    "Run 'devcontainer-sync init' first");
    }
}

} // namespace DevSync
