// =================================================================
// include/DevSync/DevcontainerCustomizer.hpp
// =================================================================
// Removes the firewall feature from a synchronized .devcontainer directory
// and commits the result.

#pragma once

#include "DevSync/GitExecutor.hpp"
#include "DevSync/SysInteraction.hpp"
#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief Accumulated outcome of a customization pass
 *
 * Each stripping routine produces its own partial result; the customizer
 * merges them. Paths are relative to the repository root.
 */
struct FirewallRemovalResult {
    std::vector<std::string> files_modified;
    std::vector<std::string> files_removed;
    std::vector<std::string> dockerfile_changes;
    std::vector<std::string> json_changes;
    std::vector<std::string> warnings;
    std::vector<std::string> patterns_not_found;

    bool hasChanges() const { return !files_modified.empty() || !files_removed.empty(); }
    bool hasWarnings() const { return !warnings.empty() || !patterns_not_found.empty(); }

    void merge(const FirewallRemovalResult& partial);

    /**
     * @brief Every change as one line, in the order used for commit messages
     */
    std::vector<std::string> changeList() const;
};

class DevcontainerCustomizer {
public:
    static constexpr const char* INIT_COMMIT_MESSAGE = "Strip firewall configurations from devcontainer";
    static constexpr const char* UPDATE_COMMIT_MESSAGE = "Strip firewall configurations from updated devcontainer";

    /**
     * @param git Executor used for the commit.
     * @param working_dir Repository root.
     * @param prefix Directory (relative to the root) holding the devcontainer.
     */
    DevcontainerCustomizer(GitExecutor& git, std::string working_dir, std::string prefix);

    /**
     * @brief Runs every stripping routine over the prefix directory.
     *
     * Warnings never fail the pass. Throws SyncError for unreadable files or
     * a malformed manifest.
     */
    FirewallRemovalResult stripFirewallFeatures();

    /**
     * @brief Lists scripts to delete: the well-known names plus any other
     *        shell script whose content matches a firewall pattern.
     */
    std::vector<std::string> detectFirewallScripts();

    FirewallRemovalResult removeFirewallScripts();
    FirewallRemovalResult stripManifest();
    FirewallRemovalResult stripDockerfile();

    /**
     * @brief Warnings for every part of the pass that found nothing to strip
     */
    std::vector<std::string> validateFirewallRemoval(const FirewallRemovalResult& result) const;

    /**
     * @brief Stages the prefix and commits it with an itemized message.
     * @return False without touching git when the result has no changes.
     */
    bool commitCustomizations(const FirewallRemovalResult& result, const std::string& message);

    /**
     * @brief Builds "<summary>\n\nChanges made:\n- ..." from a change list
     */
    static std::string buildCommitMessage(const std::string& summary, const std::vector<std::string>& changes);

private:
    GitExecutor& m_git;
    std::string m_working_dir;
    std::string m_prefix;
    SysInteraction m_sys;

    std::string absolutePath(const std::string& name) const;
    std::string relativePath(const std::string& name) const;
};

} // namespace DevSync
