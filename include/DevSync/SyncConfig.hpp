// =================================================================
// include/DevSync/SyncConfig.hpp
// =================================================================
// Fixed names of the synchronized layout, user-tunable settings and the
// per-invocation command context.

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace DevSync {

class ConfigParser;

namespace Defaults {
constexpr const char* REMOTE_NAME = "claude";
constexpr const char* UPSTREAM_URL = "https://github.com/anthropics/claude-code.git";
constexpr const char* UPSTREAM_BRANCH = "main";
constexpr const char* TRACKING_BRANCH = "claude-main";
constexpr const char* EXTRACTION_BRANCH = "devcontainer";
constexpr const char* UPDATED_EXTRACTION_BRANCH = "devcontainer-updated";
constexpr const char* PREFIX = ".devcontainer";
constexpr const char* BACKUP_SUFFIX = ".backup";
constexpr const char* CONFIG_PATH = ".devsync/config.yml";
constexpr long TIMEOUT_SECONDS = 30;
constexpr long LONG_TIMEOUT_SECONDS = 600;
constexpr long MAX_TIMEOUT_SECONDS = 365L * 24 * 60 * 60;
} // namespace Defaults

/**
 * @brief Settings resolved from defaults and the optional configuration file
 */
struct SyncSettings {
    std::string remote_name = Defaults::REMOTE_NAME;
    std::string upstream_url = Defaults::UPSTREAM_URL;
    std::string upstream_branch = Defaults::UPSTREAM_BRANCH;
    std::string tracking_branch = Defaults::TRACKING_BRANCH;
    std::string extraction_branch = Defaults::EXTRACTION_BRANCH;
    std::string updated_extraction_branch = Defaults::UPDATED_EXTRACTION_BRANCH;
    std::string prefix = Defaults::PREFIX;
    std::string base_branch;   ///< Empty: use the branch checked out at start
    std::string log_dir;       ///< Empty: no file logging

    /**
     * @brief Remote-tracking ref of the upstream branch, e.g. "claude/main"
     */
    std::string upstreamRef() const { return remote_name + "/" + upstream_branch; }

    std::string backupDirName() const { return prefix + Defaults::BACKUP_SUFFIX; }

    /**
     * @brief Apply the overridable keys of a configuration file
     */
    static SyncSettings fromConfig(const ConfigParser& config);
};

/**
 * @brief Context for one invocation; copied, never mutated mid-workflow
 */
struct CommandContext {
    std::string working_dir;
    bool verbose = false;
    bool strip_firewall = false;
    bool dry_run = false;
    std::chrono::seconds timeout{Defaults::TIMEOUT_SECONDS};
    std::chrono::seconds long_timeout{Defaults::LONG_TIMEOUT_SECONDS};

    CommandContext() = default;
    CommandContext(std::string dir, bool verbose_output)
        : working_dir(std::move(dir)), verbose(verbose_output) {}

    CommandContext withStripFirewall(bool strip) const {
        CommandContext copy = *this;
        copy.strip_firewall = strip;
        return copy;
    }

    CommandContext withDryRun(bool dry) const {
        CommandContext copy = *this;
        copy.dry_run = dry;
        return copy;
    }
};

} // namespace DevSync
