// =================================================================
// src/DevSync/SyncConfig.cpp
// =================================================================

#include "DevSync/SyncConfig.hpp"
#include "DevSync/ConfigParser.hpp"

namespace DevSync {

SyncSettings SyncSettings::fromConfig(const ConfigParser& config) {
    SyncSettings settings;

    // Only the upstream source and the local base branch are overridable;
    // the remote, branch and directory names stay fixed.
    if (config.hasValue("upstream_url")) {
        settings.upstream_url = config.getStringValue("upstream_url");
    }
    if (config.hasValue("upstream_branch")) {
        settings.upstream_branch = config.getStringValue("upstream_branch");
    }
    if (config.hasValue("base_branch")) {
        settings.base_branch = config.getStringValue("base_branch");
    }
    if (config.hasValue("log_dir")) {
        settings.log_dir = config.getStringValue("log_dir");
    }

    return settings;
}

} // namespace DevSync
