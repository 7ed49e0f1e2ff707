// =================================================================
// src/DevSync/ManifestStripper.cpp
// =================================================================

#include "DevSync/ManifestStripper.hpp"
#include "DevSync/SyncError.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

namespace DevSync {

namespace {

bool isCapabilityArg(const json& arg) {
    if (!arg.is_string()) {
        return false;
    }
    const auto& text = arg.get_ref<const std::string&>();
    return text.find("--cap-add=NET_ADMIN") != std::string::npos ||
           text.find("--cap-add=NET_RAW") != std::string::npos;
}

} // namespace

ManifestStripResult ManifestStripper::strip(const std::string& content) {
    ManifestStripResult result;
    result.content = content;

    json manifest;
    try {
        manifest = json::parse(content, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw SyncError::repository(std::string("Invalid JSON in devcontainer.json: ") + e.what(),
                                    "Fix JSON syntax errors in devcontainer.json");
    }

    if (!manifest.is_object()) {
        return result;
    }

    auto run_args = manifest.find("runArgs");
    if (run_args != manifest.end() && run_args->is_array()) {
        json kept = json::array();
        for (const auto& arg : *run_args) {
            if (!isCapabilityArg(arg)) {
                kept.push_back(arg);
            }
        }
        if (kept.size() < run_args->size()) {
            *run_args = kept;
            result.changes.push_back(RUN_ARGS_REMOVED);
        }
    }

    auto post_start = manifest.find("postStartCommand");
    if (post_start != manifest.end() && post_start->is_string() &&
        post_start->get_ref<const std::string&>().find("firewall") != std::string::npos) {
        manifest.erase("postStartCommand");
        result.changes.push_back(POST_START_REMOVED);
    }

    auto wait_for = manifest.find("waitFor");
    if (wait_for != manifest.end() && *wait_for == "postStartCommand" && !manifest.contains("postStartCommand")) {
        manifest.erase("waitFor");
        result.changes.push_back(WAIT_FOR_REMOVED);
    }

    if (result.changed()) {
        result.content = manifest.dump(2) + "\n";
    }
    return result;
}

} // namespace DevSync
