// =================================================================
// include/DevSync/ManifestStripper.hpp
// =================================================================
// Removes firewall wiring from devcontainer.json.

#pragma once

#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief Output of one manifest pass
 */
struct ManifestStripResult {
    std::string content;               ///< Pretty-printed document, or the input when unchanged
    std::vector<std::string> changes;

    bool changed() const { return !changes.empty(); }
};

/**
 * @brief Edits the manifest as a generic JSON document
 *
 * Comments are accepted on input. Key order is preserved so that a rewritten
 * manifest still diffs cleanly against upstream. Throws SyncError
 * (repository) on malformed JSON.
 */
class ManifestStripper {
public:
    static constexpr const char* RUN_ARGS_REMOVED = "Removed NET_ADMIN and NET_RAW capabilities from runArgs";
    static constexpr const char* POST_START_REMOVED = "Removed postStartCommand referencing firewall";
    static constexpr const char* WAIT_FOR_REMOVED = "Removed waitFor since postStartCommand was removed";

    static ManifestStripResult strip(const std::string& content);
};

} // namespace DevSync
