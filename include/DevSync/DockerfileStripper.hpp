// =================================================================
// include/DevSync/DockerfileStripper.hpp
// =================================================================
// Line-oriented removal of the firewall setup from a Dockerfile.

#pragma once

#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief Output of one stripping pass; never modified after it is returned
 */
struct DockerfileStripResult {
    std::string content;               ///< Rewritten text (equal to the input when unchanged)
    std::vector<std::string> changes;  ///< Human-readable change descriptions
    bool unterminated_section = false; ///< Setup section ran to end of file

    bool changed() const { return !changes.empty(); }
};

/**
 * @brief State machine over Dockerfile lines
 *
 * Normal -> InFirewallSection on the "# Copy and set up firewall script"
 * marker, back to Normal after the "USER node" sentinel (both dropped).
 * Normal -> InPackageInstall on an apt install line ending in a backslash,
 * back to Normal after the first line without one. Install lines are
 * filtered token by token; every other line passes through verbatim.
 */
class DockerfileStripper {
public:
    static constexpr const char* SECTION_MARKER = "# Copy and set up firewall script";
    static constexpr const char* SECTION_SENTINEL = "USER node";
    static constexpr const char* SECTION_REMOVED = "Removed firewall setup section";
    static constexpr const char* PACKAGES_REMOVED = "Removed firewall packages from apt install";

    static DockerfileStripResult strip(const std::string& content);

    /**
     * @brief True if the token names a firewall package, optionally
     *        version-pinned ("iptables=1.8.9-2")
     */
    static bool isFirewallPackage(const std::string& token);

private:
    enum class State {
        Normal,
        InFirewallSection,
        InPackageInstall
    };

    struct FilteredLine {
        std::string text;
        bool removed_any = false;  ///< At least one package token was dropped
        bool empty = false;        ///< Nothing but removed packages was on the line
    };

    static FilteredLine filterPackages(const std::string& line);
    static bool isInstallLine(const std::string& line);
    static bool hasContinuation(const std::string& line);
    static std::string dropContinuation(const std::string& line);
};

} // namespace DevSync
