// =================================================================
// src/DevSync/DevcontainerCustomizer.cpp
// =================================================================
// Implementation for firewall stripping of the devcontainer directory.

#include "DevSync/DevcontainerCustomizer.hpp"
#include "DevSync/DockerfileStripper.hpp"
#include "DevSync/FirewallPatterns.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/ManifestStripper.hpp"
#include <algorithm>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace DevSync {

namespace {

const char* const MANIFEST_NAME = "devcontainer.json";
const char* const DOCKERFILE_NAME = "Dockerfile";

void append(std::vector<std::string>& target, const std::vector<std::string>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

} // namespace

void FirewallRemovalResult::merge(const FirewallRemovalResult& partial) {
    append(files_modified, partial.files_modified);
    append(files_removed, partial.files_removed);
    append(dockerfile_changes, partial.dockerfile_changes);
    append(json_changes, partial.json_changes);
    append(warnings, partial.warnings);
    append(patterns_not_found, partial.patterns_not_found);
}

std::vector<std::string> FirewallRemovalResult::changeList() const {
    std::vector<std::string> changes;
    for (const auto& file : files_removed) {
        changes.push_back("Removed firewall script " + fs::path(file).filename().string());
    }
    append(changes, json_changes);
    append(changes, dockerfile_changes);
    return changes;
}

DevcontainerCustomizer::DevcontainerCustomizer(GitExecutor& git, std::string working_dir, std::string prefix)
    : m_git(git), m_working_dir(std::move(working_dir)), m_prefix(std::move(prefix)) {}

FirewallRemovalResult DevcontainerCustomizer::stripFirewallFeatures() {
    LOG_INFO("Customizer", "Stripping firewall features from " + m_prefix);

    FirewallRemovalResult result;
    result.merge(removeFirewallScripts());
    result.merge(stripManifest());
    result.merge(stripDockerfile());

    for (const auto& warning : validateFirewallRemoval(result)) {
        result.warnings.push_back(warning);
    }

    Logger::getInstance().logCustomization(result.files_modified.size(), result.files_removed.size(),
                                           result.warnings);
    return result;
}

std::vector<std::string> DevcontainerCustomizer::detectFirewallScripts() {
    std::vector<std::string> scripts;
    const std::string dir = absolutePath("");
    if (!m_sys.directoryExists(dir)) {
        return scripts;
    }

    const auto& names = firewallScriptNames();
    for (const auto& name : names) {
        if (m_sys.fileExists(absolutePath(name))) {
            scripts.push_back(name);
        }
    }

    for (const auto& path : m_sys.listFiles(dir, ".sh")) {
        const std::string name = fs::path(path).filename().string();
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            continue;
        }
        const auto matched = matchFirewallPatterns(m_sys.readFile(path));
        if (!matched.empty()) {
            LOG_DEBUG("Customizer", name + " matches " + matched.front());
            scripts.push_back(name);
        }
    }
    return scripts;
}

FirewallRemovalResult DevcontainerCustomizer::removeFirewallScripts() {
    FirewallRemovalResult partial;
    for (const auto& name : detectFirewallScripts()) {
        m_sys.removeFile(absolutePath(name));
        partial.files_removed.push_back(relativePath(name));
        LOG_INFO("Customizer", "Removed firewall script " + relativePath(name));
    }
    return partial;
}

FirewallRemovalResult DevcontainerCustomizer::stripManifest() {
    FirewallRemovalResult partial;
    const std::string path = absolutePath(MANIFEST_NAME);
    if (!m_sys.fileExists(path)) {
        partial.warnings.push_back(std::string(MANIFEST_NAME) + " not found");
        return partial;
    }

    ManifestStripResult stripped = ManifestStripper::strip(m_sys.readFile(path));
    if (stripped.changed()) {
        m_sys.writeFile(path, stripped.content);
        partial.files_modified.push_back(relativePath(MANIFEST_NAME));
        partial.json_changes = stripped.changes;
    } else {
        partial.patterns_not_found.push_back("--cap-add=NET_ADMIN");
        partial.patterns_not_found.push_back("postStartCommand.*firewall");
    }
    return partial;
}

FirewallRemovalResult DevcontainerCustomizer::stripDockerfile() {
    FirewallRemovalResult partial;
    const std::string path = absolutePath(DOCKERFILE_NAME);
    if (!m_sys.fileExists(path)) {
        partial.warnings.push_back(std::string(DOCKERFILE_NAME) + " not found");
        return partial;
    }

    DockerfileStripResult stripped = DockerfileStripper::strip(m_sys.readFile(path));
    if (stripped.unterminated_section) {
        partial.warnings.push_back(std::string("Firewall setup section in Dockerfile has no closing '") +
                                   DockerfileStripper::SECTION_SENTINEL + "' line");
    }
    if (stripped.changed()) {
        m_sys.writeFile(path, stripped.content);
        partial.files_modified.push_back(relativePath(DOCKERFILE_NAME));
        partial.dockerfile_changes = stripped.changes;
    } else {
        partial.patterns_not_found.push_back(DockerfileStripper::SECTION_MARKER);
    }
    return partial;
}

std::vector<std::string> DevcontainerCustomizer::validateFirewallRemoval(const FirewallRemovalResult& result) const {
    std::vector<std::string> warnings;
    if (result.files_removed.empty()) {
        warnings.push_back("No firewall scripts were found to remove");
    }
    if (result.dockerfile_changes.empty()) {
        warnings.push_back("No firewall configurations found in Dockerfile");
    }
    if (result.json_changes.empty()) {
        warnings.push_back("No firewall configurations found in devcontainer.json");
    }
    return warnings;
}

bool DevcontainerCustomizer::commitCustomizations(const FirewallRemovalResult& result, const std::string& message) {
    if (!result.hasChanges()) {
        LOG_DEBUG("Customizer", "No customization changes to commit");
        return false;
    }

    m_git.execute({"add", "--", m_prefix}, m_working_dir);
    m_git.execute({"commit", "-m", buildCommitMessage(message, result.changeList())}, m_working_dir);
    LOG_INFO("Customizer", "Committed firewall customizations");
    return true;
}

std::string DevcontainerCustomizer::buildCommitMessage(const std::string& summary,
                                                       const std::vector<std::string>& changes) {
    if (changes.empty()) {
        return summary;
    }
    std::string message = summary + "\n\nChanges made:";
    for (const auto& change : changes) {
        message += "\n- " + change;
    }
    return message;
}

std::string DevcontainerCustomizer::absolutePath(const std::string& name) const {
    fs::path path = fs::path(m_working_dir) / m_prefix;
    if (!name.empty()) {
        path /= name;
    }
    return path.string();
}

std::string DevcontainerCustomizer::relativePath(const std::string& name) const {
    return (fs::path(m_prefix) / name).string();
}

} // namespace DevSync
