// =================================================================
// src/DevSync/DockerfileStripper.cpp
// =================================================================
// Implementation for Dockerfile firewall stripping.

#include "DevSync/DockerfileStripper.hpp"
#include "DevSync/FirewallPatterns.hpp"
#include <algorithm>
#include <sstream>

namespace DevSync {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : content) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

void recordOnce(std::vector<std::string>& changes, const std::string& change) {
    if (std::find(changes.begin(), changes.end(), change) == changes.end()) {
        changes.push_back(change);
    }
}

} // namespace

DockerfileStripResult DockerfileStripper::strip(const std::string& content) {
    DockerfileStripResult result;
    std::vector<std::string> output;
    State state = State::Normal;

    for (const std::string& line : splitLines(content)) {
        switch (state) {
            case State::InFirewallSection:
                if (trim(line) == SECTION_SENTINEL) {
                    state = State::Normal;
                }
                continue;

            case State::Normal:
                if (line.find(SECTION_MARKER) != std::string::npos) {
                    recordOnce(result.changes, SECTION_REMOVED);
                    state = State::InFirewallSection;
                    continue;
                }
                if (!isInstallLine(line)) {
                    output.push_back(line);
                    continue;
                }
                if (hasContinuation(line)) {
                    state = State::InPackageInstall;
                }
                break;

            case State::InPackageInstall:
                if (!hasContinuation(line)) {
                    state = State::Normal;
                }
                break;
        }

        // Line belongs to an apt install invocation
        FilteredLine filtered = filterPackages(line);
        if (filtered.removed_any) {
            recordOnce(result.changes, PACKAGES_REMOVED);
        }
        if (!filtered.empty) {
            output.push_back(filtered.text);
            continue;
        }
        // The dropped line ended the invocation, so the line before it must
        // not continue into whatever follows.
        if (!hasContinuation(line) && !output.empty() && hasContinuation(output.back())) {
            output.back() = dropContinuation(output.back());
        }
    }

    result.unterminated_section = state == State::InFirewallSection;

    if (!result.changed()) {
        result.content = content;
        return result;
    }

    std::ostringstream joined;
    for (size_t i = 0; i < output.size(); ++i) {
        if (i) joined << '\n';
        joined << output[i];
    }
    if (!content.empty() && content.back() == '\n' && !output.empty()) {
        joined << '\n';
    }
    result.content = joined.str();
    return result;
}

bool DockerfileStripper::isFirewallPackage(const std::string& token) {
    const std::string name = token.substr(0, token.find('='));
    const auto& packages = firewallPackages();
    return std::find(packages.begin(), packages.end(), name) != packages.end();
}

DockerfileStripper::FilteredLine DockerfileStripper::filterPackages(const std::string& line) {
    FilteredLine filtered;

    const size_t indent_end = line.find_first_not_of(" \t");
    if (indent_end == std::string::npos) {
        filtered.text = line;
        return filtered;
    }

    // Whitespace tokens; a glued continuation ("iptables\") is split off
    std::vector<std::string> tokens;
    std::istringstream stream(line.substr(indent_end));
    std::string token;
    while (stream >> token) {
        if (token.size() > 1 && token.back() == '\\') {
            tokens.push_back(token.substr(0, token.size() - 1));
            tokens.push_back("\\");
        } else {
            tokens.push_back(token);
        }
    }

    std::vector<std::string> kept;
    for (const auto& t : tokens) {
        if (isFirewallPackage(t)) {
            filtered.removed_any = true;
        } else {
            kept.push_back(t);
        }
    }

    if (!filtered.removed_any) {
        filtered.text = line;
        return filtered;
    }

    if (kept.empty() || (kept.size() == 1 && kept.front() == "\\")) {
        filtered.empty = true;
        return filtered;
    }

    std::string rebuilt = line.substr(0, indent_end);
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i) rebuilt += ' ';
        rebuilt += kept[i];
    }
    filtered.text = rebuilt;
    return filtered;
}

bool DockerfileStripper::isInstallLine(const std::string& line) {
    return line.find("apt-get install") != std::string::npos ||
           line.find("apt install") != std::string::npos;
}

bool DockerfileStripper::hasContinuation(const std::string& line) {
    size_t end = line.find_last_not_of(" \t\r");
    return end != std::string::npos && line[end] == '\\';
}

std::string DockerfileStripper::dropContinuation(const std::string& line) {
    size_t end = line.find_last_not_of(" \t\r");
    if (end == std::string::npos || line[end] != '\\') {
        return line;
    }
    std::string stripped = line.substr(0, end);
    size_t last = stripped.find_last_not_of(" \t");
    return last == std::string::npos ? std::string() : stripped.substr(0, last + 1);
}

} // namespace DevSync
