// =================================================================
// src/DevSync/FirewallPatterns.cpp
// =================================================================

#include "DevSync/FirewallPatterns.hpp"

namespace DevSync {

const std::vector<FirewallPattern>& firewallPatterns() {
    static const std::vector<FirewallPattern> patterns = [] {
        const char* const sources[] = {
            R"(iptables\s*\\?)",
            R"(ipset\s*\\?)",
            R"(iproute2\s*\\?)",
            R"(dnsutils\s*\\?)",
            R"(aggregate\s*\\?)",
            R"(--cap-add=NET_ADMIN)",
            R"(--cap-add=NET_RAW)",
            R"(init-firewall\.sh)",
            R"(firewall.*\.sh)",
            R"(postStartCommand.*firewall)",
            R"(waitFor.*postStartCommand)",
        };
        std::vector<FirewallPattern> compiled;
        for (const char* source : sources) {
            compiled.push_back({source, std::regex(source, std::regex::ECMAScript | std::regex::optimize)});
        }
        return compiled;
    }();
    return patterns;
}

std::vector<std::string> matchFirewallPatterns(const std::string& content) {
    std::vector<std::string> matched;
    for (const auto& pattern : firewallPatterns()) {
        if (std::regex_search(content, pattern.regex)) {
            matched.push_back(pattern.source);
        }
    }
    return matched;
}

const std::vector<std::string>& firewallScriptNames() {
    static const std::vector<std::string> names = {"init-firewall.sh", "firewall.sh", "iptables.sh"};
    return names;
}

const std::vector<std::string>& firewallPackages() {
    static const std::vector<std::string> packages = {"iptables", "ipset", "iproute2", "dnsutils", "aggregate"};
    return packages;
}

} // namespace DevSync
