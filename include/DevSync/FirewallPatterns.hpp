// =================================================================
// include/DevSync/FirewallPatterns.hpp
// =================================================================
// Signatures of the upstream network-isolation (firewall) feature.

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace DevSync {

/**
 * @brief One compiled detection pattern together with its source text
 */
struct FirewallPattern {
    std::string source;
    std::regex regex;
};

/**
 * @brief All detection patterns, compiled once on first use
 */
const std::vector<FirewallPattern>& firewallPatterns();

/**
 * @brief Returns the source text of every pattern found in content
 */
std::vector<std::string> matchFirewallPatterns(const std::string& content);

/**
 * @brief Script names removed regardless of their content
 */
const std::vector<std::string>& firewallScriptNames();

/**
 * @brief Package names stripped from apt install invocations
 */
const std::vector<std::string>& firewallPackages();

} // namespace DevSync
