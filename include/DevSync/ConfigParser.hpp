// =================================================================
// include/DevSync/ConfigParser.hpp
// =================================================================
// Defines the reader for the .devsync/config.yml file.

#pragma once

#include <climits>
#include <string>
#include <yaml-cpp/yaml.h>

namespace DevSync {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the config.yml file. A missing file
     *        yields an empty configuration; a malformed one throws SyncError.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a string value for a given top-level key.
     * @param key The configuration key (e.g., "upstream_url").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a positive integer value for a given key.
     * @param key The configuration key (e.g., "timeout_seconds").
     * @param default_value Returned when the key is absent.
     * @param max_value Largest accepted value.
     * @return The parsed value. Throws SyncError if the value is not a
     *         positive integer or exceeds max_value.
     */
    long getPositiveIntValue(const std::string& key, long default_value, long max_value = LONG_MAX) const;

    bool hasValue(const std::string& key) const;

    bool isLoaded() const { return m_loaded; }

private:
    YAML::Node m_root;
    bool m_loaded = false;
};

} // namespace DevSync
