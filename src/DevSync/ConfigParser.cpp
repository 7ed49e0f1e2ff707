// =================================================================
// src/DevSync/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration reader.

#include "DevSync/ConfigParser.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <filesystem>

namespace DevSync {

ConfigParser::ConfigParser(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        // It's okay if the file doesn't exist; every key has a default.
        LOG_DEBUG("Config", "No configuration file at " + config_path);
        return;
    }

    try {
        m_root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw SyncError::repository("Invalid configuration file " + config_path + ": " + e.what(),
                                    "Fix the YAML syntax or remove the file to use the defaults");
    }

    if (m_root && !m_root.IsNull() && !m_root.IsMap()) {
        throw SyncError::repository("Invalid configuration file " + config_path + ": expected key: value pairs",
                                    "Fix the YAML syntax or remove the file to use the defaults");
    }
    m_loaded = true;
    LOG_DEBUG("Config", "Loaded configuration from " + config_path);
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    if (!hasValue(key)) {
        return ""; // Return empty string if key not found
    }
    return m_root[key].as<std::string>();
}

long ConfigParser::getPositiveIntValue(const std::string& key, long default_value, long max_value) const {
    if (!hasValue(key)) {
        return default_value;
    }

    const YAML::Node node = m_root[key];
    long value = 0;
    try {
        value = node.as<long>();
    } catch (const YAML::BadConversion&) {
        value = 0;
    }
    if (value <= 0 || value > max_value) {
        throw SyncError::repository("Invalid value '" + node.as<std::string>() + "' for configuration key '" + key + "'",
                                    "Use a positive whole number of seconds, at most " + std::to_string(max_value));
    }
    return value;
}

bool ConfigParser::hasValue(const std::string& key) const {
    if (!m_loaded || !m_root.IsMap()) {
        return false;
    }
    const YAML::Node node = m_root[key];
    return node && node.IsScalar() && !node.Scalar().empty();
}

} // namespace DevSync
