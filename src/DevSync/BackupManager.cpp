// =================================================================
// src/DevSync/BackupManager.cpp
// =================================================================
// Implementation for directory backups.

#include "DevSync/BackupManager.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <filesystem>
#include <utility>

namespace DevSync {

BackupManager::BackupManager(std::string working_dir, std::string suffix)
    : m_working_dir(std::move(working_dir)), m_suffix(std::move(suffix)) {}

std::string BackupManager::createBackup(const std::string& dir_name) {
    const std::string source = resolve(dir_name);
    if (!m_sys.directoryExists(source)) {
        throw SyncError::fileSystem("No " + dir_name + " directory found to backup",
                                    "Run 'devcontainer-sync init' first or update without --backup");
    }

    const std::string backup_name = backupNameFor(dir_name);
    const std::string destination = resolve(backup_name);

    // Only one backup generation is kept
    if (m_sys.directoryExists(destination)) {
        LOG_DEBUG("Backup", "Replacing previous backup " + backup_name);
        m_sys.removeDirectory(destination);
    }

    m_sys.copyDirectory(source, destination);
    LOG_INFO("Backup", "Created backup: " + dir_name + " -> " + backup_name);
    return backup_name;
}

bool BackupManager::hasBackup(const std::string& dir_name) {
    return m_sys.directoryExists(resolve(backupNameFor(dir_name)));
}

std::string BackupManager::backupNameFor(const std::string& dir_name) const {
    return dir_name + m_suffix;
}

std::string BackupManager::resolve(const std::string& relative) const {
    return (std::filesystem::path(m_working_dir) / relative).string();
}

} // namespace DevSync
