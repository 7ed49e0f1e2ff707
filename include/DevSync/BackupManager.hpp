// =================================================================
// include/DevSync/BackupManager.hpp
// =================================================================
// Header for copying the synchronized directory aside before an update.

#pragma once

#include "DevSync/SysInteraction.hpp"
#include <string>

namespace DevSync {

/**
 * @brief Keeps one backup copy of a directory next to it
 *
 * A backup of "<dir>" lives in "<dir><suffix>" (".devcontainer.backup").
 * Creating a new backup replaces the previous one.
 */
class BackupManager {
public:
    /**
     * @brief Construct a new BackupManager
     * @param working_dir Repository root the relative paths refer to
     * @param suffix Appended to the directory name to form the backup name
     */
    explicit BackupManager(std::string working_dir, std::string suffix = ".backup");

    /**
     * @brief Copy a directory to its backup location
     * @param dir_name Directory relative to the working directory
     * @return Backup path relative to the working directory. Throws SyncError
     *         (file system) if the directory does not exist or the copy fails.
     */
    std::string createBackup(const std::string& dir_name);

    /**
     * @brief Check if a backup exists for a directory
     */
    bool hasBackup(const std::string& dir_name);

    std::string backupNameFor(const std::string& dir_name) const;

private:
    std::string m_working_dir;
    std::string m_suffix;
    SysInteraction m_sys;

    std::string resolve(const std::string& relative) const;
};

} // namespace DevSync
