// =================================================================
// include/DevSync/SysInteraction.hpp
// =================================================================
// Defines the file-system operations used by the customization and
// backup steps. Failures are reported as SyncError (file system).

#pragma once

#include <string>
#include <vector>

namespace DevSync {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws SyncError on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it. Throws SyncError on failure.
     */
    void writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    void removeFile(const std::string& file_path);

    /**
     * @brief Deletes a directory tree; a missing directory is not an error.
     */
    void removeDirectory(const std::string& dir_path);

    /**
     * @brief Recursively copies source to destination, which must not exist.
     */
    void copyDirectory(const std::string& source, const std::string& destination);

    /**
     * @brief Regular files directly inside dir_path with the given extension,
     *        sorted by name.
     * @param extension Extension including the dot, e.g. ".sh".
     */
    std::vector<std::string> listFiles(const std::string& dir_path, const std::string& extension);
};

} // namespace DevSync
