// =================================================================
// src/DevSync/SysInteraction.cpp
// =================================================================
// Implementation for file-system operations.

#include "DevSync/SysInteraction.hpp"
#include "DevSync/SyncError.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace DevSync {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw SyncError::fileSystem("Failed to open file: " + file_path,
                                    "Check file permissions and ensure the file exists");
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

void SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        throw SyncError::fileSystem("Failed to open file for writing: " + file_path,
                                    "Check file permissions and available disk space");
    }
    file_stream << content;
    if (!file_stream.good()) {
        throw SyncError::fileSystem("Failed to write file: " + file_path,
                                    "Check file permissions and available disk space");
    }
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

void SysInteraction::removeFile(const std::string& file_path) {
    std::error_code ec;
    fs::remove(file_path, ec);
    if (ec) {
        throw SyncError::fileSystem("Failed to remove " + file_path + ": " + ec.message(),
                                    "Check file permissions and try again");
    }
}

void SysInteraction::removeDirectory(const std::string& dir_path) {
    std::error_code ec;
    fs::remove_all(dir_path, ec);
    if (ec) {
        throw SyncError::fileSystem("Failed to remove directory " + dir_path + ": " + ec.message(),
                                    "Check directory permissions and try again");
    }
}

void SysInteraction::copyDirectory(const std::string& source, const std::string& destination) {
    std::error_code ec;
    fs::copy(source, destination, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        throw SyncError::fileSystem("Failed to copy " + source + " to " + destination + ": " + ec.message(),
                                    "Check permissions and available disk space");
    }
}

std::vector<std::string> SysInteraction::listFiles(const std::string& dir_path, const std::string& extension) {
    std::vector<std::string> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir_path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == extension) {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        throw SyncError::fileSystem("Failed to list " + dir_path + ": " + ec.message(),
                                    "Check directory permissions");
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace DevSync
