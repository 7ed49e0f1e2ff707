// =================================================================
// src/DevSync/SyncError.cpp
// =================================================================

#include "DevSync/SyncError.hpp"

namespace DevSync {

SyncError::SyncError(ErrorCategory category, const std::string& message, const std::string& suggestion)
    : std::runtime_error(categoryName(category) + " error: " + message),
      m_category(category),
      m_message(message),
      m_suggestion(suggestion) {}

int SyncError::exitCode() const {
    switch (m_category) {
        case ErrorCategory::REPOSITORY: return 1;
        case ErrorCategory::NETWORK: return 2;
        case ErrorCategory::GIT_OPERATION: return 3;
        case ErrorCategory::FILE_SYSTEM: return 4;
    }
    return 1;
}

std::string SyncError::categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::REPOSITORY: return "Repository";
        case ErrorCategory::NETWORK: return "Network";
        case ErrorCategory::GIT_OPERATION: return "Git operation";
        case ErrorCategory::FILE_SYSTEM: return "File system";
    }
    return "Unknown";
}

SyncError SyncError::repository(const std::string& message, const std::string& suggestion) {
    return SyncError(ErrorCategory::REPOSITORY, message, suggestion);
}

SyncError SyncError::network(const std::string& message, const std::string& suggestion) {
    return SyncError(ErrorCategory::NETWORK, message, suggestion);
}

SyncError SyncError::gitOperation(const std::string& message, const std::string& suggestion) {
    return SyncError(ErrorCategory::GIT_OPERATION, message, suggestion);
}

SyncError SyncError::fileSystem(const std::string& message, const std::string& suggestion) {
    return SyncError(ErrorCategory::FILE_SYSTEM, message, suggestion);
}

SyncError SyncError::notGitRepository() {
    return repository("Current directory is not a git repository",
                      "Run this command from within a git repository or initialize one with 'git init'");
}

SyncError SyncError::noCommitsFound() {
    return repository("No commits found in the git repository",
                      "Make at least one commit before running this command");
}

SyncError SyncError::cancelledByUser() {
    return repository("Operation cancelled by user",
                      "Use --force to skip confirmation or back up the existing files first");
}

} // namespace DevSync
