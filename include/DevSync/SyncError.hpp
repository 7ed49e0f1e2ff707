// =================================================================
// include/DevSync/SyncError.hpp
// =================================================================
// Error taxonomy shared by every layer of devcontainer-sync.

#pragma once

#include <stdexcept>
#include <string>

namespace DevSync {

/**
 * @brief Broad classes of failure, each mapped to a process exit code
 */
enum class ErrorCategory {
    REPOSITORY,     ///< Precondition/state errors, user cancellation
    NETWORK,        ///< Connectivity failures talking to the upstream
    GIT_OPERATION,  ///< A git invocation exited non-zero or timed out
    FILE_SYSTEM     ///< Local I/O failures
};

/**
 * @brief Exception carrying a category, a message and an actionable suggestion
 *
 * what() returns "<Category> error: <message>" so the text printed by main()
 * is self-describing. The suggestion is kept separately and only shown in
 * verbose mode.
 */
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorCategory category, const std::string& message, const std::string& suggestion);

    ErrorCategory category() const { return m_category; }
    const std::string& message() const { return m_message; }
    const std::string& suggestion() const { return m_suggestion; }

    /**
     * @brief Process exit code for this error (repository=1, network=2,
     *        git-operation=3, filesystem=4)
     */
    int exitCode() const;

    static std::string categoryName(ErrorCategory category);

    // Convenience constructors
    static SyncError repository(const std::string& message, const std::string& suggestion);
    static SyncError network(const std::string& message, const std::string& suggestion);
    static SyncError gitOperation(const std::string& message, const std::string& suggestion);
    static SyncError fileSystem(const std::string& message, const std::string& suggestion);

    static SyncError notGitRepository();
    static SyncError noCommitsFound();
    static SyncError cancelledByUser();

private:
    ErrorCategory m_category;
    std::string m_message;
    std::string m_suggestion;
};

} // namespace DevSync
