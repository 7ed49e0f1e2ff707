// =================================================================
// include/DevSync/Core.hpp
// =================================================================
// Defines the core application object: turns parsed commands into a
// configured workflow run and an exit code.

#pragma once

#include "DevSync/CliParser.hpp"
#include "DevSync/SyncConfig.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace DevSync {
    class ConfigParser;
    class ConfirmationProvider;
    class GitExecutor;
    class ProcessRunner;
    class SyncError;
    class SyncOrchestrator;
    struct WorkflowReport;
}

namespace DevSync {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Constructs the Core with a specific process runner for git.
     */
    Core(const Commands& commands, std::unique_ptr<ProcessRunner> runner);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the selected workflow.
     * @return 0 on success, otherwise the exit code of the error category.
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleUpdate();
    int handleRemove();

    int executeWorkflow(const std::function<WorkflowReport(SyncOrchestrator&)>& workflow);
    void loadConfiguration();
    int reportError(const SyncError& error) const;
    void printSummary(const WorkflowReport& report) const;

    const Commands& m_commands;
    std::string m_working_dir;
    std::unique_ptr<ConfigParser> m_config;
    SyncSettings m_settings;
    CommandContext m_context;
    std::unique_ptr<ProcessRunner> m_runner;
    std::unique_ptr<GitExecutor> m_git;
    std::unique_ptr<ConfirmationProvider> m_confirmation;
};

} // namespace DevSync
