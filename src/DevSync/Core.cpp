// =================================================================
// src/DevSync/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "DevSync/Core.hpp"
#include "DevSync/ConfigParser.hpp"
#include "DevSync/GitExecutor.hpp"
#include "DevSync/InteractiveConfirmation.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/ProcessRunner.hpp"
#include "DevSync/ProgressReporter.hpp"
#include "DevSync/SyncError.hpp"
#include "DevSync/SyncOrchestrator.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <utility>

namespace DevSync {

Core::Core(const Commands& commands)
    : Core(commands, std::make_unique<SystemProcessRunner>()) {}

Core::Core(const Commands& commands, std::unique_ptr<ProcessRunner> runner)
    : m_commands(commands),
      m_runner(std::move(runner))
{
    std::error_code ec;
    std::filesystem::path dir = m_commands.working_dir.empty()
        ? std::filesystem::current_path(ec)
        : std::filesystem::absolute(m_commands.working_dir, ec);
    m_working_dir = dir.lexically_normal().string();

    // --force answers the overwrite question up front
    if (m_commands.force) {
        m_confirmation = std::make_unique<FixedConfirmation>(true);
    } else {
        m_confirmation = std::make_unique<InteractiveConfirmation>();
    }
}

Core::~Core() = default;

int Core::run() {
    auto& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    const auto started = std::chrono::steady_clock::now();
    int exit_code = 0;

    try {
        loadConfiguration();
        logger.initialize(m_settings.log_dir);
        logger.logSessionStart(m_commands.active_command, m_working_dir);

        if (m_commands.active_command == "init") {
            exit_code = handleInit();
        } else if (m_commands.active_command == "update") {
            exit_code = handleUpdate();
        } else if (m_commands.active_command == "remove") {
            exit_code = handleRemove();
        } else {
            std::cerr << "Unknown command: " << m_commands.active_command << std::endl;
            exit_code = 1;
        }
    } catch (const SyncError& e) {
        exit_code = reportError(e);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Core", std::string("Unexpected failure: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger.logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(elapsed.count()));
    logger.flush();
    return exit_code;
}

int Core::handleInit() {
    return executeWorkflow([this](SyncOrchestrator& orchestrator) {
        return orchestrator.initialize(m_commands.force);
    });
}

int Core::handleUpdate() {
    return executeWorkflow([this](SyncOrchestrator& orchestrator) {
        return orchestrator.update(m_commands.backup, m_commands.force);
    });
}

int Core::handleRemove() {
    return executeWorkflow([this](SyncOrchestrator& orchestrator) {
        return orchestrator.remove(m_commands.keep_files);
    });
}

int Core::executeWorkflow(const std::function<WorkflowReport(SyncOrchestrator&)>& workflow) {
    const CommandContext context = m_context
        .withStripFirewall(m_commands.strip_firewall)
        .withDryRun(m_commands.dry_run);

    ConsoleProgressReporter progress(std::cout, context.verbose);
    SyncOrchestrator orchestrator(*m_git, context, m_settings, progress, *m_confirmation);

    WorkflowReport report = workflow(orchestrator);
    printSummary(report);
    return 0;
}

void Core::loadConfiguration() {
    const std::string config_path = m_commands.config_path.empty()
        ? (std::filesystem::path(m_working_dir) / Defaults::CONFIG_PATH).string()
        : m_commands.config_path;

    m_config = std::make_unique<ConfigParser>(config_path);
    m_settings = SyncSettings::fromConfig(*m_config);

    m_context = CommandContext(m_working_dir, m_commands.verbose);
    m_context.timeout = std::chrono::seconds(
        m_config->getPositiveIntValue("timeout_seconds", Defaults::TIMEOUT_SECONDS, Defaults::MAX_TIMEOUT_SECONDS));
    m_context.long_timeout = std::chrono::seconds(
        m_config->getPositiveIntValue("long_timeout_seconds", Defaults::LONG_TIMEOUT_SECONDS,
                                      Defaults::MAX_TIMEOUT_SECONDS));

    m_git = std::make_unique<GitExecutor>(*m_runner, m_context.timeout, m_context.long_timeout);
}

int Core::reportError(const SyncError& error) const {
    std::cerr << "Error: " << error.what() << std::endl;
    if (m_commands.verbose && !error.suggestion().empty()) {
        std::cerr << "Suggestion: " << error.suggestion() << std::endl;
    }
    return error.exitCode();
}

void Core::printSummary(const WorkflowReport& report) const {
    const bool stripped = report.customization_ran && report.customization.hasChanges();

    if (report.dry_run) {
        std::cout << "\nDry run complete: " << report.skipped_steps.size()
                  << " steps skipped, no changes were made." << std::endl;
        return;
    }

    switch (report.workflow) {
        case Workflow::INITIALIZE:
            std::cout << "\n✅ Successfully initialized devcontainer sync!" << std::endl;
            std::cout << "📁 Created " << m_settings.prefix << " directory with Claude Code configurations" << std::endl;
            if (stripped) {
                std::cout << "🔒 Stripped firewall configurations as requested" << std::endl;
            }
            std::cout << "🔗 Added '" << m_settings.remote_name << "' remote pointing to "
                      << m_settings.upstream_url << std::endl;
            std::cout << "🌿 Created tracking branch '" << m_settings.tracking_branch << "' for future updates" << std::endl;
            std::cout << "\nNext steps:" << std::endl;
            std::cout << "  • Run 'devcontainer-sync update' to get the latest configurations" << std::endl;
            std::cout << "  • Run 'devcontainer-sync remove' to clean up if no longer needed" << std::endl;
            break;

        case Workflow::UPDATE:
            std::cout << "\n✅ Successfully updated devcontainer configurations!" << std::endl;
            std::cout << "📁 Updated " << m_settings.prefix << " directory with latest Claude Code configurations" << std::endl;
            if (stripped) {
                std::cout << "🔒 Stripped firewall configurations as requested" << std::endl;
            }
            if (!report.backup_path.empty()) {
                std::cout << "💾 Backup created before update" << std::endl;
            }
            std::cout << "🔄 Merged latest changes from Claude Code repository" << std::endl;
            std::cout << "\nYour devcontainer is now up to date with the latest configurations." << std::endl;
            break;

        case Workflow::REMOVE:
            std::cout << "\n✅ Successfully removed devcontainer sync!" << std::endl;
            std::cout << "🔗 Removed '" << m_settings.remote_name << "' remote" << std::endl;
            std::cout << "🌿 Deleted tracking branches" << std::endl;
            if (report.kept_files) {
                std::cout << "📁 Kept " << m_settings.prefix << " files (--keep-files specified)" << std::endl;
            } else if (report.files_removed) {
                std::cout << "📁 Removed " << m_settings.prefix << " directory and files" << std::endl;
                std::cout << "💾 Changes committed to git history" << std::endl;
            }
            std::cout << "\nDevcontainer sync has been completely removed from this repository." << std::endl;
            break;
    }

    if (!report.warnings.empty()) {
        std::cout << "\nCompleted with " << report.warnings.size() << " warning(s)." << std::endl;
    }
}

} // namespace DevSync
