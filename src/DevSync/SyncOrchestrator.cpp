// =================================================================
// src/DevSync/SyncOrchestrator.cpp
// =================================================================
// Implementation of the sync workflows.

#include "DevSync/SyncOrchestrator.hpp"
#include "DevSync/Logger.hpp"
#include "DevSync/SyncError.hpp"
#include <filesystem>
#include <utility>

namespace DevSync {

namespace {

const char* const DRY_RUN_REASON = "dry run";

} // namespace

SyncOrchestrator::SyncOrchestrator(GitExecutor& git, CommandContext context, SyncSettings settings,
                                   ProgressReporter& progress, ConfirmationProvider& confirmation)
    : m_git(git),
      m_context(std::move(context)),
      m_settings(std::move(settings)),
      m_progress(progress),
      m_confirmation(confirmation),
      m_validator(git, m_context.working_dir),
      m_remotes(git, m_context.working_dir),
      m_branches(git, m_context.working_dir),
      m_subtrees(git, m_context.working_dir),
      m_backups(m_context.working_dir, Defaults::BACKUP_SUFFIX),
      m_customizer(git, m_context.working_dir, m_settings.prefix) {}

WorkflowReport SyncOrchestrator::initialize(bool force) {
    WorkflowReport report;
    report.workflow = Workflow::INITIALIZE;
    report.dry_run = m_context.dry_run;

    m_progress.workflowStarted("Initializing devcontainer sync from Claude Code repository...");
    if (m_context.strip_firewall) {
        m_progress.detail("Firewall stripping enabled - will remove firewall configurations");
    }

    // 1. Preconditions
    m_validator.validateGitRepository();
    m_validator.validateHasCommits();
    report.base_branch = resolveBaseBranch();

    // 2. Nothing is mutated until an existing prefix has been confirmed
    if (prefixExists()) {
        if (m_context.dry_run) {
            m_progress.warning(m_settings.prefix + " directory already exists and would be overwritten");
        } else if (!force) {
            const std::string question = "Warning: " + m_settings.prefix + " directory already exists.\n"
                                         "This will overwrite existing devcontainer configurations.\n"
                                         "Continue?";
            if (!m_confirmation.confirm(question)) {
                LOG_INFO("Orchestrator", "Overwrite of existing " + m_settings.prefix + " declined");
                throw SyncError::cancelledByUser();
            }
        }
        report.overwrote_existing = true;
    }

    // 3-4. Remote
    const bool remote_exists = m_validator.checkExistingRemote(m_settings.remote_name);
    runStep(report, {"Adding remote", "Adding Claude Code remote..."}, [&] {
        if (remote_exists) {
            m_remotes.setRemoteUrl(m_settings.remote_name, m_settings.upstream_url);
        } else {
            m_remotes.addRemote(m_settings.remote_name, m_settings.upstream_url);
        }
    });
    runStep(report, {"Fetching repository", "Fetching from Claude Code repository..."}, [&] {
        m_remotes.fetchRemote(m_settings.remote_name);
    });

    // Git will not check out the tracking branch over untracked or modified
    // files under the prefix, so a confirmed overwrite clears it first.
    if (report.overwrote_existing) {
        runStep(report, {"Clearing existing devcontainer", "Removing existing devcontainer configuration..."}, [&] {
            if (m_subtrees.removeSubtree(m_settings.prefix) && m_validator.hasStagedChanges()) {
                commitStaged(REPLACE_COMMIT_MESSAGE);
            }
        });
    }

    // 5-8. Tracking branch and extraction
    runStep(report, {"Creating branch", "Creating tracking branch..."}, [&] {
        m_branches.forceCreateBranch(m_settings.tracking_branch, m_settings.upstreamRef());
    });
    runStep(report, {"Switching branches", "Switching to Claude branch..."}, [&] {
        m_branches.checkoutBranch(m_settings.tracking_branch);
    });
    runStep(report, {"Extracting devcontainer", "Extracting devcontainer subtree..."}, [&] {
        recreateBranchForSplit(m_settings.extraction_branch);
        m_subtrees.splitSubtree(m_settings.prefix, m_settings.extraction_branch);
    });
    runStep(report, {"Returning to " + report.base_branch, "Returning to " + report.base_branch + " branch..."}, [&] {
        m_branches.checkoutBranch(report.base_branch);
    });

    // 9. Subtree
    runStep(report, {"Adding devcontainer files", "Adding devcontainer files..."}, [&] {
        m_subtrees.addSubtree(m_settings.prefix, m_settings.extraction_branch, true);
    });

    // 10. Optional customization
    if (m_context.strip_firewall) {
        runCustomization(report, DevcontainerCustomizer::INIT_COMMIT_MESSAGE);
    }

    return report;
}

WorkflowReport SyncOrchestrator::update(bool backup, bool force) {
    WorkflowReport report;
    report.workflow = Workflow::UPDATE;
    report.dry_run = m_context.dry_run;

    m_progress.workflowStarted("Updating devcontainer configurations...");
    if (m_context.strip_firewall) {
        m_progress.detail("Firewall stripping enabled - will remove firewall configurations");
    }

    // 1. Preconditions
    m_validator.validateGitRepository();
    m_validator.validateHasCommits();
    report.base_branch = resolveBaseBranch();
    if (!force && m_validator.hasUncommittedChanges()) {
        throw SyncError::repository("Working tree has uncommitted changes",
                                    "Commit or stash your changes, or re-run with --force");
    }
    if (m_context.dry_run) {
        requireInitialized();
    }

    // 2. Optional backup
    if (backup) {
        runOptionalStep(report, {"Creating backup", "Creating backup of existing devcontainer configuration...", true}, [&] {
            report.backup_path = m_backups.createBackup(m_settings.prefix);
            m_progress.detail("Backup created at: " + report.backup_path);
        });
    }

    // 3-5. Refresh the tracking branch and extract
    runStep(report, {"Fetching updates", "Fetching from Claude Code repository..."}, [&] {
        m_remotes.fetchRemote(m_settings.remote_name);
    });
    runStep(report, {"Updating tracking branch", "Updating tracking branch..."}, [&] {
        m_branches.checkoutBranch(m_settings.tracking_branch);
        m_branches.resetHard(m_settings.upstreamRef());
    });
    runStep(report, {"Extracting updates", "Extracting updated devcontainer subtree..."}, [&] {
        recreateBranchForSplit(m_settings.updated_extraction_branch);
        m_subtrees.splitSubtree(m_settings.prefix, m_settings.updated_extraction_branch);
    });

    // 6-7. Merge into the base branch
    runStep(report, {"Returning to " + report.base_branch, "Returning to " + report.base_branch + " branch..."}, [&] {
        m_branches.checkoutBranch(report.base_branch);
    });
    runStep(report, {"Applying updates", "Updating devcontainer files..."}, [&] {
        m_subtrees.mergeSubtree(m_settings.prefix, m_settings.updated_extraction_branch);
    });

    // 8. Optional customization
    if (m_context.strip_firewall) {
        runCustomization(report, DevcontainerCustomizer::UPDATE_COMMIT_MESSAGE);
    }

    return report;
}

WorkflowReport SyncOrchestrator::remove(bool keep_files) {
    WorkflowReport report;
    report.workflow = Workflow::REMOVE;
    report.dry_run = m_context.dry_run;

    m_progress.workflowStarted("Removing devcontainer sync...");

    m_validator.validateGitRepository();
    if (m_context.dry_run) {
        requireInitialized();
    }

    runStep(report, {"Removing remote", "Removing Claude remote..."}, [&] {
        m_remotes.removeRemote(m_settings.remote_name);
    });
    runStep(report, {"Removing branches", "Deleting tracking branch..."}, [&] {
        m_branches.deleteBranch(m_settings.tracking_branch);
    });

    // Extraction branches are ephemeral; they may legitimately be missing
    runStep(report, {"Cleaning up branches", "Cleaning up subtree branches..."}, [&] {
        for (const auto& branch : {m_settings.extraction_branch, m_settings.updated_extraction_branch}) {
            try {
                m_branches.deleteBranch(branch);
            } catch (const SyncError& e) {
                LOG_DEBUG("Orchestrator", "Ignoring cleanup failure for " + branch + ": " + e.message());
            }
        }
    });

    if (keep_files) {
        report.kept_files = true;
        return report;
    }

    runStep(report, {"Removing files", "Removing devcontainer directory..."}, [&] {
        if (m_subtrees.removeSubtree(m_settings.prefix) && m_validator.hasStagedChanges()) {
            commitStaged(REMOVE_COMMIT_MESSAGE);
            report.files_removed = true;
        } else {
            m_progress.detail("No tracked " + m_settings.prefix + " directory to remove");
        }
    });

    return report;
}

void SyncOrchestrator::runStep(WorkflowReport& report, const SyncStep& step, const std::function<void()>& action) {
    if (m_context.dry_run) {
        m_progress.stepSkipped(step, DRY_RUN_REASON);
        report.skipped_steps.push_back(step.label);
        return;
    }

    m_progress.stepStarted(step);
    try {
        action();
    } catch (const std::exception& e) {
        m_progress.stepFailed(step, e.what());
        Logger::getInstance().error("Orchestrator", step.label + " failed", e.what());
        throw;
    }
    m_progress.stepFinished(step);
    report.completed_steps.push_back(step.label);
}

bool SyncOrchestrator::runOptionalStep(WorkflowReport& report, const SyncStep& step,
                                       const std::function<void()>& action) {
    if (m_context.dry_run) {
        m_progress.stepSkipped(step, DRY_RUN_REASON);
        report.skipped_steps.push_back(step.label);
        return false;
    }

    m_progress.stepStarted(step);
    try {
        action();
    } catch (const std::exception& e) {
        const std::string warning = step.label + " failed: " + e.what();
        m_progress.stepFailed(step, e.what());
        m_progress.warning(warning);
        report.warnings.push_back(warning);
        LOG_WARNING("Orchestrator", warning);
        return false;
    }
    m_progress.stepFinished(step);
    report.completed_steps.push_back(step.label);
    return true;
}

std::string SyncOrchestrator::resolveBaseBranch() {
    const std::string current = m_validator.currentBranch();
    std::string base = current;

    if (!m_settings.base_branch.empty()) {
        base = m_settings.base_branch;
        if (!m_validator.checkExistingBranch(base)) {
            throw SyncError::repository("Base branch '" + base + "' does not exist",
                                        "Fix base_branch in the configuration file");
        }
    }

    for (const auto& reserved : {m_settings.tracking_branch, m_settings.extraction_branch,
                                 m_settings.updated_extraction_branch}) {
        if (current == reserved || base == reserved) {
            throw SyncError::repository("Cannot synchronize from branch '" + reserved + "'",
                                        "Check out the branch your project is developed on first");
        }
    }

    LOG_DEBUG("Orchestrator", "Base branch: " + base);
    return base;
}

void SyncOrchestrator::requireInitialized() {
    if (!m_validator.checkExistingRemote(m_settings.remote_name)) {
        throw SyncError::repository("Remote '" + m_settings.remote_name + "' does not exist",
                                    "Run 'devcontainer-sync init' first");
    }
    if (!m_validator.checkExistingBranch(m_settings.tracking_branch)) {
        throw SyncError::repository("Branch '" + m_settings.tracking_branch + "' does not exist",
                                    "Run 'devcontainer-sync init' first");
    }
}

bool SyncOrchestrator::prefixExists() const {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(m_context.working_dir) / m_settings.prefix, ec);
}

void SyncOrchestrator::recreateBranchForSplit(const std::string& branch) {
    // A split onto a branch from an earlier run only works if the histories
    // still line up, so start from scratch each time.
    if (m_validator.checkExistingBranch(branch)) {
        m_branches.deleteBranch(branch);
    }
}

void SyncOrchestrator::runCustomization(WorkflowReport& report, const std::string& commit_message) {
    report.customization_ran = runOptionalStep(
        report, {"Stripping firewall", "Stripping firewall configurations...", true}, [&] {
            report.customization = m_customizer.stripFirewallFeatures();
            report.customization_committed = m_customizer.commitCustomizations(report.customization, commit_message);
        });

    if (report.customization_ran) {
        m_progress.customizationReport(report.customization);
    }
}

void SyncOrchestrator::commitStaged(const std::string& message) {
    m_git.execute({"commit", "-m", message}, m_context.working_dir);
}

} // namespace DevSync
