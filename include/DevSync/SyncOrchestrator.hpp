// =================================================================
// include/DevSync/SyncOrchestrator.hpp
// =================================================================
// The Initialize / Update / Remove workflows. Each workflow is a fixed
// sequence of required steps (abort on failure, no rollback) and optional
// steps (failures become warnings).

#pragma once

#include "DevSync/BackupManager.hpp"
#include "DevSync/BranchManager.hpp"
#include "DevSync/DevcontainerCustomizer.hpp"
#include "DevSync/GitExecutor.hpp"
#include "DevSync/InteractiveConfirmation.hpp"
#include "DevSync/ProgressReporter.hpp"
#include "DevSync/RemoteManager.hpp"
#include "DevSync/RepositoryValidator.hpp"
#include "DevSync/SubtreeManager.hpp"
#include "DevSync/SyncConfig.hpp"
#include <functional>
#include <string>
#include <vector>

namespace DevSync {

enum class Workflow {
    INITIALIZE,
    UPDATE,
    REMOVE
};

/**
 * @brief What a finished workflow did; used for the end-of-run summary
 */
struct WorkflowReport {
    Workflow workflow = Workflow::INITIALIZE;
    bool dry_run = false;
    std::string base_branch;
    bool overwrote_existing = false;     ///< Init replaced an existing prefix
    std::string backup_path;             ///< Empty when no backup was made
    bool customization_ran = false;
    bool customization_committed = false;
    FirewallRemovalResult customization;
    bool files_removed = false;          ///< Remove deleted and committed the prefix
    bool kept_files = false;
    std::vector<std::string> completed_steps;
    std::vector<std::string> skipped_steps;
    std::vector<std::string> warnings;   ///< Downgraded optional-step failures
};

class SyncOrchestrator {
public:
    /**
     * @param git Executor shared by all managers.
     * @param context Per-invocation flags; copied.
     * @param settings Names and upstream source; copied.
     * @param progress Receives step notifications; the orchestrator prints nothing itself.
     * @param confirmation Asked before an existing prefix is overwritten.
     */
    SyncOrchestrator(GitExecutor& git, CommandContext context, SyncSettings settings,
                     ProgressReporter& progress, ConfirmationProvider& confirmation);

    /**
     * @brief Sets up the remote, the tracking and extraction branches and the
     *        squashed subtree at the prefix.
     * @param force Overwrite an existing prefix without asking.
     */
    WorkflowReport initialize(bool force);

    /**
     * @brief Pulls the latest upstream prefix into the existing subtree.
     * @param backup Copy the prefix aside before merging.
     * @param force Proceed even with uncommitted changes to tracked files.
     */
    WorkflowReport update(bool backup, bool force);

    /**
     * @brief Removes the remote and branches, and unless keep_files, the
     *        prefix itself (committed).
     */
    WorkflowReport remove(bool keep_files);

    static constexpr const char* REMOVE_COMMIT_MESSAGE = "Remove devcontainer configuration";
    static constexpr const char* REPLACE_COMMIT_MESSAGE = "Remove existing devcontainer configuration before sync";

private:
    GitExecutor& m_git;
    CommandContext m_context;
    SyncSettings m_settings;
    ProgressReporter& m_progress;
    ConfirmationProvider& m_confirmation;

    RepositoryValidator m_validator;
    RemoteManager m_remotes;
    BranchManager m_branches;
    SubtreeManager m_subtrees;
    BackupManager m_backups;
    DevcontainerCustomizer m_customizer;

    void runStep(WorkflowReport& report, const SyncStep& step, const std::function<void()>& action);
    bool runOptionalStep(WorkflowReport& report, const SyncStep& step, const std::function<void()>& action);

    /**
     * @brief Branch the synchronized files live on; refuses the sync branches
     */
    std::string resolveBaseBranch();

    void requireInitialized();
    bool prefixExists() const;
    void recreateBranchForSplit(const std::string& branch);
    void runCustomization(WorkflowReport& report, const std::string& commit_message);
    void commitStaged(const std::string& message);
};

} // namespace DevSync
