// =================================================================
// tests/OrchestratorTest.cpp
// =================================================================
// Tests for the Initialize / Update / Remove workflows against a scripted
// git runner, so every command sequence can be checked exactly.

#include "DevSync/Logger.hpp"
#include "DevSync/ProcessRunner.hpp"
#include "DevSync/SyncError.hpp"
#include "DevSync/SyncOrchestrator.hpp"
#include "TestHelpers.hpp"
#include <iostream>
#include <filesystem>
#include <cassert>
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace DevSync;

namespace {

ProcessResult makeResult(int exit_code, const std::string& out = "", const std::string& err = "") {
    ProcessResult result;
    result.exit_code = exit_code;
    result.stdout_output = out;
    result.stderr_output = err;
    return result;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Simulates just enough repository state for the workflows
class FakeGitRunner : public ProcessRunner {
public:
    std::set<std::string> remotes;
    std::set<std::string> branches = {"main"};
    std::string current_branch = "main";
    bool dirty = false;
    bool staged = false;
    bool launch_fails = false;
    bool tracked_prefix = true;     ///< Whether "git rm --cached" finds anything to stage
    std::map<std::string, ProcessResult> failures;  ///< Keyed by command-line prefix
    std::vector<std::vector<std::string>> invocations;

    ProcessResult run(const std::vector<std::string>& args, const std::string&,
                      std::chrono::milliseconds) override {
        if (launch_fails) {
            throw std::runtime_error("Failed to start 'git': No such file or directory");
        }
        assert(!args.empty() && args[0] == "git");
        std::vector<std::string> git_args(args.begin() + 1, args.end());
        invocations.push_back(git_args);

        const std::string line = formatCommandLine(git_args);
        for (const auto& failure : failures) {
            if (startsWith(line, failure.first)) {
                return failure.second;
            }
        }
        return simulate(git_args);
    }

    // Commands that change something, in order
    std::vector<std::string> mutations() const {
        static const char* const queries[] = {"rev-parse", "show-ref", "remote get-url", "status", "diff"};
        std::vector<std::string> lines;
        for (const auto& args : invocations) {
            const std::string line = formatCommandLine(args);
            bool query = false;
            for (const char* prefix : queries) {
                query = query || startsWith(line, prefix);
            }
            if (!query) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    const std::vector<std::string>* lastCommit() const {
        for (auto it = invocations.rbegin(); it != invocations.rend(); ++it) {
            if (!it->empty() && (*it)[0] == "commit") {
                return &*it;
            }
        }
        return nullptr;
    }

private:
    ProcessResult simulate(const std::vector<std::string>& a) {
        const std::string& cmd = a[0];
        if (cmd == "rev-parse") {
            if (a.size() == 3 && a[1] == "--abbrev-ref") {
                return makeResult(0, current_branch + "\n");
            }
            return makeResult(0, "ok\n");
        }
        if (cmd == "show-ref") {
            const std::string name = a.back().substr(std::string("refs/heads/").size());
            return makeResult(branches.count(name) ? 0 : 1);
        }
        if (cmd == "remote") {
            if (a[1] == "get-url") {
                return remotes.count(a[2]) ? makeResult(0, "url\n")
                                           : makeResult(2, "", "error: No such remote '" + a[2] + "'\n");
            }
            if (a[1] == "add") remotes.insert(a[2]);
            if (a[1] == "remove") remotes.erase(a[2]);
            return makeResult(0);
        }
        if (cmd == "status") {
            return makeResult(0, dirty ? " M README.md\n" : "");
        }
        if (cmd == "diff") {
            return makeResult(staged ? 1 : 0);
        }
        if (cmd == "branch") {
            if (a[1] == "-f") branches.insert(a[2]);
            if (a[1] == "-D") branches.erase(a[2]);
            return makeResult(0);
        }
        if (cmd == "checkout") {
            current_branch = a[1];
            return makeResult(0);
        }
        if (cmd == "subtree" && a[1] == "split") {
            branches.insert(a[4]);
            return makeResult(0);
        }
        if (cmd == "rm") {
            staged = staged || tracked_prefix;
            return makeResult(0);
        }
        if (cmd == "add") {
            staged = true;
            return makeResult(0);
        }
        if (cmd == "commit") {
            staged = false;
            return makeResult(0);
        }
        return makeResult(0);
    }
};

class RecordingProgress : public ProgressReporter {
public:
    std::vector<std::string> events;

    void workflowStarted(const std::string& description) override { events.push_back("workflow:" + description); }
    void stepStarted(const SyncStep& step) override { events.push_back("start:" + step.label); }
    void stepFinished(const SyncStep& step) override { events.push_back("finish:" + step.label); }
    void stepFailed(const SyncStep& step, const std::string&) override { events.push_back("fail:" + step.label); }
    void stepSkipped(const SyncStep& step, const std::string& reason) override {
        events.push_back("skip:" + step.label + ":" + reason);
    }
    void warning(const std::string& message) override { events.push_back("warning:" + message); }
    void detail(const std::string& message) override { events.push_back("detail:" + message); }
    void customizationReport(const FirewallRemovalResult& result) override {
        events.push_back("customization");
        reported.push_back(result);
    }

    std::vector<FirewallRemovalResult> reported;

    bool has(const std::string& event) const {
        return std::find(events.begin(), events.end(), event) != events.end();
    }

    bool hasPrefix(const std::string& prefix) const {
        return std::any_of(events.begin(), events.end(),
                           [&](const std::string& e) { return startsWith(e, prefix); });
    }
};

class CountingConfirmation : public ConfirmationProvider {
public:
    explicit CountingConfirmation(bool answer) : m_answer(answer) {}

    bool confirm(const std::string&) override {
        asked++;
        return m_answer;
    }

    int asked = 0;

private:
    bool m_answer;
};

} // namespace

class OrchestratorTest {
private:
    std::string work_dir;

    void setupWorkspace() {
        work_dir = TestHelpers::makeScratchDir("orchestrator");
        fs::create_directories(work_dir + "/.git");
    }

    void cleanupWorkspace() {
        TestHelpers::removeDir(work_dir);
    }

    CommandContext context(bool dry_run = false, bool strip = false) const {
        return CommandContext(work_dir, false).withDryRun(dry_run).withStripFirewall(strip);
    }

    template <typename Fn>
    SyncError expectSyncError(Fn&& fn) {
        try {
            fn();
        } catch (const SyncError& e) {
            return e;
        }
        assert(false && "Expected a SyncError");
        throw std::logic_error("unreachable");
    }

    void writePrefixFile(const std::string& name, const std::string& content) {
        TestHelpers::writeFile(work_dir + "/.devcontainer/" + name, content);
    }

public:
    void testInitializeSequence() {
        std::cout << "Testing initialize command sequence..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        GitExecutor git(runner);
        RecordingProgress progress;
        CountingConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.initialize(false);

        auto commands = runner.mutations();
        assert(commands.size() == 7);
        assert(commands[0] == "remote add claude https://github.com/anthropics/claude-code.git");
        assert(commands[1] == "fetch claude");
        assert(commands[2] == "branch -f claude-main claude/main");
        assert(commands[3] == "checkout claude-main");
        assert(commands[4] == "subtree split --prefix=.devcontainer -b devcontainer");
        assert(commands[5] == "checkout main");
        assert(startsWith(commands[6], "subtree add --prefix=.devcontainer devcontainer --squash -m"));

        assert(report.workflow == Workflow::INITIALIZE);
        assert(report.base_branch == "main");
        assert(report.completed_steps.size() == 7);
        assert(report.skipped_steps.empty());
        assert(!report.overwrote_existing);
        assert(confirmation.asked == 0 && "Nothing to overwrite, nothing to ask");
        assert(progress.has("finish:Returning to main"));
        assert(!progress.hasPrefix("start:Stripping firewall"));

        cleanupWorkspace();
        std::cout << "✓ Initialize sequence test passed" << std::endl;
    }

    void testFetchFailureAborts() {
        std::cout << "Testing fetch failure classification..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        runner.failures["fetch"] = makeResult(128, "",
            "fatal: unable to access 'https://github.com/anthropics/claude-code.git/': Could not resolve host: github.com\n");
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        SyncError error = expectSyncError([&] { orchestrator.initialize(false); });
        assert(error.category() == ErrorCategory::NETWORK);
        assert(error.exitCode() == 2);
        assert(progress.has("fail:Fetching repository"));
        assert(runner.mutations().size() == 2 && "No steps run after the failed one");

        // Any other fetch failure is a git operation error
        FakeGitRunner other_runner;
        other_runner.failures["fetch"] = makeResult(128, "", "fatal: couldn't find remote ref main\n");
        GitExecutor other_git(other_runner);
        SyncOrchestrator other(other_git, context(), SyncSettings(), progress, confirmation);
        error = expectSyncError([&] { other.initialize(false); });
        assert(error.category() == ErrorCategory::GIT_OPERATION);
        assert(error.exitCode() == 3);

        // A fetch killed on timeout is treated as a network problem
        FakeGitRunner slow_runner;
        ProcessResult timed_out = makeResult(-1);
        timed_out.timed_out = true;
        slow_runner.failures["fetch"] = timed_out;
        GitExecutor slow_git(slow_runner);
        SyncOrchestrator slow(slow_git, context(), SyncSettings(), progress, confirmation);
        error = expectSyncError([&] { slow.initialize(false); });
        assert(error.category() == ErrorCategory::NETWORK);

        cleanupWorkspace();
        std::cout << "✓ Fetch failure test passed" << std::endl;
    }

    void testGitNotInstalled() {
        std::cout << "Testing missing git executable..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        runner.launch_fails = true;
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        SyncError error = expectSyncError([&] { orchestrator.initialize(false); });
        assert(error.category() == ErrorCategory::GIT_OPERATION);
        assert(error.message().find("Failed to execute git") != std::string::npos);

        cleanupWorkspace();
        std::cout << "✓ Missing git test passed" << std::endl;
    }

    void testCancelledOverwrite() {
        std::cout << "Testing declined overwrite..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{}\n");

        FakeGitRunner runner;
        GitExecutor git(runner);
        RecordingProgress progress;
        CountingConfirmation confirmation(false);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        SyncError error = expectSyncError([&] { orchestrator.initialize(false); });
        assert(error.message() == "Operation cancelled by user");
        assert(error.exitCode() == 1);
        assert(confirmation.asked == 1);
        assert(runner.mutations().empty() && "Declining must leave the repository untouched");
        assert(fs::exists(work_dir + "/.devcontainer/devcontainer.json"));

        cleanupWorkspace();
        std::cout << "✓ Declined overwrite test passed" << std::endl;
    }

    void testConfirmedOverwrite() {
        std::cout << "Testing confirmed overwrite..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{}\n");

        FakeGitRunner runner;
        GitExecutor git(runner);
        RecordingProgress progress;
        CountingConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.initialize(false);
        assert(report.overwrote_existing);
        assert(confirmation.asked == 1);
        assert(!fs::exists(work_dir + "/.devcontainer"));

        // The prefix is gone before the first checkout
        auto commands = runner.mutations();
        assert(commands.size() == 9);
        assert(commands[1] == "fetch claude");
        assert(commands[2] == "rm -r -q --cached --ignore-unmatch -- .devcontainer");
        assert(commands[3] == "commit -m \"Remove existing devcontainer configuration before sync\"");
        assert(commands[4] == "branch -f claude-main claude/main");
        assert(commands[5] == "checkout claude-main");
        assert(startsWith(commands[8], "subtree add"));
        assert(std::count(commands.begin(), commands.end(),
                          "rm -r -q --cached --ignore-unmatch -- .devcontainer") == 1);

        auto cleared = std::find(progress.events.begin(), progress.events.end(), "finish:Clearing existing devcontainer");
        auto switched = std::find(progress.events.begin(), progress.events.end(), "start:Switching branches");
        assert(cleared != progress.events.end() && cleared < switched);
        assert(report.completed_steps.size() == 8);

        cleanupWorkspace();
        std::cout << "✓ Confirmed overwrite test passed" << std::endl;
    }

    void testConfirmedOverwriteOfUntrackedPrefix() {
        std::cout << "Testing confirmed overwrite of an untracked directory..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{ \"name\": \"local\" }\n");
        writePrefixFile("Dockerfile", "FROM debian\n");

        FakeGitRunner runner;
        runner.tracked_prefix = false;
        GitExecutor git(runner);
        RecordingProgress progress;
        CountingConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.initialize(false);
        assert(report.overwrote_existing);
        assert(!fs::exists(work_dir + "/.devcontainer"));
        assert(runner.lastCommit() == nullptr && "Nothing tracked, nothing to commit");

        auto commands = runner.mutations();
        assert(commands.size() == 8);
        assert(commands[2] == "rm -r -q --cached --ignore-unmatch -- .devcontainer");
        assert(commands[3] == "branch -f claude-main claude/main");
        assert(commands[4] == "checkout claude-main");

        cleanupWorkspace();
        std::cout << "✓ Untracked overwrite test passed" << std::endl;
    }

    void testForceSkipsConfirmation() {
        std::cout << "Testing forced overwrite..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{}\n");

        FakeGitRunner runner;
        GitExecutor git(runner);
        RecordingProgress progress;
        CountingConfirmation confirmation(false);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.initialize(true);
        assert(report.overwrote_existing);
        assert(confirmation.asked == 0);

        cleanupWorkspace();
        std::cout << "✓ Forced overwrite test passed" << std::endl;
    }

    void testRerunInitialize() {
        std::cout << "Testing initialize over a previous run..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main", "devcontainer"};
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        orchestrator.initialize(false);
        auto commands = runner.mutations();
        assert(commands[0] == "remote set-url claude https://github.com/anthropics/claude-code.git");
        auto split = std::find(commands.begin(), commands.end(), "subtree split --prefix=.devcontainer -b devcontainer");
        assert(split != commands.end());
        assert(*(split - 1) == "branch -D devcontainer" && "Stale extraction branch is dropped before the split");

        cleanupWorkspace();
        std::cout << "✓ Rerun initialize test passed" << std::endl;
    }

    void testDryRunInitialize() {
        std::cout << "Testing dry-run initialize..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{}\n");

        FakeGitRunner runner;
        GitExecutor git(runner);
        RecordingProgress progress;
        CountingConfirmation confirmation(false);
        SyncOrchestrator orchestrator(git, context(true, true), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.initialize(false);
        assert(report.dry_run);
        assert(report.skipped_steps.size() == 9 && "Eight required steps plus customization");
        assert(progress.has("skip:Clearing existing devcontainer:dry run"));
        assert(report.completed_steps.empty());
        assert(confirmation.asked == 0);
        assert(runner.mutations().empty());
        assert(progress.has("skip:Fetching repository:dry run"));
        assert(progress.has("warning:.devcontainer directory already exists and would be overwritten"));
        assert(fs::exists(work_dir + "/.devcontainer/devcontainer.json"));

        cleanupWorkspace();
        std::cout << "✓ Dry-run initialize test passed" << std::endl;
    }

    void testBaseBranchResolution() {
        std::cout << "Testing base branch resolution..." << std::endl;
        setupWorkspace();
        RecordingProgress progress;
        FixedConfirmation confirmation(true);

        FakeGitRunner on_tracking;
        on_tracking.current_branch = "claude-main";
        GitExecutor tracking_git(on_tracking);
        SyncOrchestrator refused(tracking_git, context(), SyncSettings(), progress, confirmation);
        SyncError error = expectSyncError([&] { refused.initialize(false); });
        assert(error.message() == "Cannot synchronize from branch 'claude-main'");
        assert(on_tracking.mutations().empty());

        SyncSettings settings;
        settings.base_branch = "develop";
        FakeGitRunner missing_base;
        GitExecutor missing_git(missing_base);
        SyncOrchestrator missing(missing_git, context(), settings, progress, confirmation);
        error = expectSyncError([&] { missing.initialize(false); });
        assert(error.message() == "Base branch 'develop' does not exist");

        FakeGitRunner with_base;
        with_base.branches = {"main", "develop"};
        GitExecutor base_git(with_base);
        SyncOrchestrator configured(base_git, context(), settings, progress, confirmation);
        WorkflowReport report = configured.initialize(false);
        assert(report.base_branch == "develop");
        auto commands = with_base.mutations();
        assert(commands[5] == "checkout develop");

        cleanupWorkspace();
        std::cout << "✓ Base branch resolution test passed" << std::endl;
    }

    void testUpdateRequiresCleanTree() {
        std::cout << "Testing update with uncommitted changes..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main"};
        runner.dirty = true;
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        SyncError error = expectSyncError([&] { orchestrator.update(false, false); });
        assert(error.message().find("uncommitted changes") != std::string::npos);
        assert(runner.mutations().empty());

        WorkflowReport report = orchestrator.update(false, true);
        assert(report.completed_steps.size() == 5 && "--force proceeds despite local changes");

        cleanupWorkspace();
        std::cout << "✓ Update clean-tree test passed" << std::endl;
    }

    void testUpdateSequence() {
        std::cout << "Testing update command sequence..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main", "devcontainer-updated"};
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.update(false, false);
        auto commands = runner.mutations();
        assert(commands.size() == 7);
        assert(commands[0] == "fetch claude");
        assert(commands[1] == "checkout claude-main");
        assert(commands[2] == "reset --hard claude/main");
        assert(commands[3] == "branch -D devcontainer-updated");
        assert(commands[4] == "subtree split --prefix=.devcontainer -b devcontainer-updated");
        assert(commands[5] == "checkout main");
        assert(startsWith(commands[6], "subtree merge --prefix=.devcontainer devcontainer-updated --squash -m"));

        assert(report.workflow == Workflow::UPDATE);
        assert(report.backup_path.empty());
        assert(!report.customization_ran);

        cleanupWorkspace();
        std::cout << "✓ Update sequence test passed" << std::endl;
    }

    void testUpdateBackup() {
        std::cout << "Testing update backups..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main"};
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);

        // No prefix yet: the backup fails but the update carries on
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);
        WorkflowReport report = orchestrator.update(true, false);
        assert(report.backup_path.empty());
        assert(report.warnings.size() == 1);
        assert(startsWith(report.warnings[0], "Creating backup failed: "));
        assert(progress.has("fail:Creating backup"));
        assert(report.completed_steps.back() == "Applying updates");

        writePrefixFile("Dockerfile", "FROM node:20\n");
        RecordingProgress second_progress;
        SyncOrchestrator second(git, context(), SyncSettings(), second_progress, confirmation);
        report = second.update(true, false);
        assert(report.warnings.empty());
        assert(report.backup_path == ".devcontainer.backup");
        assert(TestHelpers::readFile(work_dir + "/.devcontainer.backup/Dockerfile") == "FROM node:20\n");
        assert(report.completed_steps.front() == "Creating backup");

        cleanupWorkspace();
        std::cout << "✓ Update backup test passed" << std::endl;
    }

    void testDryRunRequiresInitialization() {
        std::cout << "Testing dry run before initialization..." << std::endl;
        setupWorkspace();

        FakeGitRunner runner;
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(true), SyncSettings(), progress, confirmation);

        SyncError error = expectSyncError([&] { orchestrator.update(true, false); });
        assert(error.message() == "Remote 'claude' does not exist");
        error = expectSyncError([&] { orchestrator.remove(false); });
        assert(error.message() == "Remote 'claude' does not exist");

        runner.remotes = {"claude"};
        error = expectSyncError([&] { orchestrator.update(false, false); });
        assert(error.message() == "Branch 'claude-main' does not exist");

        runner.branches.insert("claude-main");
        WorkflowReport report = orchestrator.update(true, false);
        assert(report.skipped_steps.size() == 6 && "Backup plus five required steps");
        assert(runner.mutations().empty());

        cleanupWorkspace();
        std::cout << "✓ Dry-run initialization check test passed" << std::endl;
    }

    void testRemove() {
        std::cout << "Testing remove..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{}\n");

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main", "devcontainer"};
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.remove(false);
        auto commands = runner.mutations();
        assert(commands.size() == 5);
        assert(commands[0] == "remote remove claude");
        assert(commands[1] == "branch -D claude-main");
        assert(commands[2] == "branch -D devcontainer" && "Missing devcontainer-updated is skipped");
        assert(commands[3] == "rm -r -q --cached --ignore-unmatch -- .devcontainer");
        assert(commands[4] == "commit -m \"Remove devcontainer configuration\"");
        assert(report.files_removed);
        assert(!fs::exists(work_dir + "/.devcontainer"));
        assert(runner.remotes.empty());

        cleanupWorkspace();
        std::cout << "✓ Remove test passed" << std::endl;
    }

    void testRemoveVariants() {
        std::cout << "Testing remove edge cases..." << std::endl;
        setupWorkspace();
        RecordingProgress progress;
        FixedConfirmation confirmation(true);

        FakeGitRunner uninitialized;
        GitExecutor bare_git(uninitialized);
        SyncOrchestrator orchestrator(bare_git, context(), SyncSettings(), progress, confirmation);
        SyncError error = expectSyncError([&] { orchestrator.remove(false); });
        assert(error.category() == ErrorCategory::REPOSITORY);
        assert(error.message() == "Remote 'claude' does not exist");
        assert(progress.has("fail:Removing remote"));

        // Extraction branch deletion failing is not fatal
        writePrefixFile("devcontainer.json", "{}\n");
        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main", "devcontainer", "devcontainer-updated"};
        runner.failures["branch -D devcontainer-updated"] = makeResult(1, "", "error: cannot delete branch\n");
        GitExecutor git(runner);
        SyncOrchestrator keeping(git, context(), SyncSettings(), progress, confirmation);
        WorkflowReport report = keeping.remove(true);
        assert(report.kept_files);
        assert(!report.files_removed);
        assert(report.completed_steps.size() == 3);
        assert(fs::exists(work_dir + "/.devcontainer/devcontainer.json"));
        auto commands = runner.mutations();
        assert(std::none_of(commands.begin(), commands.end(),
                            [](const std::string& c) { return startsWith(c, "rm "); }));

        cleanupWorkspace();
        std::cout << "✓ Remove edge case test passed" << std::endl;
    }

    void testCustomizationFailureIsWarning() {
        std::cout << "Testing customization failure downgrade..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", "{ \"runArgs\": [");

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main"};
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(false, true), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.update(false, false);
        assert(!report.customization_ran);
        assert(!report.customization_committed);
        assert(report.warnings.size() == 1);
        assert(report.warnings[0].find("Invalid JSON in devcontainer.json") != std::string::npos);
        assert(progress.has("fail:Stripping firewall"));
        assert(progress.reported.empty() && "A failed pass has no outcome to report");
        assert(runner.lastCommit() == nullptr);

        cleanupWorkspace();
        std::cout << "✓ Customization failure test passed" << std::endl;
    }

    void testUpdateCustomizationCommit() {
        std::cout << "Testing update customization commit..." << std::endl;
        setupWorkspace();
        writePrefixFile("devcontainer.json", TestHelpers::upstreamDevcontainerJson());
        writePrefixFile("Dockerfile", TestHelpers::upstreamDockerfile());
        writePrefixFile("init-firewall.sh", "#!/bin/bash\niptables -F\n");

        FakeGitRunner runner;
        runner.remotes = {"claude"};
        runner.branches = {"main", "claude-main"};
        GitExecutor git(runner);
        RecordingProgress progress;
        FixedConfirmation confirmation(true);
        SyncOrchestrator orchestrator(git, context(false, true), SyncSettings(), progress, confirmation);

        WorkflowReport report = orchestrator.update(false, false);
        assert(report.customization_ran);
        assert(report.customization_committed);
        assert(report.customization.files_removed.size() == 1);

        const auto* commit = runner.lastCommit();
        assert(commit != nullptr && commit->size() == 3);
        assert(startsWith((*commit)[2], "Strip firewall configurations from updated devcontainer\n\nChanges made:\n"));
        assert(progress.reported.size() == 1);
        assert(progress.reported[0].files_removed == report.customization.files_removed);
        assert(progress.reported[0].files_removed[0] == ".devcontainer/init-firewall.sh");
        assert(!progress.hasPrefix("detail:  - ") && "Formatting belongs to the reporter");

        cleanupWorkspace();
        std::cout << "✓ Update customization commit test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running orchestrator tests..." << std::endl;

        testInitializeSequence();
        testFetchFailureAborts();
        testGitNotInstalled();
        testCancelledOverwrite();
        testConfirmedOverwrite();
        testConfirmedOverwriteOfUntrackedPrefix();
        testForceSkipsConfirmation();
        testRerunInitialize();
        testDryRunInitialize();
        testBaseBranchResolution();
        testUpdateRequiresCleanTree();
        testUpdateSequence();
        testUpdateBackup();
        testDryRunRequiresInitialization();
        testRemove();
        testRemoveVariants();
        testCustomizationFailureIsWarning();
        testUpdateCustomizationCommit();

        std::cout << "All orchestrator tests passed!" << std::endl;
    }
};

int main() {
    try {
        // Failure paths are exercised on purpose; keep their log lines out of the output
        Logger::getInstance().setConsoleLogging(false);

        OrchestratorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All workflow tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
