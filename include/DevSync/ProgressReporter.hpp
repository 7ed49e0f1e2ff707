// =================================================================
// include/DevSync/ProgressReporter.hpp
// =================================================================
// Progress reporting for the sync workflows. The orchestrator only talks to
// the ProgressReporter interface; the console implementation lives here too.

#pragma once

#include <iosfwd>
#include <string>

namespace DevSync {

struct FirewallRemovalResult;

/**
 * @brief One visible step of a workflow
 */
struct SyncStep {
    std::string label;        ///< Short form for quiet output ("Fetching repository")
    std::string description;  ///< Full sentence for verbose output
    bool optional = false;    ///< Failures are downgraded to warnings
};

class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void workflowStarted(const std::string& description) = 0;
    virtual void stepStarted(const SyncStep& step) = 0;
    virtual void stepFinished(const SyncStep& step) = 0;
    virtual void stepFailed(const SyncStep& step, const std::string& error) = 0;
    virtual void stepSkipped(const SyncStep& step, const std::string& reason) = 0;
    virtual void warning(const std::string& message) = 0;

    /**
     * @brief Supplementary information, e.g. the list of stripped items
     */
    virtual void detail(const std::string& message) = 0;

    /**
     * @brief Outcome of a completed firewall stripping pass
     */
    virtual void customizationReport(const FirewallRemovalResult& result) = 0;
};

/**
 * @brief Writes progress to a stream
 *
 * Quiet mode prints "<label>... ✓" per step. Verbose mode prints the step
 * descriptions, every detail line and the itemized customization changes.
 */
class ConsoleProgressReporter : public ProgressReporter {
public:
    ConsoleProgressReporter(std::ostream& out, bool verbose);

    void workflowStarted(const std::string& description) override;
    void stepStarted(const SyncStep& step) override;
    void stepFinished(const SyncStep& step) override;
    void stepFailed(const SyncStep& step, const std::string& error) override;
    void stepSkipped(const SyncStep& step, const std::string& reason) override;
    void warning(const std::string& message) override;
    void detail(const std::string& message) override;
    void customizationReport(const FirewallRemovalResult& result) override;

private:
    std::ostream& m_out;
    bool m_verbose;
    bool m_line_open = false;  ///< A quiet-mode "<label>... " is waiting for its status

    void closeLine(const std::string& status);
};

} // namespace DevSync
