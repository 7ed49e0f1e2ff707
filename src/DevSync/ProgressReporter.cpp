// =================================================================
// src/DevSync/ProgressReporter.cpp
// =================================================================

#include "DevSync/ProgressReporter.hpp"
#include "DevSync/DevcontainerCustomizer.hpp"
#include <ostream>

namespace DevSync {

ConsoleProgressReporter::ConsoleProgressReporter(std::ostream& out, bool verbose)
    : m_out(out), m_verbose(verbose) {}

void ConsoleProgressReporter::workflowStarted(const std::string& description) {
    if (m_verbose) {
        m_out << description << std::endl;
    }
}

void ConsoleProgressReporter::stepStarted(const SyncStep& step) {
    if (m_verbose) {
        m_out << step.description << std::endl;
        return;
    }
    m_out << step.label << "... " << std::flush;
    m_line_open = true;
}

void ConsoleProgressReporter::stepFinished(const SyncStep&) {
    closeLine("✓");
}

void ConsoleProgressReporter::stepFailed(const SyncStep& step, const std::string& error) {
    if (m_verbose) {
        m_out << "  " << step.label << " failed: " << error << std::endl;
        return;
    }
    closeLine(step.optional ? "⚠️" : "✗");
}

void ConsoleProgressReporter::stepSkipped(const SyncStep& step, const std::string& reason) {
    if (m_verbose) {
        m_out << "  Skipped " << step.label << " (" << reason << ")" << std::endl;
        return;
    }
    m_out << step.label << "... skipped (" << reason << ")" << std::endl;
}

void ConsoleProgressReporter::warning(const std::string& message) {
    closeLine("");
    m_out << "Warning: " << message << std::endl;
}

void ConsoleProgressReporter::detail(const std::string& message) {
    if (m_verbose) {
        m_out << message << std::endl;
    }
}

void ConsoleProgressReporter::customizationReport(const FirewallRemovalResult& result) {
    if (!m_verbose) {
        return;
    }

    if (result.hasChanges()) {
        m_out << "Firewall stripping completed:" << std::endl;
        for (const auto& file : result.files_removed) {
            m_out << "  - Removed script: " << file << std::endl;
        }
        for (const auto& change : result.dockerfile_changes) {
            m_out << "  - Dockerfile: " << change << std::endl;
        }
        for (const auto& change : result.json_changes) {
            m_out << "  - devcontainer.json: " << change << std::endl;
        }
    } else {
        m_out << "No firewall configurations found to strip" << std::endl;
    }

    if (!result.warnings.empty()) {
        m_out << "Warnings:" << std::endl;
        for (const auto& warning : result.warnings) {
            m_out << "  ⚠️  " << warning << std::endl;
        }
    }
}

void ConsoleProgressReporter::closeLine(const std::string& status) {
    if (!m_line_open) {
        return;
    }
    m_out << status << std::endl;
    m_line_open = false;
}

} // namespace DevSync
