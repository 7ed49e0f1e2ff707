// =================================================================
// src/DevSync/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "DevSync/CliParser.hpp"

#ifndef DEVSYNC_VERSION
#define DEVSYNC_VERSION "0.0.0"
#endif

namespace DevSync {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "devcontainer-sync: keeps a project's .devcontainer in sync with the Claude Code repository.",
        "devcontainer-sync");
    m_app->require_subcommand(1);
    m_app->set_version_flag("--version", std::string("devcontainer-sync ") + DEVSYNC_VERSION);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupGlobalOptions(*m_app);
    setupInitCommand(*m_app);
    setupUpdateCommand(*m_app);
    setupRemoveCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupGlobalOptions(CLI::App& app) {
    app.add_flag("-v,--verbose", m_commands.verbose, "Print every step, the changes made and error suggestions.");
    app.add_flag("--dry-run", m_commands.dry_run, "Run all checks but skip every step that changes the repository.");
    app.add_option("-c,--config", m_commands.config_path, "Configuration file (default: .devsync/config.yml).")
        ->check(CLI::ExistingFile);
    app.add_option("-C,--directory", m_commands.working_dir, "Run as if started in this directory.")
        ->check(CLI::ExistingDirectory);
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Sets up the remote, tracking branch and .devcontainer subtree.");
    sub->fallthrough(); // global flags may follow the subcommand
    sub->add_flag("--strip-firewall", m_commands.strip_firewall, "Remove the firewall feature from the synced files.");
    sub->add_flag("-f,--force", m_commands.force, "Overwrite an existing .devcontainer without asking.");
}

void CliParser::setupUpdateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("update", "Merges the latest upstream .devcontainer into the project.");
    sub->fallthrough();
    sub->add_flag("--backup", m_commands.backup, "Copy .devcontainer to .devcontainer.backup first.");
    sub->add_flag("-f,--force", m_commands.force, "Proceed even with uncommitted changes to tracked files.");
    sub->add_flag("--strip-firewall", m_commands.strip_firewall, "Remove the firewall feature from the synced files.");
}

void CliParser::setupRemoveCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("remove", "Removes the remote, the sync branches and .devcontainer.");
    sub->fallthrough();
    sub->add_flag("--keep-files", m_commands.keep_files, "Keep the .devcontainer directory.");
}

} // namespace DevSync
