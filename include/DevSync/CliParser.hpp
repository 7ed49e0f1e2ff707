// =================================================================
// include/DevSync/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace DevSync {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    bool verbose = false;
    bool dry_run = false;
    std::string config_path;    // Empty: <working dir>/.devsync/config.yml
    std::string working_dir;    // Empty: current directory

    // Options for 'init' and 'update'
    bool strip_firewall = false;
    bool force = false;

    // Options for 'update'
    bool backup = false;

    // Options for 'remove'
    bool keep_files = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupGlobalOptions(CLI::App& app);
    void setupInitCommand(CLI::App& app);
    void setupUpdateCommand(CLI::App& app);
    void setupRemoveCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace DevSync
