// =================================================================
// include/Persona/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Persona {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string store_dir;
    std::string config_path;
    bool verbose = false;

    // Target of 'add', 'edit', 'remove', 'switch'
    std::string profile_name;

    // Profile fields for 'add' and 'edit'
    std::string username;
    std::string email;
    std::string branch = "main";
    std::string ssh_key;
    bool auto_push = false;
    bool sign_commits = false;

    // Which fields 'edit' was given; unset fields keep their stored value
    bool username_set = false;
    bool email_set = false;
    bool branch_set = false;
    bool ssh_key_set = false;
    bool auto_push_set = false;
    bool sign_commits_set = false;

    // File for 'export', 'import' and 'vscode'
    std::string file_path;
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
    void setupInitCommand(CLI::App& app);
    void setupListCommand(CLI::App& app);
    void setupAddCommand(CLI::App& app);
    void setupEditCommand(CLI::App& app);
    void setupRemoveCommand(CLI::App& app);
    void setupSwitchCommand(CLI::App& app);
    void setupCurrentCommand(CLI::App& app);
    void setupTestSshCommand(CLI::App& app);
    void setupExportCommand(CLI::App& app);
    void setupImportCommand(CLI::App& app);
    void setupVscodeCommand(CLI::App& app);

    // Shared by 'add' and 'edit'
    void addProfileOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Persona
