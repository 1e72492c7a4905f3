// =================================================================
// src/Persona/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Persona/CliParser.hpp"

namespace Persona {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Persona: switch between named git identities.");
    m_app->require_subcommand(0, 1);

    m_app->add_option("--store-dir", m_commands.store_dir,
                      "Profile store directory (default: $PERSONA_HOME or ~/.github-profiles)");
    m_app->add_option("-c,--config", m_commands.config_path,
                      "Configuration file (default: <store-dir>/config.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print diagnostic log messages");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupInitCommand(*m_app);
    setupListCommand(*m_app);
    setupAddCommand(*m_app);
    setupEditCommand(*m_app);
    setupRemoveCommand(*m_app);
    setupSwitchCommand(*m_app);
    setupCurrentCommand(*m_app);
    setupTestSshCommand(*m_app);
    setupExportCommand(*m_app);
    setupImportCommand(*m_app);
    setupVscodeCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::addProfileOptions(CLI::App& sub) {
    sub.add_option("name", m_commands.profile_name, "Profile name")->required();
    auto* username = sub.add_option("--username", m_commands.username, "Account user name (sets user.name)");
    auto* email = sub.add_option("--email", m_commands.email, "Email address (sets user.email)");
    auto* branch = sub.add_option("--branch", m_commands.branch, "Default branch for new repositories");
    auto* ssh_key = sub.add_option("--ssh-key", m_commands.ssh_key, "Private key to add to the SSH agent");
    auto* auto_push = sub.add_flag("--auto-push,!--no-auto-push", m_commands.auto_push,
                                   "Push automatically after commits");
    auto* sign_commits = sub.add_flag("--sign-commits,!--no-sign-commits", m_commands.sign_commits,
                                      "Sign commits");

    sub.callback([this, username, email, branch, ssh_key, auto_push, sign_commits]() {
        m_commands.username_set = username->count() > 0;
        m_commands.email_set = email->count() > 0;
        m_commands.branch_set = branch->count() > 0;
        m_commands.ssh_key_set = ssh_key->count() > 0;
        m_commands.auto_push_set = auto_push->count() > 0;
        m_commands.sign_commits_set = sign_commits->count() > 0;
    });
}

void CliParser::setupInitCommand(CLI::App& app) {
    app.add_subcommand("init", "Creates the profile store and a default configuration file.");
}

void CliParser::setupListCommand(CLI::App& app) {
    app.add_subcommand("list", "Lists all profiles.");
}

void CliParser::setupAddCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("add", "Adds a new profile.");
    addProfileOptions(*sub);
}

void CliParser::setupEditCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("edit", "Changes fields of an existing profile.");
    addProfileOptions(*sub);
}

void CliParser::setupRemoveCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("remove", "Removes a profile.");
    sub->add_option("name", m_commands.profile_name, "Profile name")->required();
}

void CliParser::setupSwitchCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("switch", "Applies a profile to the global git configuration and SSH agent.");
    sub->add_option("name", m_commands.profile_name, "Profile name")->required();
}

void CliParser::setupCurrentCommand(CLI::App& app) {
    app.add_subcommand("current", "Shows the active profile.");
}

void CliParser::setupTestSshCommand(CLI::App& app) {
    app.add_subcommand("test-ssh", "Tests the SSH connection to the remote host.");
}

void CliParser::setupExportCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("export", "Exports all profiles and the active profile to a file.");
    sub->add_option("filename", m_commands.file_path, "Export file")->required();
}

void CliParser::setupImportCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("import", "Replaces all profiles with the contents of an exported file.");
    sub->add_option("filename", m_commands.file_path, "File to import")->required()->check(CLI::ExistingFile);
}

void CliParser::setupVscodeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("vscode", "Writes a settings file for the editor extension.");
    sub->add_option("-o,--output", m_commands.file_path, "Output file (default: <store-dir>/vscode_settings.json)");
}

} // namespace Persona
