// =================================================================
// src/Persona/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Persona/Core.hpp"
#include "Persona/ConfigParser.hpp"
#include "Persona/GitIdentityWriter.hpp"
#include "Persona/Logger.hpp"
#include "Persona/ProfileActivator.hpp"
#include "Persona/ProfileStore.hpp"
#include "Persona/ProfileSwitcher.hpp"
#include "Persona/SshConnectionTester.hpp"
#include "Persona/SshKeyAgent.hpp"
#include "Persona/SysInteraction.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace Persona {

static std::string orNotSet(const std::string& value) {
    return value.empty() ? "Not set" : value;
}

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_shared<SysInteraction>())
{
    m_config.store_dir = PersonaConfig::defaultStoreDir(m_commands.store_dir);

    std::string config_path = m_commands.config_path;
    if (config_path.empty()) {
        config_path = (std::filesystem::path(m_config.store_dir) / "config.yml").string();
    }
    m_config_parser = std::make_unique<ConfigParser>(PersonaConfig::expandHome(config_path));

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : m_config.console_level);

    m_config.loadFromConfig(*m_config_parser);
    m_config.applyCommandOverrides(m_commands);

    logger.setConsoleLogLevel(m_config.console_level);
    logger.setFileLogLevel(m_config.file_level);
    if (!m_commands.active_command.empty()) {
        logger.initialize(m_config.effectiveLogDir(), m_config.log_max_size_bytes, m_config.log_max_files);
    }

    m_store = std::make_unique<ProfileStore>(m_config.store_dir);
    LOG_DEBUG("Core", "Using profile store " + m_config.store_dir);
}

Core::~Core() = default;

int Core::run() {
    const std::string& command = m_commands.active_command;
    if (command.empty()) {
        return 0;
    }

    Logger::getInstance().logSessionStart(command, m_commands.profile_name.empty()
                                                       ? m_commands.file_path
                                                       : m_commands.profile_name);
    auto start_time = std::chrono::steady_clock::now();

    int exit_code = 1;
    if (command == "init") {
        exit_code = handleInit();
    } else if (command == "list") {
        exit_code = handleList();
    } else if (command == "add") {
        exit_code = handleAdd();
    } else if (command == "edit") {
        exit_code = handleEdit();
    } else if (command == "remove") {
        exit_code = handleRemove();
    } else if (command == "switch") {
        exit_code = handleSwitch();
    } else if (command == "current") {
        exit_code = handleCurrent();
    } else if (command == "test-ssh") {
        exit_code = handleTestSsh();
    } else if (command == "export") {
        exit_code = handleExport();
    } else if (command == "import") {
        exit_code = handleImport();
    } else if (command == "vscode") {
        exit_code = handleVscode();
    } else {
        std::cerr << "Error: Unknown command '" << command << "'." << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(command, exit_code, static_cast<long>(duration.count()));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleInit() {
    const std::string& store_dir = m_config.store_dir;
    if (!m_sys->directoryExists(store_dir)) {
        if (!m_sys->createDirectory(store_dir)) {
            std::cerr << "Error: Failed to create profile directory '" << store_dir << "'." << std::endl;
            return 1;
        }
        std::cout << "Created profile directory: " << store_dir << std::endl;
    }

    const std::string config_file = m_config_parser->getPath();
    if (m_sys->fileExists(config_file)) {
        std::cout << "Configuration file '" << config_file << "' already exists. Skipping." << std::endl;
        return 0;
    }

    std::string error;
    if (!m_sys->writeFileAtomic(config_file, PersonaConfig::defaultConfigYaml(), error)) {
        std::cerr << "Error: Failed to write configuration file '" << config_file << "': " << error << std::endl;
        return 1;
    }
    std::cout << "Created default configuration file: " << config_file << std::endl;
    return 0;
}

int Core::handleList() {
    ProfileSet set = m_store->load();
    warnIfRecovered();

    if (set.empty()) {
        std::cout << "No profiles configured." << std::endl;
        return 0;
    }

    std::cout << "Available profiles:" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
    for (const auto& [name, profile] : set.profiles) {
        const bool active = set.current_profile && *set.current_profile == name;
        printProfile(profile, active);
        std::cout << std::endl;
    }
    return 0;
}

int Core::handleAdd() {
    Profile profile;
    profile.name = m_commands.profile_name;
    profile.username = m_commands.username;
    profile.email = m_commands.email;
    profile.default_branch = m_commands.branch.empty() ? "main" : m_commands.branch;
    profile.ssh_key_path = PersonaConfig::expandHome(m_commands.ssh_key);
    profile.auto_push = m_commands.auto_push;
    profile.sign_commits = m_commands.sign_commits;

    if (!profile.ssh_key_path.empty() && !m_sys->fileExists(profile.ssh_key_path)) {
        std::cerr << "Warning: SSH key '" << profile.ssh_key_path << "' does not exist yet." << std::endl;
    }

    StoreResult result = m_store->add(m_commands.profile_name, profile);
    warnIfRecovered();
    return reportStoreResult(result, "Added profile: " + m_commands.profile_name);
}

int Core::handleEdit() {
    ProfileSet set = m_store->load();
    warnIfRecovered();

    auto it = set.profiles.find(m_commands.profile_name);
    if (it == set.profiles.end()) {
        std::cerr << "Error: Profile '" << m_commands.profile_name << "' does not exist!" << std::endl;
        return 1;
    }

    Profile profile = it->second;
    if (m_commands.username_set) {
        profile.username = m_commands.username;
    }
    if (m_commands.email_set) {
        profile.email = m_commands.email;
    }
    if (m_commands.branch_set) {
        profile.default_branch = m_commands.branch.empty() ? "main" : m_commands.branch;
    }
    if (m_commands.ssh_key_set) {
        profile.ssh_key_path = PersonaConfig::expandHome(m_commands.ssh_key);
    }
    if (m_commands.auto_push_set) {
        profile.auto_push = m_commands.auto_push;
    }
    if (m_commands.sign_commits_set) {
        profile.sign_commits = m_commands.sign_commits;
    }

    if (profile == it->second) {
        std::cout << "Nothing to change for profile: " << m_commands.profile_name << std::endl;
        return 0;
    }

    StoreResult result = m_store->update(m_commands.profile_name, profile);
    return reportStoreResult(result, "Updated profile: " + m_commands.profile_name);
}

int Core::handleRemove() {
    std::optional<Profile> current = m_store->getCurrent();
    const bool was_current = current && current->name == m_commands.profile_name;

    StoreResult result = m_store->remove(m_commands.profile_name);
    warnIfRecovered();
    if (was_current) {
        return reportStoreResult(result, "Removed profile '" + m_commands.profile_name +
                                         "' and cleared current profile");
    }
    return reportStoreResult(result, "Removed profile: " + m_commands.profile_name);
}

int Core::handleSwitch() {
    auto identity = std::make_shared<GitIdentityWriter>(m_sys, m_config.git_command);
    auto agent = std::make_shared<SshKeyAgent>(m_sys, m_config.ssh_add_command);
    ProfileActivator activator(identity, agent, m_config.agent_timeout);
    ProfileSwitcher switcher(*m_store, activator);

    SwitchResult result = switcher.switchTo(m_commands.profile_name);
    warnIfRecovered();

    if (result.state == SwitchState::VALIDATING) {
        std::cerr << "Error: " << result.store_result.message << std::endl;
        return 1;
    }

    Logger::getInstance().logActivation(m_commands.profile_name, result.report);

    for (const auto& step : result.report.steps) {
        const std::string name = ProfileActivator::stepName(step.kind);
        if (!step.attempted) {
            continue;
        }
        if (step.succeeded) {
            std::cout << "  ✓ " << name << std::endl;
        } else if (step.error == ActivationError::AGENT_UNAVAILABLE) {
            std::cout << "  ! " << name << ": SSH agent unavailable, key not added" << std::endl;
        } else {
            std::cout << "  ✗ " << name << ": " << ProfileActivator::errorName(step.error) << std::endl;
            if (!step.detail.empty()) {
                std::cout << "    " << step.detail << std::endl;
            }
        }
    }

    if (result.state == SwitchState::ROLLED_BACK) {
        std::cerr << "Error switching to profile '" << m_commands.profile_name
                  << "': git identity could not be fully applied. The active profile was not changed." << std::endl;
        return 1;
    }
    if (result.state != SwitchState::COMMITTED) {
        std::cerr << "Error: profile applied but could not be recorded as active: "
                  << result.store_result.message << std::endl;
        return 1;
    }

    std::optional<Profile> current = m_store->getCurrent();
    std::cout << "✓ Switched to profile: " << m_commands.profile_name << std::endl;
    if (current) {
        std::cout << "  Username: " << orNotSet(current->username) << std::endl;
        std::cout << "  Email: " << orNotSet(current->email) << std::endl;
    }
    return 0;
}

int Core::handleCurrent() {
    std::optional<Profile> current = m_store->getCurrent();
    warnIfRecovered();

    if (!current) {
        std::cout << "No active profile" << std::endl;
        return 0;
    }

    std::cout << "Current profile: " << current->name << std::endl;
    std::cout << "Username: " << orNotSet(current->username) << std::endl;
    std::cout << "Email: " << orNotSet(current->email) << std::endl;
    std::cout << "Branch: " << orNotSet(current->default_branch) << std::endl;
    return 0;
}

int Core::handleTestSsh() {
    SshConnectionTester tester(m_sys, m_config.ssh_command, m_config.ssh_test_host, m_config.ssh_test_timeout);
    SshTestResult result = tester.test();

    switch (result.outcome) {
        case SshTestOutcome::SUCCESS:
            std::cout << "✓ SSH connection to " << tester.host() << " successful!" << std::endl;
            return 0;
        case SshTestOutcome::TIMED_OUT:
            std::cout << "✗ SSH connection timed out" << std::endl;
            return 1;
        case SshTestOutcome::FAILED:
            std::cout << "✗ SSH connection failed: " << result.detail << std::endl;
            return 1;
        case SshTestOutcome::ERROR:
        default:
            std::cout << "✗ SSH test failed: " << result.detail << std::endl;
            return 1;
    }
}

int Core::handleExport() {
    StoreResult result = m_store->exportTo(m_commands.file_path);
    warnIfRecovered();
    return reportStoreResult(result, "Configuration exported to " + m_commands.file_path);
}

int Core::handleImport() {
    StoreResult result = m_store->importFrom(m_commands.file_path);
    return reportStoreResult(result, "Configuration imported from " + m_commands.file_path);
}

int Core::handleVscode() {
    const std::string target = m_commands.file_path.empty() ? m_store->editorSettingsPath()
                                                            : m_commands.file_path;
    StoreResult result = m_store->exportEditorSettings(target);
    warnIfRecovered();
    if (reportStoreResult(result, "VS Code settings created: " + target) != 0) {
        return 1;
    }
    std::cout << "Add this to your VS Code settings.json:" << std::endl;
    std::cout << "  \"github-profile-switcher.configPath\": \"" << target << "\"" << std::endl;
    return 0;
}

void Core::printProfile(const Profile& profile, bool active) const {
    std::cout << (active ? "✓ Active " : "  Inactive ") << profile.name << std::endl;
    std::cout << "    Username: " << orNotSet(profile.username) << std::endl;
    std::cout << "    Email: " << orNotSet(profile.email) << std::endl;
    std::cout << "    Branch: " << orNotSet(profile.default_branch) << std::endl;
    if (!profile.ssh_key_path.empty()) {
        std::cout << "    SSH Key: " << profile.ssh_key_path << std::endl;
    }
}

void Core::warnIfRecovered() const {
    if (m_store->lastLoadRecovered()) {
        Logger::getInstance().warning("ProfileStore", "Discarded unreadable profile data",
                                      m_store->storeDirectory());
    }
}

int Core::reportStoreResult(const StoreResult& result, const std::string& success_message) const {
    if (result.ok()) {
        std::cout << "✓ " << success_message << std::endl;
        return 0;
    }

    Logger::getInstance().info("Core", "Command rejected: " + ProfileStore::errorName(result.error),
                               result.message);
    switch (result.error) {
        case StoreError::DUPLICATE_NAME:
            std::cerr << "Error: Profile '" << m_commands.profile_name << "' already exists!" << std::endl;
            break;
        case StoreError::NOT_FOUND:
            std::cerr << "Error: Profile '" << m_commands.profile_name << "' does not exist!" << std::endl;
            break;
        case StoreError::INVALID_FORMAT:
            std::cerr << "✗ Invalid input: " << result.message << std::endl;
            break;
        case StoreError::WRITE_FAILED:
        default:
            std::cerr << "✗ Could not save: " << result.message << std::endl;
            break;
    }
    return 1;
}

} // namespace Persona
