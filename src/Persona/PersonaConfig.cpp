// =================================================================
// src/Persona/PersonaConfig.cpp
// =================================================================
// Implementation for configuration management.

#include "Persona/PersonaConfig.hpp"
#include "Persona/CliParser.hpp"
#include "Persona/ConfigParser.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace Persona {

namespace {

// Upper bounds for integer settings
constexpr long long kMaxTimeoutSeconds = 24 * 60 * 60;
constexpr long long kMaxLogSizeBytes = 1024LL * 1024 * 1024;
constexpr long long kMaxLogFiles = 1000;

// Parses an integer setting in [1, max_value], warning and keeping the default otherwise.
template <typename T>
void readPositive(const ConfigParser& config, const std::string& key, long long max_value, T& target) {
    std::string value = config.getStringValue(key);
    if (value.empty()) {
        return;
    }
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0 || parsed > max_value) {
            throw std::out_of_range(key);
        }
        target = static_cast<T>(parsed);
    } catch (const std::exception&) {
        LOG_WARNING("Config", "Invalid " + key + " value '" + value + "', using default");
    }
}

} // namespace

void PersonaConfig::loadFromConfig(const ConfigParser& config) {
    config_path = config.getPath();
    if (!config.getError().empty()) {
        Logger::getInstance().warning("Config", "Ignoring malformed configuration file",
                                      config.getPath() + ": " + config.getError());
        return;
    }

    std::string value = config.getStringValue("store_dir");
    if (!value.empty()) {
        store_dir = expandHome(value);
    }

    value = config.getStringValue("git_command");
    if (!value.empty()) {
        git_command = value;
    }
    value = config.getStringValue("ssh_add_command");
    if (!value.empty()) {
        ssh_add_command = value;
    }
    value = config.getStringValue("ssh_command");
    if (!value.empty()) {
        ssh_command = value;
    }
    value = config.getStringValue("ssh_test_host");
    if (!value.empty()) {
        ssh_test_host = value;
    }

    long agent_seconds = agent_timeout.count();
    readPositive(config, "agent_timeout_seconds", kMaxTimeoutSeconds, agent_seconds);
    agent_timeout = std::chrono::seconds(agent_seconds);

    long test_seconds = ssh_test_timeout.count();
    readPositive(config, "ssh_test_timeout_seconds", kMaxTimeoutSeconds, test_seconds);
    ssh_test_timeout = std::chrono::seconds(test_seconds);

    value = config.getStringValue("log.dir");
    if (!value.empty()) {
        log_dir = expandHome(value);
    }
    readPositive(config, "log.max_size_bytes", kMaxLogSizeBytes, log_max_size_bytes);
    readPositive(config, "log.max_files", kMaxLogFiles, log_max_files);

    value = config.getStringValue("log.console_level");
    if (!value.empty()) {
        console_level = Logger::parseLevel(value, console_level);
    }
    value = config.getStringValue("log.file_level");
    if (!value.empty()) {
        file_level = Logger::parseLevel(value, file_level);
    }
}

void PersonaConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.store_dir.empty()) {
        store_dir = expandHome(commands.store_dir);
    }
    if (commands.verbose) {
        console_level = LogLevel::DEBUG;
    }
}

std::string PersonaConfig::effectiveLogDir() const {
    if (!log_dir.empty()) {
        return log_dir;
    }
    return (std::filesystem::path(store_dir) / "logs").string();
}

std::string PersonaConfig::defaultStoreDir(const std::string& cli_store_dir) {
    if (!cli_store_dir.empty()) {
        return expandHome(cli_store_dir);
    }
    if (const char* env = std::getenv("PERSONA_HOME")) {
        if (*env != '\0') {
            return expandHome(env);
        }
    }
    return expandHome("~/.github-profiles");
}

std::string PersonaConfig::expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user is not supported
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string PersonaConfig::defaultConfigYaml() {
    return R"(# Persona configuration
# Profile store directory (profiles.json, current_profile.json)
# store_dir: ~/.github-profiles

# External tools
git_command: git
ssh_add_command: ssh-add
ssh_command: ssh

# Seconds to wait for ssh-add before giving up on the key agent
agent_timeout_seconds: 10

# Host and deadline for `persona test-ssh`
ssh_test_host: git@github.com
ssh_test_timeout_seconds: 10

log:
  # dir: ~/.github-profiles/logs
  max_size_bytes: 1048576
  max_files: 5
  console_level: warning
  file_level: debug
)";
}

} // namespace Persona
