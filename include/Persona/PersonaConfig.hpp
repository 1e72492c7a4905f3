// =================================================================
// include/Persona/PersonaConfig.hpp
// =================================================================
// Effective settings: defaults, then config.yml, then command line.

#pragma once

#include "Persona/Logger.hpp"
#include <chrono>
#include <string>

namespace Persona {

/**
 * @brief Application settings
 */
struct PersonaConfig {
    std::string store_dir;                 ///< Profile store directory
    std::string config_path;               ///< config.yml that was read

    // External tools
    std::string git_command = "git";
    std::string ssh_add_command = "ssh-add";
    std::string ssh_command = "ssh";

    // Timeouts
    std::chrono::seconds agent_timeout{10};
    std::string ssh_test_host = "git@github.com";
    std::chrono::seconds ssh_test_timeout{10};

    // Logging
    std::string log_dir;                   ///< Empty: <store_dir>/logs
    size_t log_max_size_bytes = 1024 * 1024;
    size_t log_max_files = 5;
    LogLevel console_level = LogLevel::WARNING;
    LogLevel file_level = LogLevel::DEBUG;

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const class ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const struct Commands& commands);

    /**
     * @brief Directory holding the log files
     */
    std::string effectiveLogDir() const;

    /**
     * @brief Store directory before config.yml is read
     *
     * Precedence: --store-dir, $PERSONA_HOME, ~/.github-profiles.
     * @param cli_store_dir Value of --store-dir, may be empty
     */
    static std::string defaultStoreDir(const std::string& cli_store_dir);

    /**
     * @brief Expand a leading "~" to $HOME
     */
    static std::string expandHome(const std::string& path);

    /**
     * @brief Contents written by `init`
     */
    static std::string defaultConfigYaml();
};

} // namespace Persona
