// =================================================================
// include/Persona/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Persona/CliParser.hpp"
#include "Persona/PersonaConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Persona {
    class ConfigParser;
    class ProfileStore;
    class SysInteraction;
    struct Profile;
    struct StoreResult;
}

namespace Persona {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     *
     * Resolves the store directory, reads config.yml and sets up logging.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

    const PersonaConfig& getConfig() const { return m_config; }

private:
    // Command Handlers
    int handleInit();
    int handleList();
    int handleAdd();
    int handleEdit();
    int handleRemove();
    int handleSwitch();
    int handleCurrent();
    int handleTestSsh();
    int handleExport();
    int handleImport();
    int handleVscode();

    void printProfile(const Profile& profile, bool active) const;
    void warnIfRecovered() const;
    int reportStoreResult(const StoreResult& result, const std::string& success_message) const;

    const Commands& m_commands;
    PersonaConfig m_config;
    std::unique_ptr<ConfigParser> m_config_parser;
    std::shared_ptr<SysInteraction> m_sys;
    std::unique_ptr<ProfileStore> m_store;
};

} // namespace Persona
