// =================================================================
// include/Persona/ConfigParser.hpp
// =================================================================
// Reads the optional config.yml file.

#pragma once

#include <yaml-cpp/yaml.h>
#include <string>

namespace Persona {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * A missing file is not an error; every lookup then returns "".
     * A malformed file is recorded in getError() and treated the same way.
     * @param config_path The path to the config.yml file.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a scalar value for a given key.
     * @param key The configuration key; nested keys use dots (e.g., "log.max_files").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief True if the file existed and parsed.
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * @brief Parse error of the last load, empty if none.
     */
    const std::string& getError() const { return m_error; }

    const std::string& getPath() const { return m_path; }

private:
    std::string m_path;
    YAML::Node m_root;
    bool m_loaded = false;
    std::string m_error;
};

} // namespace Persona
