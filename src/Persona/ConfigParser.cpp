// =================================================================
// src/Persona/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Persona/ConfigParser.hpp"
#include <filesystem>
#include <sstream>

namespace Persona {

ConfigParser::ConfigParser(const std::string& config_path)
    : m_path(config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        // It's okay if the file doesn't exist, e.g., before `init` is run.
        return;
    }

    try {
        m_root = YAML::LoadFile(config_path);
        if (m_root.IsNull()) {
            m_root = YAML::Node(YAML::NodeType::Map);
        } else if (!m_root.IsMap()) {
            m_error = "top level of " + config_path + " is not a mapping";
            m_root = YAML::Node();
            return;
        }
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        m_error = e.what();
        m_root = YAML::Node();
    }
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    if (!m_loaded) {
        return "";
    }

    // Node assignment copies values, so rebind with reset() while walking.
    // Lookups go through a const node to avoid inserting missing keys.
    std::istringstream segments(key);
    std::string segment;
    YAML::Node node;
    node.reset(m_root);
    while (std::getline(segments, segment, '.')) {
        if (!node.IsMap()) {
            return "";
        }
        const YAML::Node parent = node;
        YAML::Node child = parent[segment];
        if (!child.IsDefined()) {
            return "";
        }
        node.reset(child);
    }

    if (!node.IsScalar()) {
        return "";
    }
    return node.as<std::string>();
}

} // namespace Persona
