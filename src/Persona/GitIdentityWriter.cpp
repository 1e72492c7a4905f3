// =================================================================
// src/Persona/GitIdentityWriter.cpp
// =================================================================

#include "Persona/GitIdentityWriter.hpp"
#include "Persona/Logger.hpp"

namespace Persona {

GitIdentityWriter::GitIdentityWriter(std::shared_ptr<SysInteraction> sys, const std::string& git_command)
    : m_sys(std::move(sys)), m_git_command(git_command) {}

bool GitIdentityWriter::setGlobal(const std::string& key, const std::string& value, std::string& detail) {
    auto [output, exit_code] = m_sys->executeCommand(m_git_command, {"config", "--global", key, value});
    if (exit_code != 0) {
        detail = output.empty() ? m_git_command + " exited with code " + std::to_string(exit_code) : output;
        LOG_ERROR("GitIdentityWriter", "Failed to set " + key);
        return false;
    }
    LOG_DEBUG("GitIdentityWriter", "Set " + key + " = " + value);
    return true;
}

} // namespace Persona
