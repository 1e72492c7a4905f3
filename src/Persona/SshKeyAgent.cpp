// =================================================================
// src/Persona/SshKeyAgent.cpp
// =================================================================

#include "Persona/SshKeyAgent.hpp"
#include "Persona/Logger.hpp"
#include <stdexcept>

namespace Persona {

SshKeyAgent::SshKeyAgent(std::shared_ptr<SysInteraction> sys, const std::string& ssh_add_command)
    : m_sys(std::move(sys)), m_ssh_add_command(ssh_add_command) {}

AgentStatus SshKeyAgent::addKey(const std::string& key_path,
                                std::chrono::milliseconds timeout,
                                std::string& detail) {
    CommandResult result;
    try {
        result = m_sys->executeCommand(m_ssh_add_command, {key_path}, timeout);
    } catch (const std::runtime_error& e) {
        detail = e.what();
        return AgentStatus::UNAVAILABLE;
    }

    if (result.timed_out) {
        detail = m_ssh_add_command + " did not finish within " + std::to_string(timeout.count()) + "ms";
        return AgentStatus::TIMED_OUT;
    }
    if (result.exit_code != 0) {
        // Exit code 2 means no agent could be contacted
        detail = result.output.empty()
            ? m_ssh_add_command + " exited with code " + std::to_string(result.exit_code)
            : result.output;
        return AgentStatus::UNAVAILABLE;
    }

    LOG_DEBUG("SshKeyAgent", "Registered key " + key_path);
    return AgentStatus::ADDED;
}

} // namespace Persona
