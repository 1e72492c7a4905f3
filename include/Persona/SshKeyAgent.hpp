// =================================================================
// include/Persona/SshKeyAgent.hpp
// =================================================================
// KeyAgent backed by `ssh-add`.

#pragma once

#include "Persona/ProfileActivator.hpp"
#include "Persona/SysInteraction.hpp"
#include <memory>
#include <string>

namespace Persona {

class SshKeyAgent : public KeyAgent {
public:
    /**
     * @brief Constructs the agent client.
     * @param sys Process runner.
     * @param ssh_add_command The ssh-add executable (default "ssh-add").
     */
    explicit SshKeyAgent(std::shared_ptr<SysInteraction> sys, const std::string& ssh_add_command = "ssh-add");

    AgentStatus addKey(const std::string& key_path,
                       std::chrono::milliseconds timeout,
                       std::string& detail) override;

private:
    std::shared_ptr<SysInteraction> m_sys;
    std::string m_ssh_add_command;
};

} // namespace Persona
