// =================================================================
// include/Persona/GitIdentityWriter.hpp
// =================================================================
// IdentityWriter that stores settings with `git config --global`.

#pragma once

#include "Persona/ProfileActivator.hpp"
#include "Persona/SysInteraction.hpp"
#include <memory>
#include <string>

namespace Persona {

class GitIdentityWriter : public IdentityWriter {
public:
    /**
     * @brief Constructs the writer.
     * @param sys Process runner.
     * @param git_command The git executable (default "git").
     */
    explicit GitIdentityWriter(std::shared_ptr<SysInteraction> sys, const std::string& git_command = "git");

    bool setGlobal(const std::string& key, const std::string& value, std::string& detail) override;

private:
    std::shared_ptr<SysInteraction> m_sys;
    std::string m_git_command;
};

} // namespace Persona
