// =================================================================
// include/Persona/SshConnectionTester.hpp
// =================================================================
// Checks that the active SSH identity is accepted by the remote host.

#pragma once

#include "Persona/SysInteraction.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace Persona {

/**
 * @brief Outcome of a connectivity probe
 */
enum class SshTestOutcome {
    SUCCESS,    ///< Host authenticated us
    FAILED,     ///< ssh ran but authentication was refused
    TIMED_OUT,  ///< No answer before the deadline
    ERROR       ///< ssh could not be started
};

struct SshTestResult {
    SshTestOutcome outcome;
    std::string detail;   ///< ssh output or the spawn error

    SshTestResult() : outcome(SshTestOutcome::ERROR) {}

    bool ok() const { return outcome == SshTestOutcome::SUCCESS; }
};

/**
 * @brief Runs `ssh -T <host>` and interprets the answer
 *
 * Hosts such as GitHub refuse shell access and exit non-zero even when the
 * key was accepted, so the greeting text counts as success too.
 */
class SshConnectionTester {
public:
    SshConnectionTester(std::shared_ptr<SysInteraction> sys,
                        const std::string& ssh_command = "ssh",
                        const std::string& host = "git@github.com",
                        std::chrono::milliseconds timeout = std::chrono::seconds(10));

    SshTestResult test();

    const std::string& host() const { return m_host; }

    /**
     * @brief Classify a finished ssh run
     * @param exit_code ssh exit status
     * @param output Combined ssh output
     */
    static SshTestOutcome classify(int exit_code, const std::string& output);

private:
    std::shared_ptr<SysInteraction> m_sys;
    std::string m_ssh_command;
    std::string m_host;
    std::chrono::milliseconds m_timeout;
};

} // namespace Persona
