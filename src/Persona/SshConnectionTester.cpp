// =================================================================
// src/Persona/SshConnectionTester.cpp
// =================================================================

#include "Persona/SshConnectionTester.hpp"
#include "Persona/Logger.hpp"
#include <stdexcept>

namespace Persona {

SshConnectionTester::SshConnectionTester(std::shared_ptr<SysInteraction> sys,
                                         const std::string& ssh_command,
                                         const std::string& host,
                                         std::chrono::milliseconds timeout)
    : m_sys(std::move(sys)), m_ssh_command(ssh_command), m_host(host), m_timeout(timeout) {}

SshTestResult SshConnectionTester::test() {
    SshTestResult result;
    CommandResult run;
    try {
        // BatchMode keeps ssh from prompting for passwords or host keys
        run = m_sys->executeCommand(m_ssh_command, {"-T", "-o", "BatchMode=yes", m_host}, m_timeout);
    } catch (const std::runtime_error& e) {
        result.outcome = SshTestOutcome::ERROR;
        result.detail = e.what();
        return result;
    }

    result.detail = run.output;
    if (run.timed_out) {
        result.outcome = SshTestOutcome::TIMED_OUT;
    } else if (run.exit_code == 127) {
        result.outcome = SshTestOutcome::ERROR;
        if (result.detail.empty()) {
            result.detail = "cannot execute " + m_ssh_command;
        }
    } else {
        result.outcome = classify(run.exit_code, run.output);
    }

    Logger::getInstance().info("SshConnectionTester", "Probe of " + m_host + " finished",
                               "exit code " + std::to_string(run.exit_code));
    return result;
}

SshTestOutcome SshConnectionTester::classify(int exit_code, const std::string& output) {
    if (exit_code == 0 || output.find("successfully authenticated") != std::string::npos) {
        return SshTestOutcome::SUCCESS;
    }
    return SshTestOutcome::FAILED;
}

} // namespace Persona
