// =================================================================
// src/Persona/ProfileActivator.cpp
// =================================================================
// Implementation of profile activation.

#include "Persona/ProfileActivator.hpp"
#include <filesystem>
#include <stdexcept>

namespace Persona {

const ActivationStep* ActivationReport::find(ActivationStepKind kind) const {
    for (const auto& step : steps) {
        if (step.kind == kind) {
            return &step;
        }
    }
    return nullptr;
}

size_t ActivationReport::failureCount() const {
    size_t count = 0;
    for (const auto& step : steps) {
        if (step.attempted && !step.succeeded) {
            count++;
        }
    }
    return count;
}

ProfileActivator::ProfileActivator(std::shared_ptr<IdentityWriter> identity,
                                   std::shared_ptr<KeyAgent> agent,
                                   std::chrono::milliseconds agent_timeout)
    : m_identity(std::move(identity)),
      m_agent(std::move(agent)),
      m_agent_timeout(agent_timeout) {
    if (!m_identity || !m_agent) {
        throw std::invalid_argument("ProfileActivator requires an identity writer and a key agent");
    }
}

ActivationReport ProfileActivator::activate(const Profile& profile) {
    ActivationReport report;

    report.steps.push_back(applyIdentity(ActivationStepKind::SET_USER_NAME, "user.name", profile.username));
    report.steps.push_back(applyIdentity(ActivationStepKind::SET_USER_EMAIL, "user.email", profile.email));
    report.steps.push_back(applyIdentity(ActivationStepKind::SET_DEFAULT_BRANCH, "init.defaultBranch",
                                         profile.default_branch));

    for (const auto& step : report.steps) {
        if (!step.succeeded) {
            report.success = false;
        }
    }

    // Best effort: does not contribute to report.success
    report.steps.push_back(registerKey(profile.ssh_key_path));

    return report;
}

ActivationStep ProfileActivator::applyIdentity(ActivationStepKind kind, const std::string& key,
                                               const std::string& value) {
    ActivationStep step(kind);
    if (value.empty()) {
        step.detail = "not set";
        return step;
    }

    step.attempted = true;
    std::string detail;
    bool ok = false;
    try {
        ok = m_identity->setGlobal(key, value, detail);
    } catch (const std::exception& e) {
        detail = e.what();
    }

    step.succeeded = ok;
    step.error = ok ? ActivationError::NONE : ActivationError::IDENTITY_WRITE_FAILED;
    step.detail = detail;
    return step;
}

ActivationStep ProfileActivator::registerKey(const std::string& key_path) {
    ActivationStep step(ActivationStepKind::REGISTER_SSH_KEY);
    if (key_path.empty()) {
        step.detail = "not set";
        return step;
    }

    std::error_code ec;
    if (!std::filesystem::exists(key_path, ec)) {
        step.detail = "key file not found: " + key_path;
        return step;
    }

    step.attempted = true;
    std::string detail;
    AgentStatus status = AgentStatus::UNAVAILABLE;
    try {
        status = m_agent->addKey(key_path, m_agent_timeout, detail);
    } catch (const std::exception& e) {
        detail = e.what();
    }

    if (status == AgentStatus::ADDED) {
        step.succeeded = true;
    } else {
        step.succeeded = false;
        step.error = ActivationError::AGENT_UNAVAILABLE;
        if (status == AgentStatus::TIMED_OUT && detail.empty()) {
            detail = "key agent did not respond within " +
                     std::to_string(m_agent_timeout.count()) + "ms";
        }
    }
    step.detail = detail;
    return step;
}

std::string ProfileActivator::stepName(ActivationStepKind kind) {
    switch (kind) {
        case ActivationStepKind::SET_USER_NAME: return "user.name";
        case ActivationStepKind::SET_USER_EMAIL: return "user.email";
        case ActivationStepKind::SET_DEFAULT_BRANCH: return "init.defaultBranch";
        case ActivationStepKind::REGISTER_SSH_KEY: return "ssh-key";
        default: return "unknown";
    }
}

std::string ProfileActivator::errorName(ActivationError error) {
    switch (error) {
        case ActivationError::NONE: return "none";
        case ActivationError::IDENTITY_WRITE_FAILED: return "identity write failed";
        case ActivationError::AGENT_UNAVAILABLE: return "agent unavailable";
        default: return "unknown";
    }
}

} // namespace Persona
