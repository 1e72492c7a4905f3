// =================================================================
// include/Persona/ProfileActivator.hpp
// =================================================================
// Applies a profile to the global identity configuration and the SSH
// key agent, reporting the outcome of every step.

#pragma once

#include "Persona/Profile.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Persona {

/**
 * @brief Failure kinds of an activation step
 */
enum class ActivationError {
    NONE,                   ///< Step succeeded or was skipped
    IDENTITY_WRITE_FAILED,  ///< A global identity setting could not be written
    AGENT_UNAVAILABLE       ///< Key agent unreachable, refused the key, or timed out
};

/**
 * @brief The fixed sequence of activation steps
 */
enum class ActivationStepKind {
    SET_USER_NAME,
    SET_USER_EMAIL,
    SET_DEFAULT_BRANCH,
    REGISTER_SSH_KEY
};

/**
 * @brief Outcome of one activation step
 */
struct ActivationStep {
    ActivationStepKind kind;
    bool attempted;          ///< False when the profile field was empty
    bool succeeded;          ///< True for skipped steps
    ActivationError error;
    std::string detail;      ///< Tool output or the reason the step was skipped

    ActivationStep(ActivationStepKind k)
        : kind(k), attempted(false), succeeded(true), error(ActivationError::NONE) {}
};

/**
 * @brief Aggregated outcome of an activation
 */
struct ActivationReport {
    bool success;                      ///< True iff identity steps all succeeded
    std::vector<ActivationStep> steps; ///< One entry per step, in execution order

    ActivationReport() : success(true) {}

    /**
     * @brief Find the entry for a step kind
     * @return Pointer into steps, or nullptr if absent
     */
    const ActivationStep* find(ActivationStepKind kind) const;

    /**
     * @brief Number of attempted steps that failed, soft failures included
     */
    size_t failureCount() const;
};

/**
 * @brief Writes global identity settings (user.name, user.email, ...)
 */
class IdentityWriter {
public:
    virtual ~IdentityWriter() = default;

    /**
     * @brief Set one global configuration key
     * @param key Configuration key, e.g. "user.email"
     * @param value Value to store
     * @param detail Receives tool output on failure
     * @return True on success
     */
    virtual bool setGlobal(const std::string& key, const std::string& value, std::string& detail) = 0;
};

/**
 * @brief Result of handing a key to the key agent
 */
enum class AgentStatus {
    ADDED,        ///< Key registered
    UNAVAILABLE,  ///< No agent, agent refused, or tool failed
    TIMED_OUT     ///< Registration did not finish before the deadline
};

/**
 * @brief Registers private keys with the ambient SSH agent
 */
class KeyAgent {
public:
    virtual ~KeyAgent() = default;

    /**
     * @brief Register a private key, bounded by a deadline
     * @param key_path Path to the private key
     * @param timeout Deadline for the registration
     * @param detail Receives tool output on failure
     */
    virtual AgentStatus addKey(const std::string& key_path,
                               std::chrono::milliseconds timeout,
                               std::string& detail) = 0;
};

/**
 * @brief Applies profiles to ambient global state
 *
 * Steps run in a fixed order and every step is attempted regardless of
 * earlier failures. Nothing already written is rolled back. Key agent
 * problems are soft failures and never affect overall success.
 */
class ProfileActivator {
public:
    static constexpr std::chrono::seconds kDefaultAgentTimeout{10};

    ProfileActivator(std::shared_ptr<IdentityWriter> identity,
                     std::shared_ptr<KeyAgent> agent,
                     std::chrono::milliseconds agent_timeout = kDefaultAgentTimeout);

    /**
     * @brief Apply a profile
     * @param profile Profile to apply
     * @return Per-step report; success reflects the identity steps only
     */
    ActivationReport activate(const Profile& profile);

    std::chrono::milliseconds agentTimeout() const { return m_agent_timeout; }

    static std::string stepName(ActivationStepKind kind);
    static std::string errorName(ActivationError error);

private:
    std::shared_ptr<IdentityWriter> m_identity;
    std::shared_ptr<KeyAgent> m_agent;
    std::chrono::milliseconds m_agent_timeout;

    ActivationStep applyIdentity(ActivationStepKind kind, const std::string& key, const std::string& value);
    ActivationStep registerKey(const std::string& key_path);
};

} // namespace Persona
