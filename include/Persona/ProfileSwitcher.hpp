// =================================================================
// include/Persona/ProfileSwitcher.hpp
// =================================================================
// Switches the active profile: validate, apply, then commit the pointer.

#pragma once

#include "Persona/ProfileActivator.hpp"
#include "Persona/ProfileStore.hpp"
#include <string>

namespace Persona {

/**
 * @brief Terminal state of a switch request
 */
enum class SwitchState {
    IDLE,        ///< Nothing attempted
    VALIDATING,  ///< Rejected before ambient state was touched
    ACTIVATING,  ///< Activated, but the new pointer could not be saved
    COMMITTED,   ///< Activated and the pointer persisted
    ROLLED_BACK  ///< Identity configuration failed; pointer unchanged
};

struct SwitchResult {
    SwitchState state;
    StoreResult store_result;   ///< NOT_FOUND from validation or WRITE_FAILED from commit
    ActivationReport report;    ///< Empty when validation failed

    SwitchResult() : state(SwitchState::IDLE) {}

    bool ok() const { return state == SwitchState::COMMITTED; }
};

/**
 * @brief Runs one switch request against a store and an activator
 *
 * The current pointer only moves when every identity step succeeded.
 * A RolledBack switch may leave identity settings partially applied.
 */
class ProfileSwitcher {
public:
    ProfileSwitcher(ProfileStore& store, ProfileActivator& activator);

    SwitchResult switchTo(const std::string& name);

    static std::string stateName(SwitchState state);

private:
    ProfileStore& m_store;
    ProfileActivator& m_activator;
};

} // namespace Persona
