// =================================================================
// src/Persona/ProfileSwitcher.cpp
// =================================================================

#include "Persona/ProfileSwitcher.hpp"

namespace Persona {

ProfileSwitcher::ProfileSwitcher(ProfileStore& store, ProfileActivator& activator)
    : m_store(store), m_activator(activator) {}

SwitchResult ProfileSwitcher::switchTo(const std::string& name) {
    SwitchResult result;

    result.state = SwitchState::VALIDATING;
    ProfileSet set = m_store.load();
    auto it = set.profiles.find(name);
    if (it == set.profiles.end()) {
        result.store_result = StoreResult(StoreError::NOT_FOUND, "profile '" + name + "' does not exist");
        return result;
    }

    result.state = SwitchState::ACTIVATING;
    result.report = m_activator.activate(it->second);
    if (!result.report.success) {
        result.state = SwitchState::ROLLED_BACK;
        return result;
    }

    set.current_profile = name;
    result.store_result = m_store.save(set);
    if (result.store_result.ok()) {
        result.state = SwitchState::COMMITTED;
    }
    return result;
}

std::string ProfileSwitcher::stateName(SwitchState state) {
    switch (state) {
        case SwitchState::IDLE: return "idle";
        case SwitchState::VALIDATING: return "validating";
        case SwitchState::ACTIVATING: return "activating";
        case SwitchState::COMMITTED: return "committed";
        case SwitchState::ROLLED_BACK: return "rolled back";
        default: return "unknown";
    }
}

} // namespace Persona
