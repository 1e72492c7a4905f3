// =================================================================
// include/Persona/Profile.hpp
// =================================================================
// Data model for named identity profiles and the persisted profile set.

#pragma once

#include "nlohmann/json.hpp"
#include <map>
#include <optional>
#include <string>

namespace Persona {

/**
 * @brief A named bundle of identity and preference settings
 *
 * The name is the unique key of the profile inside a ProfileSet. All other
 * fields are optional; empty strings mean "not set".
 */
struct Profile {
    std::string name;                     ///< Unique, non-empty key
    std::string username;                 ///< Account name on the remote host
    std::string email;                    ///< Commit email
    std::string default_branch = "main";  ///< Value for init.defaultBranch
    std::string ssh_key_path;             ///< Private key to register with the agent
    bool auto_push = false;
    bool sign_commits = false;

    Profile() = default;
    Profile(const std::string& profile_name, const std::string& user, const std::string& mail)
        : name(profile_name), username(user), email(mail) {}

    bool operator==(const Profile& other) const;
    bool operator!=(const Profile& other) const { return !(*this == other); }
};

/**
 * @brief The durable store contents: all profiles plus the active pointer
 */
struct ProfileSet {
    std::map<std::string, Profile> profiles;     ///< name -> profile
    std::optional<std::string> current_profile;  ///< Active profile name, if any

    bool empty() const { return profiles.empty(); }
    bool contains(const std::string& name) const { return profiles.count(name) > 0; }

    /**
     * @brief Resolve the current pointer
     * @return The active profile, or nullptr when unset or dangling
     */
    const Profile* current() const;

    bool operator==(const ProfileSet& other) const;
    bool operator!=(const ProfileSet& other) const { return !(*this == other); }
};

// nlohmann::json ADL hooks. The key path is written under both "ssh_key_path"
// and the older "ssh_key" so the editor extension and older tools can read it.
// from_json prefers "ssh_key_path", fills defaults for absent fields, and
// throws on a field of the wrong type.
void to_json(nlohmann::json& j, const Profile& profile);
void from_json(const nlohmann::json& j, Profile& profile);

/**
 * @brief Serialize the profile map as a JSON object keyed by name
 */
nlohmann::json profilesToJson(const std::map<std::string, Profile>& profiles);

/**
 * @brief Parse a JSON object keyed by profile name
 *
 * Keys win over the stored "name" field. Entries with an empty key are
 * dropped.
 * @throws nlohmann::json::exception or std::invalid_argument if the document
 *         is not an object of profile objects
 */
std::map<std::string, Profile> profilesFromJson(const nlohmann::json& j);

} // namespace Persona
