// =================================================================
// src/Persona/Profile.cpp
// =================================================================
// JSON mapping for profiles.

#include "Persona/Profile.hpp"
#include <stdexcept>

namespace Persona {

bool Profile::operator==(const Profile& other) const {
    return name == other.name &&
           username == other.username &&
           email == other.email &&
           default_branch == other.default_branch &&
           ssh_key_path == other.ssh_key_path &&
           auto_push == other.auto_push &&
           sign_commits == other.sign_commits;
}

const Profile* ProfileSet::current() const {
    if (!current_profile) {
        return nullptr;
    }
    auto it = profiles.find(*current_profile);
    return it != profiles.end() ? &it->second : nullptr;
}

bool ProfileSet::operator==(const ProfileSet& other) const {
    return profiles == other.profiles && current_profile == other.current_profile;
}

void to_json(nlohmann::json& j, const Profile& profile) {
    j = nlohmann::json{
        {"name", profile.name},
        {"username", profile.username},
        {"email", profile.email},
        {"default_branch", profile.default_branch},
        {"ssh_key_path", profile.ssh_key_path},
        {"ssh_key", profile.ssh_key_path},
        {"auto_push", profile.auto_push},
        {"sign_commits", profile.sign_commits}
    };
}

void from_json(const nlohmann::json& j, Profile& profile) {
    if (!j.is_object()) {
        throw std::invalid_argument("profile entry is not an object");
    }

    profile.name = j.value("name", std::string());
    profile.username = j.value("username", std::string());
    profile.email = j.value("email", std::string());
    profile.default_branch = j.value("default_branch", std::string("main"));

    // Older store files use "ssh_key"
    if (j.contains("ssh_key_path")) {
        profile.ssh_key_path = j.at("ssh_key_path").get<std::string>();
    } else {
        profile.ssh_key_path = j.value("ssh_key", std::string());
    }

    profile.auto_push = j.value("auto_push", false);
    profile.sign_commits = j.value("sign_commits", false);
}

nlohmann::json profilesToJson(const std::map<std::string, Profile>& profiles) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, profile] : profiles) {
        out[name] = profile;
    }
    return out;
}

std::map<std::string, Profile> profilesFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("profiles document is not an object");
    }

    std::map<std::string, Profile> profiles;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key().empty()) {
            continue;
        }
        Profile profile = it.value().get<Profile>();
        profile.name = it.key();
        profiles[it.key()] = profile;
    }
    return profiles;
}

} // namespace Persona
