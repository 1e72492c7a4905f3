// =================================================================
// src/Persona/ProfileStore.cpp
// =================================================================
// Implementation of the profile store.

#include "Persona/ProfileStore.hpp"
#include <filesystem>
#include <stdexcept>

namespace Persona {

ProfileStore::ProfileStore(const std::string& store_dir)
    : m_store_dir(store_dir) {}

std::string ProfileStore::profilesPath() const {
    return (std::filesystem::path(m_store_dir) / kProfilesFile).string();
}

std::string ProfileStore::currentProfilePath() const {
    return (std::filesystem::path(m_store_dir) / kCurrentProfileFile).string();
}

std::string ProfileStore::editorSettingsPath() const {
    return (std::filesystem::path(m_store_dir) / kEditorSettingsFile).string();
}

ProfileSet ProfileStore::load() {
    ProfileSet set;
    m_last_load_recovered = false;

    bool corrupt = false;
    if (auto document = readJson(profilesPath(), corrupt)) {
        try {
            set.profiles = profilesFromJson(*document);
        } catch (const std::exception&) {
            set.profiles.clear();
            corrupt = true;
        }
    }
    if (corrupt) {
        m_last_load_recovered = true;
    }

    corrupt = false;
    if (auto document = readJson(currentProfilePath(), corrupt)) {
        if (document->is_object()) {
            auto it = document->find("current_profile");
            if (it != document->end() && it->is_string()) {
                set.current_profile = it->get<std::string>();
            } else if (it != document->end() && !it->is_null()) {
                corrupt = true;
            }
        } else {
            corrupt = true;
        }
    }
    if (corrupt) {
        m_last_load_recovered = true;
    }

    // Dangling pointer means no active profile
    if (set.current_profile && !set.contains(*set.current_profile)) {
        set.current_profile.reset();
    }

    return set;
}

StoreResult ProfileStore::save(const ProfileSet& set) {
    for (const auto& [name, profile] : set.profiles) {
        if (name.empty()) {
            return StoreResult(StoreError::INVALID_FORMAT, "profile name must not be empty");
        }
    }

    nlohmann::json profiles_doc = nlohmann::json::object();
    for (const auto& [name, profile] : set.profiles) {
        Profile stored = profile;
        stored.name = name;
        profiles_doc[name] = stored;
    }

    nlohmann::json current_doc = nlohmann::json::object();
    if (set.current_profile && set.contains(*set.current_profile)) {
        current_doc["current_profile"] = *set.current_profile;
    } else {
        current_doc["current_profile"] = nullptr;
    }

    StoreResult result = writeJson(profilesPath(), profiles_doc);
    if (!result.ok()) {
        return result;
    }
    return writeJson(currentProfilePath(), current_doc);
}

StoreResult ProfileStore::add(const std::string& name, Profile profile) {
    if (name.empty()) {
        return StoreResult(StoreError::INVALID_FORMAT, "profile name must not be empty");
    }

    ProfileSet set = load();
    if (set.contains(name)) {
        return StoreResult(StoreError::DUPLICATE_NAME, "profile '" + name + "' already exists");
    }

    profile.name = name;
    set.profiles[name] = profile;
    return save(set);
}

StoreResult ProfileStore::update(const std::string& name, Profile profile) {
    ProfileSet set = load();
    if (!set.contains(name)) {
        return StoreResult(StoreError::NOT_FOUND, "profile '" + name + "' does not exist");
    }

    profile.name = name;
    set.profiles[name] = profile;
    return save(set);
}

StoreResult ProfileStore::remove(const std::string& name) {
    ProfileSet set = load();
    if (!set.contains(name)) {
        return StoreResult(StoreError::NOT_FOUND, "profile '" + name + "' does not exist");
    }

    set.profiles.erase(name);
    if (set.current_profile && *set.current_profile == name) {
        set.current_profile.reset();
    }
    return save(set);
}

std::optional<Profile> ProfileStore::getCurrent() {
    ProfileSet set = load();
    if (const Profile* current = set.current()) {
        return *current;
    }
    return std::nullopt;
}

StoreResult ProfileStore::exportTo(const std::string& path) {
    ProfileSet set = load();

    nlohmann::json document = nlohmann::json::object();
    document["profiles"] = profilesToJson(set.profiles);
    if (set.current_profile) {
        document["current_profile"] = *set.current_profile;
    } else {
        document["current_profile"] = nullptr;
    }

    return writeJson(path, document);
}

StoreResult ProfileStore::importFrom(const std::string& path) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(m_sys.readFile(path));
    } catch (const nlohmann::json::exception& e) {
        return StoreResult(StoreError::INVALID_FORMAT, "cannot parse " + path + ": " + e.what());
    } catch (const std::exception& e) {
        return StoreResult(StoreError::INVALID_FORMAT, e.what());
    }

    if (!document.is_object() || !document.contains("profiles")) {
        return StoreResult(StoreError::INVALID_FORMAT, path + " has no 'profiles' section");
    }

    ProfileSet set;
    try {
        set.profiles = profilesFromJson(document.at("profiles"));
    } catch (const std::exception& e) {
        return StoreResult(StoreError::INVALID_FORMAT, "invalid profiles in " + path + ": " + e.what());
    }

    auto current = document.find("current_profile");
    if (current != document.end() && current->is_string()) {
        set.current_profile = current->get<std::string>();
        if (!set.contains(*set.current_profile)) {
            set.current_profile.reset();
        }
    }

    return save(set);
}

StoreResult ProfileStore::exportEditorSettings(const std::string& path) {
    ProfileSet set = load();

    nlohmann::json document = nlohmann::json::object();
    document["github-profile-switcher.profiles"] = profilesToJson(set.profiles);
    if (set.current_profile) {
        document["github-profile-switcher.currentProfile"] = *set.current_profile;
    } else {
        document["github-profile-switcher.currentProfile"] = nullptr;
    }

    return writeJson(path.empty() ? editorSettingsPath() : path, document);
}

std::string ProfileStore::errorName(StoreError error) {
    switch (error) {
        case StoreError::NONE: return "none";
        case StoreError::DUPLICATE_NAME: return "duplicate name";
        case StoreError::NOT_FOUND: return "not found";
        case StoreError::WRITE_FAILED: return "write failed";
        case StoreError::INVALID_FORMAT: return "invalid format";
        default: return "unknown";
    }
}

std::optional<nlohmann::json> ProfileStore::readJson(const std::string& path, bool& corrupt) {
    if (!m_sys.fileExists(path)) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(m_sys.readFile(path));
    } catch (const std::exception&) {
        // Unreadable or unparseable: start over from empty state
        corrupt = true;
        return std::nullopt;
    }
}

StoreResult ProfileStore::writeJson(const std::string& path, const nlohmann::json& document) {
    std::string error;
    if (!m_sys.writeFileAtomic(path, document.dump(2) + "\n", error)) {
        return StoreResult(StoreError::WRITE_FAILED, error);
    }
    return StoreResult();
}

} // namespace Persona
