// =================================================================
// include/Persona/ProfileStore.hpp
// =================================================================
// Durable storage of named profiles and the current-profile pointer.

#pragma once

#include "Persona/Profile.hpp"
#include "Persona/SysInteraction.hpp"
#include <optional>
#include <string>

namespace Persona {

/**
 * @brief Failure kinds of store operations
 */
enum class StoreError {
    NONE,            ///< Operation succeeded
    DUPLICATE_NAME,  ///< A profile with that name already exists
    NOT_FOUND,       ///< No profile with that name
    WRITE_FAILED,    ///< Filesystem error; state was not durably updated
    INVALID_FORMAT   ///< Rejected input (bad import file, empty name)
};

/**
 * @brief Result of a store operation
 */
struct StoreResult {
    StoreError error;
    std::string message;

    StoreResult() : error(StoreError::NONE) {}
    StoreResult(StoreError err, const std::string& msg) : error(err), message(msg) {}

    bool ok() const { return error == StoreError::NONE; }
};

/**
 * @brief Durable, crash-consistent store for a ProfileSet
 *
 * State lives in two JSON files inside the store directory:
 * profiles.json (name -> profile) and current_profile.json
 * ({"current_profile": name or null}). Each file is replaced atomically.
 *
 * Every mutating operation reloads from disk first, so external edits made
 * between calls are picked up. Unreadable files are treated as empty state,
 * never as an error. The store does not log or print.
 */
class ProfileStore {
public:
    static constexpr const char* kProfilesFile = "profiles.json";
    static constexpr const char* kCurrentProfileFile = "current_profile.json";
    static constexpr const char* kEditorSettingsFile = "vscode_settings.json";

    /**
     * @brief Construct a store rooted at a directory
     * @param store_dir Directory holding the JSON files; created on first save
     */
    explicit ProfileStore(const std::string& store_dir);

    /**
     * @brief Read the persisted state
     *
     * Missing files give an empty set. Corrupt files are discarded and
     * lastLoadRecovered() reports it. A dangling current pointer is cleared.
     */
    ProfileSet load();

    /**
     * @brief Persist a complete set, replacing both files
     * @return WRITE_FAILED on filesystem errors
     */
    StoreResult save(const ProfileSet& set);

    /**
     * @brief Insert a new profile
     * @param name Key for the profile; overrides profile.name
     * @return DUPLICATE_NAME if taken, INVALID_FORMAT if empty
     */
    StoreResult add(const std::string& name, Profile profile);

    /**
     * @brief Replace an existing profile, keeping the current pointer
     * @return NOT_FOUND if absent
     */
    StoreResult update(const std::string& name, Profile profile);

    /**
     * @brief Delete a profile, clearing the current pointer if it named it
     * @return NOT_FOUND if absent; nothing is written in that case
     */
    StoreResult remove(const std::string& name);

    /**
     * @brief The active profile, if set and still present
     */
    std::optional<Profile> getCurrent();

    /**
     * @brief Write profiles and current pointer to a single file
     * @param path Destination file
     */
    StoreResult exportTo(const std::string& path);

    /**
     * @brief Replace the whole state from an exported file
     *
     * The file must be a JSON object with a "profiles" object. Anything else
     * is rejected with INVALID_FORMAT and the current state is left as is.
     */
    StoreResult importFrom(const std::string& path);

    /**
     * @brief Write a settings snippet for the editor extension
     * @param path Destination; defaults to vscode_settings.json in the store
     */
    StoreResult exportEditorSettings(const std::string& path = "");

    /**
     * @brief True if the last load() discarded unreadable data
     */
    bool lastLoadRecovered() const { return m_last_load_recovered; }

    const std::string& storeDirectory() const { return m_store_dir; }
    std::string profilesPath() const;
    std::string currentProfilePath() const;
    std::string editorSettingsPath() const;

    static std::string errorName(StoreError error);

private:
    std::string m_store_dir;
    SysInteraction m_sys;
    bool m_last_load_recovered = false;

    /**
     * @brief Parse a file as JSON
     * @return nullopt if the file is missing or does not parse
     */
    std::optional<nlohmann::json> readJson(const std::string& path, bool& corrupt);

    StoreResult writeJson(const std::string& path, const nlohmann::json& document);
};

} // namespace Persona
