// =================================================================
// tests/ProfileStoreTest.cpp
// =================================================================
// Unit tests for ProfileStore component.

#include "Persona/ProfileStore.hpp"
#include "TestHelpers.hpp"
#include <iostream>
#include <cassert>

class ProfileStoreTest {
private:
    Persona::Profile makeProfile(const std::string& user, const std::string& email) {
        Persona::Profile profile;
        profile.username = user;
        profile.email = email;
        return profile;
    }

public:
    void testEmptyStoreOnFirstRun() {
        std::cout << "Testing first run with no store directory..." << std::endl;

        TempDir dir("persona_store_empty");
        Persona::ProfileStore store((dir.path() / "missing").string());

        auto set = store.load();
        assert(set.empty() && "Fresh store should have no profiles");
        assert(!set.current_profile && "Fresh store should have no current profile");
        assert(!store.lastLoadRecovered() && "Missing files are not a recovery");
        assert(!store.getCurrent() && "No current profile on a fresh store");

        std::cout << "✓ First run test passed" << std::endl;
    }

    void testAddThenLoad() {
        std::cout << "Testing add followed by load..." << std::endl;

        TempDir dir("persona_store_add");
        Persona::ProfileStore store(dir.str());

        Persona::Profile profile = makeProfile("alice", "a@x.com");
        profile.ssh_key_path = "/home/alice/.ssh/id_work";
        profile.sign_commits = true;

        auto result = store.add("work", profile);
        assert(result.ok() && "Add to empty store should succeed");

        // A second store instance sees the persisted data
        Persona::ProfileStore reopened(dir.str());
        auto set = reopened.load();
        assert(set.profiles.size() == 1);
        assert(set.contains("work"));

        const auto& stored = set.profiles.at("work");
        assert(stored.name == "work" && "Key and name must agree");
        assert(stored.username == "alice");
        assert(stored.email == "a@x.com");
        assert(stored.default_branch == "main");
        assert(stored.ssh_key_path == "/home/alice/.ssh/id_work");
        assert(stored.sign_commits);
        assert(!stored.auto_push);

        // Both key fields are on disk for tools sharing the directory
        auto raw = nlohmann::json::parse(slurp(store.profilesPath()));
        assert(raw["work"]["ssh_key_path"] == "/home/alice/.ssh/id_work");
        assert(raw["work"]["ssh_key"] == "/home/alice/.ssh/id_work");

        std::cout << "✓ Add then load test passed" << std::endl;
    }

    void testNameIsForcedToKey() {
        std::cout << "Testing that the key wins over profile.name..." << std::endl;

        TempDir dir("persona_store_key");
        Persona::ProfileStore store(dir.str());

        Persona::Profile profile = makeProfile("bob", "b@x.com");
        profile.name = "something-else";
        assert(store.add("personal", profile).ok());

        auto set = store.load();
        assert(set.profiles.at("personal").name == "personal");

        std::cout << "✓ Key invariant test passed" << std::endl;
    }

    void testDuplicateRejected() {
        std::cout << "Testing duplicate name rejection..." << std::endl;

        TempDir dir("persona_store_dup");
        Persona::ProfileStore store(dir.str());

        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        const std::string before = slurp(store.profilesPath());

        auto result = store.add("work", makeProfile("mallory", "m@x.com"));
        assert(result.error == Persona::StoreError::DUPLICATE_NAME && "Second add must be rejected");
        assert(!result.message.empty());

        auto set = store.load();
        assert(set.profiles.at("work").username == "alice" && "Stored value must be unchanged");
        assert(slurp(store.profilesPath()) == before && "File must not be rewritten");

        std::cout << "✓ Duplicate rejection test passed" << std::endl;
    }

    void testEmptyNameRejected() {
        std::cout << "Testing empty profile name..." << std::endl;

        TempDir dir("persona_store_emptyname");
        Persona::ProfileStore store(dir.str());

        auto result = store.add("", makeProfile("alice", "a@x.com"));
        assert(result.error == Persona::StoreError::INVALID_FORMAT);
        assert(!fs::exists(store.profilesPath()) && "Nothing should be written");

        std::cout << "✓ Empty name test passed" << std::endl;
    }

    void testRemoveCurrentClearsPointer() {
        std::cout << "Testing removal of the current profile..." << std::endl;

        TempDir dir("persona_store_rmcur");
        Persona::ProfileStore store(dir.str());

        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        assert(store.add("home", makeProfile("al", "al@home.org")).ok());

        auto set = store.load();
        set.current_profile = "work";
        assert(store.save(set).ok());
        assert(store.getCurrent() && store.getCurrent()->name == "work");

        assert(store.remove("work").ok());

        Persona::ProfileStore reopened(dir.str());
        auto reloaded = reopened.load();
        assert(!reloaded.contains("work"));
        assert(reloaded.contains("home"));
        assert(!reloaded.current_profile && "Pointer must be cleared on disk");

        auto pointer = nlohmann::json::parse(slurp(reopened.currentProfilePath()));
        assert(pointer.contains("current_profile") && pointer["current_profile"].is_null());

        std::cout << "✓ Remove current test passed" << std::endl;
    }

    void testRemoveOtherKeepsPointer() {
        std::cout << "Testing removal of a non-current profile..." << std::endl;

        TempDir dir("persona_store_rmother");
        Persona::ProfileStore store(dir.str());

        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        assert(store.add("home", makeProfile("al", "al@home.org")).ok());
        auto set = store.load();
        set.current_profile = "work";
        assert(store.save(set).ok());

        assert(store.remove("home").ok());
        auto current = store.getCurrent();
        assert(current && current->name == "work");

        std::cout << "✓ Remove other test passed" << std::endl;
    }

    void testRemoveMissingLeavesBytes() {
        std::cout << "Testing removal of a missing profile..." << std::endl;

        TempDir dir("persona_store_rmmissing");
        Persona::ProfileStore store(dir.str());

        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        const std::string profiles_before = slurp(store.profilesPath());
        const std::string current_before = slurp(store.currentProfilePath());

        auto result = store.remove("nope");
        assert(result.error == Persona::StoreError::NOT_FOUND);
        assert(slurp(store.profilesPath()) == profiles_before);
        assert(slurp(store.currentProfilePath()) == current_before);

        std::cout << "✓ Remove missing test passed" << std::endl;
    }

    void testCorruptFilesLoadEmpty() {
        std::cout << "Testing recovery from corrupt files..." << std::endl;

        TempDir dir("persona_store_corrupt");
        Persona::ProfileStore store(dir.str());

        writeText(store.profilesPath(), "{ this is not json");
        writeText(store.currentProfilePath(), "[1, 2");

        auto set = store.load();
        assert(set.empty() && "Corrupt profiles file should load as empty");
        assert(!set.current_profile);
        assert(store.lastLoadRecovered() && "Recovery should be reported");

        // The store stays usable
        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        auto after = store.load();
        assert(after.contains("work"));
        assert(!store.lastLoadRecovered());

        std::cout << "✓ Corrupt file recovery test passed" << std::endl;
    }

    void testWrongShapeLoadsEmpty() {
        std::cout << "Testing recovery from structurally wrong data..." << std::endl;

        TempDir dir("persona_store_shape");
        Persona::ProfileStore store(dir.str());

        writeText(store.profilesPath(), R"({"work": {"username": 42}})");
        auto set = store.load();
        assert(set.empty());
        assert(store.lastLoadRecovered());

        writeText(store.profilesPath(), R"(["work"])");
        set = store.load();
        assert(set.empty());
        assert(store.lastLoadRecovered());

        std::cout << "✓ Wrong shape test passed" << std::endl;
    }

    void testDanglingPointerHeals() {
        std::cout << "Testing dangling current profile..." << std::endl;

        TempDir dir("persona_store_dangling");
        Persona::ProfileStore store(dir.str());

        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        writeText(store.currentProfilePath(), R"({"current_profile": "deleted-elsewhere"})");

        auto set = store.load();
        assert(!set.current_profile && "Dangling pointer should be cleared");
        assert(!store.getCurrent());
        assert(!store.lastLoadRecovered() && "Dangling pointer is not corruption");

        std::cout << "✓ Dangling pointer test passed" << std::endl;
    }

    void testLegacyFilesAreRead() {
        std::cout << "Testing store files using the older ssh_key field..." << std::endl;

        TempDir dir("persona_store_legacy");
        Persona::ProfileStore store(dir.str());

        writeText(store.profilesPath(), R"({
  "work": {
    "name": "work",
    "username": "alice",
    "email": "a@x.com",
    "default_branch": "develop",
    "ssh_key": "/keys/id_work",
    "auto_push": false,
    "sign_commits": true
  }
})");
        writeText(store.currentProfilePath(), R"({"current_profile": "work"})");

        auto current = store.getCurrent();
        assert(current);
        assert(current->default_branch == "develop");
        assert(current->ssh_key_path == "/keys/id_work");
        assert(current->sign_commits);

        std::cout << "✓ Legacy file test passed" << std::endl;
    }

    void testUpdate() {
        std::cout << "Testing profile update..." << std::endl;

        TempDir dir("persona_store_update");
        Persona::ProfileStore store(dir.str());

        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        auto set = store.load();
        set.current_profile = "work";
        assert(store.save(set).ok());

        Persona::Profile changed = makeProfile("alice", "alice@corp.example");
        changed.default_branch = "trunk";
        assert(store.update("work", changed).ok());

        auto current = store.getCurrent();
        assert(current && "Update must keep the current pointer");
        assert(current->email == "alice@corp.example");
        assert(current->default_branch == "trunk");

        auto missing = store.update("ghost", changed);
        assert(missing.error == Persona::StoreError::NOT_FOUND);

        std::cout << "✓ Update test passed" << std::endl;
    }

    void testSaveFailureReported() {
        std::cout << "Testing write failure..." << std::endl;

        TempDir dir("persona_store_writefail");
        // A regular file where the store directory should be
        const std::string blocker = dir.file("not-a-dir");
        writeText(blocker, "x");

        Persona::ProfileStore store(blocker);
        auto result = store.add("work", makeProfile("alice", "a@x.com"));
        assert(result.error == Persona::StoreError::WRITE_FAILED);
        assert(!result.message.empty());

        std::cout << "✓ Write failure test passed" << std::endl;
    }

    void testExportImportRoundTrip() {
        std::cout << "Testing export and import..." << std::endl;

        TempDir source_dir("persona_store_export");
        TempDir target_dir("persona_store_import");
        Persona::ProfileStore source(source_dir.str());

        Persona::Profile work = makeProfile("alice", "a@x.com");
        work.ssh_key_path = "/keys/id_work";
        work.auto_push = true;
        assert(source.add("work", work).ok());
        assert(source.add("home", makeProfile("al", "al@home.org")).ok());
        auto set = source.load();
        set.current_profile = "home";
        assert(source.save(set).ok());

        const std::string export_file = source_dir.file("backup/export.json");
        assert(source.exportTo(export_file).ok());

        auto exported = nlohmann::json::parse(slurp(export_file));
        assert(exported.contains("profiles"));
        assert(exported["current_profile"] == "home");

        Persona::ProfileStore target(target_dir.str());
        assert(target.importFrom(export_file).ok());

        auto imported = target.load();
        assert(imported.profiles == set.profiles && "Profiles must round-trip exactly");
        assert(imported.current_profile == set.current_profile);

        std::cout << "✓ Export/import round trip test passed" << std::endl;
    }

    void testImportRejectsInvalidFile() {
        std::cout << "Testing import of invalid files..." << std::endl;

        TempDir dir("persona_store_badimport");
        Persona::ProfileStore store(dir.str());
        assert(store.add("work", makeProfile("alice", "a@x.com")).ok());
        const std::string before = slurp(store.profilesPath());

        const std::string no_profiles = dir.file("no_profiles.json");
        writeText(no_profiles, R"({"current_profile": "work"})");
        auto result = store.importFrom(no_profiles);
        assert(result.error == Persona::StoreError::INVALID_FORMAT);

        const std::string garbage = dir.file("garbage.json");
        writeText(garbage, "not json at all");
        result = store.importFrom(garbage);
        assert(result.error == Persona::StoreError::INVALID_FORMAT);

        result = store.importFrom(dir.file("does_not_exist.json"));
        assert(result.error == Persona::StoreError::INVALID_FORMAT);

        assert(slurp(store.profilesPath()) == before && "State must be untouched");
        assert(store.load().contains("work"));

        std::cout << "✓ Invalid import test passed" << std::endl;
    }

    void testEditorSettingsExport() {
        std::cout << "Testing editor settings export..." << std::endl;

        TempDir dir("persona_store_vscode");
        Persona::ProfileStore store(dir.str());
        Persona::Profile work = makeProfile("alice", "a@x.com");
        work.ssh_key_path = "/keys/id_work";
        assert(store.add("work", work).ok());

        assert(store.exportEditorSettings().ok());
        auto settings = nlohmann::json::parse(slurp(store.editorSettingsPath()));
        assert(settings["github-profile-switcher.profiles"].contains("work"));
        assert(settings["github-profile-switcher.profiles"]["work"]["ssh_key"] == "/keys/id_work" &&
               "The extension reads ssh_key");
        assert(settings["github-profile-switcher.currentProfile"].is_null());

        std::cout << "✓ Editor settings test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProfileStore unit tests..." << std::endl;

        testEmptyStoreOnFirstRun();
        testAddThenLoad();
        testNameIsForcedToKey();
        testDuplicateRejected();
        testEmptyNameRejected();
        testRemoveCurrentClearsPointer();
        testRemoveOtherKeepsPointer();
        testRemoveMissingLeavesBytes();
        testCorruptFilesLoadEmpty();
        testWrongShapeLoadsEmpty();
        testDanglingPointerHeals();
        testLegacyFilesAreRead();
        testUpdate();
        testSaveFailureReported();
        testExportImportRoundTrip();
        testImportRejectsInvalidFile();
        testEditorSettingsExport();

        std::cout << "All ProfileStore tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProfileStoreTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ProfileStore component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
