// =================================================================
// tests/ProfileTest.cpp
// =================================================================
// Unit tests for the profile data model and its JSON mapping.

#include "Persona/Profile.hpp"
#include <iostream>
#include <cassert>

class ProfileTest {
public:
    void testDefaults() {
        std::cout << "Testing profile defaults..." << std::endl;

        Persona::Profile profile;
        assert(profile.default_branch == "main");
        assert(profile.ssh_key_path.empty());
        assert(!profile.auto_push);
        assert(!profile.sign_commits);

        auto parsed = nlohmann::json::parse(R"({"name": "bare"})").get<Persona::Profile>();
        assert(parsed.name == "bare");
        assert(parsed.default_branch == "main" && "Absent fields take defaults");
        assert(parsed.username.empty());

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testFieldNames() {
        std::cout << "Testing stored field names..." << std::endl;

        Persona::Profile profile("work", "alice", "a@x.com");
        profile.ssh_key_path = "/keys/id_work";
        profile.auto_push = true;

        nlohmann::json j = profile;
        assert(j["name"] == "work");
        assert(j["username"] == "alice");
        assert(j["email"] == "a@x.com");
        assert(j["default_branch"] == "main");
        assert(j["ssh_key_path"] == "/keys/id_work");
        assert(j["ssh_key"] == "/keys/id_work" && "Older readers look for ssh_key");
        assert(j["auto_push"] == true);
        assert(j["sign_commits"] == false);
        assert(j.size() == 8);

        std::cout << "✓ Field name test passed" << std::endl;
    }

    void testLegacyKeyField() {
        std::cout << "Testing the older ssh_key field..." << std::endl;

        auto legacy = nlohmann::json::parse(R"({"name": "w", "ssh_key": "/old/key"})").get<Persona::Profile>();
        assert(legacy.ssh_key_path == "/old/key");

        auto both = nlohmann::json::parse(
            R"({"name": "w", "ssh_key": "/old/key", "ssh_key_path": "/new/key"})").get<Persona::Profile>();
        assert(both.ssh_key_path == "/new/key" && "ssh_key_path wins");

        std::cout << "✓ Legacy key field test passed" << std::endl;
    }

    void testKeyWinsOverName() {
        std::cout << "Testing that map keys win over stored names..." << std::endl;

        auto profiles = Persona::profilesFromJson(nlohmann::json::parse(R"({
            "work": {"name": "stale", "email": "a@x.com"},
            "": {"name": "nameless"}
        })"));

        assert(profiles.size() == 1 && "Empty keys are dropped");
        assert(profiles.at("work").name == "work");
        assert(profiles.at("work").email == "a@x.com");

        std::cout << "✓ Key over name test passed" << std::endl;
    }

    void testInvalidDocuments() {
        std::cout << "Testing invalid documents..." << std::endl;

        bool threw = false;
        try {
            Persona::profilesFromJson(nlohmann::json::array());
        } catch (const std::exception&) {
            threw = true;
        }
        assert(threw && "Arrays are rejected");

        threw = false;
        try {
            Persona::profilesFromJson(nlohmann::json::parse(R"({"work": "alice"})"));
        } catch (const std::exception&) {
            threw = true;
        }
        assert(threw && "Non-object entries are rejected");

        threw = false;
        try {
            Persona::profilesFromJson(nlohmann::json::parse(R"({"work": {"auto_push": "yes"}})"));
        } catch (const std::exception&) {
            threw = true;
        }
        assert(threw && "Wrong field types are rejected");

        std::cout << "✓ Invalid document test passed" << std::endl;
    }

    void testCurrentResolution() {
        std::cout << "Testing current profile resolution..." << std::endl;

        Persona::ProfileSet set;
        set.profiles["work"] = Persona::Profile("work", "alice", "a@x.com");
        assert(set.current() == nullptr);

        set.current_profile = "work";
        assert(set.current() && set.current()->username == "alice");

        set.current_profile = "gone";
        assert(set.current() == nullptr && "Dangling pointer resolves to nothing");

        std::cout << "✓ Current resolution test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Profile unit tests..." << std::endl;

        testDefaults();
        testFieldNames();
        testLegacyKeyField();
        testKeyWinsOverName();
        testInvalidDocuments();
        testCurrentResolution();

        std::cout << "All Profile tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProfileTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Profile component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
