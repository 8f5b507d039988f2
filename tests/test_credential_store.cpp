#include <catch2/catch_test_macros.hpp>
#include "credential/credential_store.hpp"

#include <filesystem>
#include <fstream>

using namespace rulegate;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "rulegate_test_store") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

std::chrono::system_clock::time_point at_seconds(int64_t s) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(s));
}

} // namespace

TEST_CASE("InMemoryCredentialStore: save, load, remove", "[credentials][store]") {
    InMemoryCredentialStore store;
    CHECK_FALSE(store.load("svc@example.com").has_value());

    REQUIRE(store.save({"svc@example.com", "tok-1", at_seconds(1000)}));
    auto loaded = store.load("svc@example.com");
    REQUIRE(loaded.has_value());
    CHECK(loaded->token == "tok-1");
    CHECK(loaded->refreshed_at == at_seconds(1000));

    REQUIRE(store.save({"svc@example.com", "tok-2", at_seconds(2000)}));
    CHECK(store.load("svc@example.com")->token == "tok-2");

    store.remove("svc@example.com");
    CHECK_FALSE(store.load("svc@example.com").has_value());
}

TEST_CASE("JsonFileCredentialStore: tokens survive a new instance", "[credentials][store]") {
    TmpDir tmp;
    const auto path = (tmp.path / "tokens.json").string();

    {
        JsonFileCredentialStore store(path);
        REQUIRE(store.save({"a@example.com", "tok-a", at_seconds(1700000000)}));
        REQUIRE(store.save({"b@example.com", "tok-b", at_seconds(1700000100)}));
    }

    JsonFileCredentialStore reopened(path);
    auto a = reopened.load("a@example.com");
    REQUIRE(a.has_value());
    CHECK(a->identity == "a@example.com");
    CHECK(a->token == "tok-a");
    CHECK(a->refreshed_at == at_seconds(1700000000));
    CHECK(reopened.load("b@example.com")->token == "tok-b");
    CHECK_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("JsonFileCredentialStore: remove drops a single identity", "[credentials][store]") {
    TmpDir tmp;
    JsonFileCredentialStore store((tmp.path / "tokens.json").string());
    REQUIRE(store.save({"a@example.com", "tok-a", at_seconds(1)}));
    REQUIRE(store.save({"b@example.com", "tok-b", at_seconds(2)}));

    store.remove("a@example.com");
    CHECK_FALSE(store.load("a@example.com").has_value());
    CHECK(store.load("b@example.com").has_value());
}

TEST_CASE("JsonFileCredentialStore: missing or corrupt files load nothing", "[credentials][store]") {
    TmpDir tmp;

    SECTION("Missing file") {
        JsonFileCredentialStore store((tmp.path / "absent.json").string());
        CHECK_FALSE(store.load("a@example.com").has_value());
    }

    SECTION("Corrupt file is replaced on save") {
        const auto path = tmp.file("tokens.json", "{not json");
        JsonFileCredentialStore store(path);
        CHECK_FALSE(store.load("a@example.com").has_value());
        REQUIRE(store.save({"a@example.com", "tok", at_seconds(5)}));
        CHECK(store.load("a@example.com")->token == "tok");
    }

    SECTION("Entry without a token") {
        const auto path = tmp.file("tokens.json", R"({"a@example.com": {"refreshed_at": 5}})");
        JsonFileCredentialStore store(path);
        CHECK_FALSE(store.load("a@example.com").has_value());
    }
}

TEST_CASE("JsonFileCredentialStore: unwritable location fails save", "[credentials][store]") {
    JsonFileCredentialStore store("/nonexistent-dir/rulegate/tokens.json");
    CHECK_FALSE(store.save({"a@example.com", "tok", at_seconds(1)}));
}
