// relay_store backend tests

#include <catch2/catch.hpp>
#include <relay/store/scoped_store.hpp>

#include <filesystem>
#include <fstream>
#include <random>

using namespace relay_store;
using relay_core::ErrorCode;
using relay_core::Value;

namespace {

/// Fresh directory under the system temp path, removed on destruction
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() / ("relay_store_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // anonymous namespace

// =============================================================================
// Scope Names
// =============================================================================

TEST_CASE("Scope names", "[store][backend]") {
    REQUIRE(std::string(to_string(Scope::Global)) == "global");
    REQUIRE(std::string(to_string(Scope::Script)) == "script");
    REQUIRE(std::string(to_string(Scope::Instance)) == "instance");
    REQUIRE(scope_from_string("instance") == Scope::Instance);
    REQUIRE_FALSE(scope_from_string("session").has_value());
}

// =============================================================================
// MemoryBackend
// =============================================================================

TEST_CASE("MemoryBackend", "[store][backend]") {
    MemoryBackend backend;
    BucketKey bucket{Scope::Script, "pinger"};

    REQUIRE(backend.put(bucket, "a", Value(1)).is_ok());
    REQUIRE(backend.put(bucket, "b", Value(2)).is_ok());
    REQUIRE(backend.size() == 2);

    REQUIRE(backend.erase(bucket, "a").is_ok());
    REQUIRE(backend.erase(bucket, "missing").is_ok());

    auto entries = backend.load_all();
    REQUIRE(entries.is_ok());
    REQUIRE(entries->size() == 1);
    REQUIRE(entries->front().key == "b");
}

// =============================================================================
// JsonFileBackend
// =============================================================================

TEST_CASE("JsonFileBackend survives a restart", "[store][backend]") {
    TempDir dir;
    auto file = dir.path / "nested" / "store.json";

    {
        ScopedStore store(std::make_shared<JsonFileBackend>(file));
        REQUIRE(store.load().is_ok());
        REQUIRE(store.set(Scope::Global, "", "pings", Value(42)).is_ok());
        REQUIRE(store.set(Scope::Script, "greeter", "greeting", Value("hello")).is_ok());
        REQUIRE(store.set(Scope::Instance, "greeter@main", "last_client", Value{{"uid", "abc"}}).is_ok());
        REQUIRE(store.set(Scope::Script, "greeter", "temp", Value(true)).is_ok());
        REQUIRE(store.unset(Scope::Script, "greeter", "temp").is_ok());
    }

    REQUIRE(std::filesystem::exists(file));

    ScopedStore reopened(std::make_shared<JsonFileBackend>(file));
    REQUIRE(reopened.load().is_ok());
    REQUIRE(*reopened.get(Scope::Global, "", "pings") == 42);
    REQUIRE(*reopened.get(Scope::Script, "greeter", "greeting") == "hello");
    REQUIRE((*reopened.get(Scope::Instance, "greeter@main", "last_client"))["uid"] == "abc");
    REQUIRE_FALSE(reopened.get(Scope::Script, "greeter", "temp").has_value());
}

TEST_CASE("JsonFileBackend starts empty without a file", "[store][backend]") {
    TempDir dir;
    JsonFileBackend backend(dir.path / "absent.json");
    auto entries = backend.load_all();
    REQUIRE(entries.is_ok());
    REQUIRE(entries->empty());
}

TEST_CASE("JsonFileBackend rejects a corrupt file", "[store][backend]") {
    TempDir dir;
    auto file = dir.path / "store.json";
    {
        std::ofstream out(file);
        out << "{ this is not json";
    }

    ScopedStore store(std::make_shared<JsonFileBackend>(file));
    auto r = store.load();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code() == ErrorCode::ParseError);
}

TEST_CASE("JsonFileBackend skips unknown sections", "[store][backend]") {
    TempDir dir;
    auto file = dir.path / "store.json";
    {
        std::ofstream out(file);
        out << R"({"global": {"": {"a": 1}}, "session": {"x": {"b": 2}}})";
    }

    JsonFileBackend backend(file);
    auto entries = backend.load_all();
    REQUIRE(entries.is_ok());
    REQUIRE(entries->size() == 1);
    REQUIRE(entries->front().bucket.scope == Scope::Global);
}
