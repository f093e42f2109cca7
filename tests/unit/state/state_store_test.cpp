/**
 * Tests for StateStore and PersistedPreferences - the JSON file that remembers
 * tracked containers and creation defaults between runs.
 */

#include <gtest/gtest.h>
#include <flocker/state/state_store.h>

#include "../../common/test_env.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace flocker;
using namespace flocker::state;
using flocker::test::TempDir;

namespace {

ContainerRecord makeRecord(const std::string& id, uint16_t port,
                           std::optional<int64_t> startedAt = std::nullopt) {
    ContainerRecord r;
    r.id = id;
    r.name = "fluree-" + id;
    r.image = docker::ImageReference::parse("fluree/server:3.0.1").value();
    r.hostPort = port;
    if (startedAt)
        r.lastStart = TimePoint(std::chrono::seconds(*startedAt));
    return r;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

// ============================================================================
// PersistedPreferences
// ============================================================================

TEST(PersistedPreferencesTest, UpsertReplacesById) {
    PersistedPreferences prefs;
    prefs.upsert(makeRecord("a", 8090));
    prefs.upsert(makeRecord("b", 8091));
    auto updated = makeRecord("a", 8090, 100);
    prefs.upsert(updated);

    ASSERT_EQ(prefs.containers.size(), 2u);
    ASSERT_NE(prefs.find("a"), nullptr);
    EXPECT_TRUE(prefs.find("a")->lastStart.has_value());
    EXPECT_EQ(prefs.find("zzz"), nullptr);
}

TEST(PersistedPreferencesTest, RemoveClearsActive) {
    PersistedPreferences prefs;
    prefs.upsert(makeRecord("a", 8090));
    prefs.activeId = "a";
    ASSERT_NE(prefs.active(), nullptr);

    EXPECT_TRUE(prefs.remove("a"));
    EXPECT_FALSE(prefs.activeId.has_value());
    EXPECT_EQ(prefs.active(), nullptr);
    EXPECT_FALSE(prefs.remove("a"));
}

TEST(PersistedPreferencesTest, MostRecentIgnoresNeverStarted) {
    PersistedPreferences prefs;
    EXPECT_EQ(prefs.mostRecent(), nullptr);
    prefs.upsert(makeRecord("never", 8090));
    prefs.upsert(makeRecord("old", 8091, 1000));
    prefs.upsert(makeRecord("new", 8092, 2000));

    ASSERT_NE(prefs.mostRecent(), nullptr);
    EXPECT_EQ(prefs.mostRecent()->id, "new");
}

TEST(PersistedPreferencesTest, RememberDefaultsCopiesCreationInputs) {
    PersistedPreferences prefs;
    auto r = makeRecord("a", 58090);
    r.dataDir = fs::path("/srv/fluree");
    r.mode = docker::RunMode::Foreground;
    prefs.rememberDefaults(r);

    EXPECT_EQ(prefs.defaults.port, 58090);
    EXPECT_EQ(prefs.defaults.dataDir, fs::path("/srv/fluree"));
    EXPECT_EQ(prefs.defaults.mode, docker::RunMode::Foreground);
}

// ============================================================================
// Serialization
// ============================================================================

TEST(StateSerializationTest, RoundTripKeepsEveryField) {
    PersistedPreferences prefs;
    auto r = makeRecord("abc123", 58090, 1714557600);
    r.dataDir = fs::path("/srv/fluree");
    r.mode = docker::RunMode::Foreground;
    prefs.upsert(r);
    prefs.upsert(makeRecord("def456", 8090));
    prefs.activeId = "abc123";
    prefs.rememberDefaults(r);

    auto parsed = parsePreferences(serializePreferences(prefs));
    ASSERT_TRUE(parsed);
    const auto& p = parsed.value();
    ASSERT_EQ(p.containers.size(), 2u);
    const auto* a = p.find("abc123");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->name, "fluree-abc123");
    EXPECT_EQ(a->image.str(), "fluree/server:3.0.1");
    EXPECT_EQ(a->hostPort, 58090);
    EXPECT_EQ(a->dataDir, fs::path("/srv/fluree"));
    EXPECT_EQ(a->mode, docker::RunMode::Foreground);
    ASSERT_TRUE(a->lastStart.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(a->lastStart->time_since_epoch())
                  .count(),
              1714557600);
    EXPECT_FALSE(p.find("def456")->lastStart.has_value());
    EXPECT_EQ(p.activeId, std::optional<ContainerId>("abc123"));
    EXPECT_EQ(p.defaults.port, 58090);
}

TEST(StateSerializationTest, UsesDocumentedKeys) {
    PersistedPreferences prefs;
    prefs.upsert(makeRecord("a", 8090));
    auto doc = nlohmann::json::parse(serializePreferences(prefs));
    EXPECT_EQ(doc["version"], 1);
    EXPECT_TRUE(doc["containers"][0].contains("last_start"));
    EXPECT_TRUE(doc["containers"][0]["data_dir"].is_null());
    EXPECT_TRUE(doc["active"].is_null());
    EXPECT_EQ(doc["defaults"]["mode"], "background");
}

TEST(StateSerializationTest, InvalidRecordsAreSkipped) {
    auto parsed = parsePreferences(R"({
        "containers": [
            {"id": "good", "image": "fluree/server:latest", "port": 8090},
            {"id": "", "image": "fluree/server:latest", "port": 8090},
            {"id": "badport", "image": "fluree/server:latest", "port": 70000},
            {"name": "noid"}
        ],
        "active": "badport"
    })");
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed.value().containers.size(), 1u);
    EXPECT_EQ(parsed.value().containers[0].id, "good");
    EXPECT_FALSE(parsed.value().activeId.has_value());
}

TEST(StateSerializationTest, MissingDefaultsComeFromMostRecentRecord) {
    auto parsed = parsePreferences(R"({
        "containers": [
            {"id": "old", "image": "fluree/server", "port": 8090, "last_start": 10},
            {"id": "new", "image": "fluree/server", "port": 9999, "mode": "foreground",
             "data_dir": "/data", "last_start": 20}
        ]
    })");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().defaults.port, 9999);
    EXPECT_EQ(parsed.value().defaults.mode, docker::RunMode::Foreground);
    EXPECT_EQ(parsed.value().defaults.dataDir, fs::path("/data"));
}

TEST(StateSerializationTest, NonJsonIsMalformed) {
    auto parsed = parsePreferences("{ not json");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::MalformedResponse);
    EXPECT_FALSE(parsePreferences("[1, 2]"));
}

// ============================================================================
// StateStore
// ============================================================================

TEST(StateStoreTest, MissingFileLoadsDefaults) {
    TempDir dir("flocker_state");
    StateStore store(dir.path() / "state.json");
    auto prefs = store.load();
    EXPECT_TRUE(prefs.containers.empty());
    EXPECT_FALSE(prefs.activeId.has_value());
    EXPECT_EQ(prefs.defaults.port, 8090);
}

TEST(StateStoreTest, CorruptFileLoadsDefaults) {
    TempDir dir("flocker_state");
    auto path = dir.path() / "state.json";
    std::ofstream(path) << "\x01garbage";
    StateStore store(path);
    EXPECT_TRUE(store.load().containers.empty());
}

TEST(StateStoreTest, SaveCreatesParentAndReplacesAtomically) {
    TempDir dir("flocker_state");
    auto path = dir.path() / "nested" / "state.json";
    StateStore store(path);

    PersistedPreferences prefs;
    prefs.upsert(makeRecord("a", 8090));
    ASSERT_TRUE(store.save(prefs));
    prefs.upsert(makeRecord("b", 8091));
    ASSERT_TRUE(store.save(prefs));

    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(fs::path(path.string() + ".tmp")));
    EXPECT_EQ(store.load().containers.size(), 2u);
    EXPECT_NE(readFile(path).find("\"b\""), std::string::npos);
}

TEST(StateStoreTest, SaveFailureIsReported) {
    TempDir dir("flocker_state");
    // A regular file where the parent directory should be
    auto blocker = dir.path() / "blocker";
    std::ofstream(blocker) << "x";
    StateStore store(blocker / "state.json");

    auto result = store.save(PersistedPreferences{});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}
