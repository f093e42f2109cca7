#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <flocker/core/types.h>
#include <flocker/docker/types.h>

namespace flocker::state {

/**
 * A container this tool created. Identity fields (id, name, image, port, data
 * directory, mode) never change after creation; only lastStart is refreshed.
 */
struct ContainerRecord {
    ContainerId id;
    std::string name;
    docker::ImageReference image;
    uint16_t hostPort{docker::kServerContainerPort};
    std::optional<std::filesystem::path> dataDir;
    docker::RunMode mode{docker::RunMode::Background};
    std::optional<TimePoint> lastStart;
};

struct PreferredDefaults {
    uint16_t port{docker::kServerContainerPort};
    std::optional<std::filesystem::path> dataDir;
    docker::RunMode mode{docker::RunMode::Background};
};

struct PersistedPreferences {
    std::vector<ContainerRecord> containers;
    std::optional<ContainerId> activeId;
    PreferredDefaults defaults;

    // Record referenced by activeId, or nullptr
    const ContainerRecord* active() const;

    const ContainerRecord* find(const ContainerId& id) const;

    // Record with the newest lastStart, or nullptr when none was ever started
    const ContainerRecord* mostRecent() const;

    // Replaces the record with the same id or appends it.
    void upsert(ContainerRecord record);

    // Drops the record; clears activeId when it pointed at it. Returns false if unknown.
    bool remove(const ContainerId& id);

    void rememberDefaults(const ContainerRecord& record);
};

/**
 * JSON file holding PersistedPreferences.
 *
 * load() never fails: a missing, unreadable or malformed file yields default
 * preferences. save() replaces the file atomically (temp file + rename) and
 * is safe to call from several threads; the last save wins.
 */
class StateStore {
public:
    explicit StateStore(std::filesystem::path path);

    PersistedPreferences load() const;

    Result<void> save(const PersistedPreferences& prefs);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex saveMutex_;
};

// Exposed for tests
std::string serializePreferences(const PersistedPreferences& prefs);
Result<PersistedPreferences> parsePreferences(const std::string& text);

} // namespace flocker::state
