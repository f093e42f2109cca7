#include <flocker/state/state_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace flocker::state {

using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;

docker::RunMode parseMode(const std::string& text) {
    return text == "foreground" ? docker::RunMode::Foreground : docker::RunMode::Background;
}

json recordToJson(const ContainerRecord& r) {
    json j;
    j["id"] = r.id;
    j["name"] = r.name;
    j["image"] = r.image.str();
    j["port"] = r.hostPort;
    j["data_dir"] = r.dataDir ? json(r.dataDir->string()) : json(nullptr);
    j["mode"] = docker::runModeToString(r.mode);
    if (r.lastStart) {
        j["last_start"] = std::chrono::duration_cast<std::chrono::seconds>(
                              r.lastStart->time_since_epoch())
                              .count();
    } else {
        j["last_start"] = nullptr;
    }
    return j;
}

std::optional<ContainerRecord> recordFromJson(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string())
        return std::nullopt;

    ContainerRecord r;
    r.id = j["id"].get<std::string>();
    if (r.id.empty())
        return std::nullopt;
    r.name = j.value("name", std::string{});

    auto image = docker::ImageReference::parse(j.value("image", std::string{}));
    if (!image) {
        spdlog::warn("Ignoring tracked container {}: {}", r.id, image.error().message);
        return std::nullopt;
    }
    r.image = image.value();

    int port = j.value("port", static_cast<int>(docker::kServerContainerPort));
    if (port < 1 || port > 65535) {
        spdlog::warn("Ignoring tracked container {}: invalid port {}", r.id, port);
        return std::nullopt;
    }
    r.hostPort = static_cast<uint16_t>(port);

    if (j.contains("data_dir") && j["data_dir"].is_string() &&
        !j["data_dir"].get<std::string>().empty())
        r.dataDir = std::filesystem::path(j["data_dir"].get<std::string>());
    r.mode = parseMode(j.value("mode", std::string{"background"}));
    if (j.contains("last_start") && j["last_start"].is_number_integer())
        r.lastStart = TimePoint(std::chrono::seconds(j["last_start"].get<int64_t>()));
    return r;
}

} // namespace

const ContainerRecord* PersistedPreferences::active() const {
    return activeId ? find(*activeId) : nullptr;
}

const ContainerRecord* PersistedPreferences::find(const ContainerId& id) const {
    auto it = std::find_if(containers.begin(), containers.end(),
                           [&](const ContainerRecord& r) { return r.id == id; });
    return it == containers.end() ? nullptr : &*it;
}

const ContainerRecord* PersistedPreferences::mostRecent() const {
    const ContainerRecord* best = nullptr;
    for (const auto& r : containers) {
        if (r.lastStart && (!best || *r.lastStart > *best->lastStart))
            best = &r;
    }
    return best;
}

void PersistedPreferences::upsert(ContainerRecord record) {
    auto it = std::find_if(containers.begin(), containers.end(),
                           [&](const ContainerRecord& r) { return r.id == record.id; });
    if (it != containers.end())
        *it = std::move(record);
    else
        containers.push_back(std::move(record));
}

bool PersistedPreferences::remove(const ContainerId& id) {
    auto it = std::find_if(containers.begin(), containers.end(),
                           [&](const ContainerRecord& r) { return r.id == id; });
    if (activeId && *activeId == id)
        activeId.reset();
    if (it == containers.end())
        return false;
    containers.erase(it);
    return true;
}

void PersistedPreferences::rememberDefaults(const ContainerRecord& record) {
    defaults.port = record.hostPort;
    defaults.dataDir = record.dataDir;
    defaults.mode = record.mode;
}

std::string serializePreferences(const PersistedPreferences& prefs) {
    json doc;
    doc["version"] = kFormatVersion;
    doc["containers"] = json::array();
    for (const auto& r : prefs.containers)
        doc["containers"].push_back(recordToJson(r));
    doc["active"] = prefs.activeId ? json(*prefs.activeId) : json(nullptr);
    doc["defaults"] = {
        {"port", prefs.defaults.port},
        {"data_dir",
         prefs.defaults.dataDir ? json(prefs.defaults.dataDir->string()) : json(nullptr)},
        {"mode", docker::runModeToString(prefs.defaults.mode)}};
    return doc.dump(2);
}

Result<PersistedPreferences> parsePreferences(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        return Error{ErrorCode::MalformedResponse, std::string("state file is not JSON: ") + e.what()};
    }
    if (!doc.is_object())
        return Error{ErrorCode::MalformedResponse, "state file is not a JSON object"};

    PersistedPreferences prefs;
    try {
        if (doc.contains("containers") && doc["containers"].is_array()) {
            for (const auto& entry : doc["containers"]) {
                if (auto record = recordFromJson(entry))
                    prefs.upsert(std::move(*record));
            }
        }
        if (doc.contains("active") && doc["active"].is_string()) {
            auto id = doc["active"].get<std::string>();
            if (prefs.find(id))
                prefs.activeId = id;
        }
        if (doc.contains("defaults") && doc["defaults"].is_object()) {
            const auto& d = doc["defaults"];
            int port = d.value("port", static_cast<int>(docker::kServerContainerPort));
            if (port >= 1 && port <= 65535)
                prefs.defaults.port = static_cast<uint16_t>(port);
            if (d.contains("data_dir") && d["data_dir"].is_string() &&
                !d["data_dir"].get<std::string>().empty())
                prefs.defaults.dataDir = std::filesystem::path(d["data_dir"].get<std::string>());
            prefs.defaults.mode = parseMode(d.value("mode", std::string{"background"}));
        } else if (const auto* recent = prefs.mostRecent()) {
            prefs.rememberDefaults(*recent);
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::MalformedResponse, std::string("state file has bad fields: ") + e.what()};
    }
    return prefs;
}

StateStore::StateStore(std::filesystem::path path) : path_(std::move(path)) {}

PersistedPreferences StateStore::load() const {
    std::ifstream in(path_);
    if (!in) {
        spdlog::debug("No state file at {}, starting fresh", path_.string());
        return {};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto prefs = parsePreferences(buffer.str());
    if (!prefs) {
        spdlog::warn("Ignoring state file {}: {}", path_.string(), prefs.error().message);
        return {};
    }
    spdlog::debug("Loaded {} tracked container(s) from {}", prefs.value().containers.size(),
                  path_.string());
    return std::move(prefs).value();
}

Result<void> StateStore::save(const PersistedPreferences& prefs) {
    std::lock_guard<std::mutex> lock(saveMutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot create " + path_.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Cannot write " + tmp.string()};
        }
        out << serializePreferences(prefs) << '\n';
        out.flush();
        if (!out) {
            return Error{ErrorCode::IoError, "Failed writing " + tmp.string()};
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return Error{ErrorCode::IoError,
                     "Cannot replace " + path_.string() + ": " + ec.message()};
    }
    spdlog::debug("Saved state to {}", path_.string());
    return {};
}

} // namespace flocker::state
