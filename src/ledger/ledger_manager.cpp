#include <flocker/docker/engine_api.h>
#include <flocker/ledger/ledger_manager.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace flocker::ledger {

using json = nlohmann::json;

namespace {

uint64_t asCount(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key))
        return 0;
    const auto& v = j[key];
    if (v.is_number_unsigned())
        return v.get<uint64_t>();
    if (v.is_number_integer())
        return static_cast<uint64_t>(std::max<int64_t>(0, v.get<int64_t>()));
    if (v.is_number_float())
        return static_cast<uint64_t>(std::max(0.0, v.get<double>()));
    return 0;
}

std::vector<std::string> findCommand() {
    return {"find",  std::string(docker::kServerDataPath), "-type", "f", "-name", "*.json",
            "-not", "-path", "*/commit/*"};
}

} // namespace

LedgerManager::LedgerManager(docker::IDockerClient& client) : client_(client) {}

std::vector<std::string> LedgerManager::parseFileList(std::string_view output) {
    std::vector<std::string> files;
    for (auto& line : docker::engine::splitLines(output)) {
        auto b = line.find_first_not_of(" \t");
        if (b == std::string::npos)
            continue;
        auto e = line.find_last_not_of(" \t");
        files.push_back(line.substr(b, e - b + 1));
    }
    return files;
}

Result<std::optional<LedgerSummary>> LedgerManager::parseLedgerFile(std::string_view path,
                                                                    std::string_view content) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::exception& e) {
        return Error{ErrorCode::MalformedResponse,
                     "Cannot parse " + std::string(path) + ": " + e.what()};
    }
    if (!doc.is_object() || !doc.contains("ledgerAlias"))
        return std::optional<LedgerSummary>{};
    if (!doc["ledgerAlias"].is_string())
        return Error{ErrorCode::MalformedResponse,
                     std::string(path) + ": ledgerAlias is not a string"};

    LedgerSummary summary;
    summary.name = doc["ledgerAlias"].get<std::string>();
    summary.path = std::string(path);

    // Head of the first branch carries the commit metadata
    if (doc.contains("branches") && doc["branches"].is_array() && !doc["branches"].empty()) {
        const auto& branch = doc["branches"][0];
        if (branch.is_object() && branch.contains("commit") && branch["commit"].is_object()) {
            const auto& commit = branch["commit"];
            if (commit.contains("time")) {
                if (commit["time"].is_string())
                    summary.lastUpdate = commit["time"].get<std::string>();
                else if (commit["time"].is_number())
                    summary.lastUpdate = commit["time"].dump();
            }
            if (commit.contains("data") && commit["data"].is_object()) {
                const auto& data = commit["data"];
                summary.commitCount = asCount(data, "t");
                summary.sizeBytes = asCount(data, "size");
                summary.flakes = asCount(data, "flakes");
            }
        }
    }
    return std::optional<LedgerSummary>{std::move(summary)};
}

Result<std::string> LedgerManager::ledgerDirectory(std::string_view ledgerFile) {
    std::filesystem::path file{std::string(ledgerFile)};
    auto normalized = file.lexically_normal();
    if (normalized.generic_string() != file.generic_string())
        return Error{ErrorCode::InvalidArgument,
                     "Refusing to delete non-canonical path " + std::string(ledgerFile)};

    auto dir = normalized.parent_path();
    const std::filesystem::path root{std::string(docker::kServerDataPath)};
    auto rel = dir.lexically_relative(root);
    if (rel.empty() || rel == "." || rel.begin()->string() == "..")
        return Error{ErrorCode::InvalidArgument,
                     "Refusing to delete " + dir.generic_string() + " outside " +
                         root.generic_string()};
    return dir.generic_string();
}

Result<std::vector<std::pair<LedgerSummary, std::string>>>
LedgerManager::scan(const ContainerId& id, std::optional<Error>& warning) {
    std::vector<std::pair<LedgerSummary, std::string>> found;

    auto listing = client_.execInContainer(id, findCommand());
    if (!listing)
        return listing.error();

    for (const auto& file : parseFileList(listing.value().stdoutText)) {
        auto content = client_.execInContainer(id, {"cat", file});
        if (!content)
            return content.error();

        auto parsed = parseLedgerFile(file, content.value().stdoutText);
        if (!parsed) {
            spdlog::debug("Skipping {}: {}", file, parsed.error().message);
            if (!warning)
                warning = parsed.error();
            continue;
        }
        if (parsed.value())
            found.emplace_back(std::move(*parsed.value()), std::move(content.value().stdoutText));
    }
    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first.name < b.first.name; });
    return found;
}

Result<LedgerListing> LedgerManager::listLedgers(const ContainerId& id) {
    LedgerListing listing;
    auto scanned = scan(id, listing.warning);
    if (!scanned)
        return scanned.error();
    if (listing.warning)
        spdlog::warn("Ledger listing degraded: {}", listing.warning->message);
    for (auto& entry : scanned.value())
        listing.ledgers.push_back(std::move(entry.first));
    spdlog::debug("Found {} ledger(s) in {}", listing.ledgers.size(), id);
    return listing;
}

Result<LedgerDetail> LedgerManager::describeLedger(const ContainerId& id, std::string_view name) {
    std::optional<Error> warning;
    auto scanned = scan(id, warning);
    if (!scanned)
        return scanned.error();

    for (auto& [summary, raw] : scanned.value()) {
        if (summary.name != name)
            continue;
        LedgerDetail detail;
        detail.summary = std::move(summary);
        try {
            detail.document = json::parse(raw).dump(2);
        } catch (const json::exception& e) {
            return Error{ErrorCode::MalformedResponse, e.what()};
        }
        return detail;
    }
    return Error{ErrorCode::NotFound, "Ledger '" + std::string(name) + "' not found"};
}

Result<void> LedgerManager::deleteLedger(const ContainerId& id, std::string_view name,
                                         bool confirmed) {
    if (!confirmed) {
        return Error{ErrorCode::ConfirmationRequired,
                     "Deleting ledger '" + std::string(name) + "' requires confirmation"};
    }

    std::optional<Error> warning;
    auto scanned = scan(id, warning);
    if (!scanned)
        return scanned.error();

    auto it = std::find_if(scanned.value().begin(), scanned.value().end(),
                           [&](const auto& entry) { return entry.first.name == name; });
    if (it == scanned.value().end())
        return Error{ErrorCode::NotFound, "Ledger '" + std::string(name) + "' not found"};

    auto dir = ledgerDirectory(it->first.path);
    if (!dir)
        return dir.error();

    spdlog::info("Deleting ledger '{}' ({})", name, dir.value());
    auto removed = client_.execInContainer(id, {"rm", "-rf", dir.value()});
    if (!removed) {
        if (removed.error().code == ErrorCode::ExecFailed)
            return Error{ErrorCode::LedgerDeleteFailed,
                         "Failed to delete ledger '" + std::string(name) + "': " +
                             removed.error().message};
        return removed.error();
    }
    return {};
}

} // namespace flocker::ledger
