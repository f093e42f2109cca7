#include <flocker/cli/display.h>
#include <flocker/config/config_helpers.h>

#include <fmt/format.h>

#include <array>
#include <ctime>

namespace flocker::cli {

std::string formatBytes(uint64_t bytes) {
    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024)
        return fmt::format("{} B", bytes);
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string shortId(std::string_view id) {
    return std::string(id.substr(0, 12));
}

std::string formatTimePoint(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return "unknown";
    return buf;
}

std::string formatRecordLine(const state::ContainerRecord& record,
                             const std::optional<docker::ContainerStatus>& status) {
    std::string state = status ? docker::containerStateToString(status->state) : "unknown";
    return fmt::format("{} [{}] (Image: {}, Port: {}, Last Start: {})",
                       record.name.empty() ? shortId(record.id) : record.name, state,
                       record.image.str(), record.hostPort,
                       record.lastStart ? formatTimePoint(*record.lastStart) : "Never");
}

std::string formatStatus(const docker::ContainerStatus& status) {
    std::string out = fmt::format("Container: {} ({})\n", status.name.empty() ? "<unnamed>" : status.name,
                                  shortId(status.id));
    out += fmt::format("Status: {}", status.rawState.empty()
                                         ? docker::containerStateToString(status.state)
                                         : status.rawState);
    if (!status.running() && status.exitCode)
        out += fmt::format(" (exit code {})", *status.exitCode);
    out += "\n";
    if (!status.image.empty())
        out += fmt::format("Image: {}\n", status.image);
    if (status.hostPort) {
        out += fmt::format("Mapped port: {}\n", *status.hostPort);
        if (status.running())
            out += fmt::format("Fluree is available at http://localhost:{}\n", *status.hostPort);
    }
    if (status.dataBind)
        out += fmt::format("Data directory: {}\n", *status.dataBind);
    if (status.startedAt)
        out += fmt::format("Started at: {}\n", *status.startedAt);
    return out;
}

std::string statsHeader() {
    return fmt::format("{:<14}{:>9}  {:>24}  {:>8}", "CONTAINER ID", "CPU %", "MEM USAGE / LIMIT",
                       "MEM %");
}

std::string formatStatsRow(std::string_view id, const docker::StatsSample& sample) {
    std::string mem = formatBytes(sample.memoryUsageBytes) + " / " +
                      formatBytes(sample.memoryLimitBytes);
    return fmt::format("{:<14}{:>8.2f}%  {:>24}  {:>7.2f}%", shortId(id), sample.cpuPercent, mem,
                       sample.memoryPercent);
}

std::string formatLedgerLine(const ledger::LedgerSummary& ledger) {
    return fmt::format("{} (Last commit: {}, Commits: {}, Size: {})", ledger.name,
                       ledger.lastUpdate.empty() ? "unknown" : ledger.lastUpdate,
                       ledger.commitCount, formatBytes(ledger.sizeBytes));
}

std::string formatLedgerDetail(const ledger::LedgerDetail& detail) {
    std::string out = fmt::format("Ledger: {}\n", detail.summary.name);
    out += fmt::format("  Commits:     {}\n", detail.summary.commitCount);
    out += fmt::format("  Flakes:      {}\n", detail.summary.flakes);
    out += fmt::format("  Size:        {} ({} bytes)\n", formatBytes(detail.summary.sizeBytes),
                       detail.summary.sizeBytes);
    out += fmt::format("  Last commit: {}\n",
                       detail.summary.lastUpdate.empty() ? "unknown" : detail.summary.lastUpdate);
    out += fmt::format("  File:        {}\n\n", detail.summary.path);
    out += config::sanitize_for_terminal(detail.document);
    return out;
}

std::string formatTagLine(std::string_view repository, const registry::Tag& tag,
                          std::size_t nameWidth, TimePoint now) {
    return fmt::format("{}:{:<{}} (updated {})", repository, tag.name, nameWidth,
                       registry::formatRelativeTime(now, tag.lastUpdated));
}

std::string formatImageLine(const docker::ImageInfo& image) {
    std::string tags;
    for (const auto& t : image.repoTags) {
        if (!tags.empty())
            tags += ", ";
        tags += t;
    }
    std::string id = image.id;
    if (id.rfind("sha256:", 0) == 0)
        id.erase(0, 7);
    return fmt::format("{} ({}, {})", tags.empty() ? "<untagged>" : tags, shortId(id),
                       formatBytes(image.sizeBytes));
}

} // namespace flocker::cli
