#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <flocker/core/types.h>
#include <flocker/docker/types.h>
#include <flocker/ledger/ledger_manager.h>
#include <flocker/registry/hub_client.h>
#include <flocker/state/state_store.h>

namespace flocker::cli {

// "1.5 KB", "12.0 MB"; plain bytes below 1 KiB.
std::string formatBytes(uint64_t bytes);

// First 12 characters of a container id, as docker ps prints it.
std::string shortId(std::string_view id);

std::string formatTimePoint(TimePoint tp);

// "name [running] (Image: fluree/server:stable, Port: 8090, Last Start: ...)"
std::string formatRecordLine(const state::ContainerRecord& record,
                             const std::optional<docker::ContainerStatus>& status);

std::string formatStatus(const docker::ContainerStatus& status);

// Header and row of the stats table
std::string statsHeader();
std::string formatStatsRow(std::string_view id, const docker::StatsSample& sample);

std::string formatLedgerLine(const ledger::LedgerSummary& ledger);
std::string formatLedgerDetail(const ledger::LedgerDetail& detail);

std::string formatTagLine(std::string_view repository, const registry::Tag& tag,
                          std::size_t nameWidth, TimePoint now);

std::string formatImageLine(const docker::ImageInfo& image);

} // namespace flocker::cli
