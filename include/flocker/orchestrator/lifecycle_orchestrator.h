#pragma once

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <flocker/config/negotiator.h>
#include <flocker/core/channel_stream.h>
#include <flocker/core/types.h>
#include <flocker/docker/docker_client.h>
#include <flocker/ledger/ledger_manager.h>
#include <flocker/state/state_store.h>

namespace flocker::orchestrator {

enum class Phase { Start, Reconcile, AwaitSelection, AwaitResume, Creating, Managing, Exit };

constexpr const char* phaseToString(Phase phase) {
    switch (phase) {
        case Phase::Start: return "Start";
        case Phase::Reconcile: return "Reconcile";
        case Phase::AwaitSelection: return "AwaitSelection";
        case Phase::AwaitResume: return "AwaitResume";
        case Phase::Creating: return "Creating";
        case Phase::Managing: return "Managing";
        case Phase::Exit: return "Exit";
    }
    return "Unknown";
}

struct CreationRequest {
    std::string image; // "fluree/server:stable"
    config::NegotiationRequest negotiation;
    // Pull and retry once when the image is not present locally.
    bool pullIfMissing{false};
    docker::PullProgressCallback onPullProgress;
};

struct OrchestratorOptions {
    std::chrono::seconds stopGrace{10};
};

/**
 * Drives one container through its lifecycle for one interactive session.
 *
 * The orchestrator owns the in-memory PersistedPreferences and is the only
 * caller of StateStore::save. Every operation checks that it is legal in the
 * current phase and returns InvalidState otherwise, without touching the
 * daemon. Failure kinds are passed through unchanged; only NotFound for the
 * active container moves the phase on its own (back to AwaitSelection, with the
 * stale record dropped and saved).
 */
class LifecycleOrchestrator {
public:
    LifecycleOrchestrator(docker::IDockerClient& client, state::StateStore& store,
                          OrchestratorOptions options = {});

    Phase phase() const { return phase_; }

    // Start: loads preferences and reconciles.
    Result<Phase> start();

    // Reconcile: inspects the active record. A daemon failure leaves the
    // phase at Reconcile so the caller may retry.
    Result<Phase> reconcile();

    std::vector<state::ContainerRecord> trackedContainers() const;

    // AwaitSelection: makes a tracked container the active one and reconciles it.
    Result<Phase> selectExisting(const ContainerId& id);

    // AwaitResume
    Result<Phase> resume();
    Result<Phase> recreate();
    Result<Phase> discard();

    // AwaitSelection -> Creating -> Managing. Any failure returns to AwaitSelection.
    Result<Phase> create(const CreationRequest& request);

    // Managing, non-transitioning except for NotFound demotion
    Result<docker::ContainerStatus> refreshStatus();
    Result<std::unique_ptr<Stream<docker::StatsSample>>> openStats();
    Result<std::vector<std::string>> fetchLogs(std::size_t tailLines);
    Result<std::unique_ptr<Stream<std::string>>> attachLogs(std::size_t tailLines = 0);
    Result<ledger::LedgerListing> listLedgers();
    Result<ledger::LedgerDetail> describeLedger(std::string_view name);
    Result<void> deleteLedger(std::string_view name, bool confirmed);

    // Managing -> Reconcile (-> AwaitResume once reconciled)
    Result<Phase> stop();

    // Managing -> AwaitSelection
    Result<Phase> stopAndDestroy();

    // Any phase -> Exit. Returns the save failure, if any; the phase changes regardless.
    Result<void> exit();

    const state::ContainerRecord* activeRecord() const { return prefs_.active(); }

    const state::PersistedPreferences& preferences() const { return prefs_; }

    // Status seen by the last reconcile or refresh
    const std::optional<docker::ContainerStatus>& lastStatus() const { return lastStatus_; }

    // Set when the most recent save failed; cleared by the next successful one.
    const std::optional<Error>& lastSaveError() const { return lastSaveError_; }

private:
    Result<void> require(std::initializer_list<Phase> allowed, std::string_view operation) const;
    Result<ContainerId> requireActive(std::string_view operation) const;
    void transition(Phase next);
    void persist();
    void demoteIfMissing(const Error& error);
    void demoteIfContainerGone(const Error& error);
    Result<std::vector<state::ContainerRecord>> runningRecords();
    Result<ContainerId> createWithOptionalPull(const docker::CreateContainerSpec& spec,
                                               const CreationRequest& request);

    docker::IDockerClient& client_;
    state::StateStore& store_;
    OrchestratorOptions options_;
    config::ConfigurationNegotiator negotiator_;
    ledger::LedgerManager ledgers_;

    Phase phase_{Phase::Start};
    state::PersistedPreferences prefs_;
    std::optional<docker::ContainerStatus> lastStatus_;
    std::optional<Error> lastSaveError_;
};

} // namespace flocker::orchestrator
