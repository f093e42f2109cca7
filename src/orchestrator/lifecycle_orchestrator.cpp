#include <flocker/orchestrator/lifecycle_orchestrator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace flocker::orchestrator {

LifecycleOrchestrator::LifecycleOrchestrator(docker::IDockerClient& client,
                                             state::StateStore& store, OrchestratorOptions options)
    : client_(client), store_(store), options_(options), ledgers_(client) {}

// ============================================================================
// Bookkeeping
// ============================================================================

Result<void> LifecycleOrchestrator::require(std::initializer_list<Phase> allowed,
                                            std::string_view operation) const {
    if (std::find(allowed.begin(), allowed.end(), phase_) != allowed.end())
        return {};
    return Error{ErrorCode::InvalidState, std::string(operation) + " is not allowed in phase " +
                                              phaseToString(phase_)};
}

Result<ContainerId> LifecycleOrchestrator::requireActive(std::string_view operation) const {
    const auto* record = prefs_.active();
    if (!record)
        return Error{ErrorCode::InvalidState, std::string(operation) + ": no active container"};
    return record->id;
}

void LifecycleOrchestrator::transition(Phase next) {
    if (next != phase_)
        spdlog::info("Phase {} -> {}", phaseToString(phase_), phaseToString(next));
    phase_ = next;
}

void LifecycleOrchestrator::persist() {
    auto saved = store_.save(prefs_);
    if (!saved) {
        spdlog::warn("Could not save state: {}", saved.error().message);
        lastSaveError_ = saved.error();
    } else {
        lastSaveError_.reset();
    }
}

void LifecycleOrchestrator::demoteIfMissing(const Error& error) {
    if (error.code != ErrorCode::NotFound)
        return;
    if (phase_ != Phase::Managing && phase_ != Phase::AwaitResume && phase_ != Phase::Reconcile)
        return;
    if (const auto* record = prefs_.active()) {
        spdlog::warn("Container {} no longer exists; forgetting it", record->id);
        prefs_.remove(record->id);
        persist();
    }
    lastStatus_.reset();
    transition(Phase::AwaitSelection);
}

// Exec-based calls report NotFound for missing ledgers too; only demote when
// the daemon confirms the container itself is gone.
void LifecycleOrchestrator::demoteIfContainerGone(const Error& error) {
    if (error.code != ErrorCode::NotFound)
        return;
    const auto* record = prefs_.active();
    if (!record)
        return;
    auto status = client_.inspectContainer(record->id);
    if (!status)
        demoteIfMissing(status.error());
}

Result<std::vector<state::ContainerRecord>> LifecycleOrchestrator::runningRecords() {
    std::vector<state::ContainerRecord> running;
    if (prefs_.containers.empty())
        return running;

    auto live = client_.listContainers(true);
    if (!live)
        return live.error();
    for (const auto& record : prefs_.containers) {
        bool up = std::any_of(live.value().begin(), live.value().end(),
                              [&](const docker::ContainerStatus& s) {
                                  return s.id == record.id ||
                                         (s.id.size() >= record.id.size() &&
                                          s.id.compare(0, record.id.size(), record.id) == 0);
                              });
        if (up)
            running.push_back(record);
    }
    return running;
}

std::vector<state::ContainerRecord> LifecycleOrchestrator::trackedContainers() const {
    return prefs_.containers;
}

// ============================================================================
// Start / Reconcile
// ============================================================================

Result<Phase> LifecycleOrchestrator::start() {
    if (auto ok = require({Phase::Start}, "start"); !ok)
        return ok.error();

    prefs_ = store_.load();
    if (!prefs_.active() && prefs_.activeId) {
        prefs_.activeId.reset();
    }
    transition(Phase::Reconcile);
    return reconcile();
}

Result<Phase> LifecycleOrchestrator::reconcile() {
    if (auto ok = require({Phase::Reconcile}, "reconcile"); !ok)
        return ok.error();

    const auto* record = prefs_.active();
    if (!record) {
        lastStatus_.reset();
        transition(Phase::AwaitSelection);
        return phase_;
    }

    auto status = client_.inspectContainer(record->id);
    if (!status) {
        if (status.error().code == ErrorCode::NotFound) {
            demoteIfMissing(status.error());
            return phase_;
        }
        return status.error();
    }

    lastStatus_ = status.value();
    transition(status.value().running() ? Phase::Managing : Phase::AwaitResume);
    return phase_;
}

Result<Phase> LifecycleOrchestrator::selectExisting(const ContainerId& id) {
    if (auto ok = require({Phase::AwaitSelection}, "select container"); !ok)
        return ok.error();
    if (!prefs_.find(id))
        return Error{ErrorCode::NotFound, "Container " + id + " is not tracked"};

    prefs_.activeId = id;
    persist();
    transition(Phase::Reconcile);
    return reconcile();
}

// ============================================================================
// AwaitResume
// ============================================================================

Result<Phase> LifecycleOrchestrator::resume() {
    if (auto ok = require({Phase::AwaitResume}, "resume"); !ok)
        return ok.error();
    auto id = requireActive("resume");
    if (!id)
        return id.error();

    auto started = client_.startContainer(id.value());
    if (!started) {
        demoteIfMissing(started.error());
        return started.error();
    }

    if (const auto* record = prefs_.find(id.value())) {
        auto updated = *record;
        updated.lastStart = std::chrono::system_clock::now();
        prefs_.rememberDefaults(updated);
        prefs_.upsert(std::move(updated));
    }
    persist();
    if (lastStatus_) {
        lastStatus_->state = docker::ContainerState::Running;
        lastStatus_->rawState = "running";
    }
    transition(Phase::Managing);
    return phase_;
}

Result<Phase> LifecycleOrchestrator::recreate() {
    if (auto ok = require({Phase::AwaitResume}, "recreate"); !ok)
        return ok.error();
    auto id = requireActive("recreate");
    if (!id)
        return id.error();

    auto removed = client_.removeContainer(id.value(), true);
    if (!removed)
        return removed.error();

    // Keep the old settings as defaults for the replacement
    prefs_.rememberDefaults(*prefs_.find(id.value()));
    prefs_.remove(id.value());
    persist();
    lastStatus_.reset();
    transition(Phase::AwaitSelection);
    return phase_;
}

Result<Phase> LifecycleOrchestrator::discard() {
    if (auto ok = require({Phase::AwaitResume}, "discard"); !ok)
        return ok.error();
    auto id = requireActive("discard");
    if (!id)
        return id.error();

    prefs_.remove(id.value());
    persist();
    lastStatus_.reset();
    transition(Phase::AwaitSelection);
    return phase_;
}

// ============================================================================
// Creating
// ============================================================================

Result<ContainerId>
LifecycleOrchestrator::createWithOptionalPull(const docker::CreateContainerSpec& spec,
                                              const CreationRequest& request) {
    auto created = client_.createContainer(spec);
    if (created || created.error().code != ErrorCode::ImageNotFound || !request.pullIfMissing)
        return created;

    spdlog::info("Image {} not present locally, pulling", spec.image.str());
    auto pulled = client_.pullImage(spec.image, request.onPullProgress);
    if (!pulled)
        return pulled.error();
    return client_.createContainer(spec);
}

Result<Phase> LifecycleOrchestrator::create(const CreationRequest& request) {
    if (auto ok = require({Phase::AwaitSelection}, "create"); !ok)
        return ok.error();
    transition(Phase::Creating);

    auto fail = [this](Error error) -> Result<Phase> {
        transition(Phase::AwaitSelection);
        return error;
    };

    auto image = docker::ImageReference::parse(request.image);
    if (!image)
        return fail(image.error());

    // Reject a malformed port before asking the daemon which records hold one
    if (auto port = config::ConfigurationNegotiator::parsePort(request.negotiation.port); !port)
        return fail(port.error());

    auto running = runningRecords();
    if (!running)
        return fail(running.error());

    auto negotiated = negotiator_.negotiate(request.negotiation, running.value());
    if (!negotiated)
        return fail(negotiated.error());
    const auto& cfg = negotiated.value();

    if (cfg.createDirectory && cfg.volume) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.volume->hostPath, ec);
        if (ec)
            return fail(Error{ErrorCode::IoError, "Cannot create " +
                                                      cfg.volume->hostPath.string() + ": " +
                                                      ec.message()});
        spdlog::info("Created data directory {}", cfg.volume->hostPath.string());
    }

    docker::CreateContainerSpec spec;
    spec.image = image.value();
    spec.ports.hostPort = cfg.hostPort;
    spec.volume = cfg.volume;
    spec.mode = cfg.mode;
    spec.name = cfg.name;

    auto id = createWithOptionalPull(spec, request);
    if (!id)
        return fail(id.error());

    auto started = client_.startContainer(id.value());
    if (!started) {
        // Do not leave a created-but-never-started container behind
        if (auto cleanup = client_.removeContainer(id.value(), true); !cleanup)
            spdlog::warn("Could not remove unstarted container {}: {}", id.value(),
                         cleanup.error().message);
        return fail(started.error());
    }

    state::ContainerRecord record;
    record.id = id.value();
    record.name = cfg.name;
    record.image = spec.image;
    record.hostPort = cfg.hostPort;
    if (cfg.volume)
        record.dataDir = cfg.volume->hostPath;
    record.mode = cfg.mode;
    record.lastStart = std::chrono::system_clock::now();

    prefs_.rememberDefaults(record);
    prefs_.upsert(record);
    prefs_.activeId = record.id;
    persist();

    docker::ContainerStatus status;
    status.id = record.id;
    status.name = record.name;
    status.state = docker::ContainerState::Running;
    status.rawState = "running";
    status.image = spec.image.str();
    status.hostPort = record.hostPort;
    lastStatus_ = std::move(status);

    spdlog::info("Started container {} from {} on port {}", record.id, spec.image.str(),
                 record.hostPort);
    transition(Phase::Managing);
    return phase_;
}

// ============================================================================
// Managing
// ============================================================================

Result<docker::ContainerStatus> LifecycleOrchestrator::refreshStatus() {
    if (auto ok = require({Phase::Managing}, "refresh status"); !ok)
        return ok.error();
    auto id = requireActive("refresh status");
    if (!id)
        return id.error();

    auto status = client_.inspectContainer(id.value());
    if (!status) {
        demoteIfMissing(status.error());
        return status.error();
    }
    lastStatus_ = status.value();
    return status;
}

Result<std::unique_ptr<Stream<docker::StatsSample>>> LifecycleOrchestrator::openStats() {
    if (auto ok = require({Phase::Managing}, "stats"); !ok)
        return ok.error();
    auto id = requireActive("stats");
    if (!id)
        return id.error();

    auto stream = client_.streamStats(id.value());
    if (!stream)
        demoteIfMissing(stream.error());
    return stream;
}

Result<std::vector<std::string>> LifecycleOrchestrator::fetchLogs(std::size_t tailLines) {
    if (auto ok = require({Phase::Managing}, "logs"); !ok)
        return ok.error();
    auto id = requireActive("logs");
    if (!id)
        return id.error();

    auto lines = client_.fetchLogs(id.value(), tailLines);
    if (!lines)
        demoteIfMissing(lines.error());
    return lines;
}

Result<std::unique_ptr<Stream<std::string>>>
LifecycleOrchestrator::attachLogs(std::size_t tailLines) {
    if (auto ok = require({Phase::Managing}, "attach logs"); !ok)
        return ok.error();
    auto id = requireActive("attach logs");
    if (!id)
        return id.error();

    auto stream = client_.followLogs(id.value(), tailLines);
    if (!stream)
        demoteIfMissing(stream.error());
    return stream;
}

Result<ledger::LedgerListing> LifecycleOrchestrator::listLedgers() {
    if (auto ok = require({Phase::Managing}, "list ledgers"); !ok)
        return ok.error();
    auto id = requireActive("list ledgers");
    if (!id)
        return id.error();

    auto listing = ledgers_.listLedgers(id.value());
    if (!listing)
        demoteIfContainerGone(listing.error());
    return listing;
}

Result<ledger::LedgerDetail> LifecycleOrchestrator::describeLedger(std::string_view name) {
    if (auto ok = require({Phase::Managing}, "describe ledger"); !ok)
        return ok.error();
    auto id = requireActive("describe ledger");
    if (!id)
        return id.error();

    auto detail = ledgers_.describeLedger(id.value(), name);
    if (!detail)
        demoteIfContainerGone(detail.error());
    return detail;
}

Result<void> LifecycleOrchestrator::deleteLedger(std::string_view name, bool confirmed) {
    if (auto ok = require({Phase::Managing}, "delete ledger"); !ok)
        return ok.error();
    auto id = requireActive("delete ledger");
    if (!id)
        return id.error();

    auto deleted = ledgers_.deleteLedger(id.value(), name, confirmed);
    if (!deleted)
        demoteIfContainerGone(deleted.error());
    return deleted;
}

Result<Phase> LifecycleOrchestrator::stop() {
    if (auto ok = require({Phase::Managing}, "stop"); !ok)
        return ok.error();
    auto id = requireActive("stop");
    if (!id)
        return id.error();

    auto stopped = client_.stopContainer(id.value(), options_.stopGrace);
    if (!stopped) {
        demoteIfMissing(stopped.error());
        return stopped.error();
    }
    persist();
    transition(Phase::Reconcile);
    return reconcile();
}

Result<Phase> LifecycleOrchestrator::stopAndDestroy() {
    if (auto ok = require({Phase::Managing}, "stop and destroy"); !ok)
        return ok.error();
    auto id = requireActive("stop and destroy");
    if (!id)
        return id.error();

    auto stopped = client_.stopContainer(id.value(), options_.stopGrace);
    if (!stopped) {
        demoteIfMissing(stopped.error());
        return stopped.error();
    }
    auto removed = client_.removeContainer(id.value(), true);
    if (!removed)
        return removed.error();

    prefs_.remove(id.value());
    persist();
    lastStatus_.reset();
    transition(Phase::AwaitSelection);
    return phase_;
}

// ============================================================================
// Exit
// ============================================================================

Result<void> LifecycleOrchestrator::exit() {
    if (auto ok = require({Phase::Start, Phase::Reconcile, Phase::AwaitSelection,
                           Phase::AwaitResume, Phase::Managing},
                          "exit");
        !ok)
        return ok.error();

    if (phase_ != Phase::Start)
        persist();
    transition(Phase::Exit);
    if (lastSaveError_)
        return *lastSaveError_;
    return {};
}

} // namespace flocker::orchestrator
