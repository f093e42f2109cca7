#include <flocker/cli/display.h>
#include <flocker/cli/error_hints.h>
#include <flocker/cli/interactive_session.h>
#include <flocker/cli/prompt_util.h>
#include <flocker/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <stop_token>
#include <thread>

namespace flocker::cli {

using orchestrator::Phase;

namespace {

enum class ManageAction { Stats, Logs, Ledgers, Stop, Destroy, Exit };

constexpr auto kPollInterval = std::chrono::milliseconds(200);

} // namespace

InteractiveSession::InteractiveSession(orchestrator::LifecycleOrchestrator& orchestrator,
                                       docker::IDockerClient& client,
                                       const registry::HubClient& hub, SessionOptions options)
    : orchestrator_(orchestrator), client_(client), hub_(hub), options_(std::move(options)) {}

void InteractiveSession::report(const Error& error) {
    std::cout << "\n[FAIL] " << formatErrorWithHint(error) << "\n";
    if (const auto& saveError = orchestrator_.lastSaveError()) {
        std::cout << "[WARN] State not saved: " << saveError->message << "\n";
    }
}

template <typename T, typename Format>
void InteractiveSession::watch(Stream<T>& stream, Format&& format) {
    std::mutex outMutex;
    std::jthread consumer([&](std::stop_token st) {
        while (!st.stop_requested()) {
            auto item = stream.next(kPollInterval);
            if (item) {
                std::lock_guard<std::mutex> lock(outMutex);
                std::cout << format(*item) << "\n" << std::flush;
                continue;
            }
            if (stream.closed()) {
                std::lock_guard<std::mutex> lock(outMutex);
                if (auto failure = stream.failure())
                    std::cout << "[WARN] " << failure->message << "\n";
                std::cout << "(stream ended; press Enter to return)\n" << std::flush;
                return;
            }
        }
    });

    std::string line;
    std::getline(std::cin, line);
    stream.cancel();
    consumer.request_stop();
}

int InteractiveSession::finish() {
    if (orchestrator_.phase() != Phase::Exit) {
        auto exited = orchestrator_.exit();
        if (!exited)
            std::cout << "[WARN] " << formatErrorWithHint(exited.error()) << "\n";
    }
    if (unrecovered_) {
        spdlog::debug("Session ended after: {}", unrecovered_->message);
        return 1;
    }
    return 0;
}

int InteractiveSession::run() {
    std::cout << "Flocker: Fluree server containers on Docker\n";

    auto started = orchestrator_.start();
    if (!started)
        report(started.error());

    for (;;) {
        if (input_closed())
            return finish();

        bool keepGoing = true;
        switch (orchestrator_.phase()) {
            case Phase::Start:
            case Phase::Reconcile:
                keepGoing = handleReconcileFailure();
                break;
            case Phase::AwaitSelection:
                keepGoing = handleSelection();
                break;
            case Phase::AwaitResume:
                keepGoing = handleResume();
                break;
            case Phase::Managing:
                keepGoing = handleManaging();
                break;
            case Phase::Creating:
                // create() never returns while Creating
                keepGoing = false;
                break;
            case Phase::Exit:
                keepGoing = false;
                break;
        }
        if (!keepGoing)
            return finish();
    }
}

// ============================================================================
// Reconcile
// ============================================================================

bool InteractiveSession::handleReconcileFailure() {
    if (!prompt_yes_no("Could not check the saved container. Retry?")) {
        unrecovered_ = Error{ErrorCode::DaemonUnreachable, "Gave up reconciling saved container"};
        return false;
    }
    auto result = orchestrator_.reconcile();
    if (!result) {
        report(result.error());
        unrecovered_ = result.error();
    } else {
        unrecovered_.reset();
    }
    return true;
}

// ============================================================================
// AwaitSelection
// ============================================================================

bool InteractiveSession::handleSelection() {
    auto tracked = orchestrator_.trackedContainers();

    std::vector<ChoiceItem> items;
    items.push_back({"new", "Create new container", ""});
    for (const auto& record : tracked) {
        std::optional<docker::ContainerStatus> status;
        auto inspected = client_.inspectContainer(record.id);
        if (inspected) {
            status = inspected.value();
        } else if (inspected.error().code == ErrorCode::NotFound) {
            docker::ContainerStatus missing;
            missing.id = record.id;
            missing.state = docker::ContainerState::Missing;
            status = missing;
        }
        items.push_back({record.id, formatRecordLine(record, status), ""});
    }
    items.push_back({"exit", "Exit Flocker", ""});

    auto index = prompt_choice("\nWhat would you like to do?", items);
    if (input_closed())
        return false;
    const auto& choice = items[index].value;
    if (choice == "exit")
        return false;
    if (choice == "new") {
        createContainer();
        return true;
    }

    auto selected = orchestrator_.selectExisting(choice);
    if (!selected)
        report(selected.error());
    return true;
}

std::optional<std::string> InteractiveSession::chooseRemoteTag() {
    std::cout << "Fetching tags for " << options_.repository << " from Docker Hub...\n";
    auto tags = hub_.fetchTags(options_.repository);
    if (!tags) {
        report(tags.error());
        return std::nullopt;
    }
    if (tags.value().empty()) {
        std::cout << "No tags published for " << options_.repository << "\n";
        return std::nullopt;
    }

    std::size_t width = 0;
    for (const auto& t : tags.value())
        width = std::max(width, t.name.size());
    const auto now = std::chrono::system_clock::now();

    std::vector<ChoiceItem> items;
    for (const auto& t : tags.value())
        items.push_back({t.name, formatTagLine(options_.repository, t, width, now), ""});
    auto index = prompt_choice("\nSelect an image tag:", items);
    if (input_closed())
        return std::nullopt;
    return options_.repository + ":" + items[index].value;
}

std::optional<std::string> InteractiveSession::chooseLocalImage() {
    auto images = client_.listLocalImages();
    if (!images) {
        report(images.error());
        return std::nullopt;
    }

    const std::string prefix = options_.repository + ":";
    std::vector<ChoiceItem> items;
    for (const auto& image : images.value()) {
        for (const auto& tag : image.repoTags) {
            if (tag.rfind(prefix, 0) == 0)
                items.push_back({tag, formatImageLine(image), ""});
        }
    }
    if (items.empty()) {
        std::cout << "No local " << options_.repository << " images found.\n";
        return std::nullopt;
    }
    auto index = prompt_choice("\nSelect a local image:", items);
    if (input_closed())
        return std::nullopt;
    return items[index].value;
}

std::optional<std::string> InteractiveSession::chooseImage(bool& remote) {
    std::vector<ChoiceItem> sources{{"remote", "Remote (Docker Hub)", ""}, {"local", "Local", ""}};
    auto index = prompt_choice("\nImage source:", sources);
    if (input_closed())
        return std::nullopt;
    remote = sources[index].value == "remote";
    return remote ? chooseRemoteTag() : chooseLocalImage();
}

void InteractiveSession::createContainer() {
    bool remote = false;
    auto image = chooseImage(remote);
    if (!image)
        return;

    const auto& defaults = orchestrator_.preferences().defaults;

    orchestrator::CreationRequest request;
    request.image = *image;
    request.pullIfMissing = remote;
    request.onPullProgress = [](const docker::PullProgress& p) {
        if (!p.status.empty())
            std::cout << "  " << (p.id.empty() ? "" : p.id + ": ") << p.status << "\n";
    };

    InputOptions nameOpts;
    nameOpts.validator = [](const std::string& s) {
        return config::ConfigurationNegotiator::isValidContainerName(s);
    };
    nameOpts.invalidMessage = "Use letters, digits, '_', '.' or '-', starting with a letter or digit.";
    auto name = prompt_input("Container name (leave empty for a generated name)", nameOpts);
    if (!name.empty())
        request.negotiation.name = name;

    InputOptions portOpts;
    portOpts.defaultValue = std::to_string(defaults.port);
    portOpts.validator = [](const std::string& s) {
        return static_cast<bool>(config::ConfigurationNegotiator::parsePort(s));
    };
    portOpts.invalidMessage = "Enter a port between 1 and 65535.";
    request.negotiation.port = prompt_input("Host port", portOpts);

    YesNoOptions mountOpts;
    mountOpts.defaultYes = defaults.dataDir.has_value();
    if (prompt_yes_no("Mount a local directory for ledger data?", mountOpts)) {
        InputOptions dirOpts;
        if (defaults.dataDir)
            dirOpts.defaultValue = defaults.dataDir->string();
        dirOpts.allowEmpty = defaults.dataDir.has_value();
        request.negotiation.hostDirectory = prompt_input("Data directory", dirOpts);
    }

    YesNoOptions detachOpts;
    detachOpts.defaultYes = defaults.mode == docker::RunMode::Background;
    request.negotiation.mode = prompt_yes_no("Run in detached mode?", detachOpts)
                                   ? docker::RunMode::Background
                                   : docker::RunMode::Foreground;
    if (input_closed())
        return;

    std::cout << "Creating container from " << request.image << "...\n";
    auto created = orchestrator_.create(request);
    if (!created && created.error().code == ErrorCode::DirectoryMissing) {
        std::cout << created.error().message << "\n";
        YesNoOptions createOpts;
        createOpts.defaultYes = false;
        if (!prompt_yes_no("Create it?", createOpts))
            return;
        request.negotiation.createIfMissing = true;
        created = orchestrator_.create(request);
    }
    if (!created) {
        report(created.error());
        return;
    }

    const auto* record = orchestrator_.activeRecord();
    if (record) {
        std::cout << "\nContainer started: " << shortId(record->id) << "\n";
        std::cout << "Fluree will be available at http://localhost:" << record->hostPort << "\n";
    }
    if (request.negotiation.mode == docker::RunMode::Foreground) {
        auto stream = orchestrator_.attachLogs(0);
        if (!stream) {
            report(stream.error());
            return;
        }
        std::cout << "Attached to container output. Press Enter to detach.\n";
        watch(*stream.value(), [](const std::string& line) {
            return config::sanitize_for_terminal(line);
        });
    }
}

// ============================================================================
// AwaitResume
// ============================================================================

bool InteractiveSession::handleResume() {
    if (const auto& status = orchestrator_.lastStatus())
        std::cout << "\n" << formatStatus(*status);

    std::vector<ChoiceItem> items{
        {"resume", "Resume container", ""},
        {"recreate", "Recreate container", "Removes it and configures a new one"},
        {"discard", "Discard container", "Forgets it; the container stays in Docker"},
        {"exit", "Exit Flocker", ""}};
    auto index = prompt_choice("\nThe container is stopped. What would you like to do?", items);
    if (input_closed())
        return false;

    const auto& choice = items[index].value;
    Result<Phase> result = Phase::AwaitResume;
    if (choice == "resume")
        result = orchestrator_.resume();
    else if (choice == "recreate")
        result = orchestrator_.recreate();
    else if (choice == "discard")
        result = orchestrator_.discard();
    else
        return false;

    if (!result)
        report(result.error());
    return true;
}

// ============================================================================
// Managing
// ============================================================================

void InteractiveSession::showStats() {
    auto stream = orchestrator_.openStats();
    if (!stream) {
        report(stream.error());
        return;
    }
    const auto* record = orchestrator_.activeRecord();
    const std::string id = record ? record->id : std::string{};
    std::cout << "Press Enter to stop.\n" << statsHeader() << "\n";
    watch(*stream.value(),
          [&id](const docker::StatsSample& sample) { return formatStatsRow(id, sample); });
}

void InteractiveSession::showLogs() {
    YesNoOptions followOpts;
    followOpts.defaultYes = false;
    if (prompt_yes_no("Follow new log output?", followOpts)) {
        auto stream = orchestrator_.attachLogs(options_.logTail);
        if (!stream) {
            report(stream.error());
            return;
        }
        std::cout << "Press Enter to stop following.\n";
        watch(*stream.value(), [](const std::string& line) {
            return config::sanitize_for_terminal(line);
        });
        return;
    }

    auto lines = orchestrator_.fetchLogs(options_.logTail);
    if (!lines) {
        report(lines.error());
        return;
    }
    if (lines.value().empty())
        std::cout << "(no log output)\n";
    for (const auto& line : lines.value())
        std::cout << config::sanitize_for_terminal(line) << "\n";
}

void InteractiveSession::ledgerActions(const ledger::LedgerSummary& ledger) {
    std::vector<ChoiceItem> items{{"details", "See More Details", ""},
                                  {"delete", "Delete Ledger", ""},
                                  {"back", "Return to Ledger List", ""}};
    for (;;) {
        auto index = prompt_choice("\n" + formatLedgerLine(ledger), items);
        if (input_closed() || items[index].value == "back")
            return;

        if (items[index].value == "details") {
            auto detail = orchestrator_.describeLedger(ledger.name);
            if (!detail) {
                report(detail.error());
                if (orchestrator_.phase() != Phase::Managing)
                    return;
                continue;
            }
            std::cout << "\n" << formatLedgerDetail(detail.value()) << "\n";
            continue;
        }

        std::cout << "[WARN] This will permanently delete the ledger and all its data!\n";
        InputOptions confirmOpts;
        confirmOpts.retryOnInvalid = false;
        auto typed = prompt_input("Type 'delete' to confirm", confirmOpts);
        auto deleted = orchestrator_.deleteLedger(ledger.name, typed == "delete");
        if (!deleted) {
            if (deleted.error().code == ErrorCode::ConfirmationRequired)
                std::cout << "Deletion cancelled.\n";
            else
                report(deleted.error());
            if (orchestrator_.phase() != Phase::Managing)
                return;
            continue;
        }
        std::cout << "Ledger '" << ledger.name << "' deleted.\n";
        return;
    }
}

void InteractiveSession::ledgerMenu() {
    while (orchestrator_.phase() == Phase::Managing) {
        auto listing = orchestrator_.listLedgers();
        if (!listing) {
            report(listing.error());
            return;
        }
        if (listing.value().warning)
            std::cout << "[WARN] " << formatErrorWithHint(*listing.value().warning) << "\n";
        const auto& ledgers = listing.value().ledgers;
        if (ledgers.empty()) {
            std::cout << "No ledgers found.\n";
            return;
        }

        std::vector<ChoiceItem> items;
        for (const auto& l : ledgers)
            items.push_back({l.name, formatLedgerLine(l), ""});
        items.push_back({"", "Return to Main Menu", ""});
        auto index = prompt_choice("\nLedgers:", items);
        if (input_closed() || index + 1 == items.size())
            return;
        ledgerActions(ledgers[index]);
    }
}

bool InteractiveSession::handleManaging() {
    if (const auto& status = orchestrator_.lastStatus())
        std::cout << "\n" << formatStatus(*status);

    std::vector<ChoiceItem> items{{"stats", "View Container Stats", ""},
                                  {"logs", "View Container Logs", ""},
                                  {"ledgers", "List Ledgers", ""},
                                  {"stop", "Stop Container", ""},
                                  {"destroy", "Stop and Destroy Container", ""},
                                  {"exit", "Exit Flocker", ""}};
    auto index = prompt_choice("\nWhat would you like to do?", items);
    if (input_closed())
        return false;

    switch (static_cast<ManageAction>(index)) {
        case ManageAction::Stats:
            showStats();
            break;
        case ManageAction::Logs:
            showLogs();
            break;
        case ManageAction::Ledgers:
            ledgerMenu();
            break;
        case ManageAction::Stop: {
            std::cout << "Stopping container...\n";
            auto stopped = orchestrator_.stop();
            if (!stopped)
                report(stopped.error());
            break;
        }
        case ManageAction::Destroy: {
            YesNoOptions confirm;
            confirm.defaultYes = false;
            if (!prompt_yes_no("Stop and permanently remove this container?", confirm))
                break;
            auto destroyed = orchestrator_.stopAndDestroy();
            if (!destroyed)
                report(destroyed.error());
            else
                std::cout << "Container removed.\n";
            break;
        }
        case ManageAction::Exit:
            return false;
    }

    if (orchestrator_.phase() == Phase::Managing) {
        auto refreshed = orchestrator_.refreshStatus();
        if (!refreshed)
            report(refreshed.error());
    }
    return true;
}

} // namespace flocker::cli
