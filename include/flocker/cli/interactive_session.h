#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <flocker/core/types.h>
#include <flocker/docker/docker_client.h>
#include <flocker/orchestrator/lifecycle_orchestrator.h>
#include <flocker/registry/hub_client.h>

namespace flocker::cli {

struct SessionOptions {
    std::string repository{docker::kDefaultRepository};
    std::size_t logTail{100};
};

/**
 * Menu-driven front end over the LifecycleOrchestrator. Reads operator choices
 * from std::cin, prints to std::cout, and loops until the orchestrator reaches
 * Exit or input ends.
 */
class InteractiveSession {
public:
    InteractiveSession(orchestrator::LifecycleOrchestrator& orchestrator,
                       docker::IDockerClient& client, const registry::HubClient& hub,
                       SessionOptions options = {});

    // 0 on a normal exit, 1 when the session ends on an unrecovered error.
    int run();

private:
    bool handleReconcileFailure();
    bool handleSelection();
    bool handleResume();
    bool handleManaging();

    std::optional<std::string> chooseImage(bool& remote);
    std::optional<std::string> chooseRemoteTag();
    std::optional<std::string> chooseLocalImage();
    void createContainer();

    void showStats();
    void showLogs();
    void ledgerMenu();
    void ledgerActions(const ledger::LedgerSummary& ledger);

    // Prints stream items on a background consumer until the operator presses Enter.
    template <typename T, typename Format> void watch(Stream<T>& stream, Format&& format);

    void report(const Error& error);
    int finish();

    orchestrator::LifecycleOrchestrator& orchestrator_;
    docker::IDockerClient& client_;
    const registry::HubClient& hub_;
    SessionOptions options_;
    std::optional<Error> unrecovered_;
};

} // namespace flocker::cli
