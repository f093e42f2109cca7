#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <flocker/core/types.h>
#include <flocker/docker/docker_client.h>

namespace flocker::ledger {

struct LedgerSummary {
    std::string name;
    uint64_t commitCount{0};
    uint64_t sizeBytes{0};
    std::string lastUpdate;
    uint64_t flakes{0};
    std::string path; // ledger file inside the container
};

struct LedgerListing {
    std::vector<LedgerSummary> ledgers;
    // MalformedResponse when a ledger file could not be parsed (the first one)
    std::optional<Error> warning;
};

struct LedgerDetail {
    LedgerSummary summary;
    std::string document; // pretty-printed ledger JSON
};

/**
 * Ledger inspection inside a running server container, done entirely through
 * execInContainer (find/cat/rm). Holds no state between calls.
 */
class LedgerManager {
public:
    explicit LedgerManager(docker::IDockerClient& client);

    // Daemon and exec failures are errors; an unparseable file is not: it is
    // skipped and the listing carries a MalformedResponse warning.
    Result<LedgerListing> listLedgers(const ContainerId& id);

    Result<LedgerDetail> describeLedger(const ContainerId& id, std::string_view name);

    // ConfirmationRequired without touching the container unless confirmed.
    Result<void> deleteLedger(const ContainerId& id, std::string_view name, bool confirmed);

    // Parses one ledger file; std::nullopt for JSON that is not a ledger record.
    static Result<std::optional<LedgerSummary>> parseLedgerFile(std::string_view path,
                                                                 std::string_view content);

    // Splits `find` output into absolute paths.
    static std::vector<std::string> parseFileList(std::string_view output);

    // Directory removed along with a ledger file. InvalidArgument unless it lies
    // strictly below the server data root.
    static Result<std::string> ledgerDirectory(std::string_view ledgerFile);

private:
    Result<std::vector<std::pair<LedgerSummary, std::string>>> scan(const ContainerId& id,
                                                                    std::optional<Error>& warning);

    docker::IDockerClient& client_;
};

} // namespace flocker::ledger
