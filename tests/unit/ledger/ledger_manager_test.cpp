/**
 * Tests for LedgerManager - ledger discovery, detail and deletion through
 * commands executed inside the server container.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <flocker/ledger/ledger_manager.h>

#include "../../common/mock_docker_client.h"

using namespace flocker;
using namespace flocker::ledger;
using flocker::test::execOutput;
using flocker::test::MockDockerClient;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr const char* kMovies = R"({
    "ledgerAlias": "movies",
    "branches": [{"name": "main",
                  "commit": {"time": "2024-05-01T10:00:00Z",
                             "data": {"t": 12, "size": 20480, "flakes": 340}}}]
})";

constexpr const char* kBooks = R"({
    "ledgerAlias": "books",
    "branches": [{"commit": {"time": 1714557600000, "data": {"t": 3, "size": 100, "flakes": 9}}}]
})";

const std::string kMoviesPath = "/opt/fluree-server/data/movies/main/movies.json";
const std::string kBooksPath = "/opt/fluree-server/data/books/books.json";

// Answers find/cat from a fixed file table.
class LedgerManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(client_, execInContainer("c1", _))
            .WillByDefault(Invoke([this](const ContainerId&, const std::vector<std::string>& cmd)
                                      -> Result<docker::ExecResult> {
                if (cmd.at(0) == "find") {
                    std::string out;
                    for (const auto& [path, content] : files_)
                        out += path + "\n";
                    return execOutput(out);
                }
                if (cmd.at(0) == "cat") {
                    for (const auto& [path, content] : files_) {
                        if (path == cmd.at(1))
                            return execOutput(content);
                    }
                    return Error{ErrorCode::ExecFailed, "exit code 1: No such file"};
                }
                if (cmd.at(0) == "rm") {
                    removed_.push_back(cmd.at(2));
                    return rmResult_;
                }
                return Error{ErrorCode::InternalError, "unexpected command"};
            }));
    }

    NiceMock<MockDockerClient> client_;
    std::vector<std::pair<std::string, std::string>> files_{{kMoviesPath, kMovies},
                                                            {kBooksPath, kBooks}};
    std::vector<std::string> removed_;
    Result<docker::ExecResult> rmResult_{docker::ExecResult{}};
};

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(LedgerParseTest, ReadsCommitMetadata) {
    auto parsed = LedgerManager::parseLedgerFile(kMoviesPath, kMovies);
    ASSERT_TRUE(parsed);
    ASSERT_TRUE(parsed.value().has_value());
    const auto& s = *parsed.value();
    EXPECT_EQ(s.name, "movies");
    EXPECT_EQ(s.commitCount, 12u);
    EXPECT_EQ(s.sizeBytes, 20480u);
    EXPECT_EQ(s.flakes, 340u);
    EXPECT_EQ(s.lastUpdate, "2024-05-01T10:00:00Z");
    EXPECT_EQ(s.path, kMoviesPath);
}

TEST(LedgerParseTest, NonLedgerJsonIsSkipped) {
    auto parsed = LedgerManager::parseLedgerFile("/x.json", R"({"some": "config"})");
    ASSERT_TRUE(parsed);
    EXPECT_FALSE(parsed.value().has_value());
}

TEST(LedgerParseTest, BrokenJsonIsMalformed) {
    auto parsed = LedgerManager::parseLedgerFile("/x.json", "{\"ledgerAlias\": ");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::MalformedResponse);
}

TEST(LedgerParseTest, FileListTrimsAndSkipsBlankLines) {
    auto files = LedgerManager::parseFileList("  /a.json\n\n/b.json \r\n");
    EXPECT_THAT(files, ElementsAre("/a.json", "/b.json"));
}

TEST(LedgerParseTest, LedgerDirectoryStaysBelowDataRoot) {
    EXPECT_EQ(LedgerManager::ledgerDirectory(kMoviesPath).value(),
              "/opt/fluree-server/data/movies/main");
    EXPECT_FALSE(LedgerManager::ledgerDirectory("/opt/fluree-server/data/top.json"));
    EXPECT_FALSE(LedgerManager::ledgerDirectory("/opt/fluree-server/data/../etc/x.json"));
    EXPECT_FALSE(LedgerManager::ledgerDirectory("/etc/passwd"));
}

// ============================================================================
// listLedgers / describeLedger
// ============================================================================

TEST_F(LedgerManagerTest, ListsLedgersSortedByName) {
    LedgerManager manager(client_);
    auto listing = manager.listLedgers("c1");
    ASSERT_TRUE(listing);
    EXPECT_FALSE(listing.value().warning.has_value());
    ASSERT_EQ(listing.value().ledgers.size(), 2u);
    EXPECT_EQ(listing.value().ledgers[0].name, "books");
    EXPECT_EQ(listing.value().ledgers[1].name, "movies");
    EXPECT_EQ(listing.value().ledgers[0].lastUpdate, "1714557600000");
}

TEST_F(LedgerManagerTest, EmptyDataDirectoryListsNothing) {
    files_.clear();
    LedgerManager manager(client_);
    auto listing = manager.listLedgers("c1");
    ASSERT_TRUE(listing);
    EXPECT_TRUE(listing.value().ledgers.empty());
    EXPECT_FALSE(listing.value().warning.has_value());
}

TEST_F(LedgerManagerTest, MalformedFileYieldsEmptyListingWithWarning) {
    files_ = {{"/opt/fluree-server/data/bad/bad.json", "{oops"}};
    LedgerManager manager(client_);
    auto listing = manager.listLedgers("c1");
    ASSERT_TRUE(listing);
    EXPECT_TRUE(listing.value().ledgers.empty());
    ASSERT_TRUE(listing.value().warning.has_value());
    EXPECT_EQ(listing.value().warning->code, ErrorCode::MalformedResponse);
}

TEST_F(LedgerManagerTest, CorruptSiblingDoesNotHideHealthyLedgers) {
    files_.emplace_back("/opt/fluree-server/data/tmp/partial.json", "{trunc");
    LedgerManager manager(client_);
    auto listing = manager.listLedgers("c1");
    ASSERT_TRUE(listing);
    ASSERT_EQ(listing.value().ledgers.size(), 2u);
    EXPECT_EQ(listing.value().ledgers[0].name, "books");
    EXPECT_EQ(listing.value().ledgers[1].name, "movies");
    ASSERT_TRUE(listing.value().warning.has_value());
    EXPECT_EQ(listing.value().warning->code, ErrorCode::MalformedResponse);
    EXPECT_NE(listing.value().warning->message.find("partial.json"), std::string::npos);
}

TEST_F(LedgerManagerTest, ExecFailureIsAnError) {
    EXPECT_CALL(client_, execInContainer("c1", _))
        .WillOnce(Return(Result<docker::ExecResult>(
            Error{ErrorCode::InvalidState, "container is not running"})));
    LedgerManager manager(client_);
    auto listing = manager.listLedgers("c1");
    ASSERT_FALSE(listing);
    EXPECT_EQ(listing.error().code, ErrorCode::InvalidState);
}

TEST_F(LedgerManagerTest, DescribeReturnsPrettyDocument) {
    LedgerManager manager(client_);
    auto detail = manager.describeLedger("c1", "movies");
    ASSERT_TRUE(detail);
    EXPECT_EQ(detail.value().summary.commitCount, 12u);
    EXPECT_NE(detail.value().document.find("\"ledgerAlias\": \"movies\""), std::string::npos);
}

TEST_F(LedgerManagerTest, DescribeIgnoresCorruptSibling) {
    files_.emplace_back("/opt/fluree-server/data/tmp/partial.json", "{trunc");
    LedgerManager manager(client_);
    auto detail = manager.describeLedger("c1", "books");
    ASSERT_TRUE(detail);
    EXPECT_EQ(detail.value().summary.commitCount, 3u);
}

TEST_F(LedgerManagerTest, DescribeUnknownLedgerIsNotFound) {
    LedgerManager manager(client_);
    auto detail = manager.describeLedger("c1", "nope");
    ASSERT_FALSE(detail);
    EXPECT_EQ(detail.error().code, ErrorCode::NotFound);
}

// ============================================================================
// deleteLedger
// ============================================================================

TEST_F(LedgerManagerTest, DeleteWithoutConfirmationTouchesNothing) {
    EXPECT_CALL(client_, execInContainer(_, _)).Times(0);
    LedgerManager manager(client_);
    auto result = manager.deleteLedger("c1", "movies", false);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ConfirmationRequired);
}

TEST_F(LedgerManagerTest, ConfirmedDeleteRemovesLedgerDirectory) {
    LedgerManager manager(client_);
    auto result = manager.deleteLedger("c1", "movies", true);
    ASSERT_TRUE(result);
    EXPECT_THAT(removed_, ElementsAre("/opt/fluree-server/data/movies/main"));
}

TEST_F(LedgerManagerTest, ConfirmedDeleteProceedsDespiteCorruptSibling) {
    files_.emplace_back("/opt/fluree-server/data/tmp/partial.json", "{trunc");
    LedgerManager manager(client_);
    auto result = manager.deleteLedger("c1", "movies", true);
    ASSERT_TRUE(result);
    EXPECT_THAT(removed_, ElementsAre("/opt/fluree-server/data/movies/main"));
}

TEST_F(LedgerManagerTest, DeleteUnknownLedgerIsNotFound) {
    LedgerManager manager(client_);
    auto result = manager.deleteLedger("c1", "nope", true);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(removed_.empty());
}

TEST_F(LedgerManagerTest, FailedRemovalIsLedgerDeleteFailed) {
    rmResult_ = Error{ErrorCode::ExecFailed, "exit code 1: rm: cannot remove"};
    LedgerManager manager(client_);
    auto result = manager.deleteLedger("c1", "books", true);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::LedgerDeleteFailed);
    EXPECT_THAT(removed_, ElementsAre("/opt/fluree-server/data/books"));
}
