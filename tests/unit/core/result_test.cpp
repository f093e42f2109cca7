#include <gtest/gtest.h>
#include <flocker/core/types.h>

#include <fmt/format.h>

#include <memory>
#include <string>

using namespace flocker;

// ============================================================================
// Error
// ============================================================================

TEST(ErrorTest, CodeOnlyErrorUsesDescription) {
    Error err(ErrorCode::PortInUse);
    EXPECT_EQ(err.code, ErrorCode::PortInUse);
    EXPECT_EQ(err.message, "Port in use");
}

TEST(ErrorTest, ComparesAgainstErrorCode) {
    Error err{ErrorCode::NotFound, "no such container: abc"};
    EXPECT_TRUE(err == ErrorCode::NotFound);
    EXPECT_TRUE(ErrorCode::NotFound == err);
    EXPECT_TRUE(err != ErrorCode::ImageNotFound);
}

TEST(ErrorTest, FormatsThroughFmt) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::DaemonUnreachable), "Docker daemon unreachable");
}

// ============================================================================
// Result<T>
// ============================================================================

TEST(ResultTest, HoldsValue) {
    Result<int> r(42);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    Result<int> r(Error{ErrorCode::Timeout, "took too long"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(r.error().message, "took too long");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<std::string> r(ErrorCode::InvalidArgument);
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, ErrorOnValueThrows) {
    Result<std::string> r(std::string("ok"));
    EXPECT_THROW((void)r.error(), std::runtime_error);
}

TEST(ResultTest, MovesOutMoveOnlyValue) {
    Result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    auto p = std::move(r).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 7);
}

// ============================================================================
// Result<void>
// ============================================================================

TEST(ResultVoidTest, DefaultIsSuccess) {
    Result<void> r;
    EXPECT_TRUE(r);
    EXPECT_NO_THROW(r.value());
}

TEST(ResultVoidTest, CarriesError) {
    Result<void> r(Error{ErrorCode::ConfirmationRequired, "confirm first"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfirmationRequired);
    EXPECT_THROW(r.value(), std::runtime_error);
}
