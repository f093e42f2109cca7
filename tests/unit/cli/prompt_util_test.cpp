/**
 * Tests for prompt_util.h - interactive prompts used by the session menus.
 *
 * std::cin is replaced by an istringstream; std::cout is captured so the
 * rendered prompt can be checked where it matters.
 */

#include <gtest/gtest.h>
#include <flocker/cli/prompt_util.h>

#include <iostream>
#include <sstream>
#include <string>

using namespace flocker::cli;

namespace {

/**
 * RAII helper to redirect std::cin to a custom buffer for testing.
 */
class MockStdin {
public:
    explicit MockStdin(const std::string& input) : buffer_(input), oldBuf_(std::cin.rdbuf()) {
        std::cin.rdbuf(buffer_.rdbuf());
    }

    ~MockStdin() {
        std::cin.rdbuf(oldBuf_);
        std::cin.clear(); // Clear any error flags
    }

    MockStdin(const MockStdin&) = delete;
    MockStdin& operator=(const MockStdin&) = delete;

private:
    std::istringstream buffer_;
    std::streambuf* oldBuf_;
};

/**
 * RAII helper capturing std::cout.
 */
class CaptureCout {
public:
    CaptureCout() : oldBuf_(std::cout.rdbuf()) { std::cout.rdbuf(sink_.rdbuf()); }

    ~CaptureCout() { std::cout.rdbuf(oldBuf_); }

    CaptureCout(const CaptureCout&) = delete;
    CaptureCout& operator=(const CaptureCout&) = delete;

    std::string str() const { return sink_.str(); }

private:
    std::ostringstream sink_;
    std::streambuf* oldBuf_;
};

std::vector<ChoiceItem> actions() {
    return {{"stats", "View container stats", ""},
            {"logs", "View container logs", ""},
            {"stop", "Stop container", ""}};
}

} // namespace

// ============================================================================
// prompt_yes_no()
// ============================================================================

TEST(PromptUtilTest, YesNoAcceptsYAndN) {
    {
        MockStdin input("y\n");
        CaptureCout out;
        EXPECT_TRUE(prompt_yes_no("Pull the image now?"));
    }
    {
        MockStdin input("N\n");
        CaptureCout out;
        EXPECT_FALSE(prompt_yes_no("Pull the image now?"));
    }
}

TEST(PromptUtilTest, YesNoAcceptsWholeWords) {
    {
        MockStdin input("  Yes \n");
        CaptureCout out;
        EXPECT_TRUE(prompt_yes_no("Detach?", {.defaultYes = false}));
    }
    {
        MockStdin input("no\n");
        CaptureCout out;
        EXPECT_FALSE(prompt_yes_no("Detach?"));
    }
    {
        MockStdin input("yep\n");
        CaptureCout out;
        EXPECT_FALSE(prompt_yes_no("Detach?", {.defaultYes = false}));
    }
}

TEST(PromptUtilTest, YesNoShowsDefaultInSuffix) {
    MockStdin input("\n");
    CaptureCout out;
    EXPECT_FALSE(prompt_yes_no("Delete ledger?", {.defaultYes = false}));
    EXPECT_EQ(out.str(), "Delete ledger? [y/N] ");
}

TEST(PromptUtilTest, YesNoEOFReturnsDefault) {
    MockStdin input("");
    CaptureCout out;
    EXPECT_TRUE(prompt_yes_no("Continue?", {.defaultYes = true}));
    EXPECT_TRUE(input_closed());
}

TEST(PromptUtilTest, YesNoInvalidInputReturnsDefault) {
    MockStdin input("maybe\n");
    CaptureCout out;
    EXPECT_FALSE(prompt_yes_no("Continue?", {.defaultYes = false, .retryOnInvalid = false}));
}

TEST(PromptUtilTest, YesNoRetryOnInvalidEventuallyAccepts) {
    MockStdin input("maybe\ny\n");
    CaptureCout out;
    EXPECT_TRUE(prompt_yes_no("Continue?", {.defaultYes = false, .retryOnInvalid = true}));
}

TEST(PromptUtilTest, YesNoRequiredAnswerShowsNoDefault) {
    MockStdin input("\nn\n");
    CaptureCout out;
    EXPECT_FALSE(prompt_yes_no("Continue?", {.allowEmpty = false, .retryOnInvalid = true}));
    EXPECT_NE(out.str().find("[y/n]"), std::string::npos);
}

// ============================================================================
// prompt_input()
// ============================================================================

TEST(PromptUtilTest, InputTrimsAndReturnsValue) {
    MockStdin input("  58090 \r\n");
    CaptureCout out;
    EXPECT_EQ(prompt_input("Host port", {.defaultValue = "8090"}), "58090");
    EXPECT_EQ(out.str(), "Host port [8090]: ");
}

TEST(PromptUtilTest, InputEmptyReturnsDefault) {
    MockStdin input("\n");
    CaptureCout out;
    EXPECT_EQ(prompt_input("Host port", {.defaultValue = "8090"}), "8090");
}

TEST(PromptUtilTest, InputEOFReturnsDefault) {
    MockStdin input("");
    CaptureCout out;
    EXPECT_EQ(prompt_input("Data directory", {.defaultValue = "/srv/fluree"}), "/srv/fluree");
}

TEST(PromptUtilTest, InputValidatorRetriesWithMessage) {
    MockStdin input("abc\n8091\n");
    CaptureCout out;
    auto digits = [](const std::string& s) {
        return s.find_first_not_of("0123456789") == std::string::npos;
    };
    EXPECT_EQ(prompt_input("Host port",
                           {.validator = digits, .invalidMessage = "Enter a number"}),
              "8091");
    EXPECT_NE(out.str().find("Enter a number\n"), std::string::npos);
}

TEST(PromptUtilTest, InputValidatorWithoutRetryReturnsDefault) {
    MockStdin input("invalid\n");
    CaptureCout out;
    auto validator = [](const std::string& s) { return s == "valid"; };
    EXPECT_EQ(prompt_input("Value", {.defaultValue = "fallback",
                                     .retryOnInvalid = false,
                                     .validator = validator}),
              "fallback");
}

TEST(PromptUtilTest, InputRequiredRepromptsOnEmpty) {
    MockStdin input("\n\nmovies\n");
    CaptureCout out;
    EXPECT_EQ(prompt_input("Ledger name", {.allowEmpty = false}), "movies");
}

// ============================================================================
// prompt_choice()
// ============================================================================

TEST(PromptUtilTest, ChoiceReturnsZeroBasedIndex) {
    MockStdin input("2\n");
    CaptureCout out;
    EXPECT_EQ(prompt_choice("What would you like to do?", actions()), 1u);
    EXPECT_NE(out.str().find("  2. View container logs\n"), std::string::npos);
    EXPECT_NE(out.str().find("Select a number (1-3) [1]: "), std::string::npos);
}

TEST(PromptUtilTest, ChoiceEmptyReturnsDefault) {
    MockStdin input("\n");
    CaptureCout out;
    EXPECT_EQ(prompt_choice("Select:", actions(), {.defaultIndex = 2}), 2u);
}

TEST(PromptUtilTest, ChoiceRejectsOutOfRangeAndGarbage) {
    for (const char* bad : {"0\n", "4\n", "-1\n", "2x\n", "abc\n"}) {
        MockStdin input(bad);
        CaptureCout out;
        EXPECT_EQ(prompt_choice("Select:", actions(), {.defaultIndex = 0, .retryOnInvalid = false}),
                  0u)
            << bad;
    }
}

TEST(PromptUtilTest, ChoiceRetryEventuallyAccepts) {
    MockStdin input("invalid\n99\n3\n");
    CaptureCout out;
    EXPECT_EQ(prompt_choice("Select:", actions()), 2u);
}

TEST(PromptUtilTest, ChoiceEOFReturnsDefault) {
    MockStdin input("");
    CaptureCout out;
    EXPECT_EQ(prompt_choice("Select:", actions(), {.defaultIndex = 1}), 1u);
}

TEST(PromptUtilTest, ChoiceThrowsOnEmptyItems) {
    CaptureCout out;
    std::vector<ChoiceItem> items;
    EXPECT_THROW(prompt_choice("Select:", items), std::invalid_argument);
}

TEST(PromptUtilTest, ChoiceUsesValueAsLabelWhenLabelEmpty) {
    MockStdin input("1\n");
    CaptureCout out;
    std::vector<ChoiceItem> items = {{"fluree/server:latest", "", "updated 3 days ago"}};
    EXPECT_EQ(prompt_choice("Select:", items), 0u);
    EXPECT_NE(out.str().find("1. fluree/server:latest\n     updated 3 days ago\n"),
              std::string::npos);
}

TEST(PromptUtilTest, MultiplePromptsInSequence) {
    MockStdin input("y\n58090\n2\n");
    CaptureCout out;

    EXPECT_TRUE(prompt_yes_no("Mount a data directory?"));
    EXPECT_EQ(prompt_input("Host port"), "58090");
    EXPECT_EQ(prompt_choice("Select:", actions()), 1u);
    EXPECT_FALSE(input_closed());
}
