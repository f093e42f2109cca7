/**
 * Prompt utility helpers for the interactive session.
 *
 * All prompts read std::cin and write std::cout. On end of input they return
 * their default; input_closed() lets a caller notice and wind down.
 */
#pragma once
#include <cctype>
#include <charconv>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace flocker::cli {

inline bool input_closed() {
    return !std::cin.good();
}

namespace detail {

inline std::string_view trim_line(std::string_view line) {
    auto start = line.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
        return {};
    auto end = line.find_last_not_of(" \t\r\n");
    return line.substr(start, end - start + 1);
}

// "y", "yes", "n", "no" in any case
inline std::optional<bool> parse_answer(std::string_view text) {
    std::string lower;
    for (char c : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "y" || lower == "yes")
        return true;
    if (lower == "n" || lower == "no")
        return false;
    return std::nullopt;
}

} // namespace detail

// --------------------------- Yes / No ---------------------------- //
struct YesNoOptions {
    bool defaultYes{true};      // Returned on empty input and on EOF
    bool allowEmpty{true};      // Enter accepts the default
    bool retryOnInvalid{false}; // Keep asking until the answer parses
};

inline bool prompt_yes_no(const std::string& prompt, const YesNoOptions& opts = {}) {
    const char* suffix = !opts.allowEmpty ? " [y/n] " : (opts.defaultYes ? " [Y/n] " : " [y/N] ");
    for (;;) {
        std::cout << prompt << suffix;
        std::string line;
        if (!std::getline(std::cin, line))
            return opts.defaultYes;

        auto text = detail::trim_line(line);
        if (text.empty()) {
            if (opts.allowEmpty || !opts.retryOnInvalid)
                return opts.defaultYes;
            continue;
        }
        if (auto answer = detail::parse_answer(text))
            return *answer;
        if (!opts.retryOnInvalid)
            return opts.defaultYes;
    }
}

// --------------------------- Free text ---------------------------- //
struct InputOptions {
    std::string defaultValue{};                          // Returned on empty input and on EOF
    bool allowEmpty{true};                               // Enter accepts defaultValue
    bool retryOnInvalid{true};                           // Reprompt when the validator rejects
    std::function<bool(const std::string&)> validator{}; // true if acceptable
    std::string invalidMessage{};                        // Printed before reprompting
};

inline std::string prompt_input(const std::string& prompt, const InputOptions& opts = {}) {
    for (;;) {
        std::cout << prompt;
        if (!opts.defaultValue.empty())
            std::cout << " [" << opts.defaultValue << "]";
        std::cout << ": ";
        std::string raw;
        if (!std::getline(std::cin, raw))
            return opts.defaultValue;

        std::string line(detail::trim_line(raw));
        if (line.empty()) {
            if (opts.allowEmpty || !opts.retryOnInvalid)
                return opts.defaultValue;
            continue;
        }
        if (opts.validator && !opts.validator(line)) {
            if (!opts.retryOnInvalid)
                return opts.defaultValue;
            if (!opts.invalidMessage.empty())
                std::cout << opts.invalidMessage << "\n";
            continue;
        }
        return line;
    }
}

// --------------------------- Numbered menu ---------------------------- //
struct ChoiceItem {
    std::string value;       // Identifies the entry to the caller
    std::string label;       // Shown text; value when empty
    std::string description; // Optional second line
};

struct ChoiceOptions {
    size_t defaultIndex{0};    // 0-based
    bool allowEmpty{true};     // Enter accepts defaultIndex
    bool retryOnInvalid{true}; // Reprompt on out-of-range or non-numeric input
};

// Returns the 0-based index of the chosen item.
inline size_t prompt_choice(const std::string& header, const std::vector<ChoiceItem>& items,
                            const ChoiceOptions& opts = {}) {
    if (items.empty())
        throw std::invalid_argument("prompt_choice: items cannot be empty");
    for (;;) {
        if (!header.empty())
            std::cout << header << "\n";
        for (size_t i = 0; i < items.size(); ++i) {
            const auto& it = items[i];
            std::cout << "  " << (i + 1) << ". " << (it.label.empty() ? it.value : it.label)
                      << "\n";
            if (!it.description.empty())
                std::cout << "     " << it.description << "\n";
        }
        std::cout << "Select a number (1-" << items.size() << ")";
        if (opts.allowEmpty)
            std::cout << " [" << (opts.defaultIndex + 1) << "]";
        std::cout << ": ";
        std::string line;
        if (!std::getline(std::cin, line))
            return opts.defaultIndex;

        auto text = detail::trim_line(line);
        if (text.empty() && opts.allowEmpty)
            return opts.defaultIndex;
        size_t choice = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), choice);
        if (ec == std::errc() && ptr == text.data() + text.size() && choice >= 1 &&
            choice <= items.size())
            return choice - 1;
        if (!opts.retryOnInvalid)
            return opts.defaultIndex;
    }
}

} // namespace flocker::cli
