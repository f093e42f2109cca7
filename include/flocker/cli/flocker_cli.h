#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace flocker::cli {

/**
 * Main CLI application class
 */
class FlockerCLI {
public:
    FlockerCLI();
    ~FlockerCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    bool getVerbose() const { return verbose_; }

private:
    void applyLogLevel(const std::optional<std::string>& configured) const;

    std::unique_ptr<CLI::App> app_;
    bool verbose_{false};
    std::string configPath_;
};

// "trace", "debug", "info", "warn", "error", "critical", "off" (case-insensitive)
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text);

} // namespace flocker::cli
