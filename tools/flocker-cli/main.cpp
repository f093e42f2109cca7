#include <spdlog/spdlog.h>
#include <flocker/cli/flocker_cli.h>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; FlockerCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        flocker::cli::FlockerCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
