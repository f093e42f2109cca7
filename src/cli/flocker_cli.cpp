#include <flocker/cli/error_hints.h>
#include <flocker/cli/flocker_cli.h>
#include <flocker/cli/interactive_session.h>
#include <flocker/config/config_helpers.h>
#include <flocker/docker/docker_client.h>
#include <flocker/orchestrator/lifecycle_orchestrator.h>
#include <flocker/registry/hub_client.h>
#include <flocker/state/state_store.h>
#include <flocker/version.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace flocker::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text) {
    std::string v;
    v.reserve(text.size());
    for (char c : text)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

FlockerCLI::FlockerCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Manage Fluree server containers on Docker", "flocker");
    app_->set_version_flag("--version", FLOCKER_VERSION_LONG_STRING);
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("--config", configPath_,
                     "Config file (default: $XDG_CONFIG_HOME/flocker/config.toml)");
}

FlockerCLI::~FlockerCLI() = default;

// Precedence: env FLOCKER_LOG_LEVEL > --verbose > [logging] level > warn
void FlockerCLI::applyLogLevel(const std::optional<std::string>& configured) const {
    if (const char* envLvl = std::getenv("FLOCKER_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown FLOCKER_LOG_LEVEL '{}'", envLvl);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (configured) {
        if (auto lvl = parseLogLevel(*configured)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown [logging] level '{}'", *configured);
    }
    spdlog::set_level(spdlog::level::warn);
}

int FlockerCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    auto configFile = config::get_config_path(configPath_);
    auto loaded = config::load_config(configFile);
    if (!loaded) {
        applyLogLevel(std::nullopt);
        std::cerr << "[FAIL] " << configFile.string() << ": "
                  << formatErrorWithHint(loaded.error()) << "\n";
        return 1;
    }
    auto cfg = std::move(loaded).value();
    config::apply_environment(cfg);
    applyLogLevel(cfg.logLevel);

    spdlog::debug("flocker {} using Docker at {}", FLOCKER_VERSION_STRING, cfg.dockerHost);

    docker::DockerClientConfig dockerConfig;
    dockerConfig.host = cfg.dockerHost;
    dockerConfig.apiVersion = cfg.apiVersion;
    dockerConfig.requestTimeout = cfg.requestTimeout;
    auto client = docker::makeDockerClient(dockerConfig);

    state::StateStore store(config::get_state_path());
    spdlog::debug("State file: {}", store.path().string());

    orchestrator::OrchestratorOptions orchestratorOptions;
    orchestratorOptions.stopGrace = cfg.stopGrace;
    orchestrator::LifecycleOrchestrator orchestrator(*client, store, orchestratorOptions);

    registry::HubClientConfig hubConfig;
    hubConfig.pageSize = cfg.pageSize;
    registry::HubClient hub(hubConfig);

    SessionOptions sessionOptions;
    sessionOptions.repository = cfg.repository;
    InteractiveSession session(orchestrator, *client, hub, sessionOptions);
    return session.run();
}

} // namespace flocker::cli
