#pragma once

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "gattlink/core/config.hpp"
#include "gattlink/config/loader.hpp"
#include "gattlink/log/logger.hpp"
#include "common/cli/validators.hpp"

namespace gattlink::examples::cli::minimal {

struct Params {
    std::string peer        = "SIM:UART:01";
    std::string config_path;                 // optional JSON file
    int retry_count         = core::RETRY_COUNT;
    int connect_timeout_ms  = 2000;
    int request_timeout_ms  = 2000;
    std::string log_level   = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Peer            : " << peer << "\n"
           << "  Config          : " << (config_path.empty() ? "<none>" : config_path) << "\n"
           << "  Retry count     : " << retry_count << "\n"
           << "  Connect timeout : " << connect_timeout_ms << " ms\n"
           << "  Request timeout : " << request_timeout_ms << " ms\n"
           << "  Log Level       : " << log_level << "\n";
    }

    // Command-line values first, then the JSON file (if any) on top
    [[nodiscard]]
    inline core::SessionConfig session_config() const {
        config::Settings settings;
        settings.session.retry_count = retry_count;
        settings.session.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
        if (!config_path.empty()) {
            const config::Result r = config::load(config_path, settings);
            if (r != config::Result::Ok) {
                std::cerr << "Cannot use config '" << config_path << "': " << config::to_string(r) << std::endl;
                std::exit(EXIT_FAILURE);
            }
            if (settings.log_level) {
                log::set_level(*settings.log_level);
            }
        }
        return settings.session;
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-p,--peer", params.peer, "Peer identifier")->check(peer_validator)->default_val(params.peer);
    app.add_option("-c,--config", params.config_path, "JSON session configuration")->check(CLI::ExistingFile);
    app.add_option("-r,--retries", params.retry_count, "Automatic reconnect attempts")->check(CLI::NonNegativeNumber)->default_val(params.retry_count);
    app.add_option("--connect-timeout", params.connect_timeout_ms, "Connect watchdog (ms)")->check(CLI::PositiveNumber)->default_val(params.connect_timeout_ms);
    app.add_option("--request-timeout", params.request_timeout_ms, "Request deadline (ms)")->check(CLI::PositiveNumber)->default_val(params.request_timeout_ms);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "This example runs against the in-process simulated central.\n"
        "Behavior is observable via logs and the session observer."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    log::set_level(params.log_level);
    return params;
}

} // namespace gattlink::examples::cli::minimal
