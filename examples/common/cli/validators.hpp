#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace gattlink::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn"  || value == "error" || value == "fatal") {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Peer identifier validator
// -------------------------------------------------------------
inline auto peer_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!value.empty() && value.find(' ') == std::string::npos) {
            return {};
        }
        return "Peer identifier must be a non-empty token (e.g. SIM:UART:01)";
    },
    "Peer identifier validator"
);

} // namespace gattlink::examples::cli
