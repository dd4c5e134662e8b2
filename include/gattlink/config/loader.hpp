#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "gattlink/core/config.hpp"
#include "gattlink/config/parser/result.hpp"


namespace gattlink::config {

/*
===============================================================================
 JSON configuration
===============================================================================

  {
    "retry_count":         3,        // >= 0
    "connect_timeout_ms":  20000,    // > 0
    "line_terminator":     "\n",
    "max_write_size":      512,      // > 0
    "write_with_response": false,
    "log_level":           "info"    // trace | debug | info | warn | error | fatal
  }

Every key is optional; absent keys keep the SessionConfig defaults. Unknown
keys are ignored.

On failure `out` is left unchanged.
===============================================================================
*/

struct Settings {
    core::SessionConfig session;
    std::optional<std::string> log_level;
};

[[nodiscard]]
Result parse(std::string_view json, Settings& out);

[[nodiscard]]
Result load(const std::string& path, Settings& out);

} // namespace gattlink::config
