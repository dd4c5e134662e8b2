#include "gattlink/config/loader.hpp"

#include <chrono>
#include <cstdint>
#include <limits>

#include "gattlink/config/parser/helpers.hpp"
#include "gattlink/log/logger.hpp"

#include "simdjson.h"


namespace gattlink::config {

namespace {

[[nodiscard]]
bool known_level(std::string_view name) noexcept {
    return name == "trace" || name == "debug" || name == "info"
        || name == "warn"  || name == "error" || name == "fatal";
}

[[nodiscard]]
Result apply(const simdjson::dom::element& root, Settings& out) {
    using namespace parser;

    if (!helper::require_object(root)) {
        GL_WARN("[CONFIG] Root element is not an object");
        return Result::InvalidSchema;
    }

    std::optional<std::int64_t> retry_count;
    std::optional<std::int64_t> connect_timeout_ms;
    std::optional<std::string> line_terminator;
    std::optional<std::int64_t> max_write_size;
    std::optional<bool> write_with_response;
    std::optional<std::string> log_level;

    if (!helper::parse_int64_optional(root, "retry_count", retry_count)
     || !helper::parse_int64_optional(root, "connect_timeout_ms", connect_timeout_ms)
     || !helper::parse_string_optional(root, "line_terminator", line_terminator)
     || !helper::parse_int64_optional(root, "max_write_size", max_write_size)
     || !helper::parse_bool_optional(root, "write_with_response", write_with_response)
     || !helper::parse_string_optional(root, "log_level", log_level)) {
        GL_WARN("[CONFIG] Field with unexpected type");
        return Result::InvalidSchema;
    }

    if (retry_count && (*retry_count < 0 || *retry_count > std::numeric_limits<int>::max())) {
        GL_WARN("[CONFIG] retry_count must be in [0, " << std::numeric_limits<int>::max() << "] (got " << *retry_count << ")");
        return Result::InvalidValue;
    }
    if (connect_timeout_ms && *connect_timeout_ms <= 0) {
        GL_WARN("[CONFIG] connect_timeout_ms must be > 0 (got " << *connect_timeout_ms << ")");
        return Result::InvalidValue;
    }
    // 512 is the largest ATT attribute value
    if (max_write_size && (*max_write_size <= 0 || *max_write_size > static_cast<std::int64_t>(core::MAX_WRITE_SIZE))) {
        GL_WARN("[CONFIG] max_write_size must be in [1, " << core::MAX_WRITE_SIZE << "] (got " << *max_write_size << ")");
        return Result::InvalidValue;
    }
    if (log_level && !known_level(*log_level)) {
        GL_WARN("[CONFIG] Unknown log_level '" << *log_level << "'");
        return Result::InvalidValue;
    }

    Settings next = out;
    if (retry_count) {
        next.session.retry_count = static_cast<int>(*retry_count);
    }
    if (connect_timeout_ms) {
        next.session.connect_timeout = std::chrono::milliseconds(*connect_timeout_ms);
    }
    if (line_terminator) {
        next.session.line_terminator = *line_terminator;
    }
    if (max_write_size) {
        next.session.max_write_size = static_cast<std::size_t>(*max_write_size);
    }
    if (write_with_response) {
        next.session.write_with_response = *write_with_response;
    }
    if (log_level) {
        next.log_level = log_level;
    }
    out = std::move(next);
    return Result::Ok;
}

} // namespace

Result parse(std::string_view json, Settings& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    const simdjson::padded_string padded(json);
    if (auto err = parser.parse(padded).get(root); err) {
        GL_WARN("[CONFIG] Invalid JSON: " << simdjson::error_message(err));
        return Result::InvalidJson;
    }
    return apply(root, out);
}

Result load(const std::string& path, Settings& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (auto err = parser.load(path).get(root); err) {
        if (err == simdjson::IO_ERROR) {
            GL_WARN("[CONFIG] Cannot read '" << path << "'");
            return Result::FileNotFound;
        }
        GL_WARN("[CONFIG] Invalid JSON in '" << path << "': " << simdjson::error_message(err));
        return Result::InvalidJson;
    }
    const Result r = apply(root, out);
    if (r == Result::Ok) {
        GL_DEBUG("[CONFIG] Loaded '" << path << "'");
    }
    return r;
}

} // namespace gattlink::config
