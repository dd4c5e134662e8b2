#pragma once

#include <cstdint>
#include <string_view>


namespace gattlink::config {

// ===============================================
// CONFIG LOAD RESULT
// ===============================================
enum class Result : std::uint8_t {
    Ok            = 0,
    FileNotFound  = 1,            // Path missing or unreadable
    InvalidJson   = 2,            // Structural failure
    InvalidSchema = 3,            // Root is not an object, or a known key has the wrong type
    InvalidValue  = 4             // Known key with the right type but an unusable value
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::FileNotFound:  return "FileNotFound";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

} // namespace gattlink::config
