#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gattlink/core/types.hpp"


namespace gattlink::core::request {

// -----------------------------------------------------------------------------
// Expectation
// -----------------------------------------------------------------------------
//
// Expected-response pattern. A value matches when it equals the pattern or
// contains it as a contiguous byte sequence.
//
// An absent pattern never matches: the request can only end by deadline,
// disconnect or cancellation.
//
// Text patterns are compared as raw UTF-8 bytes, without any line terminator.
//
// -----------------------------------------------------------------------------
class Expectation {
public:
    Expectation() = default;

    Expectation(std::nullopt_t) noexcept {}

    Expectation(const char* text) {
        if (text) {
            pattern_ = to_bytes(text);
        }
    }

    Expectation(std::string_view text)
        : pattern_(to_bytes(text)) {}

    Expectation(const std::string& text)
        : pattern_(to_bytes(text)) {}

    Expectation(Bytes bytes)
        : pattern_(std::move(bytes)) {}

    [[nodiscard]]
    static Expectation none() noexcept {
        return Expectation{};
    }

    [[nodiscard]]
    bool has_pattern() const noexcept {
        return pattern_.has_value();
    }

    [[nodiscard]]
    const std::optional<Bytes>& pattern() const noexcept {
        return pattern_;
    }

private:
    std::optional<Bytes> pattern_;
};

// Equal-or-contains. An empty pattern is contained in every value.
[[nodiscard]]
bool matches(const Expectation& expected, const Bytes& value) noexcept;

} // namespace gattlink::core::request
