#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "gattlink/core/types.hpp"


namespace gattlink::core::dispatch {

// -----------------------------------------------------------------------------
// Command
// -----------------------------------------------------------------------------
//
// A logical command: either text (encoded as UTF-8 plus the configured line
// terminator) or raw bytes (sent verbatim).
//
// Implicitly constructible so that callers can write send("PING") or
// send(Bytes{0x01, 0x02}).
//
// -----------------------------------------------------------------------------
class Command {
public:
    enum class Kind : std::uint8_t {
        Text,
        Binary
    };

    Command(const char* text)
        : kind_(Kind::Text), text_(text ? text : "") {}

    Command(std::string_view text)
        : kind_(Kind::Text), text_(text) {}

    Command(std::string text)
        : kind_(Kind::Text), text_(std::move(text)) {}

    Command(Bytes bytes)
        : kind_(Kind::Binary), bytes_(std::move(bytes)) {}

    [[nodiscard]]
    Kind kind() const noexcept {
        return kind_;
    }

    [[nodiscard]]
    bool is_text() const noexcept {
        return kind_ == Kind::Text;
    }

    [[nodiscard]]
    const std::string& text() const noexcept {
        return text_;
    }

    [[nodiscard]]
    const Bytes& bytes() const noexcept {
        return bytes_;
    }

private:
    Kind kind_;
    std::string text_;
    Bytes bytes_;
};

} // namespace gattlink::core::dispatch
