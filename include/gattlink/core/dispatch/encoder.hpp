#pragma once

#include <cstddef>
#include <string_view>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/dispatch/command.hpp"


namespace gattlink::core::dispatch {

struct EncodeOptions {
    std::string_view line_terminator{"\n"};
    std::size_t max_write_size{512};
};

// Strict UTF-8 validation: rejects overlong forms, surrogates and code points
// above U+10FFFF.
[[nodiscard]]
bool is_valid_utf8(std::string_view text) noexcept;

// Text -> UTF-8 bytes + terminator.
// EncodingFailure if the text is not valid UTF-8, contains NUL, or the encoded
// payload (terminator included) exceeds max_write_size.
[[nodiscard]]
Error encode_text(std::string_view text, const EncodeOptions& options, Bytes& out);

// Bytes are copied verbatim. EncodingFailure if empty or larger than
// max_write_size.
[[nodiscard]]
Error encode_bytes(const Bytes& bytes, const EncodeOptions& options, Bytes& out);

[[nodiscard]]
inline Error encode(const Command& command, const EncodeOptions& options, Bytes& out) {
    return command.is_text()
        ? encode_text(command.text(), options, out)
        : encode_bytes(command.bytes(), options, out);
}

} // namespace gattlink::core::dispatch
