#include "gattlink/core/dispatch/encoder.hpp"

#include <cstdint>

#include "gattlink/log/logger.hpp"


namespace gattlink::core::dispatch {

bool is_valid_utf8(std::string_view text) noexcept {
    const auto* p   = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto* end = p + text.size();

    while (p < end) {
        const std::uint8_t b0 = *p;
        if (b0 < 0x80) {
            ++p;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min = 0;
        if ((b0 & 0xE0) == 0xC0) {
            len = 2; cp = b0 & 0x1F; min = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3; cp = b0 & 0x0F; min = 0x800;
        } else if ((b0 & 0xF8) == 0xF0) {
            len = 4; cp = b0 & 0x07; min = 0x10000;
        } else {
            return false; // stray continuation byte or 5/6-byte lead
        }

        if (static_cast<std::size_t>(end - p) < len) {
            return false;
        }
        for (std::size_t i = 1; i < len; ++i) {
            const std::uint8_t b = p[i];
            if ((b & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        p += len;
    }
    return true;
}

Error encode_text(std::string_view text, const EncodeOptions& options, Bytes& out) {
    if (text.find('\0') != std::string_view::npos) {
        GL_WARN("[DISPATCH] Text command contains NUL. Rejecting.");
        return Error::EncodingFailure;
    }
    if (!is_valid_utf8(text)) {
        GL_WARN("[DISPATCH] Text command is not valid UTF-8. Rejecting.");
        return Error::EncodingFailure;
    }
    const std::size_t size = text.size() + options.line_terminator.size();
    if (size == 0 || size > options.max_write_size) {
        GL_WARN("[DISPATCH] Encoded command size " << size << " outside (0, " << options.max_write_size << "]. Rejecting.");
        return Error::EncodingFailure;
    }
    out.clear();
    out.reserve(size);
    out.insert(out.end(), text.begin(), text.end());
    out.insert(out.end(), options.line_terminator.begin(), options.line_terminator.end());
    return Error::None;
}

Error encode_bytes(const Bytes& bytes, const EncodeOptions& options, Bytes& out) {
    if (bytes.empty() || bytes.size() > options.max_write_size) {
        GL_WARN("[DISPATCH] Binary command size " << bytes.size() << " outside (0, " << options.max_write_size << "]. Rejecting.");
        return Error::EncodingFailure;
    }
    out = bytes;
    return Error::None;
}

} // namespace gattlink::core::dispatch
