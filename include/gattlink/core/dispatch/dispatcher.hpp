#pragma once

#include <optional>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/config.hpp"
#include "gattlink/core/dispatch/command.hpp"
#include "gattlink/core/dispatch/encoder.hpp"
#include "gattlink/core/gatt/characteristic_cache.hpp"
#include "gattlink/core/transport/concepts.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink::core::dispatch {

/*
===============================================================================
 gattlink::core::dispatch::Dispatcher
===============================================================================

Turns a logical Command into a single write on a writable characteristic.

Dispatch is split in two steps so that callers can register interest in a
response between validation and the write itself:

  prepare()  resolve target + encode payload      (no I/O)
  issue()    hand the prepared write to the central

The write is fire-and-forget: with_response follows SessionConfig and any
acknowledgement travels through the event stream, never through this path.
Writes are never retried here; link-level retries belong to the central.

Not thread-safe; used under the Session lock.
===============================================================================
*/

struct PreparedWrite {
    Characteristic target;
    Bytes payload;
};

template<transport::CentralConcept Central>
class Dispatcher {
public:
    Dispatcher(Central& central, const SessionConfig& config) noexcept
        : central_(central)
        , config_(config)
    {}

    // Target resolution: explicit key if given (must be known and writable),
    // otherwise the first writable characteristic.
    [[nodiscard]]
    inline Error prepare(const gatt::CharacteristicCache& cache,
                         const Command& command,
                         const std::optional<CharacteristicKey>& target,
                         PreparedWrite& out) const {
        std::optional<Characteristic> resolved;
        if (target) {
            resolved = cache.find(*target);
            if (!resolved || !gatt::is_writable(*resolved)) {
                GL_WARN("[DISPATCH] Target " << *target << " is not a writable characteristic");
                return Error::NoWritableEndpoint;
            }
        }
        else {
            resolved = cache.first_writable();
            if (!resolved) {
                GL_WARN("[DISPATCH] No writable characteristic discovered");
                return Error::NoWritableEndpoint;
            }
        }

        const EncodeOptions options{config_.line_terminator, config_.max_write_size};
        Error err = encode(command, options, out.payload);
        if (err != Error::None) {
            return err;
        }
        out.target = std::move(*resolved);
        return Error::None;
    }

    [[nodiscard]]
    inline Error issue(const PeerId& peer, const PreparedWrite& write) {
        GL_TRACE("[DISPATCH] Writing " << write.payload.size() << " byte(s) to " << write.target.key());
        if (!central_.write(peer, write.target, write.payload, config_.write_with_response)) {
            GL_ERROR("[DISPATCH] Central rejected write to " << write.target.key());
            return Error::TransportError;
        }
        return Error::None;
    }

private:
    Central& central_;
    const SessionConfig& config_;
};

} // namespace gattlink::core::dispatch
