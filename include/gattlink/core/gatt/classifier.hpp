#pragma once

#include <vector>

#include "gattlink/core/types.hpp"


namespace gattlink::core::gatt {

// -----------------------------------------------------------------------------
// Endpoint classification
// -----------------------------------------------------------------------------
//
// Pure functions over a discovered characteristic list. Order is preserved,
// so the first element of each result is the default endpoint for commands
// (writable) and responses (notifiable).
//
// Indicate-only characteristics are not notifiable: responses are expected as
// unacknowledged notifications.
//
// -----------------------------------------------------------------------------

[[nodiscard]]
inline bool is_writable(const Characteristic& c) noexcept {
    return c.properties.has(Property::Write) || c.properties.has(Property::WriteWithoutResponse);
}

[[nodiscard]]
inline bool is_notifiable(const Characteristic& c) noexcept {
    return c.properties.has(Property::Notify);
}

[[nodiscard]]
std::vector<Characteristic> writable(const std::vector<Characteristic>& characteristics);

[[nodiscard]]
std::vector<Characteristic> notifiable(const std::vector<Characteristic>& characteristics);

} // namespace gattlink::core::gatt
