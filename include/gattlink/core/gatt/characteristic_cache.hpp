#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/gatt/classifier.hpp"


namespace gattlink::core::gatt {

// -----------------------------------------------------------------------------
// CharacteristicCache
// -----------------------------------------------------------------------------
//
// Characteristics discovered on the current connection, across every service,
// in discovery order. Keyed by (service, characteristic) UUID.
//
// Not thread-safe: owned by the Session and accessed under its lock.
// Filled by CharacteristicsDiscovered events, emptied whenever the link leaves
// Connected.
//
// -----------------------------------------------------------------------------
class CharacteristicCache {
public:
    // Adds newly discovered characteristics. A characteristic already present
    // has its properties refreshed and keeps its last observed value.
    inline void add(const std::vector<Characteristic>& discovered) {
        for (const auto& c : discovered) {
            auto* existing = find_(c.key());
            if (existing) {
                existing->properties = c.properties;
                if (c.value) {
                    existing->value = c.value;
                }
                continue;
            }
            items_.push_back(c);
        }
    }

    // Records the last observed value. Returns false for unknown endpoints.
    inline bool update_value(const CharacteristicKey& key, const Bytes& value) {
        auto* existing = find_(key);
        if (!existing) {
            return false;
        }
        existing->value = value;
        return true;
    }

    [[nodiscard]]
    inline std::optional<Characteristic> find(const CharacteristicKey& key) const {
        auto it = std::find_if(items_.begin(), items_.end(),
            [&](const Characteristic& c) { return c.service == key.service && c.uuid == key.uuid; });
        if (it == items_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    inline void clear() noexcept {
        items_.clear();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return items_.empty();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return items_.size();
    }

    [[nodiscard]]
    inline const std::vector<Characteristic>& all() const noexcept {
        return items_;
    }

    [[nodiscard]]
    inline std::vector<Characteristic> writable() const {
        return gatt::writable(items_);
    }

    [[nodiscard]]
    inline std::vector<Characteristic> notifiable() const {
        return gatt::notifiable(items_);
    }

    [[nodiscard]]
    inline std::optional<Characteristic> first_writable() const {
        for (const auto& c : items_) {
            if (is_writable(c)) {
                return c;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]]
    inline std::optional<Characteristic> first_notifiable() const {
        for (const auto& c : items_) {
            if (is_notifiable(c)) {
                return c;
            }
        }
        return std::nullopt;
    }

private:
    inline Characteristic* find_(const CharacteristicKey& key) noexcept {
        for (auto& c : items_) {
            if (c.service == key.service && c.uuid == key.uuid) {
                return &c;
            }
        }
        return nullptr;
    }

private:
    std::vector<Characteristic> items_;
};

} // namespace gattlink::core::gatt
