#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <ostream>


namespace gattlink::core {

// Opaque payload as written to / notified by a characteristic
using Bytes = std::vector<std::uint8_t>;

// Canonical textual UUID ("6E400002-B5A3-F393-E0A9-E50E24DCCA9E" or a short "180D")
using Uuid = std::string;

// Transport peer handle (address on Linux, opaque identifier elsewhere)
using PeerId = std::string;

[[nodiscard]]
inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

[[nodiscard]]
inline std::string to_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// ===============================================================
// CHARACTERISTIC PROPERTIES
// ===============================================================
enum class Property : std::uint8_t {
    Read                 = 1u << 0,
    Write                = 1u << 1,
    WriteWithoutResponse = 1u << 2,
    Notify               = 1u << 3,
    Indicate             = 1u << 4,
};

struct Properties {
    std::uint8_t bits{0};

    constexpr Properties() noexcept = default;
    constexpr Properties(Property p) noexcept : bits(static_cast<std::uint8_t>(p)) {}

    [[nodiscard]]
    constexpr bool has(Property p) const noexcept {
        return (bits & static_cast<std::uint8_t>(p)) != 0;
    }

    constexpr bool operator==(const Properties&) const noexcept = default;
};

[[nodiscard]]
inline constexpr Properties operator|(Properties a, Properties b) noexcept {
    Properties out;
    out.bits = static_cast<std::uint8_t>(a.bits | b.bits);
    return out;
}

[[nodiscard]]
inline constexpr Properties operator|(Property a, Property b) noexcept {
    return Properties{a} | Properties{b};
}

// ===============================================================
// GATT ENTITIES
// ===============================================================
struct Service {
    Uuid uuid;
    bool primary{true};

    bool operator==(const Service&) const = default;
};

// Identity of an endpoint: (service, characteristic) pair
struct CharacteristicKey {
    Uuid service;
    Uuid uuid;

    bool operator==(const CharacteristicKey&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const CharacteristicKey& key) {
    return os << key.service << "/" << key.uuid;
}

struct Characteristic {
    Uuid service;
    Uuid uuid;
    Properties properties;
    std::optional<Bytes> value;   // last observed value, absent until the first read/notify

    [[nodiscard]]
    CharacteristicKey key() const {
        return CharacteristicKey{service, uuid};
    }
};

// ===============================================================
// DISCOVERY
// ===============================================================
struct Peer {
    PeerId id;
    std::string name;
};

struct Advertisement {
    std::string local_name;
    std::vector<Uuid> service_uuids;
    Bytes manufacturer_data;
    std::optional<int> tx_power;
    bool connectable{true};
};

// ===============================================================
// RADIO STATE
// ===============================================================
enum class RadioState : std::uint8_t {
    Unknown,
    Resetting,
    Unsupported,
    Unauthorized,
    PoweredOff,
    PoweredOn
};

[[nodiscard]]
inline constexpr std::string_view to_string(RadioState s) noexcept {
    switch (s) {
        case RadioState::Unknown:      return "Unknown";
        case RadioState::Resetting:    return "Resetting";
        case RadioState::Unsupported:  return "Unsupported";
        case RadioState::Unauthorized: return "Unauthorized";
        case RadioState::PoweredOff:   return "PoweredOff";
        case RadioState::PoweredOn:    return "PoweredOn";
        default:                       return "Unknown";
    }
}

// ===============================================================
// CALLER OPTIONS
// ===============================================================
struct ScanOptions {
    bool allow_duplicates{false};
};

struct ConnectOptions {
    // Overrides SessionConfig::connect_timeout for this attempt only
    std::optional<std::chrono::milliseconds> timeout;
};

} // namespace gattlink::core
