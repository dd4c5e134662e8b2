#include "gattlink/core/request/matcher.hpp"

#include <algorithm>


namespace gattlink::core::request {

bool matches(const Expectation& expected, const Bytes& value) noexcept {
    if (!expected.has_pattern()) {
        return false;
    }
    const Bytes& pattern = *expected.pattern();
    if (pattern.empty()) {
        return true;
    }
    if (pattern.size() > value.size()) {
        return false;
    }
    return std::search(value.begin(), value.end(), pattern.begin(), pattern.end()) != value.end();
}

} // namespace gattlink::core::request
