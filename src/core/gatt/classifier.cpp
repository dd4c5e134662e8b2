#include "gattlink/core/gatt/classifier.hpp"

#include <algorithm>
#include <iterator>


namespace gattlink::core::gatt {

std::vector<Characteristic> writable(const std::vector<Characteristic>& characteristics) {
    std::vector<Characteristic> out;
    std::copy_if(characteristics.begin(), characteristics.end(), std::back_inserter(out),
        [](const Characteristic& c) { return is_writable(c); });
    return out;
}

std::vector<Characteristic> notifiable(const std::vector<Characteristic>& characteristics) {
    std::vector<Characteristic> out;
    std::copy_if(characteristics.begin(), characteristics.end(), std::back_inserter(out),
        [](const Characteristic& c) { return is_notifiable(c); });
    return out;
}

} // namespace gattlink::core::gatt
