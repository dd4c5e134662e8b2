#include "gattlink/sim/peripheral.hpp"

#include <utility>


namespace gattlink::sim {

using core::Property;

SimulatedPeripheral make_uart_peripheral(const PeerId& id, const std::string& name) {
    SimulatedPeripheral p;
    p.peer = core::Peer{id, name};
    p.advertisement.local_name = name;
    p.advertisement.service_uuids = {std::string(UART_SERVICE)};
    p.advertisement.tx_power = 0;

    p.services = {Service{std::string(UART_SERVICE), true}};

    Characteristic rx;
    rx.service = std::string(UART_SERVICE);
    rx.uuid = std::string(UART_RX);
    rx.properties = Property::Write | Property::WriteWithoutResponse;

    Characteristic tx;
    tx.service = std::string(UART_SERVICE);
    tx.uuid = std::string(UART_TX);
    tx.properties = core::Properties{Property::Notify};

    p.characteristics = {rx, tx};
    return p;
}

Responder line_responder(CharacteristicKey reply_on,
                         std::function<std::optional<std::string>(std::string_view line)> handler) {
    return [reply_on = std::move(reply_on), handler = std::move(handler)](const Characteristic&, const Bytes& payload) {
        std::string_view line(reinterpret_cast<const char*>(payload.data()), payload.size());
        if (!line.empty() && line.back() == '\n') {
            line.remove_suffix(1);
        }
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        std::vector<Notification> out;
        if (!handler) {
            return out;
        }
        if (auto reply = handler(line)) {
            out.push_back(Notification{reply_on, core::to_bytes(*reply)});
        }
        return out;
    };
}

} // namespace gattlink::sim
