#pragma once

// Public entry point: pulls in the session, its value types and the logger,
// and lifts the commonly used names into namespace gattlink.

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/config.hpp"
#include "gattlink/core/transport/event.hpp"
#include "gattlink/core/transport/concepts.hpp"
#include "gattlink/core/session.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink {

using core::Error;
using core::Bytes;
using core::Uuid;
using core::PeerId;
using core::Property;
using core::Properties;
using core::Service;
using core::Characteristic;
using core::CharacteristicKey;
using core::Peer;
using core::Advertisement;
using core::RadioState;
using core::ScanOptions;
using core::ConnectOptions;
using core::SessionConfig;
using core::to_bytes;
using core::to_text;

using core::transport::Event;
using core::transport::EventType;
using core::transport::EventHandler;
using core::transport::CentralConcept;

using core::session::State;
using core::dispatch::Command;
using core::request::Expectation;
using core::request::Outcome;
using core::request::RequestId;
using core::request::INVALID_REQUEST;

template<core::transport::CentralConcept Central>
using Session = core::Session<Central>;

} // namespace gattlink
