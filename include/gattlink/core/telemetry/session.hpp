#pragma once

#include <ostream>
#include <type_traits>

#include "gattlink/metrics/counter.hpp"


namespace gattlink::core::telemetry {

// ============================================================================
// Session Telemetry
//
// Counts lifecycle decisions and request outcomes observed by a Session.
// Incremented only when built with GATTLINK_ENABLE_TELEMETRY_L1.
// Mechanical facts only.
// ============================================================================

struct alignas(64) Session final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // connect() accepted
    metrics::counter32 connect_calls_total;

    // Connecting -> Connected
    metrics::counter32 connect_success_total;

    // Central reported ConnectFailed while Connecting
    metrics::counter32 connect_failure_total;

    // Watchdog expired (connect or reconnect)
    metrics::counter32 watchdog_expired_total;

    // disconnect() accepted
    metrics::counter32 disconnect_calls_total;

    // Disconnected with an error while Connected or Reconnecting
    metrics::counter32 drops_total;

    // ---------------------------------------------------------------------
    // Retry
    // ---------------------------------------------------------------------

    // Reconnect issued (budget decremented)
    metrics::counter32 retry_attempts_total;

    // Reconnecting -> Connected
    metrics::counter32 retry_success_total;

    // Drop observed with an empty budget
    metrics::counter32 retry_exhausted_total;

    // ---------------------------------------------------------------------
    // Dispatch
    // ---------------------------------------------------------------------

    // Writes handed to the central
    metrics::counter64 writes_total;

    // send()/send_and_wait() rejected before a write was issued
    metrics::counter64 writes_rejected_total;

    // ---------------------------------------------------------------------
    // Correlation
    // ---------------------------------------------------------------------

    metrics::counter64 requests_total;
    metrics::counter64 requests_succeeded_total;
    metrics::counter64 requests_timed_out_total;
    metrics::counter64 requests_failed_total;     // Disconnected / Cancelled

    // Values evaluated against an expectation
    metrics::counter64 values_evaluated_total;

    // Values dropped as consecutive duplicates
    metrics::counter64 values_suppressed_total;

    // ---------------------------------------------------------------------
    // Fan-out
    // ---------------------------------------------------------------------

    metrics::counter64 events_forwarded_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Session& other) const noexcept {
        connect_calls_total.copy_to(other.connect_calls_total);
        connect_success_total.copy_to(other.connect_success_total);
        connect_failure_total.copy_to(other.connect_failure_total);
        watchdog_expired_total.copy_to(other.watchdog_expired_total);
        disconnect_calls_total.copy_to(other.disconnect_calls_total);
        drops_total.copy_to(other.drops_total);

        retry_attempts_total.copy_to(other.retry_attempts_total);
        retry_success_total.copy_to(other.retry_success_total);
        retry_exhausted_total.copy_to(other.retry_exhausted_total);

        writes_total.copy_to(other.writes_total);
        writes_rejected_total.copy_to(other.writes_rejected_total);

        requests_total.copy_to(other.requests_total);
        requests_succeeded_total.copy_to(other.requests_succeeded_total);
        requests_timed_out_total.copy_to(other.requests_timed_out_total);
        requests_failed_total.copy_to(other.requests_failed_total);
        values_evaluated_total.copy_to(other.values_evaluated_total);
        values_suppressed_total.copy_to(other.values_suppressed_total);

        events_forwarded_total.copy_to(other.events_forwarded_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Session Telemetry ===\n";

        os << "Lifecycle\n";
        os << "  Connect calls         : " << connect_calls_total.load() << '\n';
        os << "  Connect success       : " << connect_success_total.load() << '\n';
        os << "  Connect failure       : " << connect_failure_total.load() << '\n';
        os << "  Watchdog expired      : " << watchdog_expired_total.load() << '\n';
        os << "  Disconnect calls      : " << disconnect_calls_total.load() << '\n';
        os << "  Drops                 : " << drops_total.load() << '\n';

        os << "\nRetry\n";
        os << "  Retry attempts        : " << retry_attempts_total.load() << '\n';
        os << "  Retry success         : " << retry_success_total.load() << '\n';
        os << "  Retry exhausted       : " << retry_exhausted_total.load() << '\n';

        os << "\nDispatch\n";
        os << "  Writes                : " << writes_total.load() << '\n';
        os << "  Writes rejected       : " << writes_rejected_total.load() << '\n';

        os << "\nCorrelation\n";
        os << "  Requests              : " << requests_total.load() << '\n';
        os << "  Succeeded             : " << requests_succeeded_total.load() << '\n';
        os << "  Timed out             : " << requests_timed_out_total.load() << '\n';
        os << "  Failed                : " << requests_failed_total.load() << '\n';
        os << "  Values evaluated      : " << values_evaluated_total.load() << '\n';
        os << "  Values suppressed     : " << values_suppressed_total.load() << '\n';

        os << "\nFan-out\n";
        os << "  Events forwarded      : " << events_forwarded_total.load() << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Session>, "telemetry::Session must be standard layout");
static_assert(!std::is_polymorphic_v<Session>, "telemetry::Session must not be polymorphic");
static_assert(alignof(Session) == 64, "telemetry::Session must be cache-line aligned");

} // namespace gattlink::core::telemetry
