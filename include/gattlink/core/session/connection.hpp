#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/config.hpp"
#include "gattlink/core/session/state.hpp"
#include "gattlink/core/session/signal.hpp"
#include "gattlink/core/transport/concepts.hpp"
#include "gattlink/core/timer/timer_queue.hpp"
#include "gattlink/core/telemetry/session.hpp"
#include "gattlink/telemetry.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink::core::session {

/*
===============================================================================
 gattlink::core::session::Connection
===============================================================================

Connection-lifecycle state machine for a single peripheral, parameterized by
a central conforming to transport::CentralConcept.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Own the connection phase, the retry budget and the connect watchdog
- Issue central commands (connect, disconnect, service discovery)
- Expose observable consequences as edge-triggered Signals

The Connection knows nothing about characteristics, requests or observers.
The owning Session drains poll_signal() after every call and applies the
consequences (cache reset, request failure, ConnectionFailure fan-out).

-------------------------------------------------------------------------------
 Phases
-------------------------------------------------------------------------------

  Idle ──connect──▶ Connecting ──confirmed──▶ Connected ──disconnect──▶ Idle
                        │                        │        (via Disconnecting)
                        │ watchdog / refused     │ dropped with error
                        ▼                        ▼
                       Idle                Reconnecting ──confirmed──▶ Connected
                                                 │
                                                 │ watchdog / budget == 0
                                                 ▼
                                                Idle

-------------------------------------------------------------------------------
 Retry budget
-------------------------------------------------------------------------------
- Reset to retry_count only on Connecting -> Connected
- Each drop with an error consumes one unit and reissues connect immediately
- A drop observed with an empty budget ends in Idle (ConnectionDropped)
- n consecutive drops therefore exhaust a budget of n

-------------------------------------------------------------------------------
 Watchdog
-------------------------------------------------------------------------------
Armed on connect() and on every reconnect attempt, disarmed on any exit from
Connecting / Reconnecting. Each arm bumps a generation number; the timer task
carries the generation it was armed with and on_watchdog() ignores it unless
the watchdog is still armed with that same generation. Stale expiries are
therefore silent, whatever the timer's punctuality.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
Not thread-safe. Every member is called under the owning Session's lock,
including on_watchdog() (the watchdog handler is expected to take that lock).
===============================================================================
*/

template<transport::CentralConcept Central>
class Connection {
public:
    using WatchdogHandler = std::function<void(std::uint64_t generation)>;

    Connection(Central& central,
               timer::TimerQueue& timers,
               telemetry::Session& telemetry,
               int retry_count = RETRY_COUNT,
               std::chrono::milliseconds connect_timeout = CONNECT_TIMEOUT) noexcept
        : central_(central)
        , timers_(timers)
        , telemetry_(telemetry)
        , retry_count_(retry_count < 0 ? 0 : retry_count)
        , connect_timeout_(connect_timeout)
        , retry_budget_(retry_count_)
    {}

    ~Connection() {
        disarm_watchdog_();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Invoked on the timer thread when a watchdog deadline passes
    inline void set_watchdog_handler(WatchdogHandler handler) {
        on_watchdog_ = std::move(handler);
    }

    // -------------------------------------------------------------------------
    // User intent
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error connect(const PeerId& peer, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        // 0) PRECONDITION: only from Idle
        if (state_ != State::Idle) {
            GL_WARN("[CONN] connect() called while not idle (state: " << to_string(state_) << "). Ignoring.");
            return Error::InvalidState;
        }
        GL_TL1( telemetry_.connect_calls_total.inc() );
        GL_DEBUG("[CONN] Connecting to: " << peer);
        peer_ = peer;
        attempt_timeout_ = timeout.value_or(connect_timeout_);
        // 1) Enter FSM
        transition_(Event::ConnectRequested);
        // 2) Ask the central; the result arrives as an event
        central_.connect(peer_);
        arm_watchdog_();
        return Error::None;
    }

    [[nodiscard]]
    inline Error disconnect(const PeerId& peer) {
        if (state_ == State::Idle) {
            GL_WARN("[CONN] disconnect() called while idle. Ignoring.");
            return Error::InvalidState;
        }
        if (peer != peer_) {
            GL_WARN("[CONN] disconnect() for unknown peer '" << peer << "' (current: '" << peer_ << "'). Ignoring.");
            return Error::InvalidState;
        }
        GL_TL1( telemetry_.disconnect_calls_total.inc() );
        transition_(Event::DisconnectRequested);
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Central events
    // -------------------------------------------------------------------------

    inline void on_transport_connected(const PeerId& peer) {
        if (!is_current_(peer)) {
            return;
        }
        transition_(Event::TransportConnected);
    }

    inline void on_transport_connect_failed(const PeerId& peer, Error error) {
        if (!is_current_(peer)) {
            return;
        }
        GL_WARN("[CONN] Connection attempt to " << peer << " failed (" << to_string(error) << ")");
        transition_(Event::TransportConnectFailed, error);
    }

    inline void on_transport_disconnected(const PeerId& peer, Error error) {
        if (!is_current_(peer)) {
            return;
        }
        if (error == Error::None) {
            transition_(Event::TransportDisconnected);
        }
        else {
            GL_WARN("[CONN] Link to " << peer << " dropped (" << to_string(error) << ")");
            transition_(Event::TransportDropped, error);
        }
    }

    inline void on_radio_powered_off() {
        if (state_ == State::Idle) {
            return;
        }
        GL_WARN("[CONN] Radio powered off while " << to_string(state_));
        transition_(Event::RadioPoweredOff);
    }

    inline void on_watchdog(std::uint64_t generation) {
        if (!watchdog_armed_ || generation != watchdog_generation_) {
            GL_TRACE("[CONN] Stale watchdog (generation " << generation << ", current " << watchdog_generation_
                     << ", armed " << watchdog_armed_ << "). Ignoring.");
            return;
        }
        watchdog_armed_ = false;
        watchdog_timer_ = timer::INVALID_TIMER;
        GL_TL1( telemetry_.watchdog_expired_total.inc() );
        transition_(Event::WatchdogExpired, Error::ConnectionTimeout);
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool poll_signal(Signal& out) {
        if (signals_.empty()) {
            return false;
        }
        out = signals_.front();
        signals_.pop_front();
        return true;
    }

    [[nodiscard]]
    inline State state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline int retry_budget() const noexcept {
        return retry_budget_;
    }

    [[nodiscard]]
    inline int retry_count() const noexcept {
        return retry_count_;
    }

    [[nodiscard]]
    inline const PeerId& peer() const noexcept {
        return peer_;
    }

    [[nodiscard]]
    inline bool watchdog_armed() const noexcept {
        return watchdog_armed_;
    }

    [[nodiscard]]
    inline std::uint64_t watchdog_generation() const noexcept {
        return watchdog_generation_;
    }

    // Incremented on every transition into Connected
    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    // Stops the watchdog without a state change (Session teardown)
    inline void shutdown() {
        disarm_watchdog_();
    }

private:
    Central& central_;
    timer::TimerQueue& timers_;
    telemetry::Session& telemetry_;    // not owned

    const int retry_count_;
    const std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds attempt_timeout_{CONNECT_TIMEOUT};

    PeerId peer_;
    State state_{State::Idle};
    int retry_budget_;
    std::uint64_t epoch_{0};

    // Watchdog
    WatchdogHandler on_watchdog_;
    bool watchdog_armed_{false};
    std::uint64_t watchdog_generation_{0};
    timer::TimerId watchdog_timer_{timer::INVALID_TIMER};

    std::deque<Signal> signals_;

    inline void emit_(Signal sig) {
        GL_TRACE("[CONN] Emitting signal: " << to_string(sig));
        signals_.push_back(sig);
    }

private:
    inline void set_state_(State new_state) noexcept {
        GL_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    [[nodiscard]]
    inline bool is_current_(const PeerId& peer) const {
        if (state_ == State::Idle || peer != peer_) {
            GL_TRACE("[CONN] Ignoring event for '" << peer << "' (state: " << to_string(state_) << ", peer: '" << peer_ << "')");
            return false;
        }
        return true;
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) {
        const State state = state_;

        GL_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Idle:
            switch (event) {
            case Event::ConnectRequested:
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                disarm_watchdog_();
                retry_budget_ = retry_count_;
                set_state_(State::Connected);
                ++epoch_;
                GL_TL1( telemetry_.connect_success_total.inc() );
                emit_(Signal::Connected);
                GL_INFO("[CONN] Connected to " << peer_);
                central_.discover_services(peer_);
                break;

            case Event::TransportConnectFailed:
            case Event::TransportDropped:
                disarm_watchdog_();
                GL_TL1( telemetry_.connect_failure_total.inc() );
                set_state_(State::Idle);
                emit_(Signal::ConnectionFailed);
                break;

            case Event::WatchdogExpired:
                GL_WARN("[CONN] Connection to " << peer_ << " timed out after " << attempt_timeout_.count() << " ms");
                // Cancel the outstanding attempt
                central_.disconnect(peer_);
                set_state_(State::Idle);
                emit_(Signal::ConnectionTimeout);
                break;

            case Event::TransportDisconnected:
                disarm_watchdog_();
                set_state_(State::Idle);
                emit_(Signal::Disconnected);
                break;

            case Event::DisconnectRequested:
            case Event::RadioPoweredOff:
                teardown_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::TransportDropped:
                GL_TL1( telemetry_.drops_total.inc() );
                set_state_(State::Reconnecting);
                emit_(Signal::Disconnected);
                attempt_reconnect_(error);
                break;

            case Event::TransportDisconnected:
                GL_INFO("[CONN] Disconnected by peer " << peer_);
                set_state_(State::Idle);
                emit_(Signal::Disconnected);
                break;

            case Event::DisconnectRequested:
            case Event::RadioPoweredOff:
                teardown_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::TransportConnected:
                disarm_watchdog_();
                set_state_(State::Connected);
                ++epoch_;
                GL_TL1( telemetry_.retry_success_total.inc() );
                emit_(Signal::Reconnected);
                GL_INFO("[CONN] Connection re-established with " << peer_ << " (budget left: " << retry_budget_ << ")");
                central_.discover_services(peer_);
                break;

            case Event::TransportDropped:
            case Event::TransportConnectFailed:
                // The reconnect attempt itself failed
                disarm_watchdog_();
                GL_TL1( telemetry_.drops_total.inc() );
                attempt_reconnect_(error);
                break;

            case Event::WatchdogExpired:
                GL_WARN("[CONN] Reconnection to " << peer_ << " timed out after " << attempt_timeout_.count() << " ms");
                central_.disconnect(peer_);
                set_state_(State::Idle);
                emit_(Signal::ConnectionTimeout);
                break;

            case Event::TransportDisconnected:
                disarm_watchdog_();
                set_state_(State::Idle);
                emit_(Signal::Disconnected);
                break;

            case Event::DisconnectRequested:
            case Event::RadioPoweredOff:
                teardown_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Disconnecting:
            // Transient: teardown_() enters and leaves it within one call
            break;
        }
    }

    // Budget check-and-decrement: runs under the Session lock as one step
    inline void attempt_reconnect_(Error cause) {
        if (retry_budget_ <= 0) {
            GL_WARN("[CONN] Retry budget exhausted after '" << to_string(cause) << "'. Giving up on " << peer_);
            GL_TL1( telemetry_.retry_exhausted_total.inc() );
            retry_budget_ = 0;
            set_state_(State::Idle);
            emit_(Signal::ConnectionDropped);
            return;
        }
        --retry_budget_;
        GL_TL1( telemetry_.retry_attempts_total.inc() );
        GL_DEBUG("[CONN] Reconnecting to " << peer_ << " (budget left: " << retry_budget_ << ")");
        central_.connect(peer_);
        arm_watchdog_();
        emit_(Signal::RetryImmediate);
    }

    inline void teardown_() {
        disarm_watchdog_();
        set_state_(State::Disconnecting);
        GL_DEBUG("[CONN] Disconnecting from: " << peer_);
        central_.disconnect(peer_);
        set_state_(State::Idle);
        emit_(Signal::Disconnected);
        GL_INFO("[CONN] Disconnected from " << peer_);
    }

    inline void arm_watchdog_() {
        disarm_watchdog_();
        ++watchdog_generation_;
        watchdog_armed_ = true;
        const std::uint64_t generation = watchdog_generation_;
        auto handler = on_watchdog_;
        watchdog_timer_ = timers_.schedule(attempt_timeout_, [handler, generation]() {
            if (handler) {
                handler(generation);
            }
        });
        GL_TRACE("[CONN] Watchdog armed (generation " << generation << ", " << attempt_timeout_.count() << " ms)");
    }

    inline void disarm_watchdog_() {
        if (!watchdog_armed_) {
            return;
        }
        watchdog_armed_ = false;
        (void)timers_.cancel(watchdog_timer_);
        watchdog_timer_ = timer::INVALID_TIMER;
        GL_TRACE("[CONN] Watchdog disarmed (generation " << watchdog_generation_ << ")");
    }
};

} // namespace gattlink::core::session
