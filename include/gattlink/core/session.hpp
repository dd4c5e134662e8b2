#pragma once

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/config.hpp"
#include "gattlink/core/transport/concepts.hpp"
#include "gattlink/core/transport/event.hpp"
#include "gattlink/core/timer/timer_queue.hpp"
#include "gattlink/core/gatt/characteristic_cache.hpp"
#include "gattlink/core/dispatch/command.hpp"
#include "gattlink/core/dispatch/dispatcher.hpp"
#include "gattlink/core/request/outcome.hpp"
#include "gattlink/core/request/matcher.hpp"
#include "gattlink/core/request/correlator.hpp"
#include "gattlink/core/session/state.hpp"
#include "gattlink/core/session/signal.hpp"
#include "gattlink/core/session/connection.hpp"
#include "gattlink/core/telemetry/session.hpp"
#include "gattlink/telemetry.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink::core {

/*
===============================================================================
 gattlink::core::Session
===============================================================================

Client-side session with one BLE peripheral, driven by a central conforming
to transport::CentralConcept.

-------------------------------------------------------------------------------
 Composition
-------------------------------------------------------------------------------
- session::Connection     phase, retry budget, connect watchdog
- gatt::CharacteristicCache
                           endpoints discovered on the current connection
- dispatch::Dispatcher    command -> single write
- request::Correlator     notification stream -> request/response
- Observer                single handler receiving every central event,
                           plus ConnectionFailure events raised here

-------------------------------------------------------------------------------
 Threading model
-------------------------------------------------------------------------------
Three kinds of threads enter a Session:
  - caller threads (public API)
  - the central's serial worker (events)
  - the session's timer thread (watchdog + request deadlines)

All mutable state is guarded by one mutex. Observer callbacks and request
completions are collected while the lock is held and run after it is
released, so user code may call back into the Session.

Lock order is Session -> TimerQueue. Timer tasks run outside the timer lock.

The central must never invoke its event handler from inside a command call
(commands are issued under the Session lock).

-------------------------------------------------------------------------------
 Lifetime
-------------------------------------------------------------------------------
The central must outlive the Session. On destruction the Session detaches
from the central, disconnects the current peer, resolves every pending
request with Cancelled and joins its timer thread.

The observer is not owned: whatever it captures must stay valid until it is
cleared or the Session is destroyed.
===============================================================================
*/

template<transport::CentralConcept Central>
class Session {
public:
    using Observer   = transport::EventHandler;
    using RequestId  = request::RequestId;
    using Outcome    = request::Outcome;
    using Completion = request::Completion;

    explicit Session(Central& central, SessionConfig config = {})
        : central_(central)
        , config_(std::move(config))
        , timers_("session")
        , connection_(central_, timers_, telemetry_, config_.retry_count, config_.connect_timeout)
        , dispatcher_(central_, config_)
        , correlator_(timers_, telemetry_)
    {
        connection_.set_watchdog_handler([this](std::uint64_t generation) {
            on_watchdog_(generation);
        });
        correlator_.set_expiry_handler([this](RequestId id) {
            on_request_expired_(id);
        });
        central_.set_event_handler([this](const transport::Event& ev) {
            ++event_depth_;
            on_event_(ev);
            --event_depth_;
        });
        GL_DEBUG("[SESSION] Created (retry_count " << config_.retry_count
                 << ", connect_timeout " << config_.connect_timeout.count() << " ms)");
    }

    ~Session() {
        // No event can reach this Session once the handler is replaced
        central_.set_event_handler(transport::EventHandler{});

        std::vector<request::Resolution> resolutions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connection_.state() != session::State::Idle) {
                central_.disconnect(connection_.peer());
            }
            connection_.shutdown();
            resolutions = correlator_.fail_all(Error::Cancelled);
            cache_.clear();
            observer_ = nullptr;
        }
        for (const auto& r : resolutions) {
            r.fire();
        }
        timers_.stop();
        GL_DEBUG("[SESSION] Destroyed");
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Discovery
    // -------------------------------------------------------------------------

    inline void start_scan(const std::vector<Uuid>& filter = {}, const ScanOptions& options = {}) {
        GL_DEBUG("[SESSION] Scanning (" << filter.size() << " service filter(s), duplicates "
                 << (options.allow_duplicates ? "allowed" : "filtered") << ")");
        central_.scan(filter, options);
    }

    inline void stop_scan() {
        central_.stop_scan();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Only valid from Idle. The result arrives asynchronously: Connected
    // through the observer, or a ConnectionFailure event.
    [[nodiscard]]
    inline Error connect(const PeerId& peer, const ConnectOptions& options = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.connect(peer, options.timeout);
    }

    // Valid from any non-Idle phase; otherwise a logged no-op returning
    // InvalidState. Pending requests are resolved with Disconnected.
    inline Error disconnect(const PeerId& peer) {
        Deferred_ deferred;
        Error err;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            err = connection_.disconnect(peer);
            drain_signals_(deferred);
            deferred.observer = observer_;
        }
        run_(deferred, nullptr);
        return err;
    }

    // -------------------------------------------------------------------------
    // Notifications
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error set_notifying(bool enabled, const CharacteristicKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_.state() != session::State::Connected) {
            GL_WARN("[SESSION] set_notifying() while not connected (state: " << to_string(connection_.state()) << ")");
            return Error::InvalidState;
        }
        auto ch = cache_.find(key);
        if (!ch || !gatt::is_notifiable(*ch)) {
            GL_WARN("[SESSION] " << key << " is not a notifiable characteristic");
            return Error::NoNotifiableEndpoint;
        }
        central_.set_notify(connection_.peer(), *ch, enabled);
        auto it = std::find(notifying_.begin(), notifying_.end(), key);
        if (enabled && it == notifying_.end()) {
            notifying_.push_back(key);
        }
        else if (!enabled && it != notifying_.end()) {
            notifying_.erase(it);
        }
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Commands
    // -------------------------------------------------------------------------

    // Fire-and-forget write. Returns false (and logs) if the write could not be
    // issued: not connected, no writable target, encoding failure, or the
    // central refused the command.
    inline bool send(const dispatch::Command& command, const std::optional<CharacteristicKey>& target = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_.state() != session::State::Connected) {
            GL_WARN("[SESSION] send() called while not connected (state: " << to_string(connection_.state()) << "). Ignoring.");
            GL_TL1( telemetry_.writes_rejected_total.inc() );
            return false;
        }
        dispatch::PreparedWrite write;
        Error err = dispatcher_.prepare(cache_, command, target, write);
        if (err == Error::None) {
            err = dispatcher_.issue(connection_.peer(), write);
        }
        if (err != Error::None) {
            GL_WARN("[SESSION] send() failed (" << to_string(err) << ")");
            GL_TL1( telemetry_.writes_rejected_total.inc() );
            return false;
        }
        GL_TL1( telemetry_.writes_total.inc() );
        return true;
    }

    // Request/response, callback form.
    //
    // Writes `command` to the first writable characteristic and resolves with
    // the first value on the first notifiable characteristic that matches
    // `expected`, or with RequestTimeout once `timeout` has elapsed.
    //
    // Synchronous failures (NoNotifiableEndpoint, NoWritableEndpoint,
    // EncodingFailure, TransportError) invoke `completion` before returning
    // and return INVALID_REQUEST. Otherwise `completion` runs exactly once,
    // on the central's worker (match) or on the timer thread (deadline), or
    // on the thread calling disconnect()/cancel().
    inline RequestId send_and_wait(const dispatch::Command& command,
                                   request::Expectation expected,
                                   std::chrono::milliseconds timeout,
                                   Completion completion) {
        std::optional<request::Resolution> failed;
        Error err = Error::None;
        RequestId id = request::INVALID_REQUEST;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto endpoint = cache_.first_notifiable();
            if (!endpoint) {
                GL_WARN("[SESSION] send_and_wait(): no notifiable characteristic");
                err = Error::NoNotifiableEndpoint;
            }
            else {
                dispatch::PreparedWrite write;
                err = dispatcher_.prepare(cache_, command, std::nullopt, write);
                if (err == Error::None) {
                    ensure_notifying_(*endpoint);
                    // Subscribe before writing: a reply may arrive as soon as
                    // the central has the command, but not before this lock is
                    // released.
                    id = correlator_.add(endpoint->key(), std::move(expected), timeout, std::move(completion));
                    err = dispatcher_.issue(connection_.peer(), write);
                    if (err != Error::None) {
                        failed = correlator_.cancel(id, err);
                        id = request::INVALID_REQUEST;
                    }
                    else {
                        GL_TL1( telemetry_.writes_total.inc() );
                    }
                }
            }
            if (err != Error::None) {
                GL_TL1( telemetry_.writes_rejected_total.inc() );
            }
        }
        if (failed) {
            failed->fire();
        }
        else if (err != Error::None && completion) {
            completion(Outcome::failure(err));
        }
        return id;
    }

    // Request/response, future form. The future is ready once the request
    // resolves; it never throws.
    [[nodiscard]]
    inline std::future<Outcome> send_and_wait_async(const dispatch::Command& command,
                                                    request::Expectation expected,
                                                    std::chrono::milliseconds timeout) {
        auto promise = std::make_shared<std::promise<Outcome>>();
        auto future = promise->get_future();
        (void)send_and_wait(command, std::move(expected), timeout, [promise](const Outcome& outcome) {
            promise->set_value(outcome);
        });
        return future;
    }

    // Request/response, blocking form.
    // Must not be called from an observer or completion callback: those run
    // on the threads that resolve requests. Calls made while a central event
    // is being handled on this thread, or from the session's timer thread,
    // are rejected with InvalidState.
    [[nodiscard]]
    inline Outcome send_and_wait(const dispatch::Command& command,
                                 request::Expectation expected,
                                 std::chrono::milliseconds timeout) {
        if (timers_.on_worker()) {
            GL_ERROR("[SESSION] Blocking send_and_wait() called from the timer thread. Rejecting.");
            return Outcome::failure(Error::InvalidState);
        }
        if (event_depth_ > 0) {
            GL_ERROR("[SESSION] Blocking send_and_wait() called from the central's callback context. Rejecting.");
            return Outcome::failure(Error::InvalidState);
        }
        return send_and_wait_async(command, std::move(expected), timeout).get();
    }

    // Resolves a pending request with Cancelled. Returns false if the request
    // has already resolved.
    inline bool cancel(RequestId id) {
        std::optional<request::Resolution> resolution;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            resolution = correlator_.cancel(id, Error::Cancelled);
        }
        if (!resolution) {
            return false;
        }
        resolution->fire();
        return true;
    }

    // -------------------------------------------------------------------------
    // Observer
    // -------------------------------------------------------------------------

    inline void set_observer(Observer observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = std::move(observer);
    }

    inline void clear_observer() {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = nullptr;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline session::State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.state();
    }

    [[nodiscard]]
    inline int retry_budget() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.retry_budget();
    }

    [[nodiscard]]
    inline std::optional<PeerId> connected_peer() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_.state() != session::State::Connected) {
            return std::nullopt;
        }
        return connection_.peer();
    }

    [[nodiscard]]
    inline std::vector<Characteristic> characteristics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.all();
    }

    [[nodiscard]]
    inline std::vector<Characteristic> writable() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.writable();
    }

    [[nodiscard]]
    inline std::vector<Characteristic> notifiable() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.notifiable();
    }

    [[nodiscard]]
    inline bool is_notifying(const CharacteristicKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(notifying_.begin(), notifying_.end(), key) != notifying_.end();
    }

    [[nodiscard]]
    inline std::size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return correlator_.size();
    }

    // Timers currently armed on the session's timer thread
    // (watchdog + request deadlines)
    [[nodiscard]]
    inline std::size_t armed_timers() const {
        return timers_.pending();
    }

    [[nodiscard]]
    inline const SessionConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]]
    inline const telemetry::Session& telemetry() const noexcept {
        return telemetry_;
    }

private:
    // Work collected under the lock, run after it is released
    struct Deferred_ {
        Observer observer;
        std::vector<transport::Event> failures;
        std::vector<request::Resolution> resolutions;
    };

    Central& central_;
    const SessionConfig config_;
    telemetry::Session telemetry_;

    mutable std::mutex mutex_;
    timer::TimerQueue timers_;
    session::Connection<Central> connection_;
    dispatch::Dispatcher<Central> dispatcher_;
    request::Correlator correlator_;
    gatt::CharacteristicCache cache_;
    std::vector<CharacteristicKey> notifying_;
    Observer observer_;

    // > 0 while this thread is inside a central event handler
    inline static thread_local int event_depth_ = 0;

private:
    // ---------------------------------------------------------------------
    // Central events (central worker)
    // ---------------------------------------------------------------------
    inline void on_event_(const transport::Event& ev) {
        GL_TRACE("[SESSION] Event: " << transport::to_string(ev.type) << " (peer '" << ev.peer << "')");
        Deferred_ deferred;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (ev.type) {
                case transport::EventType::RadioStateChanged:
                    GL_DEBUG("[SESSION] Radio state: " << to_string(ev.radio_state));
                    if (ev.radio_state == RadioState::PoweredOff) {
                        connection_.on_radio_powered_off();
                    }
                    break;

                case transport::EventType::Connected:
                    connection_.on_transport_connected(ev.peer);
                    break;

                case transport::EventType::ConnectFailed:
                    connection_.on_transport_connect_failed(ev.peer, ev.error == Error::None ? Error::ConnectionFailed : ev.error);
                    break;

                case transport::EventType::Disconnected:
                    connection_.on_transport_disconnected(ev.peer, ev.error);
                    break;

                case transport::EventType::ServicesDiscovered:
                    on_services_discovered_(ev);
                    break;

                case transport::EventType::CharacteristicsDiscovered:
                    on_characteristics_discovered_(ev);
                    break;

                case transport::EventType::ValueUpdated:
                    on_value_updated_(ev, deferred);
                    break;

                case transport::EventType::PeerDiscovered:
                case transport::EventType::WriteAcknowledged:
                case transport::EventType::ConnectionFailure:
                default:
                    break;
            }
            drain_signals_(deferred);
            deferred.observer = observer_;
        }
        run_(deferred, &ev);
    }

    inline bool is_connected_to_(const PeerId& peer) const {
        return connection_.state() == session::State::Connected && connection_.peer() == peer;
    }

    inline void on_services_discovered_(const transport::Event& ev) {
        if (!is_connected_to_(ev.peer)) {
            return;
        }
        GL_DEBUG("[SESSION] " << ev.services.size() << " service(s) discovered on " << ev.peer);
        for (const auto& service : ev.services) {
            central_.discover_characteristics(ev.peer, service);
        }
    }

    inline void on_characteristics_discovered_(const transport::Event& ev) {
        if (!is_connected_to_(ev.peer)) {
            return;
        }
        cache_.add(ev.characteristics);
        GL_DEBUG("[SESSION] Service " << ev.service.uuid << ": " << ev.characteristics.size()
                 << " characteristic(s) (" << cache_.size() << " known)");
    }

    inline void on_value_updated_(const transport::Event& ev, Deferred_& deferred) {
        if (!is_connected_to_(ev.peer)) {
            return;
        }
        if (ev.error != Error::None) {
            GL_WARN("[SESSION] Value update on " << ev.characteristic.key() << " reported " << to_string(ev.error));
            return;
        }
        const CharacteristicKey key = ev.characteristic.key();
        (void)cache_.update_value(key, ev.value);
        auto resolved = correlator_.on_value(key, ev.value);
        for (auto& r : resolved) {
            deferred.resolutions.push_back(std::move(r));
        }
    }

    // ---------------------------------------------------------------------
    // Timer callbacks (timer thread)
    // ---------------------------------------------------------------------
    inline void on_watchdog_(std::uint64_t generation) {
        Deferred_ deferred;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_.on_watchdog(generation);
            drain_signals_(deferred);
            deferred.observer = observer_;
        }
        run_(deferred, nullptr);
    }

    inline void on_request_expired_(RequestId id) {
        std::optional<request::Resolution> resolution;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            resolution = correlator_.expire(id);
        }
        if (resolution) {
            resolution->fire();
        }
    }

    // ---------------------------------------------------------------------
    // Signal handling (under lock)
    // ---------------------------------------------------------------------
    inline void drain_signals_(Deferred_& deferred) {
        session::Signal sig;
        while (connection_.poll_signal(sig)) {
            switch (sig) {
                case session::Signal::Connected:
                case session::Signal::Reconnected:
                    break;

                case session::Signal::RetryImmediate:
                    GL_DEBUG("[SESSION] Reconnect issued (budget left: " << connection_.retry_budget() << ")");
                    break;

                case session::Signal::Disconnected:
                case session::Signal::ConnectionTimeout:
                case session::Signal::ConnectionDropped:
                case session::Signal::ConnectionFailed:
                    reset_link_(deferred);
                    break;

                default:
                    break;
            }
            const Error failure = session::failure_of(sig);
            if (failure != Error::None) {
                GL_WARN("[SESSION] Connection failure: " << to_string(failure));
                deferred.failures.push_back(transport::Event::make_connection_failure(connection_.peer(), failure));
            }
        }
    }

    inline void reset_link_(Deferred_& deferred) {
        cache_.clear();
        notifying_.clear();
        auto failed = correlator_.fail_all(Error::Disconnected);
        for (auto& r : failed) {
            deferred.resolutions.push_back(std::move(r));
        }
    }

    inline void ensure_notifying_(const Characteristic& ch) {
        const auto key = ch.key();
        if (std::find(notifying_.begin(), notifying_.end(), key) != notifying_.end()) {
            return;
        }
        GL_DEBUG("[SESSION] Enabling notifications on " << key);
        central_.set_notify(connection_.peer(), ch, true);
        notifying_.push_back(key);
    }

    // ---------------------------------------------------------------------
    // Deferred work (no lock held)
    // ---------------------------------------------------------------------
    inline void run_(const Deferred_& deferred, const transport::Event* raw) {
        if (deferred.observer) {
            if (raw) {
                GL_TL1( telemetry_.events_forwarded_total.inc() );
                deferred.observer(*raw);
            }
            for (const auto& ev : deferred.failures) {
                GL_TL1( telemetry_.events_forwarded_total.inc() );
                deferred.observer(ev);
            }
        }
        for (const auto& r : deferred.resolutions) {
            r.fire();
        }
    }
};

} // namespace gattlink::core
