#include "gattlink/core/request/correlator.hpp"

#include "gattlink/telemetry.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink::core::request {

RequestId Correlator::add(const CharacteristicKey& endpoint,
                          Expectation expected,
                          std::chrono::milliseconds timeout,
                          Completion completion) {
    GL_TL1( telemetry_.requests_total.inc() );

    const RequestId id = pending_.next_id();

    PendingRequest req;
    req.id = id;
    req.endpoint = endpoint;
    req.expected = std::move(expected);
    req.deadline = std::chrono::steady_clock::now() + timeout;
    req.completion = OnceCompletion(id, std::move(completion));
    pending_.add(std::move(req));

    // Armed after insertion so that an immediate expiry still finds the entry
    auto handler = on_expiry_;
    const timer::TimerId timer = timers_.schedule(timeout, [handler, id]() {
        if (handler) {
            handler(id);
        }
    });
    if (timer == timer::INVALID_TIMER) {
        GL_ERROR("[CORR] Request #" << id << ": deadline could not be armed (timer queue stopped)");
    }
    (void)pending_.set_timer(id, timer);

    GL_DEBUG("[CORR] Request #" << id << " registered on " << endpoint << " (timeout " << timeout.count() << " ms)");
    return id;
}

std::vector<Resolution> Correlator::on_value(const CharacteristicKey& endpoint, const Bytes& value) {
    std::vector<Resolution> out;
    if (pending_.empty()) {
        return out;
    }

    auto matched = pending_.take_matching(endpoint, value);
    out.reserve(matched.size());
    for (auto& req : matched) {
        GL_DEBUG("[CORR] Request #" << req.id << " matched after " << req.evaluations << " evaluation(s)");
        GL_TL1( telemetry_.requests_succeeded_total.inc() );
        out.push_back(finish_(req, Outcome::success(value)));
    }
    return out;
}

std::optional<Resolution> Correlator::expire(RequestId id) {
    auto req = pending_.take(id);
    if (!req) {
        GL_TRACE("[CORR] Deadline for request #" << id << " ignored (already resolved)");
        return std::nullopt;
    }
    GL_DEBUG("[CORR] Request #" << id << " timed out after " << req->evaluations << " evaluation(s)");
    GL_TL1( telemetry_.requests_timed_out_total.inc() );
    // The firing timer is the one being removed; nothing left to cancel
    req->timer = timer::INVALID_TIMER;
    return finish_(*req, Outcome::failure(Error::RequestTimeout));
}

std::optional<Resolution> Correlator::cancel(RequestId id, Error reason) {
    auto req = pending_.take(id);
    if (!req) {
        return std::nullopt;
    }
    GL_DEBUG("[CORR] Request #" << id << " resolved with " << to_string(reason));
    GL_TL1( telemetry_.requests_failed_total.inc() );
    return finish_(*req, Outcome::failure(reason));
}

std::vector<Resolution> Correlator::fail_all(Error reason) {
    std::vector<Resolution> out;
    auto all = pending_.take_all();
    if (all.empty()) {
        return out;
    }
    GL_DEBUG("[CORR] Failing " << all.size() << " pending request(s) with " << to_string(reason));
    out.reserve(all.size());
    for (auto& req : all) {
        GL_TL1( telemetry_.requests_failed_total.inc() );
        out.push_back(finish_(req, Outcome::failure(reason)));
    }
    return out;
}

Resolution Correlator::finish_(PendingRequest& request, Outcome outcome) {
    GL_TL1( telemetry_.values_evaluated_total.inc(request.evaluations) );
    GL_TL1( telemetry_.values_suppressed_total.inc(request.suppressed) );
    if (request.timer != timer::INVALID_TIMER) {
        (void)timers_.cancel(request.timer);
        request.timer = timer::INVALID_TIMER;
    }
    return Resolution{std::move(request.completion), std::move(outcome)};
}

} // namespace gattlink::core::request
