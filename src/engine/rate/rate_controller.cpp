#include "rate_controller.hpp"
#include "../../core/logger/logger.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;

RateController::RateController(const RateConfig& config, Clock& clock)
    : config_(config), clock_(clock) {
}

DomainState& RateController::state_for(const std::string& domain) {
    auto it = domains_.find(domain);
    if (it == domains_.end()) {
        DomainState s;
        s.domain = domain;
        it       = domains_.emplace(domain, std::move(s)).first;
    }
    return it->second;
}

void RateController::open_breaker(DomainState& s, SteadyTimePoint now) {
    s.breaker         = BreakerState::Open;
    s.open_until      = now + config_.cooldown;
    s.probe_in_flight = false;
    Logger::warn("Circuit open for " + s.domain + " after "
                 + std::to_string(s.consecutive_failures) + " consecutive failures, cooling down "
                 + std::to_string(config_.cooldown.count()) + "ms");
}

bool RateController::admit_dispatch(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    SteadyTimePoint             now = clock_.steady_now();
    DomainState&                s   = state_for(domain);

    if (s.breaker == BreakerState::Open) {
        if (now < s.open_until)
            return false;
        s.breaker         = BreakerState::HalfOpen;
        s.probe_in_flight = false;
        Logger::info("Circuit half-open for " + domain + ", allowing one probe");
    }

    // Half-open lets exactly one probe through, and only once older fetches have drained.
    if (s.breaker == BreakerState::HalfOpen && (s.probe_in_flight || s.in_flight > 0))
        return false;

    if (s.in_flight >= config_.domain_concurrency_cap)
        return false;

    if (s.dispatched_before && now - s.last_dispatch < config_.politeness_interval)
        return false;

    s.in_flight++;
    s.last_dispatch     = now;
    s.dispatched_before = true;
    if (s.breaker == BreakerState::HalfOpen)
        s.probe_in_flight = true;
    return true;
}

void RateController::release(const std::string& domain, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    DomainState&                s = state_for(domain);

    if (s.in_flight > 0)
        s.in_flight--;
    else
        Logger::warn("Rate: release without dispatch for " + domain);

    if (s.breaker == BreakerState::HalfOpen && s.probe_in_flight) {
        s.probe_in_flight = false;
        if (success) {
            s.breaker              = BreakerState::Closed;
            s.consecutive_failures = 0;
            Logger::info("Circuit closed for " + domain + ", probe succeeded");
        }
        else {
            s.consecutive_failures++;
            open_breaker(s, clock_.steady_now());
        }
        return;
    }

    if (success) {
        s.consecutive_failures = 0;
        return;
    }

    s.consecutive_failures++;
    if (s.breaker == BreakerState::Closed && s.consecutive_failures >= config_.failure_threshold)
        open_breaker(s, clock_.steady_now());
}

void RateController::cancel_dispatch(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    DomainState&                s = state_for(domain);

    if (s.in_flight > 0)
        s.in_flight--;
    else
        Logger::warn("Rate: cancel without dispatch for " + domain);
    if (s.breaker == BreakerState::HalfOpen)
        s.probe_in_flight = false;
}

void RateController::restore_in_flight(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    DomainState&                s = state_for(domain);
    s.in_flight++;
}

DomainState RateController::state(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = domains_.find(domain);
    if (it == domains_.end()) {
        DomainState s;
        s.domain = domain;
        return s;
    }
    return it->second;
}

BreakerState RateController::breaker(const std::string& domain) const {
    return state(domain).breaker;
}

int RateController::in_flight(const std::string& domain) const {
    return state(domain).in_flight;
}

}  // namespace Engine
}  // namespace Prowl
