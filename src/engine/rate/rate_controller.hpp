#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>

#include "../../core/types/clock.hpp"
#include "../../core/types/constants.hpp"
#include "../../core/types/crawl_types.hpp"

namespace Prowl {
namespace Engine {

struct RateConfig {
    std::chrono::milliseconds politeness_interval{Core::Constants::DEFAULT_POLITENESS_INTERVAL_MS};
    int                       domain_concurrency_cap = Core::Constants::DEFAULT_DOMAIN_CONCURRENCY_CAP;
    int                       failure_threshold      = Core::Constants::DEFAULT_FAILURE_THRESHOLD;
    std::chrono::milliseconds cooldown{Core::Constants::DEFAULT_COOLDOWN_MS};
};

// Per-domain politeness and circuit breaker on the monotonic clock. Never blocks: every call
// answers immediately.
class RateController {
public:
    explicit RateController(const RateConfig& config, Core::Clock& clock = Core::Clock::system());

    // True if the domain may be fetched now; on true the in-flight count is incremented and
    // the dispatch is stamped.
    bool admit_dispatch(const std::string& domain);

    // Ends one dispatch admitted earlier. Consecutive failures past the threshold open the
    // breaker for the cooldown window; a half-open probe closes or reopens it.
    void release(const std::string& domain, bool success);

    // Takes back a dispatch that never reached the network. Neither the failure streak nor
    // the breaker changes, and a half-open domain may admit its trial fetch again.
    void cancel_dispatch(const std::string& domain);

    // Re-registers a dispatch that survived a restart so in-flight counts stay exact.
    void restore_in_flight(const std::string& domain);

    Core::DomainState  state(const std::string& domain) const;
    Core::BreakerState breaker(const std::string& domain) const;
    int                in_flight(const std::string& domain) const;
    const RateConfig&  config() const {
        return config_;
    }

private:
    RateConfig   config_;
    Core::Clock& clock_;

    mutable std::mutex                       mutex_;
    std::map<std::string, Core::DomainState> domains_;

    Core::DomainState& state_for(const std::string& domain);
    void               open_breaker(Core::DomainState& s, Core::SteadyTimePoint now);
};

}  // namespace Engine
}  // namespace Prowl
