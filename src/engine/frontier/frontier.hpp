#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../core/types/clock.hpp"
#include "../../core/types/constants.hpp"
#include "../../core/types/crawl_types.hpp"
#include "../../storage/kv_store.hpp"
#include "../dedup/dedup_store.hpp"
#include "../rate/rate_controller.hpp"

#ifndef CPPCHECK
class FrontierTest_RoundRobinAcrossDomains_Test;
#endif

namespace Prowl {
namespace Engine {

struct FrontierConfig {
    int                       max_retries = Core::Constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_backoff_base{Core::Constants::DEFAULT_RETRY_BACKOFF_BASE_MS};
    std::chrono::milliseconds lease_timeout{Core::Constants::DEFAULT_LEASE_TIMEOUT_MS};
};

enum class EnqueueOutcome {
    Admitted,
    DepthExceeded,
    Duplicate,
    InvalidUrl,
    OffDomain,
    UnknownJob,
    JobClosed
};

enum class FailOutcome { Retrying, Dead, Stale };

const char* to_string(EnqueueOutcome outcome);

struct FrontierStats {
    size_t queued    = 0;
    size_t in_flight = 0;
    size_t retrying  = 0;
    size_t done      = 0;
    size_t dead      = 0;
};

// Depth-aware work queue shared by all workers. Queued entries live in one FIFO bucket per
// domain; dequeue_ready() walks the domains round-robin and asks the RateController before
// taking the head of a bucket. Every state transition is written through to the store.
class Frontier {
#ifndef CPPCHECK
    friend class ::FrontierTest_RoundRobinAcrossDomains_Test;
#endif

public:
    Frontier(Storage::KvStore&     store,
             DedupStore&           dedup,
             RateController&       rate,
             const FrontierConfig& config,
             Core::Clock&          clock = Core::Clock::system());

    // hosts scopes admission: only URLs on one of these hosts are accepted for the job.
    void register_job(const std::string&              job_id,
                      int                             max_depth,
                      const std::vector<std::string>& hosts);
    // Stops admission for the job; in-flight entries may still ack or fail.
    void close_job(const std::string& job_id);
    // Removes the job's Queued and Retrying entries. Returns how many were dropped.
    size_t drop_job(const std::string& job_id);

    // Admits url at parent_depth + 1. Seeds use Constants::SEED_PARENT_DEPTH.
    EnqueueOutcome enqueue(const std::string& job_id, const std::string& url, int parent_depth);

    std::optional<Core::WorkUnit> dequeue_ready();

    // True while unit still holds the entry's current lease. A worker checks this before it
    // admits links or records a result for the unit.
    bool owns(const Core::WorkUnit& unit) const;

    // Both ignore units whose lease is no longer current (returning false / Stale).
    bool        ack(const Core::WorkUnit& unit);
    FailOutcome fail(const Core::WorkUnit& unit, bool retryable, Core::ErrorClass error_class);

    // InFlight entries whose lease expired are failed as retryable. Returns the affected
    // entries in their new state (Retrying or Dead).
    std::vector<Core::FrontierEntry> recover_expired_leases();

    // Rebuilds the in-memory queues of registered jobs from the store and moves the id
    // counter past every persisted entry. Call it before the first enqueue on a reused store.
    size_t restore();

    bool          drained(const std::string& job_id) const;
    size_t        in_flight(const std::string& job_id) const;
    FrontierStats stats(const std::string& job_id) const;
    size_t        size() const;

    std::optional<Core::FrontierEntry> entry(uint64_t id) const;

    static std::string key(uint64_t entry_id);

#ifdef CPPCHECK
public:
#else
private:
#endif
    struct JobScope {
        int                   max_depth = 0;
        std::set<std::string> hosts;
        bool                  open = true;
        FrontierStats         counts;
    };

    Storage::KvStore& store_;
    DedupStore&       dedup_;
    RateController&   rate_;
    FrontierConfig    config_;
    Core::Clock&      clock_;

    mutable std::mutex                                mutex_;
    std::map<std::string, JobScope>                   jobs_;
    std::unordered_map<uint64_t, Core::FrontierEntry> entries_;
    std::map<std::string, std::deque<uint64_t>>       buckets_;
    std::deque<std::string>                           rotation_;
    std::multimap<Core::TimePoint, uint64_t>          retry_schedule_;
    uint64_t                                          next_id_ = 1;

    static size_t& counter(FrontierStats& stats, Core::EntryState state);

    void persist(const Core::FrontierEntry& entry);
    void push_queued(const Core::FrontierEntry& entry);
    void promote_due_retries(Core::TimePoint now);
    void transition(Core::FrontierEntry& entry, Core::EntryState to);
    FailOutcome fail_locked(Core::FrontierEntry& entry,
                            bool                 retryable,
                            Core::ErrorClass     error_class,
                            Core::TimePoint      now);
    bool        lease_is_current(const Core::WorkUnit& unit, Core::FrontierEntry*& out);
    bool        holds_lease(const Core::WorkUnit& unit) const;
};

}  // namespace Engine
}  // namespace Prowl
