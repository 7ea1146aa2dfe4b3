#include "frontier.hpp"
#include <cstdio>
#include <nlohmann/json.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;
using Prowl::Utils::Url;

namespace {
constexpr const char* FRONTIER_PREFIX = "frontier/";
}  // namespace

size_t& Frontier::counter(FrontierStats& stats, EntryState state) {
    switch (state) {
        case EntryState::Queued: return stats.queued;
        case EntryState::InFlight: return stats.in_flight;
        case EntryState::Retrying: return stats.retrying;
        case EntryState::Done: return stats.done;
        case EntryState::Dead: return stats.dead;
    }
    return stats.dead;
}

const char* to_string(EnqueueOutcome outcome) {
    switch (outcome) {
        case EnqueueOutcome::Admitted: return "admitted";
        case EnqueueOutcome::DepthExceeded: return "depth_exceeded";
        case EnqueueOutcome::Duplicate: return "duplicate";
        case EnqueueOutcome::InvalidUrl: return "invalid_url";
        case EnqueueOutcome::OffDomain: return "off_domain";
        case EnqueueOutcome::UnknownJob: return "unknown_job";
        case EnqueueOutcome::JobClosed: return "job_closed";
    }
    return "unknown";
}

Frontier::Frontier(Storage::KvStore&     store,
                   DedupStore&           dedup,
                   RateController&       rate,
                   const FrontierConfig& config,
                   Clock&                clock)
    : store_(store), dedup_(dedup), rate_(rate), config_(config), clock_(clock) {
}

std::string Frontier::key(uint64_t entry_id) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(entry_id));
    return FRONTIER_PREFIX + std::string(buf);
}

void Frontier::register_job(const std::string&              job_id,
                            int                             max_depth,
                            const std::vector<std::string>& hosts) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobScope&                   scope = jobs_[job_id];
    scope.max_depth                   = max_depth;
    scope.open                        = true;
    for (const auto& h : hosts) {
        if (!h.empty())
            scope.hosts.insert(h);
    }
}

void Frontier::close_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    if (it != jobs_.end())
        it->second.open = false;
}

void Frontier::persist(const FrontierEntry& entry) {
    store_.put(key(entry.id), nlohmann::json(entry).dump());
}

void Frontier::transition(FrontierEntry& entry, EntryState to) {
    auto it = jobs_.find(entry.job_id);
    if (it != jobs_.end()) {
        size_t& from_count = counter(it->second.counts, entry.state);
        if (from_count > 0)
            from_count--;
        counter(it->second.counts, to)++;
    }
    entry.state = to;
}

void Frontier::push_queued(const FrontierEntry& entry) {
    auto it = buckets_.find(entry.domain);
    if (it == buckets_.end()) {
        it = buckets_.emplace(entry.domain, std::deque<uint64_t>{}).first;
        rotation_.push_back(entry.domain);
    }
    it->second.push_back(entry.id);
}

EnqueueOutcome Frontier::enqueue(const std::string& job_id, const std::string& url, int parent_depth) {
    int depth = parent_depth + 1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = jobs_.find(job_id);
        if (it == jobs_.end())
            return EnqueueOutcome::UnknownJob;
        if (!it->second.open)
            return EnqueueOutcome::JobClosed;
        if (depth > it->second.max_depth)
            return EnqueueOutcome::DepthExceeded;
    }

    std::string normalized = Url::normalize(url);
    if (normalized.empty())
        return EnqueueOutcome::InvalidUrl;
    std::string domain = Url::domain_of(normalized);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const JobScope&             scope = jobs_.at(job_id);
        if (!scope.hosts.empty() && !scope.hosts.count(domain))
            return EnqueueOutcome::OffDomain;
    }

    // The claim is the admission gate; it is atomic in the store and never undone.
    if (!dedup_.try_claim(job_id, normalized, depth))
        return EnqueueOutcome::Duplicate;

    std::lock_guard<std::mutex> lock(mutex_);
    JobScope&                   scope = jobs_.at(job_id);
    if (!scope.open)
        return EnqueueOutcome::JobClosed;

    FrontierEntry entry;
    entry.id            = next_id_++;
    entry.url           = normalized;
    entry.job_id        = job_id;
    entry.domain        = domain;
    entry.depth         = depth;
    entry.state         = EntryState::Queued;
    entry.discovered_at = clock_.now();
    entry.ready_at      = entry.discovered_at;

    persist(entry);
    scope.counts.queued++;
    push_queued(entry);
    entries_.emplace(entry.id, entry);

    Logger::debug("Admitted " + normalized + " (depth " + std::to_string(depth) + ")");
    return EnqueueOutcome::Admitted;
}

void Frontier::promote_due_retries(TimePoint now) {
    while (!retry_schedule_.empty() && retry_schedule_.begin()->first <= now) {
        auto first = retry_schedule_.begin();
        auto it    = entries_.find(first->second);
        if (it == entries_.end() || it->second.state != EntryState::Retrying) {
            retry_schedule_.erase(first);
            continue;
        }

        FrontierEntry updated = it->second;
        updated.state         = EntryState::Queued;
        persist(updated);
        retry_schedule_.erase(first);

        transition(it->second, EntryState::Queued);
        push_queued(it->second);
    }
}

std::optional<WorkUnit> Frontier::dequeue_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint                   now = clock_.now();
    promote_due_retries(now);

    size_t domains = rotation_.size();
    for (size_t i = 0; i < domains; ++i) {
        std::string domain = std::move(rotation_.front());
        rotation_.pop_front();

        auto bucket_it = buckets_.find(domain);
        if (bucket_it == buckets_.end())
            continue;
        std::deque<uint64_t>& bucket = bucket_it->second;

        while (!bucket.empty()) {
            auto e = entries_.find(bucket.front());
            if (e != entries_.end() && e->second.state == EntryState::Queued)
                break;
            bucket.pop_front();
        }
        if (bucket.empty()) {
            buckets_.erase(bucket_it);
            continue;
        }

        if (!rate_.admit_dispatch(domain)) {
            rotation_.push_back(domain);
            continue;
        }

        FrontierEntry& entry  = entries_.at(bucket.front());
        FrontierEntry  leased = entry;
        leased.state          = EntryState::InFlight;
        leased.lease          = entry.lease + 1;
        leased.lease_expires  = now + config_.lease_timeout;

        try {
            persist(leased);
        } catch (const Storage::StoreError&) {
            rate_.cancel_dispatch(domain);
            rotation_.push_front(domain);
            throw;
        }

        bucket.pop_front();
        if (bucket.empty())
            buckets_.erase(bucket_it);
        else
            rotation_.push_back(domain);

        transition(entry, EntryState::InFlight);
        entry.lease         = leased.lease;
        entry.lease_expires = leased.lease_expires;

        WorkUnit unit;
        unit.entry_id = entry.id;
        unit.lease    = entry.lease;
        unit.job_id   = entry.job_id;
        unit.url      = entry.url;
        unit.depth    = entry.depth;
        unit.domain   = entry.domain;
        unit.attempt  = entry.attempt;
        return unit;
    }
    return std::nullopt;
}

bool Frontier::holds_lease(const WorkUnit& unit) const {
    auto it = entries_.find(unit.entry_id);
    return it != entries_.end() && it->second.state == EntryState::InFlight
           && it->second.lease == unit.lease;
}

bool Frontier::lease_is_current(const WorkUnit& unit, FrontierEntry*& out) {
    if (!holds_lease(unit)) {
        Logger::debug("Stale lease for " + unit.url);
        return false;
    }
    out = &entries_.at(unit.entry_id);
    return true;
}

bool Frontier::owns(const WorkUnit& unit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holds_lease(unit);
}

bool Frontier::ack(const WorkUnit& unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    FrontierEntry*              entry = nullptr;
    if (!lease_is_current(unit, entry))
        return false;

    uint64_t id = entry->id;
    store_.erase(key(id));
    rate_.release(entry->domain, true);
    transition(*entry, EntryState::Done);
    entries_.erase(id);
    return true;
}

FailOutcome Frontier::fail(const WorkUnit& unit, bool retryable, ErrorClass error_class) {
    std::lock_guard<std::mutex> lock(mutex_);
    FrontierEntry*              entry = nullptr;
    if (!lease_is_current(unit, entry))
        return FailOutcome::Stale;
    return fail_locked(*entry, retryable, error_class, clock_.now());
}

FailOutcome Frontier::fail_locked(FrontierEntry& entry,
                                  bool           retryable,
                                  ErrorClass     error_class,
                                  TimePoint      now) {
    if (retryable && entry.attempt < config_.max_retries) {
        FrontierEntry updated = entry;
        updated.attempt++;
        updated.state      = EntryState::Retrying;
        updated.last_error = error_class;
        updated.ready_at   = now + get_backoff_time(updated.attempt, config_.retry_backoff_base.count());
        persist(updated);

        rate_.release(entry.domain, false);
        transition(entry, EntryState::Retrying);
        entry.attempt    = updated.attempt;
        entry.last_error = error_class;
        entry.ready_at   = updated.ready_at;
        retry_schedule_.emplace(entry.ready_at, entry.id);

        Logger::warn("Retrying " + entry.url + " (" + to_string(error_class) + ", attempt "
                     + std::to_string(entry.attempt) + "/" + std::to_string(config_.max_retries)
                     + ")");
        return FailOutcome::Retrying;
    }

    uint64_t id = entry.id;
    store_.erase(key(id));
    rate_.release(entry.domain, false);
    transition(entry, EntryState::Dead);
    Logger::error("Dead: " + entry.url + " (" + to_string(error_class) + ")");
    entries_.erase(id);
    return FailOutcome::Dead;
}

bool Frontier::drained(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    if (it == jobs_.end())
        return true;
    const FrontierStats& c = it->second.counts;
    return c.queued == 0 && c.in_flight == 0 && c.retrying == 0;
}

size_t Frontier::in_flight(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    return it == jobs_.end() ? 0 : it->second.counts.in_flight;
}

FrontierStats Frontier::stats(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    return it == jobs_.end() ? FrontierStats{} : it->second.counts;
}

size_t Frontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::optional<FrontierEntry> Frontier::entry(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = entries_.find(id);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

}  // namespace Engine
}  // namespace Prowl
