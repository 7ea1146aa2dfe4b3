#include <nlohmann/json.hpp>
#include "../../../core/logger/logger.hpp"
#include "../frontier.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;

namespace {
constexpr const char* FRONTIER_PREFIX = "frontier/";
}

size_t Frontier::drop_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<uint64_t> doomed;
    for (const auto& [id, entry] : entries_) {
        if (entry.job_id == job_id
            && (entry.state == EntryState::Queued || entry.state == EntryState::Retrying))
            doomed.push_back(id);
    }

    auto job = jobs_.find(job_id);
    for (uint64_t id : doomed) {
        store_.erase(key(id));
        if (job != jobs_.end()) {
            size_t& count = counter(job->second.counts, entries_.at(id).state);
            if (count > 0)
                count--;
        }
        entries_.erase(id);
    }

    // Stale ids left in buckets and in the retry schedule are skipped by dequeue_ready().
    if (!doomed.empty())
        Logger::info("Frontier: dropped " + std::to_string(doomed.size()) + " pending entries of "
                     + job_id);
    return doomed.size();
}

std::vector<FrontierEntry> Frontier::recover_expired_leases() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint                   now = clock_.now();

    std::vector<uint64_t> expired;
    for (const auto& [id, entry] : entries_) {
        if (entry.state == EntryState::InFlight && entry.lease_expires <= now)
            expired.push_back(id);
    }

    std::vector<FrontierEntry> recovered;
    for (uint64_t id : expired) {
        FrontierEntry snapshot = entries_.at(id);
        Logger::warn("Lease expired for " + snapshot.url + ", recovering");

        FailOutcome outcome = fail_locked(entries_.at(id), true, ErrorClass::LeaseExpired, now);
        if (outcome == FailOutcome::Retrying) {
            recovered.push_back(entries_.at(id));
        }
        else {
            snapshot.state      = EntryState::Dead;
            snapshot.last_error = ErrorClass::LeaseExpired;
            recovered.push_back(std::move(snapshot));
        }
    }
    return recovered;
}

size_t Frontier::restore() {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t restored = 0;
    for (const auto& [k, v] : store_.scan(FRONTIER_PREFIX)) {
        FrontierEntry entry;
        try {
            entry = nlohmann::json::parse(v).get<FrontierEntry>();
        } catch (const std::exception& e) {
            Logger::warn("Frontier: discarding unreadable record " + k + ": " + e.what());
            store_.erase(k);
            continue;
        }

        if (entry.id >= next_id_)
            next_id_ = entry.id + 1;

        // Entries of jobs not registered in this process stay in the store for a later resume.
        auto job = jobs_.find(entry.job_id);
        if (job == jobs_.end())
            continue;
        if (!job->second.open) {
            store_.erase(k);
            continue;
        }

        switch (entry.state) {
            case EntryState::Queued: push_queued(entry); break;
            case EntryState::Retrying: retry_schedule_.emplace(entry.ready_at, entry.id); break;
            // Owned by a worker of the previous process; recovered once the lease runs out.
            case EntryState::InFlight: rate_.restore_in_flight(entry.domain); break;
            default: store_.erase(k); continue;
        }

        counter(job->second.counts, entry.state)++;
        entries_.emplace(entry.id, std::move(entry));
        ++restored;
    }

    if (restored > 0)
        Logger::info("Frontier: restored " + std::to_string(restored) + " entries");
    return restored;
}

}  // namespace Engine
}  // namespace Prowl
