#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../../core/types/clock.hpp"
#include "../../core/types/crawl_types.hpp"
#include "../../storage/kv_store.hpp"
#include "../frontier/frontier.hpp"

namespace Prowl {
namespace Engine {

// Owns the lifecycle of crawl jobs. Only this class changes a job's status.
class JobController {
public:
    JobController(Storage::KvStore& store,
                  Frontier&         frontier,
                  int               default_max_depth,
                  Core::Clock&      clock = Core::Clock::system());

    // Creates a job and seeds the frontier with one depth-0 entry per seed. Seeds may be bare
    // domains ("shop.example") or absolute URLs. Throws std::invalid_argument for an empty
    // seed list, an unusable seed or a negative depth, and Storage::StoreError if the job
    // cannot be persisted (the job is then marked Failed).
    std::string start_job(const std::vector<std::string>& seeds,
                          std::optional<int>              max_depth = std::nullopt);

    // Running -> Cancelled. Queued and Retrying entries are dropped; in-flight fetches finish
    // and their results are discarded by the dispatcher.
    bool cancel_job(const std::string& job_id);

    // Running -> Failed on an infrastructure fault.
    bool fail_job(const std::string& job_id, const std::string& reason);

    // Running -> Completed once the frontier holds nothing queued, retrying or in flight.
    // Never fires while start_job() is still admitting the job's seeds.
    bool check_completion(const std::string& job_id);
    // check_completion() over every running job; returns how many completed.
    size_t poll();

    // Loads persisted jobs and re-registers the running ones with the frontier.
    size_t restore();

    bool                          is_running(const std::string& job_id) const;
    bool                          all_terminal() const;
    std::optional<Core::CrawlJob> job(const std::string& job_id) const;
    std::vector<Core::CrawlJob>   jobs() const;
    std::vector<std::string>      running_jobs() const;

    static std::string key(const std::string& job_id);

private:
    Storage::KvStore& store_;
    Frontier&         frontier_;
    int               default_max_depth_;
    Core::Clock&      clock_;

    mutable std::mutex                    mutex_;
    std::map<std::string, Core::CrawlJob> jobs_;
    std::set<std::string>                 seeding_;

    void end_seeding(const std::string& job_id);
    bool finish_locked(Core::CrawlJob& job, Core::JobStatus status, const std::string& reason);

    static std::vector<std::string> hosts_of(const std::vector<std::string>& seeds);
    static std::string              new_job_id();
};

}  // namespace Engine
}  // namespace Prowl
