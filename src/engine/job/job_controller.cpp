#include "job_controller.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;
using Prowl::Utils::Url;

namespace {
constexpr const char* JOB_PREFIX = "job/";
}

JobController::JobController(Storage::KvStore& store,
                             Frontier&         frontier,
                             int               default_max_depth,
                             Clock&            clock)
    : store_(store), frontier_(frontier), default_max_depth_(default_max_depth), clock_(clock) {
}

std::string JobController::key(const std::string& job_id) {
    return JOB_PREFIX + job_id;
}

std::string JobController::new_job_id() {
    static std::mutex                     gen_mutex;
    static boost::uuids::random_generator gen;
    std::lock_guard<std::mutex>           lock(gen_mutex);
    return boost::uuids::to_string(gen());
}

std::vector<std::string> JobController::hosts_of(const std::vector<std::string>& seeds) {
    std::vector<std::string> hosts;
    for (const auto& seed : seeds)
        hosts.push_back(Url::domain_of(seed));
    return hosts;
}

std::string JobController::start_job(const std::vector<std::string>& seeds,
                                     std::optional<int>              max_depth) {
    if (seeds.empty())
        throw std::invalid_argument("A crawl job needs at least one seed");

    int depth = max_depth.value_or(default_max_depth_);
    if (depth < 0)
        throw std::invalid_argument("max depth must be >= 0, got " + std::to_string(depth));

    std::vector<std::string> seed_urls;
    for (const auto& seed : seeds) {
        std::string url = Url::normalize(Url::from_seed(seed));
        if (url.empty())
            throw std::invalid_argument("Invalid seed: " + seed);
        seed_urls.push_back(url);
    }

    CrawlJob job;
    job.id         = new_job_id();
    job.seeds      = seed_urls;
    job.max_depth  = depth;
    job.status     = JobStatus::Running;
    job.created_at = clock_.now();

    store_.put(key(job.id), nlohmann::json(job).dump());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[job.id] = job;
        seeding_.insert(job.id);
    }

    try {
        frontier_.register_job(job.id, depth, hosts_of(seed_urls));
        for (const auto& url : seed_urls) {
            EnqueueOutcome outcome = frontier_.enqueue(job.id, url, Constants::SEED_PARENT_DEPTH);
            if (outcome != EnqueueOutcome::Admitted)
                Logger::debug("Seed " + url + " not admitted: " + to_string(outcome));
        }
    } catch (const Storage::StoreError& e) {
        end_seeding(job.id);
        fail_job(job.id, e.what());
        throw;
    }
    end_seeding(job.id);

    Logger::info("Job " + job.id + " started: " + std::to_string(seed_urls.size())
                 + " seed(s), max depth " + std::to_string(depth));
    return job.id;
}

void JobController::end_seeding(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    seeding_.erase(job_id);
}

bool JobController::finish_locked(CrawlJob& job, JobStatus status, const std::string& reason) {
    if (job.status != JobStatus::Running)
        return false;

    job.status = status;
    job.reason = reason;
    try {
        store_.put(key(job.id), nlohmann::json(job).dump());
    } catch (const Storage::StoreError& e) {
        Logger::error("Job " + job.id + ": could not persist status " + to_string(status) + ": "
                      + e.what());
        if (status == JobStatus::Completed) {
            job.status = JobStatus::Failed;
            job.reason = e.what();
        }
    }
    return true;
}

bool JobController::cancel_job(const std::string& job_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = jobs_.find(job_id);
        if (it == jobs_.end() || !finish_locked(it->second, JobStatus::Cancelled, "cancelled"))
            return false;
    }
    frontier_.close_job(job_id);
    size_t dropped = frontier_.drop_job(job_id);
    Logger::warn("Job " + job_id + " cancelled, " + std::to_string(dropped)
                 + " pending entries dropped");
    return true;
}

bool JobController::fail_job(const std::string& job_id, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = jobs_.find(job_id);
        if (it == jobs_.end() || !finish_locked(it->second, JobStatus::Failed, reason))
            return false;
    }
    frontier_.close_job(job_id);
    try {
        frontier_.drop_job(job_id);
    } catch (const Storage::StoreError& e) {
        Logger::error("Job " + job_id + ": pending entries left in store: " + e.what());
    }
    Logger::error("Job " + job_id + " failed: " + reason);
    return true;
}

bool JobController::check_completion(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.status != JobStatus::Running)
        return false;
    // An empty frontier means nothing while seeds are still being admitted.
    if (seeding_.count(job_id))
        return false;
    if (!frontier_.drained(job_id) || frontier_.in_flight(job_id) > 0)
        return false;

    if (!finish_locked(it->second, JobStatus::Completed, ""))
        return false;

    FrontierStats s = frontier_.stats(job_id);
    Logger::success("Job " + job_id + " " + to_string(it->second.status) + ": "
                    + std::to_string(s.done) + " done, " + std::to_string(s.dead) + " dead");
    return true;
}

size_t JobController::poll() {
    size_t completed = 0;
    for (const auto& id : running_jobs()) {
        if (check_completion(id))
            ++completed;
    }
    return completed;
}

size_t JobController::restore() {
    size_t running = 0;
    for (const auto& [k, v] : store_.scan(JOB_PREFIX)) {
        CrawlJob job;
        try {
            job = nlohmann::json::parse(v).get<CrawlJob>();
        } catch (const std::exception& e) {
            Logger::warn("Skipping unreadable job record " + k + ": " + e.what());
            continue;
        }

        if (job.status == JobStatus::Running) {
            frontier_.register_job(job.id, job.max_depth, hosts_of(job.seeds));
            ++running;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[job.id] = std::move(job);
    }
    if (running > 0)
        Logger::info("Restored " + std::to_string(running) + " running job(s)");
    return running;
}

bool JobController::is_running(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    return it != jobs_.end() && it->second.status == JobStatus::Running;
}

bool JobController::all_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, job] : jobs_) {
        if (job.status == JobStatus::Running)
            return false;
    }
    return true;
}

std::optional<CrawlJob> JobController::job(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(job_id);
    if (it == jobs_.end())
        return std::nullopt;
    return it->second;
}

std::vector<CrawlJob> JobController::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CrawlJob>       out;
    for (const auto& [id, job] : jobs_)
        out.push_back(job);
    return out;
}

std::vector<std::string> JobController::running_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    out;
    for (const auto& [id, job] : jobs_) {
        if (job.status == JobStatus::Running)
            out.push_back(id);
    }
    return out;
}

}  // namespace Engine
}  // namespace Prowl
