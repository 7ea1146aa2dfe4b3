#include <curl/curl.h>
#include <filesystem>
#include <stdexcept>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/dedup/dedup_store.hpp"
#include "engine/dispatcher/dispatcher.hpp"
#include "engine/frontier/frontier.hpp"
#include "engine/job/job_controller.hpp"
#include "engine/rate/rate_controller.hpp"
#include "engine/sink/result_sink.hpp"
#include "storage/file_store.hpp"

namespace {

using Prowl::Core::Config;
using Prowl::Core::JobStatus;
using Prowl::Core::Logger;

constexpr int EXIT_OK          = 0;
constexpr int EXIT_CONFIG      = 1;
constexpr int EXIT_JOB_FAILED  = 2;
constexpr int EXIT_INTERRUPTED = 130;

Prowl::Engine::RateConfig rate_config(const Config& config) {
    Prowl::Engine::RateConfig rc;
    rc.politeness_interval    = std::chrono::milliseconds(config.politeness_interval_ms);
    rc.domain_concurrency_cap = config.domain_concurrency_cap;
    rc.failure_threshold      = config.failure_threshold;
    rc.cooldown               = std::chrono::milliseconds(config.cooldown_ms);
    return rc;
}

Prowl::Engine::FrontierConfig frontier_config(const Config& config) {
    Prowl::Engine::FrontierConfig fc;
    fc.max_retries        = config.max_retries;
    fc.retry_backoff_base = std::chrono::milliseconds(config.retry_backoff_base_ms);
    fc.lease_timeout      = std::chrono::milliseconds(config.lease_timeout_ms);
    return fc;
}

Prowl::Engine::DispatcherConfig dispatcher_config(const Config& config) {
    Prowl::Engine::DispatcherConfig dc;
    dc.threads          = config.threads;
    dc.workers          = config.workers;
    dc.blocking_threads = config.blocking_threads;
    dc.fetch_timeout    = std::chrono::milliseconds(config.fetch_timeout_ms);
    dc.user_agent       = config.user_agent;
    return dc;
}

void export_results(const Config&                    config,
                    const Prowl::Engine::ResultSink& sink,
                    const std::string&               job_id) {
    std::filesystem::path base = std::filesystem::path(config.output_dir) / ("prowl_" + job_id);
    try {
        if (config.export_json)
            sink.export_json(job_id, base.string() + ".json");
        if (config.export_csv)
            sink.export_csv(job_id, base.string() + ".csv");
    } catch (const std::runtime_error& e) {
        Logger::error("Export failed for job " + job_id + ": " + e.what());
    }
}

int run_crawl(const Config& config) {
    Prowl::Storage::FileStore     store(config.state_dir);
    Prowl::Engine::RateController rate(rate_config(config));
    Prowl::Engine::DedupStore     dedup(store);
    Prowl::Engine::Frontier       frontier(store, dedup, rate, frontier_config(config));
    Prowl::Engine::ResultSink     sink(store);
    Prowl::Engine::JobController  jobs(store, frontier, config.max_crawl_depth);

    std::vector<std::string> job_ids;
    if (config.resume)
        jobs.restore();
    size_t entries = frontier.restore();
    if (config.resume) {
        job_ids = jobs.running_jobs();
        Logger::info("Resuming " + std::to_string(job_ids.size()) + " job(s) with "
                     + std::to_string(entries) + " pending entries");
    }
    if (!config.seeds.empty())
        job_ids.push_back(jobs.start_job(config.seeds, config.max_crawl_depth));

    if (job_ids.empty()) {
        Logger::warn("Nothing to crawl.");
        return EXIT_OK;
    }

    Prowl::Engine::Dispatcher dispatcher(frontier, jobs, sink, dispatcher_config(config));
    dispatcher.run();

    int code = EXIT_OK;
    for (const auto& id : job_ids) {
        export_results(config, sink, id);

        auto job = jobs.job(id);
        if (!job)
            continue;
        Logger::info("Job " + id + ": " + Prowl::Core::to_string(job->status) + ", "
                     + std::to_string(sink.count(id)) + " results");
        if (job->status == JobStatus::Failed || job->status == JobStatus::Cancelled)
            code = EXIT_JOB_FAILED;
    }

    if (dispatcher.interrupted() && !jobs.all_terminal())
        return EXIT_INTERRUPTED;
    return code;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
        Logger::set_level(Logger::parse_level(config.log_level));
        config.validate();
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return EXIT_CONFIG;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    int code = EXIT_CONFIG;
    try {
        code = run_crawl(config);
    } catch (const Prowl::Storage::StoreError& e) {
        Logger::error("State store unavailable: " + std::string(e.what()));
        code = EXIT_JOB_FAILED;
    } catch (const std::invalid_argument& e) {
        Logger::error(e.what());
        code = EXIT_CONFIG;
    }
    curl_global_cleanup();

    return code;
}
