#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Prowl {
namespace Core {

namespace {

template <typename T>
void read_key(const YAML::Node& yaml, const char* key, T& out) {
    if (yaml[key])
        out = yaml[key].as<T>();
}

void require(bool ok, const std::string& message) {
    if (!ok)
        throw std::invalid_argument(message);
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        for (const char* key : {"seeds", "domains"}) {
            if (yaml[key] && yaml[key].IsSequence()) {
                for (const auto& node : yaml[key])
                    config.seeds.push_back(node.as<std::string>());
            }
        }

        read_key(yaml, "maxCrawlDepth", config.max_crawl_depth);
        read_key(yaml, "max_depth", config.max_crawl_depth);
        read_key(yaml, "politenessIntervalMs", config.politeness_interval_ms);
        read_key(yaml, "domainConcurrencyCap", config.domain_concurrency_cap);
        read_key(yaml, "maxRetries", config.max_retries);
        read_key(yaml, "retryBackoffBaseMs", config.retry_backoff_base_ms);
        read_key(yaml, "failureThreshold", config.failure_threshold);
        read_key(yaml, "cooldownMs", config.cooldown_ms);
        read_key(yaml, "leaseTimeoutMs", config.lease_timeout_ms);
        read_key(yaml, "fetchTimeoutMs", config.fetch_timeout_ms);
        read_key(yaml, "threads", config.threads);
        read_key(yaml, "workers", config.workers);
        read_key(yaml, "blockingThreads", config.blocking_threads);
        read_key(yaml, "stateDir", config.state_dir);
        read_key(yaml, "output", config.output_dir);
        read_key(yaml, "outputDir", config.output_dir);
        read_key(yaml, "saveJson", config.export_json);
        read_key(yaml, "saveCsv", config.export_csv);
        read_key(yaml, "resume", config.resume);
        read_key(yaml, "userAgent", config.user_agent);
        read_key(yaml, "logLevel", config.log_level);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

void Config::validate() const {
    require(max_crawl_depth >= 0, "maxCrawlDepth must be >= 0");
    require(politeness_interval_ms >= 0, "politenessIntervalMs must be >= 0");
    require(domain_concurrency_cap >= 1, "domainConcurrencyCap must be >= 1");
    require(max_retries >= 0, "maxRetries must be >= 0");
    require(retry_backoff_base_ms >= 0, "retryBackoffBaseMs must be >= 0");
    require(failure_threshold >= 1, "failureThreshold must be >= 1");
    require(cooldown_ms >= 0, "cooldownMs must be >= 0");
    require(fetch_timeout_ms > 0, "fetchTimeoutMs must be > 0");
    require(lease_timeout_ms > fetch_timeout_ms, "leaseTimeoutMs must exceed fetchTimeoutMs");
    require(threads >= 1, "threads must be >= 1");
    require(workers >= 1, "workers must be >= 1");
    require(blocking_threads >= 1, "blockingThreads must be >= 1");
    require(!state_dir.empty(), "stateDir must not be empty");
    require(resume || !seeds.empty(), "at least one seed is required unless --resume is set");
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Prowl - polite, resumable web crawler"};

    app.add_option("-d,--depth", config.max_crawl_depth, "Maximum crawl depth (seeds are 0)");
    app.add_option("--politeness-ms", config.politeness_interval_ms,
                   "Minimum gap between dispatches to one domain");
    app.add_option("--domain-cap", config.domain_concurrency_cap,
                   "Maximum concurrent fetches per domain");
    app.add_option("--max-retries", config.max_retries, "Retries before an entry is dead");
    app.add_option("--backoff-ms", config.retry_backoff_base_ms, "Base retry backoff");
    app.add_option("--failure-threshold", config.failure_threshold,
                   "Consecutive failures that open a domain's circuit breaker");
    app.add_option("--cooldown-ms", config.cooldown_ms, "Circuit breaker cooldown");
    app.add_option("--lease-ms", config.lease_timeout_ms, "In-flight lease timeout");
    app.add_option("--timeout-ms", config.fetch_timeout_ms, "Per-fetch timeout");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("-w,--workers", config.workers, "Number of concurrent workers");
    app.add_option("--blocking-threads", config.blocking_threads, "Threads for blocking fetches");
    app.add_option("--state", config.state_dir, "State directory");
    app.add_option("-o,--output", config.output_dir, "Output directory");
    app.add_option("--user-agent", config.user_agent, "User-Agent header");
    app.add_option("--log-level", config.log_level, "quiet|error|warn|info|debug");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag(
        "--json,!--no-json", config.export_json, "Export results as JSON (default on)");
    app.add_flag("--csv", config.export_csv, "Export results as CSV");
    app.add_flag("--resume", config.resume, "Continue unfinished jobs from the state directory");

    app.add_option("seeds", config.seeds, "Seed domains or URLs");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        // Positional seeds given on the command line replace the YAML list on re-parse.
        config.seeds.clear();
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

}  // namespace Core
}  // namespace Prowl
