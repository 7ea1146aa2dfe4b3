#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Prowl {
namespace Core {

struct Config {
    std::vector<std::string> seeds;
    int                      max_crawl_depth        = Constants::DEFAULT_MAX_CRAWL_DEPTH;
    int64_t                  politeness_interval_ms = Constants::DEFAULT_POLITENESS_INTERVAL_MS;
    int                      domain_concurrency_cap = Constants::DEFAULT_DOMAIN_CONCURRENCY_CAP;
    int                      max_retries            = Constants::DEFAULT_MAX_RETRIES;
    int64_t                  retry_backoff_base_ms  = Constants::DEFAULT_RETRY_BACKOFF_BASE_MS;
    int                      failure_threshold      = Constants::DEFAULT_FAILURE_THRESHOLD;
    int64_t                  cooldown_ms            = Constants::DEFAULT_COOLDOWN_MS;
    int64_t                  lease_timeout_ms       = Constants::DEFAULT_LEASE_TIMEOUT_MS;
    int64_t                  fetch_timeout_ms       = Constants::DEFAULT_FETCH_TIMEOUT_MS;

    int threads          = Constants::DEFAULT_THREADS;
    int workers          = Constants::DEFAULT_WORKERS;
    int blocking_threads = Constants::DEFAULT_BLOCKING_THREADS;

    std::string state_dir   = Constants::DEFAULT_STATE_DIR;
    std::string output_dir  = Constants::DEFAULT_OUTPUT_DIR;
    bool        export_json = true;
    bool        export_csv  = false;
    bool        resume      = false;
    std::string user_agent  = Constants::USER_AGENT;
    std::string log_level   = "info";
    std::string config_path;

    // Throws std::invalid_argument naming the first field out of range.
    void validate() const;

    static Config parse(int argc, char* argv[]);
};

// Applies the keys present in the YAML file at path. Throws std::runtime_error when the file
// cannot be read or a value has the wrong type.
void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Prowl
