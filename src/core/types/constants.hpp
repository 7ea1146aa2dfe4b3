#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace Prowl {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS          = 2;   // IO Threads
    static constexpr int         DEFAULT_WORKERS          = 16;  // Pull-loop coroutines
    static constexpr int         DEFAULT_BLOCKING_THREADS = 8;   // Fetch pool
    static constexpr int         DEFAULT_MAX_CRAWL_DEPTH  = 3;
    static constexpr const char* DEFAULT_OUTPUT_DIR       = "output";
    static constexpr const char* DEFAULT_STATE_DIR        = "state";
    static constexpr const char* VERSION                  = "0.1.0";
    static constexpr const char* USER_AGENT               = "Prowl-Crawler/1.0";

    static constexpr int64_t DEFAULT_POLITENESS_INTERVAL_MS = 500;
    static constexpr int     DEFAULT_DOMAIN_CONCURRENCY_CAP = 2;
    static constexpr int     DEFAULT_MAX_RETRIES            = 2;
    static constexpr int64_t DEFAULT_RETRY_BACKOFF_BASE_MS  = 500;
    static constexpr int     DEFAULT_FAILURE_THRESHOLD      = 5;
    static constexpr int64_t DEFAULT_COOLDOWN_MS            = 30000;
    static constexpr int64_t DEFAULT_LEASE_TIMEOUT_MS       = 60000;
    static constexpr int64_t DEFAULT_FETCH_TIMEOUT_MS       = 10000;

    static constexpr int64_t WORKER_IDLE_BACKOFF_MS  = 50;
    static constexpr int64_t SUPERVISOR_INTERVAL_MS  = 250;
    static constexpr int64_t MAX_RETRY_BACKOFF_MS    = 5 * 60 * 1000;
    static constexpr int     SEED_PARENT_DEPTH       = -1;
};

// base * 2^(attempt-1), capped. attempt is 1 for the first retry.
inline std::chrono::milliseconds get_backoff_time(int attempt, int64_t base_ms) {
    if (attempt <= 0 || base_ms <= 0)
        return std::chrono::milliseconds(0);
    int64_t delay = base_ms;
    for (int i = 1; i < attempt && delay < Constants::MAX_RETRY_BACKOFF_MS; ++i)
        delay *= 2;
    if (delay > Constants::MAX_RETRY_BACKOFF_MS)
        delay = Constants::MAX_RETRY_BACKOFF_MS;
    return std::chrono::milliseconds(delay);
}

}  // namespace Core
}  // namespace Prowl
