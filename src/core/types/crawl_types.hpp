#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"

namespace Prowl {
namespace Core {

enum class JobStatus { Running, Completed, Cancelled, Failed };

enum class EntryState { Queued, InFlight, Done, Retrying, Dead };

enum class ErrorClass {
    None,
    Timeout,
    Network,
    RateLimited,
    ServerError,
    ClientError,
    InvalidUrl,
    LeaseExpired
};

enum class ResultStatus { Success, Failure };

enum class BreakerState { Closed, Open, HalfOpen };

const char* to_string(JobStatus status);
const char* to_string(EntryState state);
const char* to_string(ErrorClass error_class);
const char* to_string(ResultStatus status);
const char* to_string(BreakerState state);

JobStatus  job_status_from_string(const std::string& name);
EntryState entry_state_from_string(const std::string& name);
ErrorClass error_class_from_string(const std::string& name);

bool is_retryable(ErrorClass error_class);
bool is_terminal(JobStatus status);

struct CrawlJob {
    std::string              id;
    std::vector<std::string> seeds;
    int                      max_depth = 0;
    JobStatus                status    = JobStatus::Running;
    TimePoint                created_at;
    std::string              reason;  // why a job Failed
};

struct FrontierEntry {
    uint64_t    id = 0;
    std::string url;  // normalized
    std::string job_id;
    std::string domain;
    int         depth   = 0;
    int         attempt = 0;  // completed failed dispatches
    uint64_t    lease   = 0;  // bumped on every dispatch
    EntryState  state   = EntryState::Queued;
    TimePoint   discovered_at;
    TimePoint   ready_at;        // Retrying: when the entry returns to Queued
    TimePoint   lease_expires;   // InFlight: liveness deadline
    ErrorClass  last_error = ErrorClass::None;
};

// What a worker receives from the Frontier.
struct WorkUnit {
    uint64_t    entry_id = 0;
    uint64_t    lease    = 0;
    std::string job_id;
    std::string url;
    int         depth = 0;
    std::string domain;
    int         attempt = 0;
};

struct DomainState {
    std::string     domain;
    SteadyTimePoint last_dispatch;
    bool            dispatched_before    = false;
    int             in_flight            = 0;
    int             consecutive_failures = 0;
    BreakerState    breaker              = BreakerState::Closed;
    SteadyTimePoint open_until;
    bool            probe_in_flight = false;
};

struct VisitedRecord {
    std::string job_id;
    std::string url;
    int         first_seen_depth = 0;
};

struct CrawlResult {
    std::string              job_id;
    std::string              url;
    int                      depth = 0;
    ResultStatus             status = ResultStatus::Success;
    std::vector<std::string> links;
    std::optional<long>      http_status;
    ErrorClass               error_class = ErrorClass::None;
    int64_t                  duration_ms = 0;
    int                      attempts    = 1;
};

void to_json(nlohmann::json& j, const CrawlJob& job);
void from_json(const nlohmann::json& j, CrawlJob& job);
void to_json(nlohmann::json& j, const FrontierEntry& entry);
void from_json(const nlohmann::json& j, FrontierEntry& entry);
void to_json(nlohmann::json& j, const CrawlResult& result);
void from_json(const nlohmann::json& j, CrawlResult& result);

}  // namespace Core
}  // namespace Prowl
