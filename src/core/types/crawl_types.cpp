#include "crawl_types.hpp"
#include <stdexcept>

namespace Prowl {
namespace Core {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(EntryState state) {
    switch (state) {
        case EntryState::Queued: return "queued";
        case EntryState::InFlight: return "in_flight";
        case EntryState::Done: return "done";
        case EntryState::Retrying: return "retrying";
        case EntryState::Dead: return "dead";
    }
    return "unknown";
}

const char* to_string(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::None: return "none";
        case ErrorClass::Timeout: return "timeout";
        case ErrorClass::Network: return "network";
        case ErrorClass::RateLimited: return "rate_limited";
        case ErrorClass::ServerError: return "server_error";
        case ErrorClass::ClientError: return "client_error";
        case ErrorClass::InvalidUrl: return "invalid_url";
        case ErrorClass::LeaseExpired: return "lease_expired";
    }
    return "unknown";
}

const char* to_string(ResultStatus status) {
    return status == ResultStatus::Success ? "success" : "failure";
}

const char* to_string(BreakerState state) {
    switch (state) {
        case BreakerState::Closed: return "closed";
        case BreakerState::Open: return "open";
        case BreakerState::HalfOpen: return "half_open";
    }
    return "unknown";
}

JobStatus job_status_from_string(const std::string& name) {
    for (auto s : {JobStatus::Running, JobStatus::Completed, JobStatus::Cancelled, JobStatus::Failed})
        if (name == to_string(s))
            return s;
    throw std::invalid_argument("Unknown job status: " + name);
}

EntryState entry_state_from_string(const std::string& name) {
    for (auto s : {EntryState::Queued,
                   EntryState::InFlight,
                   EntryState::Done,
                   EntryState::Retrying,
                   EntryState::Dead})
        if (name == to_string(s))
            return s;
    throw std::invalid_argument("Unknown entry state: " + name);
}

ErrorClass error_class_from_string(const std::string& name) {
    for (auto c : {ErrorClass::None,
                   ErrorClass::Timeout,
                   ErrorClass::Network,
                   ErrorClass::RateLimited,
                   ErrorClass::ServerError,
                   ErrorClass::ClientError,
                   ErrorClass::InvalidUrl,
                   ErrorClass::LeaseExpired})
        if (name == to_string(c))
            return c;
    throw std::invalid_argument("Unknown error class: " + name);
}

bool is_retryable(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::Timeout:
        case ErrorClass::Network:
        case ErrorClass::RateLimited:
        case ErrorClass::ServerError:
        case ErrorClass::LeaseExpired: return true;
        default: return false;
    }
}

bool is_terminal(JobStatus status) {
    return status != JobStatus::Running;
}

void to_json(nlohmann::json& j, const CrawlJob& job) {
    j = nlohmann::json{{"id", job.id},
                       {"seeds", job.seeds},
                       {"max_depth", job.max_depth},
                       {"status", to_string(job.status)},
                       {"created_at", to_epoch_ms(job.created_at)},
                       {"reason", job.reason}};
}

void from_json(const nlohmann::json& j, CrawlJob& job) {
    job.id         = j.at("id").get<std::string>();
    job.seeds      = j.at("seeds").get<std::vector<std::string>>();
    job.max_depth  = j.at("max_depth").get<int>();
    job.status     = job_status_from_string(j.at("status").get<std::string>());
    job.created_at = from_epoch_ms(j.at("created_at").get<int64_t>());
    job.reason     = j.value("reason", "");
}

void to_json(nlohmann::json& j, const FrontierEntry& entry) {
    j = nlohmann::json{{"id", entry.id},
                       {"url", entry.url},
                       {"job", entry.job_id},
                       {"domain", entry.domain},
                       {"depth", entry.depth},
                       {"attempt", entry.attempt},
                       {"lease", entry.lease},
                       {"state", to_string(entry.state)},
                       {"discovered_at", to_epoch_ms(entry.discovered_at)},
                       {"ready_at", to_epoch_ms(entry.ready_at)},
                       {"lease_expires", to_epoch_ms(entry.lease_expires)},
                       {"last_error", to_string(entry.last_error)}};
}

void from_json(const nlohmann::json& j, FrontierEntry& entry) {
    entry.id            = j.at("id").get<uint64_t>();
    entry.url           = j.at("url").get<std::string>();
    entry.job_id        = j.at("job").get<std::string>();
    entry.domain        = j.at("domain").get<std::string>();
    entry.depth         = j.at("depth").get<int>();
    entry.attempt       = j.at("attempt").get<int>();
    entry.lease         = j.at("lease").get<uint64_t>();
    entry.state         = entry_state_from_string(j.at("state").get<std::string>());
    entry.discovered_at = from_epoch_ms(j.at("discovered_at").get<int64_t>());
    entry.ready_at      = from_epoch_ms(j.at("ready_at").get<int64_t>());
    entry.lease_expires = from_epoch_ms(j.at("lease_expires").get<int64_t>());
    entry.last_error    = error_class_from_string(j.value("last_error", "none"));
}

void to_json(nlohmann::json& j, const CrawlResult& result) {
    j = nlohmann::json{{"job", result.job_id},
                       {"url", result.url},
                       {"depth", result.depth},
                       {"status", to_string(result.status)},
                       {"links", result.links},
                       {"error_class", to_string(result.error_class)},
                       {"duration_ms", result.duration_ms},
                       {"attempts", result.attempts}};
    if (result.http_status)
        j["http_status"] = *result.http_status;
}

void from_json(const nlohmann::json& j, CrawlResult& result) {
    result.job_id = j.at("job").get<std::string>();
    result.url    = j.at("url").get<std::string>();
    result.depth  = j.at("depth").get<int>();
    result.status = j.at("status").get<std::string>() == "success" ? ResultStatus::Success
                                                                   : ResultStatus::Failure;
    result.links       = j.value("links", std::vector<std::string>{});
    result.error_class = error_class_from_string(j.value("error_class", "none"));
    result.duration_ms = j.value("duration_ms", int64_t{0});
    result.attempts    = j.value("attempts", 1);
    if (j.contains("http_status"))
        result.http_status = j.at("http_status").get<long>();
    else
        result.http_status.reset();
}

}  // namespace Core
}  // namespace Prowl
