#include <utility>
#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cctype>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/text/link_extractor.hpp"
#include "../dispatcher.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;
using namespace Prowl::Network::Http;
using Prowl::Utils::Text::LinkExtractor;

namespace {

bool is_html(const Response& res) {
    if (res.content_type.empty())
        return true;
    std::string type = res.content_type;
    std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return type.find("html") != std::string::npos;
}

CrawlResult base_result(const WorkUnit& unit, int64_t duration_ms) {
    CrawlResult result;
    result.job_id      = unit.job_id;
    result.url         = unit.url;
    result.depth       = unit.depth;
    result.duration_ms = duration_ms;
    result.attempts    = unit.attempt + 1;
    return result;
}

}  // namespace

ErrorClass Dispatcher::classify(const Response& res) {
    if (res.status_code == static_cast<long>(HTTPCode::NetworkError)) {
        switch (res.error_type) {
            case ErrorType::Timeout:
                return ErrorClass::Timeout;
            case ErrorType::InvalidUrl:
                return ErrorClass::InvalidUrl;
            default:
                return ErrorClass::Network;
        }
    }
    if (res.status_code == static_cast<long>(HTTPCode::TooManyRequests))
        return ErrorClass::RateLimited;
    if (res.status_code >= static_cast<long>(HTTPCode::ServerError))
        return ErrorClass::ServerError;
    if (res.status_code >= static_cast<long>(HTTPCode::ClientError))
        return ErrorClass::ClientError;
    return ErrorClass::None;
}

boost::asio::awaitable<void> Dispatcher::worker_loop() {
    try {
        auto                      client = create_client();
        boost::asio::steady_timer timer(ioc_);

        while (!done_) {
            std::optional<WorkUnit> unit;
            try {
                unit = frontier_.dequeue_ready();
            } catch (const Storage::StoreError& e) {
                fail_running_jobs(e.what());
            }

            if (!unit) {
                timer.expires_after(config_.idle_backoff);
                boost::system::error_code ec;
                co_await                  timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            co_await process(*client, std::move(*unit));
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }
}

boost::asio::awaitable<void> Dispatcher::supervisor_loop() {
    boost::asio::steady_timer timer(ioc_);

    while (!done_) {
        try {
            recover_leases();
            jobs_.poll();
        } catch (const Storage::StoreError& e) {
            fail_running_jobs(e.what());
        }

        if (jobs_.all_terminal()) {
            Logger::info("Dispatcher: all jobs finished");
            trigger_done();
            co_return;
        }

        timer.expires_after(config_.supervisor_interval);
        boost::system::error_code ec;
        co_await                  timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

boost::asio::awaitable<void> Dispatcher::process(HttpClient& client, WorkUnit unit) {
    Logger::info("Fetching: " + unit.url + " (Depth " + std::to_string(unit.depth) + ")"
                 + (unit.attempt > 0 ? " [Retry " + std::to_string(unit.attempt) + "]" : ""));

    auto     started = std::chrono::steady_clock::now();
    Response res     = co_await client.get(unit.url);
    int64_t  elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - started)
                          .count();

    ErrorClass error_class = classify(res);
    try {
        if (!jobs_.is_running(unit.job_id)) {
            // Cancelled or failed while in flight: settle the entry, keep nothing.
            if (error_class == ErrorClass::None)
                frontier_.ack(unit);
            else
                frontier_.fail(unit, false, error_class);
            Logger::debug("Discarded result of inactive job for " + unit.url);
        }
        else if (error_class == ErrorClass::None) {
            handle_success(unit, res, elapsed);
        }
        else {
            handle_failure(unit, res, error_class, elapsed);
        }
        jobs_.check_completion(unit.job_id);
    } catch (const Storage::StoreError& e) {
        jobs_.fail_job(unit.job_id, e.what());
    }
    processed_++;
}

void Dispatcher::handle_success(const WorkUnit& unit, const Response& res, int64_t duration_ms) {
    // A recovered lease means the entry was already retried or recorded Dead elsewhere.
    if (!frontier_.owns(unit)) {
        Logger::debug("Lease lost, dropping fetch of " + unit.url);
        return;
    }

    CrawlResult result = base_result(unit, duration_ms);
    result.status      = ResultStatus::Success;
    result.http_status = res.status_code;

    if (is_html(res)) {
        std::string base = res.effective_url.empty() ? unit.url : res.effective_url;
        result.links     = LinkExtractor::extract_absolute(base, res.body);
    }

    size_t admitted = 0;
    for (const auto& link : result.links) {
        if (frontier_.enqueue(unit.job_id, link, unit.depth) == EnqueueOutcome::Admitted)
            ++admitted;
    }

    sink_.record(result);
    if (!frontier_.ack(unit)) {
        Logger::debug("Late ack ignored for " + unit.url);
        return;
    }
    Logger::success("Crawled: " + unit.url + " (" + std::to_string(result.links.size())
                    + " links, " + std::to_string(admitted) + " new)");
}

void Dispatcher::handle_failure(const WorkUnit& unit,
                                const Response& res,
                                ErrorClass      error_class,
                                int64_t         duration_ms) {
    FailOutcome outcome = frontier_.fail(unit, is_retryable(error_class), error_class);
    if (outcome != FailOutcome::Dead)
        return;

    CrawlResult result = base_result(unit, duration_ms);
    result.status      = ResultStatus::Failure;
    result.error_class = error_class;
    if (res.status_code != static_cast<long>(HTTPCode::NetworkError))
        result.http_status = res.status_code;
    sink_.record(result);
}

void Dispatcher::recover_leases() {
    for (const auto& entry : frontier_.recover_expired_leases()) {
        if (entry.state != EntryState::Dead || !jobs_.is_running(entry.job_id))
            continue;

        CrawlResult result;
        result.job_id      = entry.job_id;
        result.url         = entry.url;
        result.depth       = entry.depth;
        result.status      = ResultStatus::Failure;
        result.error_class = ErrorClass::LeaseExpired;
        result.attempts    = entry.attempt + 1;
        try {
            sink_.record(result);
        } catch (const Storage::StoreError& e) {
            jobs_.fail_job(entry.job_id, e.what());
        }
    }
}

void Dispatcher::fail_running_jobs(const std::string& reason) {
    Logger::error("Store unavailable: " + reason);
    for (const auto& id : jobs_.running_jobs())
        jobs_.fail_job(id, reason);
}

}  // namespace Engine
}  // namespace Prowl
