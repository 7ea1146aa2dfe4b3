#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/clock.hpp"
#include "../../core/types/constants.hpp"
#include "../../core/types/crawl_types.hpp"
#include "../../network/http/http_client.hpp"
#include "../frontier/frontier.hpp"
#include "../job/job_controller.hpp"
#include "../sink/result_sink.hpp"

#ifndef CPPCHECK
class DispatcherTest_ProcessDiscardsResultOfCancelledJob_Test;
class DispatcherTest_FetchWithRecoveredLeaseChangesNothing_Test;
#endif

namespace Prowl {
namespace Engine {

struct DispatcherConfig {
    int                       threads          = Core::Constants::DEFAULT_THREADS;
    int                       workers          = Core::Constants::DEFAULT_WORKERS;
    int                       blocking_threads = Core::Constants::DEFAULT_BLOCKING_THREADS;
    std::chrono::milliseconds fetch_timeout{Core::Constants::DEFAULT_FETCH_TIMEOUT_MS};
    std::chrono::milliseconds idle_backoff{Core::Constants::WORKER_IDLE_BACKOFF_MS};
    std::chrono::milliseconds supervisor_interval{Core::Constants::SUPERVISOR_INTERVAL_MS};
    std::string               user_agent     = Core::Constants::USER_AGENT;
    bool                      handle_signals = true;
};

// Builds one client per worker. The pool is where clients run blocking transfers.
using ClientFactory =
    std::function<std::unique_ptr<Network::Http::HttpClient>(boost::asio::thread_pool& pool)>;

// Runs the pull loops. Each worker coroutine repeatedly takes a ready unit from the Frontier,
// fetches it, enqueues the discovered links, records the result and acks; failures go back to
// the Frontier for retry. A supervisor coroutine recovers expired leases and detects job
// completion. run() returns once every job is terminal or a stop was requested.
class Dispatcher {
#ifndef CPPCHECK
    friend class ::DispatcherTest_ProcessDiscardsResultOfCancelledJob_Test;
    friend class ::DispatcherTest_FetchWithRecoveredLeaseChangesNothing_Test;
#endif

public:
    Dispatcher(Frontier&               frontier,
               JobController&          jobs,
               ResultSink&             sink,
               const DispatcherConfig& config,
               ClientFactory           factory = {},
               Core::Clock&            clock   = Core::Clock::system());
    ~Dispatcher();
    Dispatcher(const Dispatcher&)            = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void run();
    void stop();
    bool interrupted() const {
        return interrupted_.load();
    }
    size_t processed() const {
        return processed_.load();
    }

    static Core::ErrorClass classify(const Response& res);

#ifdef CPPCHECK
public:
#else
private:
#endif
    Frontier&        frontier_;
    JobController&   jobs_;
    ResultSink&      sink_;
    DispatcherConfig config_;
    ClientFactory    factory_;
    Core::Clock&     clock_;

    boost::asio::thread_pool blocking_pool_;
    boost::asio::io_context  ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::signal_set  signals_{ioc_};

    std::atomic<bool>       done_{false};
    std::atomic<bool>       interrupted_{false};
    std::atomic<bool>       is_shutdown_{false};
    std::atomic<size_t>     processed_{0};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;

    void init_io_services();
    void init_signals();
    void spawn_workers();
    void await_completion();
    void trigger_done();
    void shutdown();

    std::unique_ptr<Network::Http::HttpClient> create_client();

    boost::asio::awaitable<void> worker_loop();
    boost::asio::awaitable<void> supervisor_loop();
    boost::asio::awaitable<void> process(Network::Http::HttpClient& client, Core::WorkUnit unit);

    void handle_success(const Core::WorkUnit& unit, const Response& res, int64_t duration_ms);
    void handle_failure(const Core::WorkUnit& unit,
                        const Response&       res,
                        Core::ErrorClass      error_class,
                        int64_t               duration_ms);
    void recover_leases();
    void fail_running_jobs(const std::string& reason);
};

}  // namespace Engine
}  // namespace Prowl
