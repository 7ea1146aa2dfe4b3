#include "dispatcher.hpp"
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "../../core/logger/logger.hpp"
#include "../../network/http/curl_client.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;
using namespace Prowl::Network::Http;

Dispatcher::Dispatcher(Frontier&               frontier,
                       JobController&          jobs,
                       ResultSink&             sink,
                       const DispatcherConfig& config,
                       ClientFactory           factory,
                       Clock&                  clock)
    : frontier_(frontier),
      jobs_(jobs),
      sink_(sink),
      config_(config),
      factory_(std::move(factory)),
      clock_(clock),
      blocking_pool_(static_cast<size_t>(std::max(1, config.blocking_threads))) {
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::run() {
    done_ = false;

    init_io_services();
    init_signals();
    spawn_workers();
    Logger::info("Dispatcher: " + std::to_string(config_.workers) + " workers on "
                 + std::to_string(config_.threads) + " IO threads, awaiting completion...");
    await_completion();
    shutdown();
}

void Dispatcher::stop() {
    trigger_done();
}

std::unique_ptr<HttpClient> Dispatcher::create_client() {
    std::unique_ptr<HttpClient> client;
    if (factory_)
        client = factory_(blocking_pool_);
    else
        client = std::make_unique<CurlClient>(blocking_pool_);

    client->set_timeout(config_.fetch_timeout);
    client->set_user_agent(config_.user_agent);
    return client;
}

void Dispatcher::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < config_.threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
                trigger_done();
            }
        });
    }
}

void Dispatcher::init_signals() {
    if (!config_.handle_signals)
        return;

    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::warn("Signal " + std::to_string(signal_number)
                         + " received. Stopping; unfinished jobs can be resumed.");
            interrupted_ = true;
            trigger_done();
        }
    });
}

void Dispatcher::spawn_workers() {
    boost::asio::co_spawn(ioc_, supervisor_loop(), boost::asio::detached);
    for (int i = 0; i < config_.workers; ++i) {
        boost::asio::co_spawn(ioc_, worker_loop(), boost::asio::detached);
    }
}

void Dispatcher::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Dispatcher::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void Dispatcher::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    done_ = true;
    Logger::debug("Dispatcher: shutting down...");

    signals_.cancel();
    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    blocking_pool_.stop();
    blocking_pool_.join();
    Logger::debug("Dispatcher: " + std::to_string(processed_.load()) + " units processed.");
}

}  // namespace Engine
}  // namespace Prowl
