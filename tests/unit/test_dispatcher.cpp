#include <utility>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include "../../src/engine/dedup/dedup_store.hpp"
#include "../../src/engine/dispatcher/dispatcher.hpp"
#include "../../src/engine/frontier/frontier.hpp"
#include "../../src/engine/job/job_controller.hpp"
#include "../../src/engine/rate/rate_controller.hpp"
#include "../../src/engine/sink/result_sink.hpp"
#include "../support/failing_store.hpp"
#include "../support/fake_web.hpp"

using namespace Prowl::Engine;
using namespace Prowl::Core;
using namespace Prowl::Testing;
using Prowl::Network::Http::ErrorType;
using std::chrono::milliseconds;

class DispatcherTest : public ::testing::Test {
protected:
    ManualClock                     clock;
    FailingStore                    store;
    FakeWeb                         web;
    DedupStore                      dedup{store};
    ResultSink                      sink{store};
    std::unique_ptr<RateController> rate;
    std::unique_ptr<Frontier>       frontier;
    std::unique_ptr<JobController>  jobs;

    void build(int max_depth = 2, int max_retries = 3, int64_t politeness_ms = 0) {
        RateConfig rcfg;
        rcfg.politeness_interval    = milliseconds(politeness_ms);
        rcfg.domain_concurrency_cap = 4;
        rcfg.failure_threshold      = 100;
        rcfg.cooldown               = milliseconds(100);

        FrontierConfig fcfg;
        fcfg.max_retries        = max_retries;
        fcfg.retry_backoff_base = milliseconds(10);
        fcfg.lease_timeout      = milliseconds(30000);

        rate     = std::make_unique<RateController>(rcfg);
        frontier = std::make_unique<Frontier>(store, dedup, *rate, fcfg);
        jobs     = std::make_unique<JobController>(store, *frontier, max_depth);
    }

    void SetUp() override {
        build();
    }

    static DispatcherConfig dispatcher_config() {
        DispatcherConfig cfg;
        cfg.threads             = 2;
        cfg.workers             = 4;
        cfg.blocking_threads    = 2;
        cfg.fetch_timeout       = milliseconds(1000);
        cfg.idle_backoff        = milliseconds(5);
        cfg.supervisor_interval = milliseconds(10);
        cfg.handle_signals      = false;
        return cfg;
    }

    ClientFactory fake_clients() {
        return [this](boost::asio::thread_pool&) { return std::make_unique<FakeHttpClient>(web); };
    }

    // Runs the dispatcher, stopping it if it has not finished within the limit.
    void run(Dispatcher& dispatcher, std::chrono::seconds limit = std::chrono::seconds(20)) {
        std::promise<void> finished;
        auto               future = finished.get_future();
        std::thread        watchdog([&]() {
            if (future.wait_for(limit) == std::future_status::timeout)
                dispatcher.stop();
        });
        dispatcher.run();
        finished.set_value();
        watchdog.join();
    }

    void crawl() {
        Dispatcher dispatcher(*frontier, *jobs, sink, dispatcher_config(), fake_clients());
        run(dispatcher);
    }
};

TEST_F(DispatcherTest, CrawlsToMaxDepthFetchingEachPageOnce) {
    build(1);
    web.page("https://a.test/", R"(<a href="/b">b</a> <a href="/">home</a> <a href="https://a.test">again</a>)");
    web.page("https://a.test/b", R"(<a href="/c">c</a> <a href="/">home</a>)");
    web.page("https://a.test/c", "<p>too deep</p>");

    std::string id = jobs->start_job({"a.test"});
    crawl();

    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
    EXPECT_EQ(web.fetch_count("https://a.test/"), 1);
    EXPECT_EQ(web.fetch_count("https://a.test/b"), 1);
    EXPECT_EQ(web.fetch_count("https://a.test/c"), 0);

    EXPECT_EQ(sink.count(id), 2u);
    auto b = sink.find(id, "https://a.test/b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->depth, 1);
    EXPECT_EQ(b->status, ResultStatus::Success);
    EXPECT_EQ(b->links, (std::vector<std::string>{"https://a.test/c", "https://a.test/"}));
    EXPECT_TRUE(store.scan("frontier/").empty());
}

TEST_F(DispatcherTest, OffDomainLinksAreNotFollowed) {
    web.page("https://a.test/", R"(<a href="https://other.test/">elsewhere</a>)");
    web.page("https://other.test/", "<p>never</p>");

    std::string id = jobs->start_job({"a.test"});
    crawl();

    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
    EXPECT_EQ(web.fetch_count("https://other.test/"), 0);
    EXPECT_EQ(sink.find(id, "https://a.test/")->links.size(), 1u);
}

TEST_F(DispatcherTest, ServerErrorsAreRetried) {
    web.script("https://a.test/", 500);
    web.script("https://a.test/", 503);
    web.page("https://a.test/", "<p>finally</p>");

    std::string id = jobs->start_job({"a.test"});
    crawl();

    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
    EXPECT_EQ(web.fetch_count("https://a.test/"), 3);
    auto result = sink.find(id, "https://a.test/");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ResultStatus::Success);
    EXPECT_EQ(result->attempts, 3);
}

TEST_F(DispatcherTest, RetriesExhaustedRecordFailure) {
    build(2, 2);
    for (int i = 0; i < 5; ++i)
        web.script_error("https://a.test/", ErrorType::Timeout);

    std::string id = jobs->start_job({"a.test"});
    crawl();

    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
    EXPECT_EQ(web.fetch_count("https://a.test/"), 3);
    auto result = sink.find(id, "https://a.test/");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ResultStatus::Failure);
    EXPECT_EQ(result->error_class, ErrorClass::Timeout);
    EXPECT_FALSE(result->http_status.has_value());
    EXPECT_EQ(result->attempts, 3);
}

TEST_F(DispatcherTest, ClientErrorIsNotRetried) {
    web.page("https://a.test/", R"(<a href="/missing">gone</a>)");

    std::string id = jobs->start_job({"a.test"});
    crawl();

    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
    EXPECT_EQ(web.fetch_count("https://a.test/missing"), 1);
    auto result = sink.find(id, "https://a.test/missing");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ResultStatus::Failure);
    EXPECT_EQ(result->error_class, ErrorClass::ClientError);
    EXPECT_EQ(result->http_status.value_or(0), 404);
    EXPECT_EQ(frontier->stats(id).dead, 1u);
}

TEST_F(DispatcherTest, PolitenessSpacesFetchesPerDomain) {
    build(2, 3, 100);
    web.page("https://a.test/",
             R"(<a href="/1">1</a><a href="/2">2</a><a href="/3">3</a><a href="https://b.test/">b</a>)");
    web.page("https://b.test/", "<p>b</p>");

    std::string id = jobs->start_job({"a.test", "b.test"});
    crawl();

    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
    auto times = web.fetch_times("a.test");
    ASSERT_EQ(times.size(), 4u);
    std::sort(times.begin(), times.end());
    for (size_t i = 1; i < times.size(); ++i) {
        auto gap = std::chrono::duration_cast<milliseconds>(times[i] - times[i - 1]);
        EXPECT_GE(gap.count(), 80) << "fetch " << i;
    }
    EXPECT_EQ(web.fetch_count("https://b.test/"), 1);
}

TEST_F(DispatcherTest, JobsCrawlIndependently) {
    web.page("https://a.test/", R"(<a href="/x">x</a>)");
    web.page("https://a.test/x", "<p>x</p>");

    std::string first  = jobs->start_job({"a.test"});
    std::string second = jobs->start_job({"https://a.test/"});
    crawl();

    EXPECT_EQ(jobs->job(first)->status, JobStatus::Completed);
    EXPECT_EQ(jobs->job(second)->status, JobStatus::Completed);
    EXPECT_EQ(web.fetch_count("https://a.test/x"), 2);
    EXPECT_EQ(sink.count(first), 2u);
    EXPECT_EQ(sink.count(second), 2u);
}

TEST_F(DispatcherTest, CancelledJobIsNotCrawled) {
    web.page("https://a.test/", "<p>a</p>");
    web.page("https://b.test/", "<p>b</p>");

    std::string kept      = jobs->start_job({"a.test"});
    std::string cancelled = jobs->start_job({"b.test"});
    ASSERT_TRUE(jobs->cancel_job(cancelled));
    crawl();

    EXPECT_EQ(jobs->job(kept)->status, JobStatus::Completed);
    EXPECT_EQ(jobs->job(cancelled)->status, JobStatus::Cancelled);
    EXPECT_EQ(web.fetch_count("https://b.test/"), 0);
    EXPECT_EQ(sink.count(cancelled), 0u);
}

TEST_F(DispatcherTest, ProcessDiscardsResultOfCancelledJob) {
    web.page("https://a.test/", R"(<a href="/next">next</a>)");
    std::string id   = jobs->start_job({"a.test"});
    auto        unit = frontier->dequeue_ready();
    ASSERT_TRUE(unit.has_value());
    ASSERT_TRUE(jobs->cancel_job(id));

    Dispatcher              dispatcher(*frontier, *jobs, sink, dispatcher_config(), fake_clients());
    FakeHttpClient          client(web);
    boost::asio::io_context ioc;
    boost::asio::co_spawn(ioc, dispatcher.process(client, *unit), boost::asio::detached);
    ioc.run();

    EXPECT_EQ(dispatcher.processed(), 1u);
    EXPECT_EQ(web.fetch_count("https://a.test/"), 1);
    EXPECT_EQ(sink.count(id), 0u);
    EXPECT_EQ(frontier->stats(id).done, 1u);
    EXPECT_TRUE(frontier->drained(id));
    EXPECT_FALSE(dedup.find(id, "https://a.test/next").has_value());
    EXPECT_EQ(jobs->job(id)->status, JobStatus::Cancelled);
}

TEST_F(DispatcherTest, FetchWithRecoveredLeaseChangesNothing) {
    RateConfig rcfg;
    rcfg.politeness_interval = milliseconds(0);
    FrontierConfig fcfg;
    fcfg.max_retries   = 0;
    fcfg.lease_timeout = milliseconds(1000);

    jobs.reset();
    frontier.reset();
    rate     = std::make_unique<RateController>(rcfg, clock);
    frontier = std::make_unique<Frontier>(store, dedup, *rate, fcfg, clock);
    jobs     = std::make_unique<JobController>(store, *frontier, 2, clock);

    web.page("https://a.test/", R"(<a href="/next">next</a>)");
    std::string id   = jobs->start_job({"a.test"});
    auto        unit = frontier->dequeue_ready();
    ASSERT_TRUE(unit.has_value());

    clock.advance(milliseconds(2000));
    Dispatcher dispatcher(*frontier, *jobs, sink, dispatcher_config(), fake_clients(), clock);
    dispatcher.recover_leases();
    ASSERT_EQ(frontier->stats(id).dead, 1u);
    EXPECT_FALSE(frontier->owns(*unit));

    FakeHttpClient          client(web);
    boost::asio::io_context ioc;
    boost::asio::co_spawn(ioc, dispatcher.process(client, *unit), boost::asio::detached);
    ioc.run();

    EXPECT_EQ(web.fetch_count("https://a.test/"), 1);
    auto recorded = sink.find(id, "https://a.test/");
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(recorded->status, ResultStatus::Failure);
    EXPECT_EQ(recorded->error_class, ErrorClass::LeaseExpired);
    EXPECT_FALSE(dedup.find(id, "https://a.test/next").has_value());
    EXPECT_EQ(frontier->stats(id).done, 0u);
    EXPECT_EQ(jobs->job(id)->status, JobStatus::Completed);
}

TEST_F(DispatcherTest, StoreFailureFailsRunningJobs) {
    web.page("https://a.test/", "<p>a</p>");
    std::string id = jobs->start_job({"a.test"});
    store.fail_writes(true, "frontier/");
    crawl();

    auto job = jobs->job(id);
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_EQ(job->reason, "store unavailable");
    EXPECT_EQ(web.fetch_count("https://a.test/"), 0);
}

TEST_F(DispatcherTest, StopLeavesJobsRunning) {
    build(2, 1000);
    for (int i = 0; i < 1000; ++i)
        web.script("https://a.test/", 503);

    std::string id = jobs->start_job({"a.test"});
    Dispatcher  dispatcher(*frontier, *jobs, sink, dispatcher_config(), fake_clients());
    run(dispatcher, std::chrono::seconds(1));

    EXPECT_FALSE(dispatcher.interrupted());
    EXPECT_TRUE(jobs->is_running(id));
    EXPECT_GE(web.fetch_count("https://a.test/"), 1);
    EXPECT_EQ(sink.count(id), 0u);
}

TEST(DispatcherClassifyTest, MapsResponsesToErrorClasses) {
    Prowl::Response res;
    res.status_code = 200;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::None);
    res.status_code = 301;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::None);
    res.status_code = 404;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::ClientError);
    res.status_code = 429;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::RateLimited);
    res.status_code = 502;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::ServerError);

    res.status_code = 0;
    res.error_type  = ErrorType::Timeout;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::Timeout);
    res.error_type = ErrorType::InvalidUrl;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::InvalidUrl);
    res.error_type = ErrorType::Network;
    EXPECT_EQ(Dispatcher::classify(res), ErrorClass::Network);
}
