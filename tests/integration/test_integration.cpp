#include <atomic>
#include <filesystem>
#include <fstream>
#ifndef CPPCHECK
#include <gtest/gtest.h>
#else
#define TEST(a, b) void a##_##b()
#define TEST_F(a, b) void a##_##b()
#define EXPECT_EQ(a, b)
#define EXPECT_TRUE(a)
#define EXPECT_FALSE(a)
#define ASSERT_TRUE(a)
namespace testing { class Test {}; }
#endif
#include <httplib.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>
#include "core/logger/logger.hpp"
#include "engine/dedup/dedup_store.hpp"
#include "engine/dispatcher/dispatcher.hpp"
#include "engine/frontier/frontier.hpp"
#include "engine/job/job_controller.hpp"
#include "engine/rate/rate_controller.hpp"
#include "engine/sink/result_sink.hpp"
#include "storage/file_store.hpp"

namespace fs = std::filesystem;
using namespace Prowl::Engine;
using namespace Prowl::Core;

class TestServer {
public:
    TestServer() {
    }

    void set_route(const std::string& path,
                   const std::string& content,
                   const std::string& type = "text/html") {
        server_.Get(path, [content, type](const httplib::Request&, httplib::Response& res) {
            res.set_content(content, type.c_str());
        });
    }

    // Answers with status for the first failures requests, then serves content.
    void set_flaky_route(const std::string& path, int failures, int status, const std::string& content) {
        auto remaining = std::make_shared<std::atomic<int>>(failures);
        server_.Get(path, [remaining, status, content](const httplib::Request&, httplib::Response& res) {
            if (remaining->fetch_sub(1) > 0) {
                res.status = status;
                return;
            }
            res.set_content(content, "text/html");
        });
    }

    void set_slow_route(const std::string& path, std::chrono::milliseconds delay) {
        server_.Get(path, [delay](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(delay);
            res.set_content("<html><body>late</body></html>", "text/html");
        });
    }

    void start(int port, const std::string& host = "127.0.0.1") {
        port_   = port;
        host_   = host;
        thread_ = std::thread([this, host, port]() { server_.listen(host.c_str(), port); });
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    void stop() {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    std::string url() const {
        return "http://" + host_ + ":" + std::to_string(port_);
    }

private:
    httplib::Server server_;
    std::thread     thread_;
    int             port_ = 0;
    std::string     host_ = "127.0.0.1";
};

// The crawl pipeline over a durable store, wired the way the CLI wires it.
struct Pipeline {
    Prowl::Storage::FileStore store;
    RateController            rate;
    DedupStore                dedup;
    Frontier                  frontier;
    ResultSink                sink;
    JobController             jobs;

    Pipeline(const std::string& state_dir, int max_depth, int max_retries)
        : store(state_dir),
          rate(rate_config()),
          dedup(store),
          frontier(store, dedup, rate, frontier_config(max_retries)),
          sink(store),
          jobs(store, frontier, max_depth) {
    }

    static RateConfig rate_config() {
        RateConfig cfg;
        cfg.politeness_interval    = std::chrono::milliseconds(20);
        cfg.domain_concurrency_cap = 2;
        cfg.failure_threshold      = 10;
        cfg.cooldown               = std::chrono::milliseconds(200);
        return cfg;
    }

    static FrontierConfig frontier_config(int max_retries) {
        FrontierConfig cfg;
        cfg.max_retries        = max_retries;
        cfg.retry_backoff_base = std::chrono::milliseconds(50);
        cfg.lease_timeout      = std::chrono::milliseconds(10000);
        return cfg;
    }

    void run(std::chrono::milliseconds fetch_timeout = std::chrono::milliseconds(2000)) {
        DispatcherConfig cfg;
        cfg.threads             = 1;
        cfg.workers             = 4;
        cfg.blocking_threads    = 2;
        cfg.fetch_timeout       = fetch_timeout;
        cfg.idle_backoff        = std::chrono::milliseconds(10);
        cfg.supervisor_interval = std::chrono::milliseconds(20);
        cfg.handle_signals      = false;

        Dispatcher dispatcher(frontier, jobs, sink, cfg);
        dispatcher.run();
    }
};

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(LOG_INFO);
        if (fs::exists("test_output"))
            fs::remove_all("test_output");
        fs::create_directory("test_output");
    }

    void TearDown() override {
        if (fs::exists("test_output"))
            fs::remove_all("test_output");
    }
};

TEST_F(IntegrationTest, BasicCrawlDiscovery) {
    TestServer server;
    server.set_route("/", "<html><body><a href='/a'>A</a></body></html>");
    server.set_route("/a", "<html><body><a href='/b'>B</a><a href='/'>Home</a></body></html>");
    server.set_route("/b", "<html><body><a href='/c'>C</a></body></html>");
    server.set_route("/c", "<html><body>Too deep</body></html>");
    server.start(8091);

    Pipeline    pipeline("test_output/state", 2, 1);
    std::string id = pipeline.jobs.start_job({server.url() + "/"});
    pipeline.run();

    EXPECT_EQ(pipeline.jobs.job(id)->status, JobStatus::Completed);
    EXPECT_EQ(pipeline.sink.count(id), 3u);
    EXPECT_TRUE(pipeline.sink.find(id, server.url() + "/b").has_value());
    EXPECT_FALSE(pipeline.sink.find(id, server.url() + "/c").has_value());

    pipeline.sink.export_json(id, "test_output/results.json");
    std::ifstream  in("test_output/results.json");
    nlohmann::json doc = nlohmann::json::parse(in);
    EXPECT_EQ(doc["results"].size(), 3u);

    server.stop();
}

TEST_F(IntegrationTest, ImageFiltering) {
    TestServer server;
    server.set_route(
        "/",
        "<html><body><img src='/logo.png'><a href='/logo.png'>Link to Image</a></body></html>");
    server.set_route("/logo.png", "FAKE_IMAGE_DATA", "image/png");
    server.start(8092);

    Pipeline    pipeline("test_output/state", 1, 1);
    std::string id = pipeline.jobs.start_job({server.url() + "/"});
    pipeline.run();

    EXPECT_EQ(pipeline.sink.count(id), 1u);
    EXPECT_FALSE(pipeline.sink.find(id, server.url() + "/logo.png").has_value());

    server.stop();
}

TEST_F(IntegrationTest, DomainRestriction) {
    TestServer server1;
    server1.set_route("/",
                      "<html><body><a href='http://localhost:8094/ext'>External</a></body></html>");
    server1.start(8093, "127.0.0.1");

    TestServer server2;
    server2.set_route("/ext", "<html><body>External Page</body></html>");
    server2.start(8094, "localhost");

    Pipeline    pipeline("test_output/state", 1, 1);
    std::string id = pipeline.jobs.start_job({server1.url() + "/"});
    pipeline.run();

    EXPECT_EQ(pipeline.jobs.job(id)->status, JobStatus::Completed);
    EXPECT_EQ(pipeline.sink.count(id), 1u);
    EXPECT_FALSE(pipeline.sink.find(id, "http://localhost:8094/ext").has_value());

    server1.stop();
    server2.stop();
}

TEST_F(IntegrationTest, RetryLogic) {
    TestServer server;
    server.set_route("/", "<html><body><a href='/flaky'>Flaky</a><a href='/gone'>Gone</a></body></html>");
    server.set_flaky_route("/flaky", 2, 503, "<html><body>Success after retry</body></html>");
    server.start(8095);

    Pipeline    pipeline("test_output/state", 1, 3);
    std::string id = pipeline.jobs.start_job({server.url() + "/"});
    pipeline.run();

    auto flaky = pipeline.sink.find(id, server.url() + "/flaky");
    ASSERT_TRUE(flaky.has_value());
    EXPECT_EQ(flaky->status, ResultStatus::Success);
    EXPECT_EQ(flaky->attempts, 3);

    auto gone = pipeline.sink.find(id, server.url() + "/gone");
    ASSERT_TRUE(gone.has_value());
    EXPECT_EQ(gone->status, ResultStatus::Failure);
    EXPECT_EQ(gone->error_class, ErrorClass::ClientError);
    EXPECT_EQ(gone->attempts, 1);

    server.stop();
}

TEST_F(IntegrationTest, FetchTimeout) {
    TestServer server;
    server.set_slow_route("/", std::chrono::milliseconds(1500));
    server.start(8096);

    Pipeline    pipeline("test_output/state", 0, 0);
    std::string id = pipeline.jobs.start_job({server.url() + "/"});
    pipeline.run(std::chrono::milliseconds(300));

    auto result = pipeline.sink.find(id, server.url() + "/");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ResultStatus::Failure);
    EXPECT_EQ(result->error_class, ErrorClass::Timeout);
    EXPECT_FALSE(result->http_status.has_value());

    server.stop();
}

TEST_F(IntegrationTest, ResumeAfterRestart) {
    TestServer server;
    server.set_route("/", "<html><body><a href='/a'>A</a></body></html>");
    server.set_route("/a", "<html><body>A</body></html>");
    server.start(8097);

    std::string id;
    {
        // Seeded but never dispatched, as if the process died right after start.
        Pipeline first("test_output/state", 1, 1);
        id = first.jobs.start_job({server.url() + "/"});
    }

    Pipeline second("test_output/state", 1, 1);
    EXPECT_EQ(second.jobs.restore(), 1u);
    EXPECT_EQ(second.frontier.restore(), 1u);
    second.run();

    EXPECT_EQ(second.jobs.job(id)->status, JobStatus::Completed);
    EXPECT_EQ(second.sink.count(id), 2u);

    server.stop();
}
