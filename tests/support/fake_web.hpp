#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../../src/network/http/http_client.hpp"
#include "../../src/utils/url/url.hpp"

namespace Prowl {
namespace Testing {

// Scripted web shared by every FakeHttpClient of a test. Unknown URLs answer 404.
class FakeWeb {
public:
    void page(const std::string& url, const std::string& html, long status = 200) {
        std::lock_guard<std::mutex> lock(mutex_);
        Response                    res;
        res.effective_url = url;
        res.status_code   = status;
        res.content_type  = "text/html; charset=utf-8";
        res.body          = html;
        res.success       = status >= 200 && status < 400;
        pages_[Utils::Url::normalize(url)] = res;
    }

    // Responses handed out in order before falling back to the page (or 404).
    void script(const std::string& url, long status) {
        std::lock_guard<std::mutex> lock(mutex_);
        Response                    res;
        res.effective_url = url;
        res.status_code   = status;
        res.success       = status >= 200 && status < 400;
        scripted_[Utils::Url::normalize(url)].push_back(res);
    }

    void script_error(const std::string& url, Network::Http::ErrorType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        Response                    res;
        res.effective_url = url;
        res.status_code   = 0;
        res.error_type    = type;
        res.error         = "scripted transport error";
        scripted_[Utils::Url::normalize(url)].push_back(res);
    }

    Response respond(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string                 key = Utils::Url::normalize(url);
        fetches_[key]++;
        fetch_times_[Utils::Url::domain_of(key)].push_back(std::chrono::steady_clock::now());
        log_.push_back(key);

        auto scripted = scripted_.find(key);
        if (scripted != scripted_.end() && !scripted->second.empty()) {
            Response res = scripted->second.front();
            scripted->second.pop_front();
            return res;
        }

        auto it = pages_.find(key);
        if (it != pages_.end())
            return it->second;

        Response res;
        res.effective_url = url;
        res.status_code   = 404;
        res.error         = "HTTP 404";
        return res;
    }

    int fetch_count(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = fetches_.find(Utils::Url::normalize(url));
        return it == fetches_.end() ? 0 : it->second;
    }

    std::vector<std::chrono::steady_clock::time_point> fetch_times(const std::string& domain) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = fetch_times_.find(domain);
        return it == fetch_times_.end() ? std::vector<std::chrono::steady_clock::time_point>{}
                                        : it->second;
    }

    std::vector<std::string> log() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

private:
    mutable std::mutex                                                        mutex_;
    std::map<std::string, Response>                                           pages_;
    std::map<std::string, std::deque<Response>>                               scripted_;
    std::map<std::string, int>                                                fetches_;
    std::map<std::string, std::vector<std::chrono::steady_clock::time_point>> fetch_times_;
    std::vector<std::string>                                                  log_;
};

class FakeHttpClient : public Network::Http::HttpClient {
public:
    explicit FakeHttpClient(FakeWeb& web) : web_(web) {
    }

    boost::asio::awaitable<Response> get(const std::string& url) override {
        co_return web_.respond(url);
    }

private:
    FakeWeb& web_;
};

}  // namespace Testing
}  // namespace Prowl
