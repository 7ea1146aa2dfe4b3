#pragma once
#include "http_client.hpp"
#include <boost/asio/thread_pool.hpp>
#include <curl/curl.h>
#include <memory>
#include <string>

namespace Prowl {
namespace Network {
namespace Http {

// libcurl easy-handle client. The blocking transfer runs on the supplied thread pool so the
// calling coroutine only suspends. One instance serves one worker at a time.
class CurlClient : public HttpClient {
public:
    explicit CurlClient(boost::asio::thread_pool& pool);
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_timeout(std::chrono::milliseconds timeout) override;
    void set_user_agent(const std::string& user_agent) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

    // Synchronous transfer on the calling thread.
    Response fetch(const std::string& url);

private:
    struct Request {
        std::string url;
        long        timeout_ms      = 10000;
        bool        follow_location = true;
        long        max_redirects   = 5;
        std::string user_agent;
    };

    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    boost::asio::thread_pool&          pool_;
    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::chrono::milliseconds          timeout_;
    std::string                        user_agent_;

    Response create_error_response(const std::string& msg, ErrorType type) const;
    void     setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const;
    Response handle_response(CURLcode           res,
                             long               response_code,
                             const std::string& effective_url,
                             std::string&       body,
                             std::string&       content_type) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Prowl
