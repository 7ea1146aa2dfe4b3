#include "curl_client.hpp"
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <string_view>
#include "../../core/types/constants.hpp"

namespace Prowl {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorType::Timeout;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorType::InvalidUrl;
        default:
            return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*  ctx   = static_cast<CurlClient::RequestContext*>(userp);
    size_t total = size * nitems;
    if (!ctx || !ctx->content_type)
        return total;

    std::string_view header(buffer, total);
    if (!istarts_with(header, CONTENT_TYPE_HEADER))
        return total;

    // Redirect hops each carry their own content-type; the last one wins.
    *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    return total;
}

CurlClient::CurlClient(boost::asio::thread_pool& pool)
    : pool_(pool),
      curl_(curl_easy_init()),
      timeout_(Core::Constants::DEFAULT_FETCH_TIMEOUT_MS),
      user_agent_(Core::Constants::USER_AGENT) {
}

void CurlClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

Response CurlClient::create_error_response(const std::string& msg, ErrorType type) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = type;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, req.max_redirects);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());
}

Response CurlClient::handle_response(CURLcode           res,
                                     long               response_code,
                                     const std::string& effective_url,
                                     std::string&       body,
                                     std::string&       content_type) const {
    if (res != CURLE_OK) {
        Response response   = create_error_response(curl_easy_strerror(res),
                                                  map_curl_code_to_error_type(res));
        response.effective_url = effective_url;
        return response;
    }

    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;
    response.content_type  = content_type;
    response.body          = std::move(body);
    response.success       = response.status_code >= static_cast<long>(HTTPCode::Ok)
                       && response.status_code < static_cast<long>(HTTPCode::ClientError);
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

Response CurlClient::fetch(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle", ErrorType::Other);

    Request req;
    req.url        = url;
    req.timeout_ms = static_cast<long>(timeout_.count());
    req.user_agent = user_agent_;

    std::string    body_buffer;
    std::string    content_type;
    RequestContext ctx{&body_buffer, &content_type};

    setup_curl_options(curl_.get(), req, ctx);
    CURLcode res = curl_easy_perform(curl_.get());

    long response_code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    std::string effective_url = eff_url_ptr ? std::string(eff_url_ptr) : url;

    return handle_response(res, response_code, effective_url, body_buffer, content_type);
}

boost::asio::awaitable<Response> CurlClient::get(const std::string& url) {
    co_return co_await boost::asio::co_spawn(
        pool_,
        [this, url]() -> boost::asio::awaitable<Response> { co_return fetch(url); },
        boost::asio::use_awaitable);
}

}  // namespace Http
}  // namespace Network
}  // namespace Prowl
