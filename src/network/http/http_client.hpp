#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace Prowl {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, InvalidUrl, Other };

enum class HTTPCode {
    NetworkError    = 0,
    Ok              = 200,
    ClientError     = 400,
    TooManyRequests = 429,
    ServerError     = 500
};

}  // namespace Http
}  // namespace Network
}  // namespace Prowl

namespace Prowl {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

// Fetches one URL. Implementations never throw for transport failures; they report them in
// Response::error_type with status_code 0.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual void set_user_agent(const std::string& /*user_agent*/){};
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Prowl
