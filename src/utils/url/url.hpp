#pragma once
#include <string>

namespace Prowl {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // Canonical form used for dedup: lower-case scheme and host, default port dropped,
    // fragment dropped, dot segments removed, no trailing slash except for the root path,
    // query parameters sorted. Returns "" when url is not an absolute http(s) URL.
    static std::string normalize(const std::string& url);

    // Lower-cased host without trailing dot or port; "" if there is none.
    static std::string domain_of(const std::string& url);

    // Turns a bare seed such as "shop.example" into "https://shop.example/".
    static std::string from_seed(const std::string& seed);

    // True for http(s) URLs that do not point at an image or media asset.
    static bool is_crawlable(const std::string& url);
};

}  // namespace Utils
}  // namespace Prowl
