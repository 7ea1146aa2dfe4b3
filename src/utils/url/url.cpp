#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

namespace Prowl {
namespace Utils {

namespace {

std::string to_lower(std::string s) {
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string clean_host(std::string host) {
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return to_lower(std::move(host));
}

// "/a/./b/../c/" -> "/a/c/"
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }
    bool trailing = path.size() > 1 && path.back() == '/';
    if (trailing && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

std::string sort_query(const std::string& query) {
    std::vector<std::string> params;
    std::stringstream        ss(query);
    std::string              param;
    while (std::getline(ss, param, '&')) {
        if (!param.empty())
            params.push_back(param);
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& p : params) {
        if (!out.empty())
            out += '&';
        out += p;
    }
    return out;
}

const std::vector<std::string>& skipped_extensions() {
    static const std::vector<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".ico", ".tiff", ".avif",
        ".css", ".js",   ".mp4", ".mp3", ".woff", ".woff2", ".ttf", ".zip", ".pdf"};
    return extensions;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos && colon > 0);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = (end_auth != std::string_view::npos) ? sv.substr(end_auth) : std::string_view();

        size_t      at = authority.find_last_of('@');
        std::string host_port = (at != std::string::npos) ? authority.substr(at + 1) : authority;

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }
    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative_in) {
    std::string relative = trim(relative_in);
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        return (frag == std::string::npos ? base : base.substr(0, frag)) + relative;
    }

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    // mailto:, javascript:, tel: and friends
    size_t colon_pos = relative.find(':');
    size_t slash_pos = relative.find('/');
    if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos))
        return "";

    UrlParsed b = parse(base);
    if (b.scheme.empty() || b.host.empty())
        return "";

    if (relative.compare(0, 2, "//") == 0)
        return b.scheme + ":" + relative;

    std::string authority = b.host;
    if (!b.port.empty())
        authority += ":" + b.port;

    std::string path_part = relative;
    std::string query_frag;
    size_t      qf = path_part.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path_part.substr(qf);
        path_part  = path_part.substr(0, qf);
    }

    std::string path;
    if (path_part[0] == '/') {
        path = path_part;
    }
    else {
        std::string dir        = b.path;
        size_t      last_slash = dir.find_last_of('/');
        dir  = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        path = dir + path_part;
    }

    return b.scheme + "://" + authority + remove_dot_segments(path) + query_frag;
}

std::string Url::normalize(const std::string& url) {
    UrlParsed p = parse(trim(url));

    std::string scheme = to_lower(p.scheme);
    if (scheme != "http" && scheme != "https")
        return "";

    std::string host = clean_host(p.host);
    if (host.empty())
        return "";

    std::string port = p.port;
    if (!port.empty()) {
        if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }))
            return "";
        port.erase(0, std::min(port.find_first_not_of('0'), port.size() - 1));
        if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443"))
            port.clear();
    }

    std::string path = remove_dot_segments(p.path);
    if (path.size() > 1 && path.back() == '/')
        path.pop_back();

    std::string out = scheme + "://" + host;
    if (!port.empty())
        out += ":" + port;
    out += path;

    std::string query = sort_query(p.query);
    if (!query.empty())
        out += "?" + query;
    return out;
}

std::string Url::domain_of(const std::string& url) {
    return clean_host(parse(trim(url)).host);
}

std::string Url::from_seed(const std::string& seed) {
    std::string s = trim(seed);
    if (s.empty())
        return "";
    if (s.find("://") == std::string::npos)
        s = "https://" + s;
    return s;
}

bool Url::is_crawlable(const std::string& url) {
    UrlParsed   p      = parse(url);
    std::string scheme = to_lower(p.scheme);
    if ((scheme != "http" && scheme != "https") || p.host.empty())
        return false;

    std::string path = to_lower(p.path);
    for (const auto& ext : skipped_extensions()) {
        if (path.size() >= ext.size()
            && path.compare(path.size() - ext.size(), ext.size(), ext) == 0)
            return false;
    }
    return true;
}

}  // namespace Utils
}  // namespace Prowl
