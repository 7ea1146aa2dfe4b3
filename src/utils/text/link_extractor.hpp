#pragma once
#include <string>
#include <vector>

namespace Prowl {
namespace Utils {
namespace Text {

class LinkExtractor {
public:
    // Raw href values of <a>, <area> and <link rel="next|prev"> elements, in document order.
    static std::vector<std::string> extract(const std::string& html);

    // extract() resolved against base_url, deduplicated, non-http(s) targets dropped.
    static std::vector<std::string> extract_absolute(const std::string& base_url,
                                                     const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Prowl
