#include "link_extractor.hpp"
#include <gumbo.h>
#include <strings.h>
#include <unordered_set>
#include "../url/url.hpp"

namespace Prowl {
namespace Utils {
namespace Text {

namespace {

bool is_pagination_rel(const GumboAttribute* rel) {
    return rel && (strcasecmp(rel->value, "next") == 0 || strcasecmp(rel->value, "prev") == 0);
}

void collect_links(GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    const GumboElement& el = node->v.element;
    if (el.tag == GUMBO_TAG_A || el.tag == GUMBO_TAG_AREA
        || (el.tag == GUMBO_TAG_LINK
            && is_pagination_rel(gumbo_get_attribute(&el.attributes, "rel")))) {
        GumboAttribute* href = gumbo_get_attribute(&el.attributes, "href");
        if (href && href->value[0] != '\0')
            links.emplace_back(href->value);
    }

    const GumboVector* children = &el.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<GumboNode*>(children->data[i]), links);
    }
}

}  // namespace

std::vector<std::string> LinkExtractor::extract(const std::string& html) {
    std::vector<std::string> links;
    if (html.empty())
        return links;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    collect_links(output->root, links);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return links;
}

std::vector<std::string> LinkExtractor::extract_absolute(const std::string& base_url,
                                                         const std::string& html) {
    std::vector<std::string>        out;
    std::unordered_set<std::string> seen;
    for (const auto& link : extract(html)) {
        std::string absolute = Url::resolve(base_url, link);
        if (absolute.empty() || !Url::is_crawlable(absolute))
            continue;
        if (seen.insert(absolute).second)
            out.push_back(std::move(absolute));
    }
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Prowl
