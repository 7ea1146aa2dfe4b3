#include "dedup_store.hpp"
#include "../../utils/url/url.hpp"

namespace Prowl {
namespace Engine {

using Prowl::Utils::Url;

namespace {
constexpr const char* VISITED_PREFIX = "visited/";
}

DedupStore::DedupStore(Storage::KvStore& store) : store_(store) {
}

std::string DedupStore::key(const std::string& job_id, const std::string& normalized_url) {
    return VISITED_PREFIX + job_id + "/" + normalized_url;
}

bool DedupStore::try_claim(const std::string& job_id, const std::string& url, int depth) {
    std::string normalized = Url::normalize(url);
    if (normalized.empty())
        return false;
    return store_.put_if_absent(key(job_id, normalized), std::to_string(depth));
}

std::optional<Core::VisitedRecord> DedupStore::find(const std::string& job_id,
                                                    const std::string& url) const {
    std::string normalized = Url::normalize(url);
    if (normalized.empty())
        return std::nullopt;

    auto value = store_.get(key(job_id, normalized));
    if (!value)
        return std::nullopt;

    Core::VisitedRecord record;
    record.job_id           = job_id;
    record.url              = normalized;
    record.first_seen_depth = std::stoi(*value);
    return record;
}

size_t DedupStore::count(const std::string& job_id) const {
    return store_.scan(std::string(VISITED_PREFIX) + job_id + "/").size();
}

}  // namespace Engine
}  // namespace Prowl
