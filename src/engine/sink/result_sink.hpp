#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/crawl_types.hpp"
#include "../../storage/kv_store.hpp"

namespace Prowl {
namespace Engine {

// Persists per-URL outcomes. Records are keyed by (job, normalized URL), so replaying a
// result overwrites the earlier record instead of adding a second one.
class ResultSink {
public:
    explicit ResultSink(Storage::KvStore& store);

    // Returns true when this call created the record, false when it replaced one.
    bool record(const Core::CrawlResult& result);

    std::optional<Core::CrawlResult> find(const std::string& job_id, const std::string& url) const;
    std::vector<Core::CrawlResult>   results(const std::string& job_id) const;
    size_t                           count(const std::string& job_id) const;

    void export_json(const std::string& job_id, const std::string& path) const;
    void export_csv(const std::string& job_id, const std::string& path) const;

    static std::string key(const std::string& job_id, const std::string& normalized_url);

private:
    Storage::KvStore& store_;
};

}  // namespace Engine
}  // namespace Prowl
