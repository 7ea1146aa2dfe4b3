#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/crawl_types.hpp"
#include "../../storage/kv_store.hpp"

namespace Prowl {
namespace Engine {

// Per-job visited set. A claim is write-once and never rolled back.
class DedupStore {
public:
    explicit DedupStore(Storage::KvStore& store);

    // Normalizes url and records it as seen for job_id. True only for the first claim of the
    // (job, url) pair; false for every later claim or when url cannot be normalized.
    // Throws Storage::StoreError when the backing store is unavailable.
    bool try_claim(const std::string& job_id, const std::string& url, int depth = 0);

    std::optional<Core::VisitedRecord> find(const std::string& job_id,
                                            const std::string& url) const;
    size_t count(const std::string& job_id) const;

    static std::string key(const std::string& job_id, const std::string& normalized_url);

private:
    Storage::KvStore& store_;
};

}  // namespace Engine
}  // namespace Prowl
