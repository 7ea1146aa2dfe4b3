#include "memory_store.hpp"

namespace Prowl {
namespace Storage {

std::optional<std::string> MemoryStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    return it->second;
}

void MemoryStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

bool MemoryStore::put_if_absent(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.emplace(key, value).second;
}

bool MemoryStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.erase(key) > 0;
}

std::vector<std::pair<std::string, std::string>>
MemoryStore::scan(const std::string& prefix) const {
    std::lock_guard<std::mutex>                      lock(mutex_);
    std::vector<std::pair<std::string, std::string>> out;
    for (auto it = data_.lower_bound(prefix); it != data_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
            break;
        out.emplace_back(it->first, it->second);
    }
    return out;
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

}  // namespace Storage
}  // namespace Prowl
