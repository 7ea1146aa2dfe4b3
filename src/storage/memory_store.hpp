#pragma once
#include <map>
#include <mutex>
#include <string>
#include "kv_store.hpp"

namespace Prowl {
namespace Storage {

class MemoryStore : public KvStore {
public:
    MemoryStore()           = default;
    ~MemoryStore() override = default;

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    bool put_if_absent(const std::string& key, const std::string& value) override;
    bool erase(const std::string& key) override;
    std::vector<std::pair<std::string, std::string>>
    scan(const std::string& prefix) const override;

    size_t size() const;

protected:
    mutable std::mutex                 mutex_;
    std::map<std::string, std::string> data_;
};

}  // namespace Storage
}  // namespace Prowl
