#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Prowl {
namespace Storage {

// Raised when the backing store cannot complete an operation. Fatal to the job that hit it.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {
    }
};

// Opaque key-value store. Each call is atomic and linearizable for the single key it touches.
class KvStore {
public:
    virtual ~KvStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const                 = 0;
    virtual void                       put(const std::string& key, const std::string& value) = 0;
    // Stores value only if key is absent. Returns true if this call created the key.
    virtual bool put_if_absent(const std::string& key, const std::string& value) = 0;
    virtual bool erase(const std::string& key)                                   = 0;
    // All pairs whose key starts with prefix, in key order.
    virtual std::vector<std::pair<std::string, std::string>>
    scan(const std::string& prefix) const = 0;
};

}  // namespace Storage
}  // namespace Prowl
