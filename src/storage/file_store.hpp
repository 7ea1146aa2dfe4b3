#pragma once
#include <fstream>
#include <string>
#include "memory_store.hpp"

namespace Prowl {
namespace Storage {

// Durable store: an in-memory map mirrored by an append-only JSON-lines journal.
// The journal is replayed and compacted when the store is opened.
class FileStore : public MemoryStore {
public:
    explicit FileStore(const std::string& base_path);
    ~FileStore() override = default;

    void put(const std::string& key, const std::string& value) override;
    bool put_if_absent(const std::string& key, const std::string& value) override;
    bool erase(const std::string& key) override;

    const std::string& journal_path() const {
        return journal_path_;
    }

private:
    std::string   base_path_;
    std::string   journal_path_;
    std::ofstream journal_;

    void replay();
    void compact();
    void append(const std::string& op, const std::string& key, const std::string* value);
};

}  // namespace Storage
}  // namespace Prowl
