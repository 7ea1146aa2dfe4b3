#include "file_store.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"

namespace Prowl {
namespace Storage {

using Prowl::Core::Logger;

namespace {
constexpr const char* JOURNAL_FILE = "prowl.journal";
constexpr const char* OP_PUT       = "put";
constexpr const char* OP_DEL       = "del";
}  // namespace

FileStore::FileStore(const std::string& base_path) : base_path_(base_path) {
    std::filesystem::path dir(base_path_.empty() ? "." : base_path_);
    try {
        std::filesystem::create_directories(dir);
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError("Failed to create state directory " + dir.string() + ": " + e.what());
    }
    journal_path_ = (dir / JOURNAL_FILE).string();

    replay();
    compact();

    journal_.open(journal_path_, std::ios::out | std::ios::app);
    if (!journal_.is_open())
        throw StoreError("Failed to open journal: " + journal_path_);
    Logger::info("Store: opened " + journal_path_ + " (" + std::to_string(data_.size())
                 + " keys)");
}

void FileStore::replay() {
    std::ifstream in(journal_path_);
    if (!in.is_open())
        return;

    std::string line;
    size_t      line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty())
            continue;

        auto record = nlohmann::json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.contains("op") || !record.contains("k")) {
            // A crash mid-append leaves a torn final record.
            Logger::warn("Store: skipping unreadable journal record at line "
                         + std::to_string(line_no));
            continue;
        }

        const std::string op  = record["op"].get<std::string>();
        const std::string key = record["k"].get<std::string>();
        if (op == OP_PUT)
            data_[key] = record.value("v", "");
        else if (op == OP_DEL)
            data_.erase(key);
    }
}

void FileStore::compact() {
    std::string tmp_path = journal_path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open())
            throw StoreError("Failed to write journal: " + tmp_path);
        for (const auto& [key, value] : data_) {
            out << nlohmann::json{{"op", OP_PUT}, {"k", key}, {"v", value}}.dump() << '\n';
        }
        out.flush();
        if (!out)
            throw StoreError("Failed to write journal: " + tmp_path);
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, journal_path_, ec);
    if (ec)
        throw StoreError("Failed to replace journal " + journal_path_ + ": " + ec.message());
}

void FileStore::append(const std::string& op, const std::string& key, const std::string* value) {
    nlohmann::json record = {{"op", op}, {"k", key}};
    if (value)
        record["v"] = *value;

    journal_ << record.dump() << '\n';
    journal_.flush();
    if (!journal_)
        throw StoreError("Journal write failed: " + journal_path_);
}

void FileStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    append(OP_PUT, key, &value);
    data_[key] = value;
}

bool FileStore::put_if_absent(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.count(key))
        return false;
    append(OP_PUT, key, &value);
    data_.emplace(key, value);
    return true;
}

bool FileStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!data_.count(key))
        return false;
    append(OP_DEL, key, nullptr);
    data_.erase(key);
    return true;
}

}  // namespace Storage
}  // namespace Prowl
