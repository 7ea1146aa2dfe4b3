#include "result_sink.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Prowl {
namespace Engine {

using namespace Prowl::Core;
using Prowl::Utils::Url;

namespace {
constexpr const char* RESULT_PREFIX = "result/";

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos)
        return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

std::ofstream open_output(const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream file(p, std::ios::out | std::ios::trunc);
    if (!file.is_open())
        throw std::runtime_error("Failed to open export file: " + path);
    return file;
}
}  // namespace

ResultSink::ResultSink(Storage::KvStore& store) : store_(store) {
}

std::string ResultSink::key(const std::string& job_id, const std::string& normalized_url) {
    return RESULT_PREFIX + job_id + "/" + normalized_url;
}

bool ResultSink::record(const CrawlResult& result) {
    std::string normalized = Url::normalize(result.url);
    CrawlResult stored     = result;
    if (!normalized.empty())
        stored.url = normalized;

    std::string k     = key(stored.job_id, stored.url);
    std::string value = nlohmann::json(stored).dump();
    if (store_.put_if_absent(k, value))
        return true;

    store_.put(k, value);
    Logger::debug("Result replayed for " + stored.url);
    return false;
}

std::optional<CrawlResult> ResultSink::find(const std::string& job_id, const std::string& url) const {
    std::string normalized = Url::normalize(url);
    auto        value      = store_.get(key(job_id, normalized.empty() ? url : normalized));
    if (!value)
        return std::nullopt;
    return nlohmann::json::parse(*value).get<CrawlResult>();
}

std::vector<CrawlResult> ResultSink::results(const std::string& job_id) const {
    std::vector<CrawlResult> out;
    for (const auto& [k, v] : store_.scan(std::string(RESULT_PREFIX) + job_id + "/")) {
        out.push_back(nlohmann::json::parse(v).get<CrawlResult>());
    }
    return out;
}

size_t ResultSink::count(const std::string& job_id) const {
    return store_.scan(std::string(RESULT_PREFIX) + job_id + "/").size();
}

void ResultSink::export_json(const std::string& job_id, const std::string& path) const {
    auto           records = results(job_id);
    nlohmann::json doc     = {{"job", job_id}, {"results", records}};

    std::ofstream file = open_output(path);
    file << doc.dump(4) << '\n';
    Logger::success("Saved " + std::to_string(records.size()) + " results to " + path);
}

void ResultSink::export_csv(const std::string& job_id, const std::string& path) const {
    auto records = results(job_id);

    std::ofstream file = open_output(path);
    file << "url,depth,status,http_status,error_class,links,duration_ms\n";
    for (const auto& r : records) {
        file << csv_field(r.url) << ',' << r.depth << ',' << to_string(r.status) << ','
             << (r.http_status ? std::to_string(*r.http_status) : "") << ','
             << to_string(r.error_class) << ',' << r.links.size() << ',' << r.duration_ms
             << '\n';
    }
    Logger::success("Saved " + std::to_string(records.size()) + " results to " + path);
}

}  // namespace Engine
}  // namespace Prowl
