#include "code_atlas/parse_stage.hpp"
#include <omp.h>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

json FileParseRecord::to_json() const {
    json j = {{"relative_path", relative_path}, {"imports", imports}};
    j["error"] = error ? json(*error) : json(nullptr);
    return j;
}

FileParseRecord FileParseRecord::from_json(const json& j) {
    FileParseRecord r;
    r.relative_path = j.value("relative_path", "");
    r.imports = j.value("imports", std::vector<std::string>{});
    if (j.contains("error") && j["error"].is_string()) r.error = j["error"].get<std::string>();
    return r;
}

namespace {

FileParseRecord parse_one(const fs::path& root, const std::string& rel, const ParserFactory& factory) {
    FileParseRecord record;
    record.relative_path = rel;
    try {
        auto parser = factory();
        if (!parser) throw std::runtime_error("parser factory returned no parser");
        ParseResult result = parser->parse_file((root / fs::path(rel)).string(), false);
        record.imports = std::move(result.imports);
        record.error = std::move(result.error);
    } catch (const std::exception& e) {
        record.error = e.what();
    }
    return record;
}

} // namespace

ParseRecords parse_concurrently(const fs::path& root,
                                const std::vector<std::string>& files,
                                const ParserFactory& factory,
                                size_t workers,
                                size_t progress_every,
                                const ProgressCallback& progress) {
    ParseRecords records;
    const size_t total = files.size();
    if (total == 0) return records;
    if (progress_every == 0) progress_every = 1;

    const int thread_count = static_cast<int>(workers == 0 ? 1 : workers);
    spdlog::info("⚡ Parsing {} files on {} workers...", total, thread_count);

    // One slot per file so workers never share a record.
    std::vector<FileParseRecord> results(total);
    size_t completed = 0;
    size_t failures = 0;

    omp_set_num_threads(thread_count);
    #pragma omp parallel
    {
        #pragma omp for schedule(dynamic)
        for (int i = 0; i < static_cast<int>(total); ++i) {
            results[i] = parse_one(root, files[i], factory);

            #pragma omp critical(code_atlas_parse_progress)
            {
                if (!results[i].ok()) {
                    ++failures;
                    spdlog::debug("⚠️ Parse failed for {}: {}", files[i], *results[i].error);
                }
                ++completed;
                if (progress && (completed % progress_every == 0 || completed == total)) {
                    try {
                        progress(completed, total, "Parsing " + files[i]);
                    } catch (const std::exception& e) {
                        spdlog::warn("⚠️ Progress callback failed: {}", e.what());
                    }
                }
            }
        }
    }

    for (auto& record : results) {
        std::string key = record.relative_path;
        records[key] = std::move(record);
    }
    spdlog::info("✅ Parse stage done: {} files, {} failures", total, failures);
    return records;
}

json records_to_json(const ParseRecords& records) {
    json j = json::object();
    for (const auto& [path, record] : records) j[path] = record.to_json();
    return j;
}

ParseRecords records_from_json(const json& j) {
    ParseRecords records;
    if (!j.is_object()) return records;
    for (auto it = j.begin(); it != j.end(); ++it) {
        records[it.key()] = FileParseRecord::from_json(it.value());
    }
    return records;
}

} // namespace code_atlas
