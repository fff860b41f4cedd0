#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/source_parser.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// Imports extracted from one file by the parse stage.
struct FileParseRecord {
    std::string relative_path;
    std::vector<std::string> imports;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }

    nlohmann::json to_json() const;
    static FileParseRecord from_json(const nlohmann::json& j);
};

using ParseRecords = std::map<std::string, FileParseRecord>;

// (completed, total, message)
using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

// Parses every file (project-relative, '/' separated) in imports-only mode on
// `workers` OpenMP threads. Each file gets its own parser from `factory`.
// A failing file is recorded with its error; the batch always completes.
// Progress is reported every `progress_every` completions and once at the end.
ParseRecords parse_concurrently(const fs::path& root,
                                const std::vector<std::string>& files,
                                const ParserFactory& factory,
                                size_t workers,
                                size_t progress_every = 20,
                                const ProgressCallback& progress = nullptr);

nlohmann::json records_to_json(const ParseRecords& records);
ParseRecords records_from_json(const nlohmann::json& j);

} // namespace code_atlas
