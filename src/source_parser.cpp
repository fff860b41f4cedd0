#include "code_atlas/source_parser.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

extern "C" {
    const TSLanguage* tree_sitter_c();
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_java();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
}

namespace code_atlas {

namespace {

struct QuerySource {
    const char* import_query;
    const char* def_query;
    const char* call_query;
};

// 🎯 Structure (definitions) and logic (calls/imports) captures per language.
const std::unordered_map<std::string, QuerySource>& query_sources() {
    static const std::unordered_map<std::string, QuerySource> sources = {
        {"c", {
            R"((preproc_include path: (_) @import))",
            R"((function_definition declarator: (function_declarator declarator: (identifier) @name) body: (_)) @def)",
            R"((call_expression function: (identifier) @call_name))"
        }},
        {"cpp", {
            R"((preproc_include path: (_) @import))",
            R"(
                (function_definition declarator: (function_declarator declarator: (identifier) @name) body: (_)) @def
                (function_definition declarator: (function_declarator declarator: (field_identifier) @name) body: (_)) @def
                (class_specifier name: (type_identifier) @name) @def
                (struct_specifier name: (type_identifier) @name body: (_)) @def
            )",
            R"(
                (call_expression function: (identifier) @call_name)
                (call_expression function: (field_expression field: (field_identifier) @call_name))
            )"
        }},
        {"python", {
            R"(
                (import_statement name: (dotted_name) @import)
                (import_from_statement module_name: (dotted_name) @import)
            )",
            R"(
                (function_definition name: (identifier) @name body: (_)) @def
                (class_definition name: (identifier) @name body: (_)) @def
            )",
            R"(
                (call function: (identifier) @call_name)
                (call function: (attribute attribute: (identifier) @call_name))
            )"
        }},
        {"java", {
            R"((import_declaration) @import)",
            R"(
                (method_declaration name: (identifier) @name body: (_)) @def
                (class_declaration name: (identifier) @name body: (_)) @def
            )",
            R"((method_invocation name: (identifier) @call_name))"
        }},
        {"javascript", {
            R"((import_statement source: (string) @import))",
            R"(
                (function_declaration name: (identifier) @name body: (_)) @def
                (class_declaration name: (identifier) @name body: (_)) @def
            )",
            R"(
                (call_expression function: (identifier) @call_name)
                (call_expression function: (member_expression property: (property_identifier) @call_name))
            )"
        }},
        {"typescript", {
            R"((import_statement source: (string) @import))",
            R"(
                (function_declaration name: (identifier) @name body: (_)) @def
                (class_declaration name: (type_identifier) @name body: (_)) @def
            )",
            R"(
                (call_expression function: (identifier) @call_name)
                (call_expression function: (member_expression property: (property_identifier) @call_name))
            )"
        }},
    };
    return sources;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string clean_import(std::string raw) {
    size_t pos;
    while ((pos = raw.find("import ")) != std::string::npos) raw.erase(pos, 7);
    raw.erase(std::remove_if(raw.begin(), raw.end(), [](char c) {
        return c == ';' || c == '"' || c == '\'';
    }), raw.end());
    return trim(raw);
}

std::string first_line_signature(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    line = trim(line);
    while (!line.empty() && line.back() == '{') {
        line.pop_back();
        line = trim(line);
    }
    return line;
}

TSQuery* compile_query(const TSLanguage* lang, const char* source, const std::string& lang_id) {
    uint32_t error_offset = 0;
    TSQueryError error_type = TSQueryErrorNone;
    TSQuery* query = ts_query_new(lang, source, static_cast<uint32_t>(std::char_traits<char>::length(source)),
                                  &error_offset, &error_type);
    if (!query) {
        spdlog::error("❌ tree-sitter query for {} rejected at offset {} (error {})",
                      lang_id, error_offset, static_cast<int>(error_type));
    }
    return query;
}

} // namespace

struct TreeSitterParser::LanguageQueries {
    std::string lang_id;
    const TSLanguage* language = nullptr;
    TSQuery* import_query = nullptr;
    TSQuery* def_query = nullptr;
    TSQuery* call_query = nullptr;

    ~LanguageQueries() {
        if (import_query) ts_query_delete(import_query);
        if (def_query) ts_query_delete(def_query);
        if (call_query) ts_query_delete(call_query);
    }
};

TreeSitterParser::TreeSitterParser() {
    parser_ = ts_parser_new();
}

TreeSitterParser::~TreeSitterParser() {
    if (parser_) ts_parser_delete(parser_);
}

std::string TreeSitterParser::language_for(const std::string& path) {
    static const std::unordered_map<std::string, std::string> extension_map = {
        {".c", "c"}, {".h", "c"},
        {".cpp", "cpp"}, {".hpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hh", "cpp"},
        {".py", "python"}, {".pyw", "python"},
        {".java", "java"},
        {".js", "javascript"}, {".mjs", "javascript"}, {".jsx", "javascript"},
        {".ts", "typescript"}, {".tsx", "typescript"},
        {".lua", "lua"}, {".rs", "rust"}, {".go", "go"}, {".kt", "kotlin"}
    };
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = extension_map.find(ext);
    return it == extension_map.end() ? "" : it->second;
}

const TSLanguage* TreeSitterParser::get_lang(const std::string& lang_id) const {
    if (lang_id == "c") return tree_sitter_c();
    if (lang_id == "cpp") return tree_sitter_cpp();
    if (lang_id == "python") return tree_sitter_python();
    if (lang_id == "java") return tree_sitter_java();
    if (lang_id == "javascript") return tree_sitter_javascript();
    if (lang_id == "typescript") return tree_sitter_typescript();
    return nullptr;
}

TreeSitterParser::LanguageQueries* TreeSitterParser::queries_for(const std::string& lang_id) {
    for (auto& q : cache_) {
        if (q->lang_id == lang_id) return q.get();
    }

    const TSLanguage* lang = get_lang(lang_id);
    auto src = query_sources().find(lang_id);
    if (!lang || src == query_sources().end()) return nullptr;

    auto entry = std::make_unique<LanguageQueries>();
    entry->lang_id = lang_id;
    entry->language = lang;
    entry->import_query = compile_query(lang, src->second.import_query, lang_id);
    entry->def_query = compile_query(lang, src->second.def_query, lang_id);
    entry->call_query = compile_query(lang, src->second.call_query, lang_id);
    cache_.push_back(std::move(entry));
    return cache_.back().get();
}

std::vector<std::string> TreeSitterParser::run_query(TSQuery* query, TSNode node, const std::string& content,
                                                     const std::string& capture_name) const {
    std::vector<std::string> results;
    if (!query) return results;

    TSQueryCursor* cursor = ts_query_cursor_new();
    ts_query_cursor_exec(cursor, query, node);

    TSQueryMatch match;
    while (ts_query_cursor_next_match(cursor, &match)) {
        for (uint16_t i = 0; i < match.capture_count; ++i) {
            uint32_t len = 0;
            const char* name = ts_query_capture_name_for_id(query, match.captures[i].index, &len);
            if (capture_name != std::string(name, len)) continue;

            uint32_t start = ts_node_start_byte(match.captures[i].node);
            uint32_t end = ts_node_end_byte(match.captures[i].node);
            if (end > content.size() || start >= end) continue;
            results.push_back(trim(content.substr(start, end - start)));
        }
    }
    ts_query_cursor_delete(cursor);
    return results;
}

ParseResult TreeSitterParser::parse_file(const std::string& path, bool detailed) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        ParseResult result;
        result.file_path = path;
        result.language = language_for(path);
        result.error = "Could not read file.";
        return result;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return parse_source(path, buffer.str(), detailed);
}

ParseResult TreeSitterParser::parse_source(const std::string& path, const std::string& content, bool detailed) {
    ParseResult result;
    result.file_path = path;
    std::string lang_id = language_for(path);
    result.language = lang_id;

    LanguageQueries* queries = lang_id.empty() ? nullptr : queries_for(lang_id);
    if (!queries) {
        result.error = "Language " + (lang_id.empty() ? std::string("unknown") : lang_id) + " not supported.";
        return result;
    }
    if (!ts_parser_set_language(parser_, queries->language)) {
        result.error = "Grammar for " + lang_id + " is incompatible with the tree-sitter runtime.";
        return result;
    }

    TSTree* tree = ts_parser_parse_string(parser_, nullptr, content.c_str(), static_cast<uint32_t>(content.length()));
    if (!tree) {
        result.error = "Parsing failed.";
        return result;
    }
    TSNode root = ts_tree_root_node(tree);

    // 1. Imports
    for (const auto& raw : run_query(queries->import_query, root, content, "import")) {
        std::string clean = clean_import(raw);
        if (!clean.empty()) result.imports.push_back(clean);
    }

    // 2. Definitions with their calls
    if (detailed && queries->def_query) {
        TSQueryCursor* cursor = ts_query_cursor_new();
        ts_query_cursor_exec(cursor, queries->def_query, root);

        std::unordered_set<uint64_t> processed;
        TSQueryMatch match;
        while (ts_query_cursor_next_match(cursor, &match)) {
            TSNode def_node{};
            std::string def_name = "unknown";
            bool have_def = false;

            for (uint16_t i = 0; i < match.capture_count; ++i) {
                uint32_t len = 0;
                const char* name = ts_query_capture_name_for_id(queries->def_query, match.captures[i].index, &len);
                std::string capture(name, len);
                TSNode node = match.captures[i].node;
                if (capture == "def") {
                    def_node = node;
                    have_def = true;
                } else if (capture == "name") {
                    uint32_t s = ts_node_start_byte(node);
                    uint32_t e = ts_node_end_byte(node);
                    if (e <= content.size() && s < e) def_name = content.substr(s, e - s);
                }
            }
            if (!have_def) continue;

            uint32_t start = ts_node_start_byte(def_node);
            uint32_t end = ts_node_end_byte(def_node);
            uint64_t key = (static_cast<uint64_t>(start) << 32) | end;
            if (!processed.insert(key).second || end > content.size()) continue;

            Definition def;
            def.name = def_name;
            std::string type = ts_node_type(def_node);
            def.kind = (type.find("class") != std::string::npos || type.find("struct") != std::string::npos)
                           ? "class" : "function";
            def.start_byte = start;
            def.end_byte = end;
            def.content = content.substr(start, end - start);
            def.signature = first_line_signature(def.content);

            std::unordered_set<std::string> seen;
            for (auto& call : run_query(queries->call_query, def_node, content, "call_name")) {
                if (seen.insert(call).second) def.calls.push_back(std::move(call));
            }
            result.definitions.push_back(std::move(def));
        }
        ts_query_cursor_delete(cursor);
    }

    ts_tree_delete(tree);
    spdlog::debug("🛰️  AST X-Ray Complete: {} imports, {} definitions in {}",
                  result.imports.size(), result.definitions.size(), path);
    return result;
}

ParserFactory tree_sitter_parser_factory() {
    return []() -> std::unique_ptr<ISourceParser> { return std::make_unique<TreeSitterParser>(); };
}

} // namespace code_atlas
