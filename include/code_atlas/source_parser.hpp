#pragma once
#include <tree_sitter/api.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace code_atlas {

struct Definition {
    std::string name;
    std::string kind;        // "function" or "class"
    uint32_t start_byte = 0;
    uint32_t end_byte = 0;
    std::string signature;   // first line of the definition
    std::string content;
    std::vector<std::string> calls;
};

struct ParseResult {
    std::string file_path;
    std::string language;
    std::vector<std::string> imports;
    std::vector<Definition> definitions;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

// The parsing capability consumed by the graph builders. Implementations
// report problems (unsupported language, unreadable file) through
// ParseResult::error instead of throwing.
class ISourceParser {
public:
    virtual ~ISourceParser() = default;
    virtual ParseResult parse_file(const std::string& path, bool detailed) = 0;
};

// Workers each need their own parser instance.
using ParserFactory = std::function<std::unique_ptr<ISourceParser>()>;

// 🛰️ tree-sitter backed parser for C, C++, Python, Java, JavaScript and TypeScript.
// Not thread-safe; create one per thread.
class TreeSitterParser : public ISourceParser {
public:
    TreeSitterParser();
    ~TreeSitterParser() override;

    TreeSitterParser(const TreeSitterParser&) = delete;
    TreeSitterParser& operator=(const TreeSitterParser&) = delete;

    ParseResult parse_file(const std::string& path, bool detailed) override;

    // Same as parse_file, on in-memory content; `path` only selects the language.
    ParseResult parse_source(const std::string& path, const std::string& content, bool detailed);

    // Language id for a file extension, empty when unknown.
    static std::string language_for(const std::string& path);

private:
    struct LanguageQueries;

    const TSLanguage* get_lang(const std::string& lang_id) const;
    LanguageQueries* queries_for(const std::string& lang_id);

    std::vector<std::string> run_query(TSQuery* query, TSNode node, const std::string& content,
                                       const std::string& capture_name) const;

    TSParser* parser_;
    std::vector<std::unique_ptr<LanguageQueries>> cache_;
};

ParserFactory tree_sitter_parser_factory();

} // namespace code_atlas
