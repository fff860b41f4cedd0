#include <gtest/gtest.h>
#include <algorithm>
#include "code_atlas/source_parser.hpp"
#include "test_helpers.hpp"

using namespace code_atlas;
using code_atlas::test_support::TempDir;

namespace {

const Definition* find_definition(const ParseResult& r, const std::string& name) {
    for (const auto& d : r.definitions) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

bool calls(const Definition& d, const std::string& name) {
    return std::find(d.calls.begin(), d.calls.end(), name) != d.calls.end();
}

} // namespace

class SourceParserTest : public ::testing::Test {
protected:
    TreeSitterParser parser;
};

TEST_F(SourceParserTest, CIncludesAndFunctions) {
    const std::string code =
        "#include \"util.h\"\n"
        "#include <stdio.h>\n"
        "\n"
        "int add(int a, int b) { return a + b; }\n"
        "\n"
        "int main() {\n"
        "    printf(\"%d\", add(1, 2));\n"
        "    return 0;\n"
        "}\n";

    ParseResult r = parser.parse_source("src/main.c", code, true);
    ASSERT_TRUE(r.ok()) << *r.error;
    EXPECT_EQ(r.language, "c");
    ASSERT_EQ(r.imports.size(), 2u);
    EXPECT_EQ(r.imports[0], "util.h");
    EXPECT_EQ(r.imports[1], "<stdio.h>");

    const Definition* main_fn = find_definition(r, "main");
    ASSERT_NE(main_fn, nullptr);
    EXPECT_EQ(main_fn->kind, "function");
    EXPECT_EQ(main_fn->signature, "int main()");
    EXPECT_TRUE(calls(*main_fn, "printf"));
    EXPECT_TRUE(calls(*main_fn, "add"));
    EXPECT_EQ(code.substr(main_fn->start_byte, main_fn->end_byte - main_fn->start_byte), main_fn->content);

    const Definition* add_fn = find_definition(r, "add");
    ASSERT_NE(add_fn, nullptr);
    EXPECT_TRUE(add_fn->calls.empty());
}

TEST_F(SourceParserTest, PythonImportsClassesAndCalls) {
    const std::string code =
        "import os\n"
        "from pkg.mod import thing\n"
        "\n"
        "class Engine:\n"
        "    def start(self):\n"
        "        self.helper()\n"
        "        run()\n"
        "        run()\n"
        "\n"
        "def run():\n"
        "    pass\n";

    ParseResult r = parser.parse_source("engine.py", code, true);
    ASSERT_TRUE(r.ok()) << *r.error;
    EXPECT_EQ(r.imports, (std::vector<std::string>{"os", "pkg.mod"}));

    const Definition* engine = find_definition(r, "Engine");
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->kind, "class");
    EXPECT_EQ(engine->signature, "class Engine:");

    const Definition* start = find_definition(r, "start");
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->kind, "function");
    EXPECT_TRUE(calls(*start, "helper"));
    EXPECT_EQ(std::count(start->calls.begin(), start->calls.end(), "run"), 1);

    EXPECT_NE(find_definition(r, "run"), nullptr);
}

TEST_F(SourceParserTest, ImportsOnlyModeSkipsDefinitions) {
    ParseResult r = parser.parse_source("engine.py", "import os\n\ndef f():\n    g()\n", false);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.imports, std::vector<std::string>{"os"});
    EXPECT_TRUE(r.definitions.empty());
}

TEST_F(SourceParserTest, JavaScriptImportSourcesAreUnquoted) {
    ParseResult r = parser.parse_source("src/app.js", "import { helper } from '../utils/helper';\n", false);
    ASSERT_TRUE(r.ok()) << *r.error;
    EXPECT_EQ(r.imports, std::vector<std::string>{"../utils/helper"});
}

TEST_F(SourceParserTest, UnsupportedLanguagesReportAnError) {
    ParseResult rust = parser.parse_source("lib.rs", "fn main() {}", true);
    ASSERT_FALSE(rust.ok());
    EXPECT_EQ(*rust.error, "Language rust not supported.");

    ParseResult unknown = parser.parse_source("notes.txt", "hello", true);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(*unknown.error, "Language unknown not supported.");
}

TEST_F(SourceParserTest, UnreadableFileReportsAnError) {
    TempDir tmp;
    ParseResult r = parser.parse_file((tmp.path() / "missing.py").string(), false);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(*r.error, "Could not read file.");
}

TEST_F(SourceParserTest, ParsesFromDisk) {
    TempDir tmp;
    fs::path file = tmp.write("pkg/mod.py", "from pkg import util\n");
    ParseResult r = parser.parse_file(file.string(), false);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.imports, std::vector<std::string>{"pkg"});
}

TEST(SourceLanguage, ExtensionMapping) {
    EXPECT_EQ(TreeSitterParser::language_for("a/b.HPP"), "cpp");
    EXPECT_EQ(TreeSitterParser::language_for("x.tsx"), "typescript");
    EXPECT_EQ(TreeSitterParser::language_for("x.pyw"), "python");
    EXPECT_EQ(TreeSitterParser::language_for("Makefile"), "");
}
