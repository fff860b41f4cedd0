#include <gtest/gtest.h>
#include "code_atlas/parse_stage.hpp"
#include "test_helpers.hpp"

using namespace code_atlas;
using namespace code_atlas::test_support;

TEST(ParseStage, RecordsImportsPerFile) {
    FakeFiles files;
    files["a.py"].imports = {"b", "os"};
    files["b.py"].imports = {};
    files["c.py"].imports = {"a"};

    ParseRecords records = parse_concurrently("/project", {"a.py", "b.py", "c.py"}, fake_factory(files), 3);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records["a.py"].imports, (std::vector<std::string>{"b", "os"}));
    EXPECT_TRUE(records["b.py"].imports.empty());
    EXPECT_EQ(records["c.py"].relative_path, "c.py");
    for (const auto& [path, record] : records) EXPECT_TRUE(record.ok()) << path;
}

TEST(ParseStage, FailuresAreRecordedNotFatal) {
    FakeFiles files;
    files["good.c"].imports = {"util.h"};
    files["bad.c"].error = "Could not read file.";

    ParseRecords records = parse_concurrently("/project", {"good.c", "bad.c", "unknown.xyz"},
                                              fake_factory(files), 2);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_TRUE(records["good.c"].ok());
    ASSERT_FALSE(records["bad.c"].ok());
    EXPECT_EQ(*records["bad.c"].error, "Could not read file.");
    EXPECT_FALSE(records["unknown.xyz"].ok());
}

TEST(ParseStage, ThrowingParserBecomesAnError) {
    ParserFactory factory = []() -> std::unique_ptr<ISourceParser> {
        throw std::runtime_error("no grammar");
    };
    ParseRecords records = parse_concurrently("/project", {"x.c", "y.c"}, factory, 2);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(*records["x.c"].error, "no grammar");
    EXPECT_EQ(*records["y.c"].error, "no grammar");
}

TEST(ParseStage, ReportsProgressPeriodicallyAndAtTheEnd) {
    FakeFiles files;
    std::vector<std::string> paths;
    for (int i = 0; i < 45; ++i) {
        std::string name = "f" + std::to_string(i) + ".py";
        files[name] = {};
        paths.push_back(name);
    }

    std::vector<size_t> reported;
    size_t last_total = 0;
    parse_concurrently("/project", paths, fake_factory(files), 4, 20,
                       [&](size_t done, size_t total, const std::string&) {
                           reported.push_back(done);
                           last_total = total;
                       });

    EXPECT_EQ(reported, (std::vector<size_t>{20, 40, 45}));
    EXPECT_EQ(last_total, 45u);
}

TEST(ParseStage, EmptyInputProducesNoRecords) {
    bool called = false;
    auto records = parse_concurrently("/project", {}, fake_factory({}), 2, 20,
                                      [&](size_t, size_t, const std::string&) { called = true; });
    EXPECT_TRUE(records.empty());
    EXPECT_FALSE(called);
}

TEST(ParseStage, RecordsSurviveJson) {
    ParseRecords records;
    records["a.py"] = {"a.py", {"b"}, std::nullopt};
    records["b.py"] = {"b.py", {}, std::string("Language unknown not supported.")};

    ParseRecords back = records_from_json(records_to_json(records));
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back["a.py"].imports, std::vector<std::string>{"b"});
    EXPECT_TRUE(back["a.py"].ok());
    EXPECT_EQ(back["b.py"].error, std::optional<std::string>("Language unknown not supported."));
}

TEST(ParseStage, WorkerCountDoesNotChangeTheResult) {
    FakeFiles files;
    std::vector<std::string> paths;
    for (int i = 0; i < 60; ++i) {
        std::string name = "pkg/m" + std::to_string(i) + ".py";
        files[name].imports = {"pkg.m" + std::to_string((i + 1) % 60)};
        if (i % 7 == 0) files[name].error = "Could not read file.";
        paths.push_back(name);
    }

    ParseRecords serial = parse_concurrently("/project", paths, fake_factory(files), 1);
    ParseRecords parallel = parse_concurrently("/project", paths, fake_factory(files), 8);

    ASSERT_EQ(serial.size(), 60u);
    ASSERT_EQ(parallel.size(), 60u);
    EXPECT_EQ(records_to_json(serial), records_to_json(parallel));
}
