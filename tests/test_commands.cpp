// =============================================================================
// Command-line tests for `rts parse` and `rts line`
// =============================================================================

#include <gtest/gtest.h>
#include "commands/line.hpp"
#include "commands/parse.hpp"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("rts_commands_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);

        old_out = std::cout.rdbuf(out.rdbuf());
        old_err = std::cerr.rdbuf(err.rdbuf());

        // lines 1-3 are a header, ingredients on 4, 6 and 8
        recipe = write_file("recipe.txt",
                            "Ingredients\n"
                            "-----------\n"
                            "\n"
                            "1 cup water\n"
                            "\n"
                            "2 eggs\n"
                            "\n"
                            "salt\n");
    }

    void TearDown() override {
        std::cout.rdbuf(old_out);
        std::cerr.rdbuf(old_err);
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write_file(const std::string& name, const std::string& body) {
        fs::path p = dir / name;
        std::ofstream f(p);
        f << body;
        return p;
    }

    int run(int (*cmd)(int, char**), std::vector<std::string> args) {
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);
        return cmd((int)args.size(), argv.data());
    }

    bool out_has(const std::string& s) const { return out.str().find(s) != std::string::npos; }
    bool err_has(const std::string& s) const { return err.str().find(s) != std::string::npos; }

    fs::path dir;
    fs::path recipe;
    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* old_out = nullptr;
    std::streambuf* old_err = nullptr;
};

TEST_F(CommandTest, JoinedModeWarnsWhenCountsDiffer) {
    int rc = run(cmd_parse, {"parse", recipe.string(), "--from", "3"});

    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(out_has("1 cup water => Ingredient(quantity='1', unit='cup', name='water')"));
    EXPECT_TRUE(out_has("2 eggs => Ingredient(quantity='2', unit='eggs', name='salt')"));
    EXPECT_TRUE(err_has("warning: 3 line(s) produced 2 ingredient(s)"));
}

TEST_F(CommandTest, RangeSelectsLines) {
    int rc = run(cmd_parse, {"parse", recipe.string(), "--from", "3", "--to", "5"});

    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(out_has("1 cup water => "));
    EXPECT_FALSE(out_has("2 eggs"));
    EXPECT_EQ(err.str(), "");
}

TEST_F(CommandTest, PerLineReportsFileLineOfSkippedGroup) {
    int rc = run(cmd_parse, {"parse", recipe.string(), "--from", "3", "--per-line"});

    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(out_has("2 eggs => Ingredient(quantity='2', unit='eggs', name='')"));
    EXPECT_TRUE(err_has("warning: skipped malformed_group: line 8: "));
    EXPECT_FALSE(err_has("line(s) produced"));
}

TEST_F(CommandTest, StrictFailsWithExitCodeOne) {
    int rc = run(cmd_parse, {"parse", recipe.string(), "--from", "3", "--per-line", "--strict"});

    EXPECT_EQ(rc, 1);
    EXPECT_TRUE(err_has("[error] malformed ingredient line: line 8: "));
}

TEST_F(CommandTest, FlagsOverrideConfig) {
    auto cfg = write_file("cfg.json", R"({"per_line": true, "from_line": 3, "to_line": 4})");
    int rc = run(cmd_parse, {"parse", recipe.string(), "--config", cfg.string(), "--from", "5", "--to", "8"});

    EXPECT_EQ(rc, 0);
    EXPECT_FALSE(out_has("1 cup water"));
    EXPECT_TRUE(out_has("2 eggs => Ingredient(quantity='2', unit='eggs', name='')"));
    // per_line came from the config: "salt" (line 8) was outside --to
    EXPECT_FALSE(err_has("line(s) produced"));
    EXPECT_FALSE(err_has("malformed_group"));
}

TEST_F(CommandTest, StrictFromConfig) {
    auto cfg = write_file("cfg.json", R"({"strict": true, "per_line": true, "from_line": 3})");
    EXPECT_EQ(run(cmd_parse, {"parse", recipe.string(), "--config", cfg.string()}), 1);
    EXPECT_TRUE(err_has("line 8: "));
}

TEST_F(CommandTest, WritesJsonReport) {
    const fs::path report = dir / "out" / "ingredients.json";
    int rc = run(cmd_parse, {"parse", recipe.string(), "--from", "3", "--per-line", "--json", report.string()});

    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(out_has("OUT_INGREDIENTS: " + report.string()));
    ASSERT_TRUE(fs::exists(report));

    std::ifstream in(report);
    nlohmann::json j;
    in >> j;
    EXPECT_EQ(j["num_ingredients"], 2);
    ASSERT_EQ(j["issues"].size(), 1u);
    EXPECT_EQ(j["issues"][0]["tokens"][0], "salt");
}

TEST_F(CommandTest, UsageAndInputErrors) {
    EXPECT_EQ(run(cmd_parse, {"parse"}), 1);
    EXPECT_TRUE(err_has("error: missing input path"));

    EXPECT_EQ(run(cmd_parse, {"parse", (dir / "missing.txt").string()}), 1);
    EXPECT_TRUE(err_has("[error] failed to open: "));

    auto bad = write_file("bad.json", R"({"per_line": 1})");
    EXPECT_EQ(run(cmd_parse, {"parse", recipe.string(), "--config", bad.string()}), 1);
    EXPECT_TRUE(err_has("[error] failed to load config: root.per_line must be a boolean"));
}

TEST_F(CommandTest, LineCommand) {
    EXPECT_EQ(run(cmd_line, {"line", "1 (8) can tomatoes"}), 0);
    EXPECT_TRUE(out_has("Ingredient(quantity='1', unit='(8)', name='can tomatoes')"));

    EXPECT_EQ(run(cmd_line, {"line", "1 cup water 3", "--strict"}), 1);
    EXPECT_TRUE(err_has("[error] malformed ingredient line"));

    EXPECT_EQ(run(cmd_line, {"line"}), 1);
}
