#include <gtest/gtest.h>
#include "config/tool_defaults.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace codenv;

class ToolDefaultsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "codenv_tool_defaults_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    fs::path test_dir_;
};

TEST_F(ToolDefaultsTest, ReadsCodexModelFromToml) {
    std::string path = write_file("config.toml",
        "model = \"gpt-5.1-codex\"\n"
        "model_provider = \"openai\"\n"
        "\n"
        "[model_providers.openai]\n"
        "name = \"OpenAI\"\n");
    EXPECT_EQ(read_codex_default_model(path).value_or(""), "gpt-5.1-codex");
}

TEST_F(ToolDefaultsTest, CodexModelMissingOrBroken) {
    std::string no_model = write_file("a.toml", "model_provider = \"openai\"\n");
    EXPECT_FALSE(read_codex_default_model(no_model).has_value());

    std::string broken = write_file("b.toml", "model = \n[[[");
    EXPECT_FALSE(read_codex_default_model(broken).has_value());

    EXPECT_FALSE(read_codex_default_model((test_dir_ / "absent.toml").string()).has_value());
}

TEST_F(ToolDefaultsTest, ReadsClaudeModelFromSettings) {
    std::string path = write_file("settings.json", R"({"model": "claude-opus-4-5-20251101", "env": {}})");
    EXPECT_EQ(read_claude_default_model(path).value_or(""), "claude-opus-4-5-20251101");

    std::string bad = write_file("bad.json", "{");
    EXPECT_FALSE(read_claude_default_model(bad).has_value());
}
