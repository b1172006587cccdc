#include <gtest/gtest.h>
#include "config/usage_config.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace codenv;

class UsageConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "codenv_usage_config_test";
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

TEST_F(UsageConfigTest, MissingFileYieldsEmptyConfig) {
    std::string path = (test_dir_ / "nope.json").string();
    auto cfg = read_config(path);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->profiles.empty());
    EXPECT_EQ(ledger_path(*cfg), (test_dir_ / "usage.jsonl").string());
    EXPECT_EQ(state_path(*cfg), (test_dir_ / "usage.jsonl.state.json").string());
    EXPECT_EQ(lock_path(*cfg), (test_dir_ / "usage.jsonl.state.json.lock").string());
    EXPECT_EQ(binding_log_path(*cfg), (test_dir_ / "profile-log.jsonl").string());
}

TEST_F(UsageConfigTest, InvalidJsonReportsError) {
    std::string path = write_file("config.json", "{not json");
    std::string error;
    auto cfg = read_config(path, &error);
    EXPECT_FALSE(cfg.has_value());
    EXPECT_NE(error.find("Invalid JSON"), std::string::npos);
}

TEST_F(UsageConfigTest, PathOverrides) {
    std::string ledger = (test_dir_ / "data" / "ledger.jsonl").string();
    std::string path = write_file("config.json", nlohmann::json{
        {"usagePath", ledger},
        {"codexSessionsPath", (test_dir_ / "codex").string()},
        {"claudeSessionsPath", (test_dir_ / "claude").string()},
    }.dump());

    auto cfg = read_config(path);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(ledger_path(*cfg), ledger);
    EXPECT_EQ(state_path(*cfg), ledger + ".state.json");
    EXPECT_EQ(sessions_path(*cfg, ToolType::Codex), (test_dir_ / "codex").string());
    EXPECT_EQ(sessions_path(*cfg, ToolType::Claude), (test_dir_ / "claude").string());
}

TEST_F(UsageConfigTest, ParsesProfilesAndPricing) {
    std::string path = write_file("config.json", R"({
        "profiles": {
            "codex-work": {"type": "codex", "pricing": {"model": "gpt-5.1", "multiplier": "1.5x", "output": "$12"}},
            "cc-home": {"name": "Home", "type": "claude"}
        },
        "pricing": {"models": {"my-model": {"input": "1,250.5", "output": 2}}}
    })");

    auto cfg = read_config(path);
    ASSERT_TRUE(cfg.has_value());
    ASSERT_EQ(cfg->profiles.size(), 2u);

    const ProfileConfig* work = find_profile(*cfg, "codex-work");
    ASSERT_NE(work, nullptr);
    ASSERT_TRUE(work->pricing.has_value());
    EXPECT_EQ(work->pricing->model, "gpt-5.1");
    EXPECT_DOUBLE_EQ(work->pricing->multiplier.value_or(0), 1.5);
    EXPECT_DOUBLE_EQ(work->pricing->overrides.output.value_or(0), 12.0);
    EXPECT_FALSE(work->pricing->overrides.input.has_value());

    const auto& model = cfg->pricing_models.at("my-model");
    EXPECT_DOUBLE_EQ(model.input.value_or(0), 1250.5);
    EXPECT_DOUBLE_EQ(model.output.value_or(0), 2.0);
}

TEST(PriceValueTest, ParsesLooseStrings) {
    EXPECT_DOUBLE_EQ(parse_price_value(nlohmann::json("$3.75 / 1M")).value_or(-1), 3.75);
    EXPECT_DOUBLE_EQ(parse_price_value(nlohmann::json(0.3)).value_or(-1), 0.3);
    EXPECT_DOUBLE_EQ(parse_price_value(nlohmann::json("-2")).value_or(0), -2.0);
    EXPECT_FALSE(parse_price_value(nlohmann::json("free")).has_value());
    EXPECT_FALSE(parse_price_value(nlohmann::json(nullptr)).has_value());
}

TEST(ProfileNameTest, StripsTypePrefix) {
    ProfileConfig plain;
    EXPECT_EQ(profile_display_name("codex-work", plain, ToolType::Codex), "work");
    EXPECT_EQ(profile_display_name("cc_home", plain, ToolType::Claude), "home");
    EXPECT_EQ(profile_display_name("claude.team", plain, ToolType::Claude), "team");
    EXPECT_EQ(profile_display_name("work", plain, ToolType::Codex), "work");

    ProfileConfig typed;
    typed.type = "codex";
    EXPECT_EQ(profile_display_name("codex-", typed), "codex-");

    ProfileConfig named;
    named.name = "Named";
    EXPECT_EQ(profile_display_name("codex-work", named, ToolType::Codex), "Named");
}

TEST(ProfileTypeTest, InfersFromConfigThenKey) {
    ProfileConfig typed;
    typed.type = "Claude";
    EXPECT_TRUE(infer_profile_type("codex-x", &typed) == ToolType::Claude);
    EXPECT_TRUE(infer_profile_type("codex-x", nullptr) == ToolType::Codex);
    EXPECT_TRUE(infer_profile_type("cc-x", nullptr) == ToolType::Claude);
    EXPECT_FALSE(infer_profile_type("misc", nullptr).has_value());
}
