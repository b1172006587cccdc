#include <gtest/gtest.h>
#include "usage/profile_binder.h"
#include <filesystem>

namespace fs = std::filesystem;
using namespace codenv;

namespace {

ProfileBindingEntry session_entry(ToolType tool, const std::string& key, const std::string& name,
                                  const std::string& file, const std::string& id) {
    ProfileBindingEntry e;
    e.kind = BindingKind::Session;
    e.timestamp = "2025-05-01T10:00:00.000Z";
    e.profile_key = key;
    e.profile_name = name;
    e.profile_type = tool;
    e.session_file = file;
    e.session_id = id;
    return e;
}

}

TEST(ProfileBinderTest, MatchesByFileBeforeId) {
    std::vector<ProfileBindingEntry> entries = {
        session_entry(ToolType::Codex, "codex-a", "a", "/s/one.jsonl", ""),
        session_entry(ToolType::Codex, "codex-b", "b", "", "sid-1"),
    };
    ProfileBinder binder(entries);
    BindingResult result = binder.resolve(ToolType::Codex, "/s/one.jsonl", "sid-1");
    ASSERT_TRUE(result.match.has_value());
    EXPECT_FALSE(result.ambiguous);
    EXPECT_EQ(result.match->profile_key, "codex-a");

    result = binder.resolve(ToolType::Codex, "/s/two.jsonl", "sid-1");
    ASSERT_TRUE(result.match.has_value());
    EXPECT_EQ(result.match->profile_key, "codex-b");
}

TEST(ProfileBinderTest, TwoProfilesForOneSessionIsAmbiguous) {
    std::vector<ProfileBindingEntry> entries = {
        session_entry(ToolType::Claude, "cc-a", "a", "", "sid-1"),
        session_entry(ToolType::Claude, "cc-b", "b", "", "sid-1"),
    };
    BindingResult result = ProfileBinder(entries).resolve(ToolType::Claude, "/s/x.jsonl", "sid-1");
    EXPECT_FALSE(result.match.has_value());
    EXPECT_TRUE(result.ambiguous);
}

TEST(ProfileBinderTest, RepeatedBindingToSameProfileIsUnique) {
    std::vector<ProfileBindingEntry> entries = {
        session_entry(ToolType::Claude, "cc-a", "a", "", "sid-1"),
        session_entry(ToolType::Claude, "cc-a", "a", "", "sid-1"),
    };
    BindingResult result = ProfileBinder(entries).resolve(ToolType::Claude, "", "sid-1");
    ASSERT_TRUE(result.match.has_value());
    EXPECT_EQ(result.match->profile_key, "cc-a");
}

TEST(ProfileBinderTest, IgnoresOtherToolsAndUseEntries) {
    ProfileBindingEntry use = session_entry(ToolType::Codex, "codex-u", "u", "", "sid-1");
    use.kind = BindingKind::Use;
    std::vector<ProfileBindingEntry> entries = {
        session_entry(ToolType::Claude, "cc-a", "a", "", "sid-1"),
        use,
    };
    BindingResult result = ProfileBinder(entries).resolve(ToolType::Codex, "", "sid-1");
    EXPECT_FALSE(result.match.has_value());
    EXPECT_FALSE(result.ambiguous);
}

TEST(ProfileBinderTest, NameFromConfigWhenKeyKnown) {
    UsageConfig config;
    config.profiles["codex-work"] = ProfileConfig{};
    config.profiles["codex-named"] = ProfileConfig{"Named", "codex", std::nullopt};

    std::vector<ProfileBindingEntry> entries = {
        session_entry(ToolType::Codex, "codex-work", "stale", "", "sid-1"),
        session_entry(ToolType::Codex, "codex-named", "", "", "sid-2"),
        session_entry(ToolType::Codex, "", "loose", "", "sid-3"),
    };
    ProfileBinder binder(entries, &config);
    EXPECT_EQ(binder.resolve(ToolType::Codex, "", "sid-1").match->profile_name, "work");
    EXPECT_EQ(binder.resolve(ToolType::Codex, "", "sid-2").match->profile_name, "Named");

    auto loose = binder.resolve(ToolType::Codex, "", "sid-3");
    ASSERT_TRUE(loose.match.has_value());
    EXPECT_EQ(loose.match->profile_key, "");
    EXPECT_EQ(loose.match->profile_name, "loose");
}

class ProfileBindingLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "codenv_binding_log_test";
        fs::remove_all(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
};

TEST_F(ProfileBindingLogTest, WritersRoundTripThroughBinder) {
    ProfileBindingLog log((test_dir_ / "profile-log.jsonl").string());

    UsageContext ctx;
    ctx.tool = ToolType::Codex;
    ctx.profile_key = "codex-work";
    ctx.terminal_tag = "tty1";
    ctx.cwd = "/work";
    ASSERT_TRUE(log.append_use(ctx));
    ASSERT_TRUE(log.append_session(ctx, "/s/rollout.jsonl", "sid-9"));

    UsageContext anonymous;
    EXPECT_FALSE(log.append_session(anonymous, "/s/other.jsonl", "sid-10"));

    auto entries = log.read_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].kind == BindingKind::Use);
    EXPECT_TRUE(entries[1].kind == BindingKind::Session);
    EXPECT_EQ(entries[1].profile_name, "codex-work");
    EXPECT_EQ(entries[1].terminal_tag, "tty1");

    BindingResult result = ProfileBinder(entries).resolve(ToolType::Codex, "/s/rollout.jsonl", "");
    ASSERT_TRUE(result.match.has_value());
    EXPECT_EQ(result.match->profile_key, "codex-work");
}
