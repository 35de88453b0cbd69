#include <filesystem>
#include <gtest/gtest.h>
#include <lectern/config.hpp>

#include "core/command_line.hpp"

using namespace lectern;

// ─── CockpitConfig ───────────────────────────────────────────────────────────

TEST(CockpitConfig, Defaults)
{
    CockpitConfig c;
    EXPECT_EQ(c.initial_pane_count, 1u);
    EXPECT_EQ(c.layout_retry_attempts, 60u);
    EXPECT_EQ(c.settle_burst_frames, 40u);
    EXPECT_EQ(c.selection_channel, "cockpit-webview-selection");
    EXPECT_EQ(c.default_url, "https://duckduckgo.com/");
}

TEST(CockpitConfig, DeserializeOverridesAndIgnoresUnknownKeys)
{
    CockpitConfig c;
    ASSERT_TRUE(c.deserialize(R"({
        "initial_pane_count": 2,
        "default_url": "https://start.example/",
        "selection_debounce_ms": 250,
        "log_level": "debug",
        "something_else": "ignored"
    })"));
    EXPECT_EQ(c.initial_pane_count, 2u);
    EXPECT_EQ(c.default_url, "https://start.example/");
    EXPECT_EQ(c.selection_debounce_ms, 250u);
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.settle_burst_frames, 40u);
}

TEST(CockpitConfig, OutOfRangeValuesAreClamped)
{
    CockpitConfig c;
    ASSERT_TRUE(c.deserialize(R"({"initial_pane_count": 9, "layout_retry_attempts": 0})"));
    EXPECT_EQ(c.initial_pane_count, 3u);
    EXPECT_EQ(c.layout_retry_attempts, 1u);
}

TEST(CockpitConfig, UnknownLogLevelKeepsCurrent)
{
    CockpitConfig c;
    c.deserialize(R"({"log_level": "loud"})");
    EXPECT_EQ(c.log_level, "info");
}

TEST(CockpitConfig, RejectsNonObject)
{
    CockpitConfig c;
    EXPECT_FALSE(c.deserialize("[]"));
    EXPECT_FALSE(c.deserialize(""));
}

TEST(CockpitConfig, SaveAndLoad)
{
    auto path = std::filesystem::temp_directory_path() / "lectern_test_config" / "cockpit.json";
    CockpitConfig out;
    out.initial_pane_count = 3;
    out.host_label         = "host \"window\"";
    out.log_file           = "/tmp/lectern.log";
    ASSERT_TRUE(out.save(path.string()));

    CockpitConfig in;
    ASSERT_TRUE(in.load(path.string()));
    EXPECT_EQ(in.initial_pane_count, 3u);
    EXPECT_EQ(in.host_label, "host \"window\"");
    EXPECT_EQ(in.log_file, "/tmp/lectern.log");

    std::filesystem::remove_all(path.parent_path());
}

TEST(CockpitConfig, MissingFileFailsAndKeepsDefaults)
{
    CockpitConfig c;
    EXPECT_FALSE(c.load("/nonexistent/lectern/cockpit.json"));
    EXPECT_EQ(c.initial_pane_count, 1u);
}

// ─── Command line ────────────────────────────────────────────────────────────

TEST(CommandLine, ParsesContext)
{
    CommandLine cmd;
    std::string err;
    ASSERT_TRUE(parse_command_line(
        {"--url", "techsite.example", "--title", "Tech", "--idea-id", "7", "--panes", "2"}, cmd, err));
    EXPECT_EQ(cmd.context.url, "techsite.example");
    EXPECT_EQ(cmd.context.title.value_or(""), "Tech");
    EXPECT_EQ(cmd.context.idea_id.value_or(0), 7);
    EXPECT_EQ(cmd.panes.value_or(0), 2u);
    EXPECT_FALSE(cmd.help);
}

TEST(CommandLine, RejectsBadInput)
{
    CommandLine cmd;
    std::string err;
    EXPECT_FALSE(parse_command_line({"--idea-id", "seven"}, cmd, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(parse_command_line({"--panes", "4"}, cmd, err));
    EXPECT_FALSE(parse_command_line({"--url"}, cmd, err));
    EXPECT_FALSE(parse_command_line({"--bogus", "1"}, cmd, err));
    EXPECT_FALSE(parse_command_line({"stray"}, cmd, err));
}

TEST(CommandLine, HelpFlag)
{
    CommandLine cmd;
    std::string err;
    ASSERT_TRUE(parse_command_line({"-h"}, cmd, err));
    EXPECT_TRUE(cmd.help);
    EXPECT_NE(usage("lectern_cockpit").find("--reference-id"), std::string::npos);
}

TEST(CommandLine, OverridesConfig)
{
    CommandLine cmd;
    std::string err;
    ASSERT_TRUE(parse_command_line({"--panes", "3", "--log-level", "trace"}, cmd, err));
    CockpitConfig c;
    apply_command_line(cmd, c);
    EXPECT_EQ(c.initial_pane_count, 3u);
    EXPECT_EQ(c.log_level, "trace");
}
