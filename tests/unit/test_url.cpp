#include <gtest/gtest.h>

#include "core/json_util.hpp"
#include "core/text.hpp"
#include "core/url.hpp"

using namespace lectern;

// ─── Scheme detection ────────────────────────────────────────────────────────

TEST(Url, DetectsSchemes)
{
    EXPECT_TRUE(has_scheme("https://example.com"));
    EXPECT_TRUE(has_scheme("mailto:someone@example.com"));
    EXPECT_TRUE(has_scheme("tauri://localhost"));
    EXPECT_TRUE(has_scheme("about:blank"));
    EXPECT_FALSE(has_scheme("example.com"));
    EXPECT_FALSE(has_scheme(""));
    EXPECT_FALSE(has_scheme("1http://x"));
}

TEST(Url, HostWithPortIsNotAScheme)
{
    EXPECT_FALSE(has_scheme("localhost:3000"));
    EXPECT_FALSE(has_scheme("example.com:8080/path"));
}

// ─── normalize_url ───────────────────────────────────────────────────────────

TEST(Url, NormalizeAddsHttps)
{
    EXPECT_EQ(normalize_url("example.com"), "https://example.com");
    EXPECT_EQ(normalize_url("  techsite.example  "), "https://techsite.example");
    EXPECT_EQ(normalize_url("localhost:3000"), "https://localhost:3000");
}

TEST(Url, NormalizeKeepsExistingScheme)
{
    EXPECT_EQ(normalize_url("mailto:a@b.c"), "mailto:a@b.c");
    EXPECT_EQ(normalize_url("tauri://localhost"), "tauri://localhost");
    EXPECT_EQ(normalize_url("http://example.com/x"), "http://example.com/x");
}

TEST(Url, NormalizeEmptyStaysEmpty)
{
    EXPECT_EQ(normalize_url(""), "");
    EXPECT_EQ(normalize_url("   "), "");
}

// ─── parse_user_url ──────────────────────────────────────────────────────────

TEST(Url, ParseAcceptsBareHost)
{
    auto url = parse_user_url("example.com/page?q=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com/page?q=1");
}

TEST(Url, ParseRejectsInvalidInput)
{
    EXPECT_FALSE(parse_user_url("").has_value());
    EXPECT_FALSE(parse_user_url("two words").has_value());
    EXPECT_FALSE(parse_user_url("https://").has_value());
    EXPECT_FALSE(parse_user_url("http:///path").has_value());
}

// ─── Text helpers ────────────────────────────────────────────────────────────

TEST(Text, TrimAndBlank)
{
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("\t\r\n"), "");
    EXPECT_TRUE(is_blank(" \n\t"));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(Text, HtmlEscape)
{
    EXPECT_EQ(html_escape("<a href=\"x\">Tom & Jerry's</a>"),
              "&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&#39;s&lt;/a&gt;");
}

// ─── Flat JSON ───────────────────────────────────────────────────────────────

TEST(Json, ReadsTopLevelValues)
{
    const std::string doc = R"({"name": "a \"quoted\" value", "n": 42})";
    EXPECT_EQ(json::read_string(doc, "name").value_or(""), "a \"quoted\" value");
    EXPECT_DOUBLE_EQ(json::read_number(doc, "n").value_or(0.0), 42.0);
    EXPECT_FALSE(json::read_string(doc, "missing").has_value());
    EXPECT_FALSE(json::read_string(doc, "n").has_value());
}

TEST(Json, EscapeRoundTripsThroughReader)
{
    const std::string value = "line\nbreak \\ \"q\"";
    const std::string doc   = "{\"v\": \"" + json::escape(value) + "\"}";
    EXPECT_EQ(json::read_string(doc, "v").value_or(""), value);
}

TEST(Json, ObjectShape)
{
    EXPECT_TRUE(json::looks_like_object("  {\"a\": 1}  "));
    EXPECT_FALSE(json::looks_like_object("[1, 2]"));
    EXPECT_FALSE(json::looks_like_object("not json"));
    EXPECT_FALSE(json::looks_like_object(""));
}
