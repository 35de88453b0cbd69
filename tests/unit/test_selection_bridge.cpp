#include <gtest/gtest.h>

#include "cockpit/pane_registry.hpp"
#include "cockpit/selection_bridge.hpp"
#include "util/fake_surface_host.hpp"

using namespace lectern;
using lectern::test::FakeSurfaceHost;

static const std::string CHANNEL = "cockpit-webview-selection";

class SelectionBridgeTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        panes.set_pane_count(2);
        PanePatch p;
        p.title       = "Pane 1";
        p.current_url = "https://one.example";
        panes.update_pane(0, p);
    }

    void send(const std::string& source, const std::string& json)
    {
        host.emit_channel(CHANNEL, ChannelMessage{source, json});
    }

    FakeSurfaceHost host;
    CockpitState    state;
    PaneRegistry    panes{state};
    SelectionBridge bridge{host, state, panes, SelectionBridgeOptions{}};
};

// ─── Payload decoding ────────────────────────────────────────────────────────

TEST(SelectionPayload, DecodesAllFields)
{
    auto p = decode_selection_payload(
        R"({"selection":"hello","title":"T","url":"https://x.example","webviewLabel":"pane-2"})");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->selection, "hello");
    EXPECT_EQ(p->title.value_or(""), "T");
    EXPECT_EQ(p->url.value_or(""), "https://x.example");
    EXPECT_EQ(p->webview_label.value_or(""), "pane-2");
}

TEST(SelectionPayload, OptionalFieldsMayBeMissing)
{
    auto p = decode_selection_payload(R"({"selection":""})");
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(p->title.has_value());
    EXPECT_FALSE(p->webview_label.has_value());
}

TEST(SelectionPayload, RejectsMalformed)
{
    EXPECT_FALSE(decode_selection_payload("").has_value());
    EXPECT_FALSE(decode_selection_payload("hello").has_value());
    EXPECT_FALSE(decode_selection_payload(R"({"title":"no selection"})").has_value());
    EXPECT_FALSE(decode_selection_payload(R"({"selection": 12})").has_value());
}

TEST(SelectionPayload, ScriptNamesChannelAndLabel)
{
    std::string js = selection_bridge_script(CHANNEL, "main", "pane-3", 120);
    EXPECT_NE(js.find("\"cockpit-webview-selection\""), std::string::npos);
    EXPECT_NE(js.find("\"pane-3\""), std::string::npos);
    EXPECT_NE(js.find("selectionchange"), std::string::npos);
    EXPECT_NE(js.find("120"), std::string::npos);
}

// ─── Subscription ────────────────────────────────────────────────────────────

TEST_F(SelectionBridgeTest, SubscribesOnce)
{
    EXPECT_TRUE(bridge.subscribe());
    EXPECT_FALSE(bridge.subscribe());
    EXPECT_EQ(host.listener_count(CHANNEL), 1u);

    bridge.unsubscribe();
    EXPECT_EQ(host.listener_count(CHANNEL), 0u);
    EXPECT_FALSE(bridge.subscribed());
}

TEST_F(SelectionBridgeTest, MessageUpdatesSelectionAndPane)
{
    bridge.subscribe();
    send("pane-1",
         R"({"selection":"  A claim.  ","title":"Article","url":"https://one.example/a","webviewLabel":"pane-1"})");

    EXPECT_EQ(state.selection.text, "A claim.");
    EXPECT_EQ(state.selection.source_title, "Article");
    EXPECT_EQ(state.selection.source_url, "https://one.example/a");
    EXPECT_EQ(panes.pane(0).title, "Article");
    EXPECT_EQ(panes.pane(0).current_url, "https://one.example/a");
}

TEST_F(SelectionBridgeTest, EmptySelectionClearsBuffer)
{
    bridge.subscribe();
    state.selection.text = "pasted earlier";
    send("pane-1", R"({"selection":"   ","title":"Loaded","url":"https://one.example/b"})");

    EXPECT_EQ(state.selection.text, "");
    EXPECT_EQ(state.selection.source_url, "https://one.example/b");
    EXPECT_EQ(panes.pane(0).title, "Loaded");
    EXPECT_EQ(panes.pane(0).current_url, "https://one.example/b");
}

TEST_F(SelectionBridgeTest, PasteAfterEmptyPingWins)
{
    bridge.subscribe();
    send("pane-1", R"({"selection":""})");
    host.set_clipboard(std::string("from clipboard"));
    ASSERT_TRUE(bridge.paste_from_clipboard());
    EXPECT_EQ(state.selection.text, "from clipboard");
}

TEST_F(SelectionBridgeTest, EmptyMetadataDoesNotOverwritePane)
{
    bridge.subscribe();
    send("pane-1", R"({"selection":"x","title":"","url":""})");
    EXPECT_EQ(panes.pane(0).title, "Pane 1");
    EXPECT_EQ(panes.pane(0).current_url, "https://one.example");
    EXPECT_EQ(state.selection.source_url, "https://one.example");
    EXPECT_EQ(state.selection.source_title, "Pane 1");
}

TEST_F(SelectionBridgeTest, InactivePaneSelectionStillWins)
{
    bridge.subscribe();
    send("pane-1", R"({"selection":"first"})");
    send("pane-2", R"({"selection":"second","url":"https://two.example"})");
    EXPECT_EQ(panes.active_index(), 0u);
    EXPECT_EQ(state.selection.text, "second");
    EXPECT_EQ(panes.pane(1).current_url, "https://two.example");
}

TEST_F(SelectionBridgeTest, MalformedMessageIsDropped)
{
    bridge.subscribe();
    state.selection.text = "unchanged";
    send("pane-1", "{not json");
    EXPECT_EQ(state.selection.text, "unchanged");
}

TEST_F(SelectionBridgeTest, UnsubscribedBridgeIgnoresMessages)
{
    send("pane-1", R"({"selection":"ignored"})");
    EXPECT_EQ(state.selection.text, "");
}

// ─── Capability ──────────────────────────────────────────────────────────────

TEST_F(SelectionBridgeTest, CapabilityFollowsHostSupport)
{
    EXPECT_EQ(bridge.capability("pane-1"), BridgeCapability::Unknown);
    EXPECT_EQ(bridge.resolve_capability("pane-1"), BridgeCapability::Available);
    EXPECT_EQ(bridge.init_scripts_for("pane-1").size(), 1u);

    host.set_supports_init_scripts(false);
    EXPECT_EQ(bridge.resolve_capability("pane-1"), BridgeCapability::Available);
    EXPECT_EQ(bridge.resolve_capability("pane-2"), BridgeCapability::Unavailable);
    EXPECT_TRUE(bridge.init_scripts_for("pane-2").empty());

    bridge.forget("pane-1");
    EXPECT_EQ(bridge.capability("pane-1"), BridgeCapability::Unknown);
}

// ─── Clipboard fallback ──────────────────────────────────────────────────────

TEST_F(SelectionBridgeTest, PasteTrimsAndTagsActivePane)
{
    host.set_clipboard("\n  Interesting claim about X.  \n");
    EXPECT_TRUE(bridge.paste_from_clipboard());
    EXPECT_EQ(state.selection.text, "Interesting claim about X.");
    EXPECT_EQ(state.selection.source_url, "https://one.example");
    EXPECT_EQ(state.selection.source_title, "Pane 1");
}

TEST_F(SelectionBridgeTest, BlankClipboardLeavesSelection)
{
    state.selection.text = "keep";
    host.set_clipboard("   ");
    EXPECT_FALSE(bridge.paste_from_clipboard());
    host.set_clipboard(std::nullopt);
    EXPECT_FALSE(bridge.paste_from_clipboard());
    EXPECT_EQ(state.selection.text, "keep");
}

TEST_F(SelectionBridgeTest, PasteThenBridgeLastWriterWins)
{
    bridge.subscribe();
    host.set_clipboard("pasted");
    bridge.paste_from_clipboard();
    send("pane-1", R"({"selection":"selected"})");
    EXPECT_EQ(state.selection.text, "selected");

    bridge.paste_from_clipboard();
    EXPECT_EQ(state.selection.text, "pasted");
}
