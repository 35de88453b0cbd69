#include <gtest/gtest.h>

#include "cockpit/cockpit.hpp"
#include "util/fake_notes_service.hpp"
#include "util/fake_surface_host.hpp"

using namespace lectern;
using lectern::test::FakeNotesService;
using lectern::test::FakeSurfaceHost;

class CockpitTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        host.set_metrics(0.0, 0.0, 1.0);
        for (size_t i = 0; i < MAX_PANES; ++i)
            mount(PaneRegistry::label_for(i), static_cast<float>(i) * 400.0f);
    }

    void mount(const std::string& label, float x)
    {
        cockpit.layout().update(label, HostRect{x, 80.0f, 380.0f, 600.0f});
    }

    CockpitContext idea_context()
    {
        CockpitContext ctx;
        ctx.url     = "techsite.example";
        ctx.title   = "Tech site";
        ctx.idea_id = 7;
        return ctx;
    }

    FakeSurfaceHost  host;
    FakeNotesService notes;
    CockpitConfig    config;
    Cockpit          cockpit{host, notes, config};
    FrameTime        t0 = FrameClock::now();
};

// ─── Session ─────────────────────────────────────────────────────────────────

TEST_F(CockpitTest, OpenSeedsFirstPaneAndResolvesTarget)
{
    cockpit.open(idea_context(), t0);

    ASSERT_TRUE(cockpit.is_open());
    const auto& state = cockpit.state();
    EXPECT_EQ(state.pane_count, 1u);
    EXPECT_EQ(state.panes[0].current_url, "https://techsite.example");
    EXPECT_EQ(state.panes[0].title, "Tech site");
    ASSERT_TRUE(std::holds_alternative<IdeaNote>(state.note_target));
    EXPECT_EQ(std::get<IdeaNote>(state.note_target).idea_id, 7);

    ASSERT_EQ(host.creates.size(), 1u);
    EXPECT_EQ(host.creates[0].label, "pane-1");
    EXPECT_EQ(host.creates[0].url, "https://techsite.example");
    EXPECT_EQ(host.listener_count(config.selection_channel), 1u);
}

TEST_F(CockpitTest, PastedSelectionGoesToIdeaNote)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();

    host.set_clipboard(std::string("  Interesting claim about X.\n"));
    ASSERT_TRUE(cockpit.paste_selection(t0));
    EXPECT_EQ(cockpit.state().selection.text, "Interesting claim about X.");
    EXPECT_TRUE(cockpit.can_add_to_notes());

    AppendResult result = cockpit.add_selection_to_notes(t0);
    EXPECT_TRUE(result.ok());

    ASSERT_EQ(notes.appends.size(), 1u);
    const auto& call = notes.appends[0];
    EXPECT_EQ(call.entity_type, "idea");
    EXPECT_EQ(call.entity_id, 7);
    EXPECT_EQ(call.note_type, "main");
    EXPECT_EQ(call.text, "Interesting claim about X.");
    EXPECT_EQ(call.source_url.value_or(""), "https://techsite.example");
    EXPECT_EQ(call.source_title.value_or(""), "Tech site");

    EXPECT_TRUE(cockpit.state().selection.text.empty());
    EXPECT_NE(cockpit.draft().text().find("Interesting claim about X."), std::string::npos);
    ASSERT_NE(cockpit.notifications().latest(NotificationKind::Success), nullptr);
}

TEST_F(CockpitTest, EditedSelectionReplacesBridgeText)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();
    host.emit_channel(config.selection_channel,
                      ChannelMessage{"pane-1",
                                     R"({"selection":"A long quoted passage","url":"https://techsite.example/a"})"});
    ASSERT_EQ(cockpit.state().selection.text, "A long quoted passage");

    cockpit.set_selection_text("A quoted passage");
    EXPECT_TRUE(cockpit.add_selection_to_notes(t0).ok());
    ASSERT_EQ(notes.appends.size(), 1u);
    EXPECT_EQ(notes.appends[0].text, "A quoted passage");
    EXPECT_EQ(notes.appends[0].source_url.value_or(""), "https://techsite.example/a");
}

TEST_F(CockpitTest, FailedAppendKeepsSelection)
{
    cockpit.open(idea_context(), t0);
    cockpit.set_selection_text("keep me");
    notes.fail_appends = true;

    AppendResult result = cockpit.add_selection_to_notes(t0);
    EXPECT_EQ(result.outcome, AppendOutcome::Failed);
    EXPECT_EQ(cockpit.state().selection.text, "keep me");
    EXPECT_NE(cockpit.notifications().latest(NotificationKind::Error), nullptr);
}

TEST_F(CockpitTest, UnsavableDraftBlocksAppend)
{
    cockpit.open(idea_context(), t0);
    cockpit.draft().edit("my long unsaved edits", t0);
    notes.fail_upserts = true;
    cockpit.set_selection_text("Interesting claim");

    AppendResult result = cockpit.add_selection_to_notes(t0);
    EXPECT_EQ(result.outcome, AppendOutcome::Failed);
    EXPECT_TRUE(notes.appends.empty());
    EXPECT_EQ(cockpit.state().selection.text, "Interesting claim");
    EXPECT_TRUE(cockpit.draft().dirty());
    EXPECT_EQ(cockpit.draft().text(), "my long unsaved edits");
    EXPECT_NE(cockpit.notifications().latest(NotificationKind::Error), nullptr);

    notes.fail_upserts = false;
    EXPECT_TRUE(cockpit.add_selection_to_notes(t0).ok());
    ASSERT_EQ(notes.upserts.size(), 1u);
    EXPECT_EQ(notes.upserts[0], "my long unsaved edits");
    EXPECT_NE(cockpit.draft().text().find("Interesting claim"), std::string::npos);
}

TEST_F(CockpitTest, FailedNoteLoadNeverOverwritesStoredNote)
{
    notes.stored_body = "<p>years of research</p>";
    notes.fail_loads  = true;
    cockpit.open(idea_context(), t0);
    EXPECT_NE(cockpit.notifications().latest(NotificationKind::Error), nullptr);

    notes.fail_loads = false;
    cockpit.draft().edit("<p>hi</p>", t0);
    cockpit.frame(t0 + std::chrono::seconds(5));
    EXPECT_EQ(notes.stored_body, "<p>years of research</p>");

    EXPECT_TRUE(cockpit.reload_note(t0));
    EXPECT_EQ(cockpit.draft().text(), "<p>years of research</p>");
}

TEST_F(CockpitTest, RetargetReportsNoteLoadFailure)
{
    cockpit.open(idea_context(), t0);
    EXPECT_EQ(cockpit.notifications().latest(NotificationKind::Error), nullptr);

    notes.fail_loads = true;
    CockpitContext next;
    next.url        = "other.example";
    next.writing_id = 4;
    cockpit.open(next, t0);

    const Notification* err = cockpit.notifications().latest(NotificationKind::Error);
    ASSERT_NE(err, nullptr);
    EXPECT_NE(err->message.find("Could not load note"), std::string::npos);
}

TEST_F(CockpitTest, NoTargetNeverCallsNotesService)
{
    CockpitContext ctx;
    ctx.url = "plain.example";
    cockpit.open(ctx, t0);
    cockpit.set_selection_text("orphan text");

    EXPECT_FALSE(cockpit.can_add_to_notes());
    AppendResult result = cockpit.add_selection_to_notes(t0);
    EXPECT_EQ(result.outcome, AppendOutcome::NoTarget);
    EXPECT_TRUE(notes.appends.empty());
    EXPECT_EQ(notes.get_or_create_calls, 0u);
    EXPECT_EQ(cockpit.state().selection.text, "orphan text");
}

TEST_F(CockpitTest, InvalidContextUrlFallsBackToDefault)
{
    CockpitContext ctx;
    ctx.url = "not a url";
    cockpit.open(ctx, t0);
    EXPECT_EQ(cockpit.state().panes[0].current_url, config.default_url);
}

TEST_F(CockpitTest, OpeningAgainRetargets)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();

    CockpitContext next;
    next.url          = "other.example/paper";
    next.reference_id = 12;
    cockpit.open(next, t0);

    EXPECT_EQ(host.creates.size(), 1u);
    ASSERT_FALSE(host.navigations.empty());
    EXPECT_EQ(host.navigations.back().first, "pane-1");
    EXPECT_EQ(host.navigations.back().second, "https://other.example/paper");
    EXPECT_TRUE(std::holds_alternative<ReferenceNote>(cockpit.state().note_target));
    EXPECT_EQ(host.listener_count(config.selection_channel), 1u);
}

TEST_F(CockpitTest, CloseTearsDownEverythingOnce)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();

    cockpit.close();
    EXPECT_FALSE(cockpit.is_open());
    EXPECT_EQ(host.live_count(), 0u);
    EXPECT_EQ(host.close_counts["pane-1"], 1);
    EXPECT_EQ(host.listener_count(config.selection_channel), 0u);
    EXPECT_EQ(host.window_listener_count(), 0u);

    cockpit.close();
    EXPECT_EQ(host.close_counts["pane-1"], 1);
}

TEST_F(CockpitTest, CloseFlushesDirtyDraft)
{
    cockpit.open(idea_context(), t0);
    cockpit.draft().edit("<p>unsaved</p>", t0);
    cockpit.close();
    ASSERT_EQ(notes.upserts.size(), 1u);
    EXPECT_EQ(notes.upserts[0], "<p>unsaved</p>");
}

// ─── Panes ───────────────────────────────────────────────────────────────────

TEST_F(CockpitTest, GrowingThenShrinkingClosesRemovedSurfaces)
{
    cockpit.open(idea_context(), t0);
    EXPECT_EQ(cockpit.set_pane_count(3), 3u);
    EXPECT_EQ(host.creates.size(), 3u);
    host.flush_creates();
    EXPECT_EQ(host.live_count(), 3u);

    cockpit.select_pane(2);
    EXPECT_EQ(cockpit.set_pane_count(1), 1u);

    EXPECT_EQ(host.live_count(), 1u);
    EXPECT_TRUE(host.is_live("pane-1"));
    EXPECT_EQ(host.close_counts["pane-1"], 0);
    EXPECT_EQ(host.close_counts["pane-2"], 1);
    EXPECT_EQ(host.close_counts["pane-3"], 1);
    EXPECT_EQ(cockpit.state().active_pane, 0u);
    EXPECT_FALSE(cockpit.layout().is_mounted("pane-2"));
}

TEST_F(CockpitTest, PaneCountIsClamped)
{
    cockpit.open(idea_context(), t0);
    EXPECT_EQ(cockpit.set_pane_count(0), 1u);
    EXPECT_EQ(cockpit.set_pane_count(9), 3u);
}

TEST_F(CockpitTest, NewPanesStartOnDefaultUrl)
{
    cockpit.open(idea_context(), t0);
    cockpit.set_pane_count(2);
    EXPECT_EQ(cockpit.state().panes[1].current_url, config.default_url);
    EXPECT_EQ(cockpit.state().panes[1].title, "Pane 2");
}

// ─── Navigation ──────────────────────────────────────────────────────────────

TEST_F(CockpitTest, SubmitUrlNavigatesActivePane)
{
    cockpit.open(idea_context(), t0);
    cockpit.set_pane_count(2);
    host.flush_creates();
    cockpit.select_pane(1);

    EXPECT_TRUE(cockpit.submit_url("news.example", t0));
    ASSERT_FALSE(host.navigations.empty());
    EXPECT_EQ(host.navigations.back().first, "pane-2");
    EXPECT_EQ(host.navigations.back().second, "https://news.example");
    EXPECT_EQ(cockpit.state().panes[1].current_url, "https://news.example");
}

TEST_F(CockpitTest, InvalidUrlPostsErrorAndNavigatesNowhere)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();

    EXPECT_FALSE(cockpit.submit_url("two words", t0));
    EXPECT_TRUE(host.navigations.empty());
    const Notification* err = cockpit.notifications().latest(NotificationKind::Error);
    ASSERT_NE(err, nullptr);
    EXPECT_NE(err->message.find("two words"), std::string::npos);
}

TEST_F(CockpitTest, HistoryTargetsActivePane)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();
    EXPECT_TRUE(cockpit.go_back());
    EXPECT_TRUE(cockpit.go_forward());
    EXPECT_TRUE(cockpit.reload());
    ASSERT_EQ(host.history_ops.size(), 3u);
    EXPECT_EQ(host.history_ops[0], "pane-1:back");
    EXPECT_EQ(host.history_ops[2], "pane-1:reload");
}

// ─── Frames ──────────────────────────────────────────────────────────────────

TEST_F(CockpitTest, UnmeasuredPaneIsCreatedOnceLayoutArrives)
{
    cockpit.layout().unmount("pane-2");
    cockpit.open(idea_context(), t0);
    cockpit.set_pane_count(2);
    EXPECT_EQ(host.creates.size(), 1u);

    cockpit.frame(t0);
    EXPECT_EQ(host.creates.size(), 1u);

    mount("pane-2", 400.0f);
    cockpit.frame(t0);
    ASSERT_EQ(host.creates.size(), 2u);
    EXPECT_EQ(host.creates[1].label, "pane-2");
}

TEST_F(CockpitTest, WindowMoveRepositionsSurfaces)
{
    cockpit.open(idea_context(), t0);
    host.flush_creates();

    host.set_metrics(200.0, 100.0, 2.0);
    host.emit_scale_changed();
    for (int i = 0; i < 50; ++i)
        cockpit.frame(t0);

    const auto& p = host.placements["pane-1"];
    EXPECT_EQ(p.x, 200);
    EXPECT_EQ(p.y, 260);
    EXPECT_EQ(p.width, 760u);
    EXPECT_EQ(p.height, 1200u);
}

TEST_F(CockpitTest, ToastsExpire)
{
    cockpit.open(idea_context(), t0);
    cockpit.submit_url("two words", t0);
    EXPECT_FALSE(cockpit.notifications().empty());
    cockpit.frame(t0 + std::chrono::milliseconds(config.toast_ttl_ms + 1));
    EXPECT_TRUE(cockpit.notifications().empty());
}
