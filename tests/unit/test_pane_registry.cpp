#include <gtest/gtest.h>

#include "cockpit/pane_registry.hpp"

using namespace lectern;

class PaneRegistryTest : public ::testing::Test
{
   protected:
    CockpitState state;
    PaneRegistry panes{state};
};

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST_F(PaneRegistryTest, StartsWithOneActivePane)
{
    EXPECT_EQ(panes.pane_count(), 1u);
    EXPECT_EQ(panes.active_index(), 0u);
    EXPECT_EQ(panes.pane(0).label, "pane-1");
    EXPECT_EQ(panes.pane(1).label, "pane-2");
    EXPECT_EQ(panes.pane(2).label, "pane-3");
}

TEST_F(PaneRegistryTest, LabelsAreUnique)
{
    for (size_t i = 0; i < MAX_PANES; ++i)
        for (size_t j = i + 1; j < MAX_PANES; ++j)
            EXPECT_NE(panes.pane(i).label, panes.pane(j).label);
}

// ─── set_pane_count ──────────────────────────────────────────────────────────

TEST_F(PaneRegistryTest, GrowingReportsAddedLabels)
{
    auto change = panes.set_pane_count(3);
    EXPECT_EQ(panes.pane_count(), 3u);
    ASSERT_EQ(change.added.size(), 2u);
    EXPECT_EQ(change.added[0], "pane-2");
    EXPECT_EQ(change.added[1], "pane-3");
    EXPECT_TRUE(change.removed.empty());
}

TEST_F(PaneRegistryTest, ShrinkingReportsRemovedLabels)
{
    panes.set_pane_count(3);
    auto change = panes.set_pane_count(1);
    EXPECT_EQ(panes.pane_count(), 1u);
    ASSERT_EQ(change.removed.size(), 2u);
    EXPECT_EQ(change.removed[0], "pane-2");
    EXPECT_EQ(change.removed[1], "pane-3");
    EXPECT_TRUE(change.added.empty());
}

TEST_F(PaneRegistryTest, CountIsClamped)
{
    panes.set_pane_count(0);
    EXPECT_EQ(panes.pane_count(), 1u);
    panes.set_pane_count(17);
    EXPECT_EQ(panes.pane_count(), MAX_PANES);
}

TEST_F(PaneRegistryTest, ExactlyNActiveForEveryN)
{
    for (size_t n = 1; n <= MAX_PANES; ++n)
    {
        panes.set_pane_count(n);
        EXPECT_EQ(panes.active_labels().size(), n);
        for (size_t i = 0; i < MAX_PANES; ++i)
            EXPECT_EQ(panes.is_active_label(panes.pane(i).label), i < n);
    }
}

TEST_F(PaneRegistryTest, ShrinkingClampsActivePane)
{
    panes.set_pane_count(3);
    panes.select_pane(2);
    EXPECT_EQ(panes.active_index(), 2u);

    panes.set_pane_count(2);
    EXPECT_EQ(panes.active_index(), 1u);

    panes.set_pane_count(1);
    EXPECT_EQ(panes.active_index(), 0u);
}

TEST_F(PaneRegistryTest, ShrinkingKeepsActivePaneInRange)
{
    panes.set_pane_count(3);
    panes.select_pane(0);
    panes.set_pane_count(2);
    EXPECT_EQ(panes.active_index(), 0u);
}

// ─── select / update ─────────────────────────────────────────────────────────

TEST_F(PaneRegistryTest, SelectIsClampedToActiveRange)
{
    panes.set_pane_count(2);
    EXPECT_EQ(panes.select_pane(5), 1u);
    EXPECT_EQ(panes.active_pane().label, "pane-2");
}

TEST_F(PaneRegistryTest, UpdatePaneAppliesOnlyPresentFields)
{
    PanePatch p;
    p.title = "Paper";
    EXPECT_TRUE(panes.update_pane(0, p));
    EXPECT_EQ(panes.pane(0).title, "Paper");
    EXPECT_EQ(panes.pane(0).current_url, "");

    PanePatch u;
    u.current_url = "https://example.com";
    panes.update_pane(0, u);
    EXPECT_EQ(panes.pane(0).title, "Paper");
    EXPECT_EQ(panes.pane(0).current_url, "https://example.com");

    EXPECT_FALSE(panes.update_pane(MAX_PANES, p));
}

TEST_F(PaneRegistryTest, IndexOfUnknownLabel)
{
    EXPECT_EQ(panes.index_of("pane-2"), std::optional<size_t>(1));
    EXPECT_FALSE(panes.index_of("main").has_value());
    EXPECT_FALSE(panes.is_active_label("pane-2"));
}

TEST_F(PaneRegistryTest, ResetRestoresDefaults)
{
    panes.set_pane_count(3);
    panes.select_pane(2);
    PanePatch p;
    p.title = "x";
    panes.update_pane(1, p);

    panes.reset();
    EXPECT_EQ(panes.pane_count(), 1u);
    EXPECT_EQ(panes.active_index(), 0u);
    EXPECT_EQ(panes.pane(1).title, "");
}
