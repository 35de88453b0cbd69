#include <gtest/gtest.h>

#include "anim/frame_queue.hpp"
#include "cockpit/bounds_sync.hpp"
#include "cockpit/host_layout.hpp"
#include "cockpit/webview_lifecycle.hpp"
#include "util/fake_surface_host.hpp"

using namespace lectern;
using lectern::test::FakeSurfaceHost;

class BoundsSyncTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        host.set_metrics(100.0, 50.0, 1.0);
        create("pane-1");
    }

    void create(const std::string& label)
    {
        layout.update(label, HostRect{10.0f, 20.0f, 300.0f, 200.0f});
        lifecycle.ensure(label, "https://a.example");
        host.flush_creates();
    }

    FakeSurfaceHost         host;
    HostLayout              layout;
    FrameQueue              frames;
    WebviewLifecycleManager lifecycle{host, layout, frames, 60};
    BoundsSynchronizer      bounds{host, layout, frames, lifecycle, 40};
};

// ─── Triggers ────────────────────────────────────────────────────────────────

TEST_F(BoundsSyncTest, LayoutChangeRepositionsAttachedPane)
{
    bounds.attach("pane-1");
    layout.update("pane-1", HostRect{0.0f, 0.0f, 120.0f, 80.0f});
    const auto& p = host.placements["pane-1"];
    EXPECT_EQ(p.x, 100);
    EXPECT_EQ(p.y, 50);
    EXPECT_EQ(p.width, 120u);
    EXPECT_EQ(p.height, 80u);
}

TEST_F(BoundsSyncTest, UnchangedLayoutDoesNotResync)
{
    bounds.attach("pane-1");
    const size_t calls = host.placement_calls;
    layout.update("pane-1", HostRect{10.0f, 20.0f, 300.0f, 200.0f});
    EXPECT_EQ(host.placement_calls, calls);
}

TEST_F(BoundsSyncTest, DetachedPaneIgnoresLayout)
{
    bounds.attach("pane-1");
    bounds.detach("pane-1");
    const size_t calls = host.placement_calls;
    layout.update("pane-1", HostRect{0.0f, 0.0f, 120.0f, 80.0f});
    EXPECT_EQ(host.placement_calls, calls);
    EXPECT_FALSE(bounds.is_attached("pane-1"));
}

TEST_F(BoundsSyncTest, WindowMoveResyncsAllAttached)
{
    create("pane-2");
    bounds.start();
    bounds.attach("pane-1");
    bounds.attach("pane-2");

    host.set_metrics(400.0, 300.0, 1.0);
    host.emit_moved();
    EXPECT_EQ(host.placements["pane-1"].x, 410);
    EXPECT_EQ(host.placements["pane-2"].y, 320);
}

TEST_F(BoundsSyncTest, ResizeAndScaleChangeResync)
{
    bounds.start();
    bounds.attach("pane-1");

    host.set_metrics(0.0, 0.0, 2.0);
    host.emit_scale_changed();
    EXPECT_EQ(host.placements["pane-1"].width, 600u);

    host.set_metrics(0.0, 0.0, 1.5);
    host.emit_resized();
    EXPECT_EQ(host.placements["pane-1"].width, 450u);
}

TEST_F(BoundsSyncTest, StopDropsEveryListener)
{
    bounds.start();
    bounds.attach("pane-1");
    EXPECT_EQ(host.window_listener_count(), 3u);
    EXPECT_EQ(layout.observer_count(), 1u);

    bounds.stop();
    EXPECT_EQ(host.window_listener_count(), 0u);
    EXPECT_EQ(layout.observer_count(), 0u);

    const size_t calls = host.placement_calls;
    host.emit_moved();
    EXPECT_EQ(host.placement_calls, calls);
}

TEST_F(BoundsSyncTest, StartTwiceRegistersOnce)
{
    bounds.start();
    bounds.start();
    EXPECT_EQ(host.window_listener_count(), 3u);
}

TEST_F(BoundsSyncTest, UnmountedHostMakesResyncANoOp)
{
    bounds.attach("pane-1");
    layout.unmount("pane-1");
    const size_t calls = host.placement_calls;

    bounds.resync("pane-1");
    bounds.resync_all();
    EXPECT_EQ(host.placement_calls, calls);
}

TEST_F(BoundsSyncTest, MissingSurfaceMakesResyncANoOp)
{
    bounds.attach("pane-3");
    layout.update("pane-3", HostRect{0.0f, 0.0f, 50.0f, 50.0f});
    EXPECT_EQ(host.placements.count("pane-3"), 0u);
}

// ─── Settle burst ────────────────────────────────────────────────────────────

TEST_F(BoundsSyncTest, BurstIsCappedAtFortyFrames)
{
    bounds.attach("pane-1");
    const size_t before = host.placement_calls;

    bounds.start_burst();
    EXPECT_EQ(bounds.burst_frames_remaining(), 40u);
    for (int i = 0; i < 100; ++i)
        frames.tick();

    EXPECT_EQ(host.placement_calls - before, 40u);
    EXPECT_EQ(bounds.burst_frames_remaining(), 0u);
    EXPECT_EQ(frames.pending(), 0u);
}

TEST_F(BoundsSyncTest, RestartingBurstRearmsWithoutDoubling)
{
    bounds.attach("pane-1");
    const size_t before = host.placement_calls;

    bounds.start_burst();
    for (int i = 0; i < 10; ++i)
        frames.tick();
    bounds.start_burst();
    EXPECT_EQ(frames.pending(), 1u);
    for (int i = 0; i < 100; ++i)
        frames.tick();

    EXPECT_EQ(host.placement_calls - before, 50u);
}

TEST_F(BoundsSyncTest, StopBurstCancels)
{
    bounds.attach("pane-1");
    bounds.start_burst();
    frames.tick();
    bounds.stop_burst();
    EXPECT_EQ(frames.pending(), 0u);
    EXPECT_EQ(bounds.burst_frames_remaining(), 0u);
}

TEST_F(BoundsSyncTest, BurstFollowsLateLayoutShifts)
{
    bounds.attach("pane-1");
    bounds.start_burst();
    frames.tick();

    // A shift the observer does not see (same rect object, window moved
    // without an event) is still corrected by the next burst frame.
    host.set_metrics(200.0, 50.0, 1.0);
    frames.tick();
    EXPECT_EQ(host.placements["pane-1"].x, 210);
}
