#pragma once

#include <cstdint>
#include <lectern/subscription.hpp>
#include <lectern/surface_host.hpp>
#include <map>
#include <string>
#include <vector>

#include "../anim/frame_queue.hpp"
#include "host_layout.hpp"
#include "webview_lifecycle.hpp"

namespace lectern
{

// Keeps each attached pane's surface on top of its host rectangle.
//
// Resync triggers: the pane's layout observer, host window move, resize and
// scale-factor change, and a capped burst of per-frame resyncs after panes
// are created or the pane count changes.
class BoundsSynchronizer
{
   public:
    BoundsSynchronizer(SurfaceHost&             host,
                       HostLayout&              layout,
                       FrameQueue&              frames,
                       WebviewLifecycleManager& lifecycle,
                       uint32_t                 burst_frames);
    ~BoundsSynchronizer();

    BoundsSynchronizer(const BoundsSynchronizer&)            = delete;
    BoundsSynchronizer& operator=(const BoundsSynchronizer&) = delete;

    // Window-level listeners.  start() is a no-op when already running.
    void start();
    void stop();
    bool running() const { return running_; }

    // Per-pane layout observer.  The subscription lives until detach().
    void attach(const std::string& label);
    void detach(const std::string& label);
    void detach_all();
    bool is_attached(const std::string& label) const;

    // (Re)arms the settle burst with the full frame budget.
    void start_burst();
    void stop_burst();
    uint32_t burst_frames_remaining() const { return burst_remaining_; }

    void resync(const std::string& label);
    void resync_all();

    std::vector<std::string> attached_labels() const;

   private:
    void burst_tick();

    SurfaceHost&             host_;
    HostLayout&              layout_;
    FrameQueue&              frames_;
    WebviewLifecycleManager& lifecycle_;
    uint32_t                 burst_frames_;

    bool                                running_ = false;
    std::vector<Subscription>           window_subs_;
    std::map<std::string, Subscription> pane_subs_;

    uint32_t       burst_remaining_ = 0;
    FrameRequestId burst_request_   = INVALID_FRAME_REQUEST;
};

}   // namespace lectern
