#pragma once

#include <cstddef>
#include <lectern/config.hpp>
#include <lectern/notes.hpp>
#include <lectern/surface_host.hpp>
#include <string>

#include "../anim/frame_queue.hpp"
#include "bounds_sync.hpp"
#include "cockpit_state.hpp"
#include "host_layout.hpp"
#include "note_draft.hpp"
#include "notification_queue.hpp"
#include "pane_registry.hpp"
#include "selection_bridge.hpp"
#include "snippet_appender.hpp"
#include "webview_lifecycle.hpp"

namespace lectern
{

// One research cockpit session over a host window.  Owns the session state
// and wires the pane, surface, bounds, selection and notes components
// together.  Every method runs on the UI thread.
class Cockpit
{
   public:
    Cockpit(SurfaceHost& host, NotesService& notes, const CockpitConfig& config);
    ~Cockpit();

    Cockpit(const Cockpit&)            = delete;
    Cockpit& operator=(const Cockpit&) = delete;

    // Opens the session, or retargets an open one at a new context.
    void open(const CockpitContext& context, FrameTime now);

    // Tears down every surface and observer.  Safe to call repeatedly.
    void close();

    bool is_open() const { return state_.open; }

    // Returns the clamped pane count.
    size_t set_pane_count(size_t n);
    size_t select_pane(size_t index);

    // Parses the URL bar text and navigates the active pane.  Invalid input
    // posts an error toast and navigates nowhere.
    bool submit_url(const std::string& text, FrameTime now);

    bool go_back();
    bool go_forward();
    bool reload();

    bool paste_selection(FrameTime now);
    void set_selection_text(std::string text);

    // Loads the target's note again after a failed load.
    bool reload_note(FrameTime now);

    bool         can_add_to_notes() const;
    AppendResult add_selection_to_notes(FrameTime now);

    // Once per rendered frame, after the UI pushed its host rectangles.
    void frame(FrameTime now);

    BridgeCapability active_bridge_capability() const;

    const CockpitState&  state() const { return state_; }
    const CockpitConfig& config() const { return config_; }

    HostLayout&              layout() { return layout_; }
    FrameQueue&              frames() { return frames_; }
    PaneRegistry&            panes() { return panes_; }
    WebviewLifecycleManager& lifecycle() { return lifecycle_; }
    BoundsSynchronizer&      bounds() { return bounds_; }
    SelectionBridge&         bridge() { return bridge_; }
    NoteDraft&               draft() { return draft_; }
    NotificationQueue&       notifications() { return notifications_; }

   private:
    void seed_pane(size_t index);
    void ensure_pane(size_t index);
    void teardown_pane(const std::string& label);
    void retarget(const CockpitContext& context, FrameTime now);
    bool bind_note(FrameTime now);
    std::string context_url(const CockpitContext& context) const;

    CockpitConfig config_;

    CockpitState            state_;
    HostLayout              layout_;
    FrameQueue              frames_;
    PaneRegistry            panes_;
    WebviewLifecycleManager lifecycle_;
    BoundsSynchronizer      bounds_;
    SelectionBridge         bridge_;
    SnippetAppender         appender_;
    NoteDraft               draft_;
    NotificationQueue       notifications_;
};

}   // namespace lectern
