#pragma once

#ifdef LECTERN_USE_IMGUI

    #include <array>
    #include <cstddef>
    #include <string>

    #include "../anim/frame_queue.hpp"

namespace lectern
{

class Cockpit;

// Immediate-mode view of a Cockpit.  Each frame it draws the chrome and
// publishes the on-screen rectangle of every visible pane body to the
// cockpit's HostLayout, which is what child surfaces are placed over.
class CockpitPanel
{
   public:
    explicit CockpitPanel(Cockpit& cockpit);

    // `pixels_per_logical` converts ImGui coordinates to the host window's
    // logical units (content scale over framebuffer scale).
    void draw(FrameTime now, float pixels_per_logical);

    bool reopen_requested() const { return reopen_requested_; }
    void clear_reopen_request() { reopen_requested_ = false; }

   private:
    void draw_top_bar(FrameTime now);
    void draw_panes(float pixels_per_logical);
    void draw_side_panel(FrameTime now);
    void draw_notifications();
    void draw_closed();

    void sync_url_buffer();
    void sync_note_buffer();
    void sync_selection_buffer();

    Cockpit& cockpit_;

    std::array<char, 2048> url_buf_{};
    size_t                 url_synced_pane_ = static_cast<size_t>(-1);
    std::string            url_synced_value_;
    bool                   url_editing_ = false;

    std::string note_buf_;
    bool        note_editing_ = false;

    std::string selection_buf_;
    bool        selection_editing_ = false;

    bool reopen_requested_ = false;
};

}   // namespace lectern

#endif   // LECTERN_USE_IMGUI
