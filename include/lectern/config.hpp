#pragma once

#include <cstdint>
#include <string>

namespace lectern
{

struct CockpitConfig
{
    // Panes
    uint32_t    initial_pane_count = 1;
    std::string default_url        = "https://duckduckgo.com/";

    // Surface lifecycle and bounds sync
    uint32_t layout_retry_attempts = 60;
    uint32_t settle_burst_frames   = 40;

    // Selection bridge
    std::string selection_channel     = "cockpit-webview-selection";
    std::string host_label            = "main";
    uint32_t    selection_debounce_ms = 120;

    // Notes panel / notifications
    uint32_t note_autosave_delay_ms = 500;
    uint32_t toast_ttl_ms           = 4000;

    // Host window
    uint32_t window_width  = 1400;
    uint32_t window_height = 900;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Load from a flat JSON object.  Missing keys keep their current value,
    // out-of-range numbers are clamped.  Returns false when the file cannot be
    // read or is not a JSON object; the config is left untouched in that case.
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    bool        deserialize(const std::string& json);
    std::string serialize() const;

    // $XDG_CONFIG_HOME/lectern/cockpit.json, else ~/.config/lectern/cockpit.json
    static std::string default_path();
};

}   // namespace lectern
