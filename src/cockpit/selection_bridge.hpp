#pragma once

#include <cstdint>
#include <lectern/subscription.hpp>
#include <lectern/surface_host.hpp>
#include <optional>
#include <string>

#include "cockpit_state.hpp"
#include "pane_registry.hpp"

namespace lectern
{

// Payload published by the in-surface script on the selection channel.
struct SelectionPayload
{
    std::string                selection;
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::optional<std::string> webview_label;
};

// nullopt unless the text is a JSON object with a string "selection".
std::optional<SelectionPayload> decode_selection_payload(const std::string& json);

// Initialization script for the surface `source_label`.  It publishes
// {selection, title, url, webviewLabel} to `host_label` on `channel` after
// the selection settles, and goes quiet when the page cannot reach the host's
// messaging object.
std::string selection_bridge_script(const std::string& channel,
                                    const std::string& host_label,
                                    const std::string& source_label,
                                    uint32_t           debounce_ms);

struct SelectionBridgeOptions
{
    std::string channel     = "cockpit-webview-selection";
    std::string host_label  = "main";
    uint32_t    debounce_ms = 120;
};

// Host side of the selection channel plus the clipboard fallback.  Both
// paths write CockpitState::selection; the last writer wins.
class SelectionBridge
{
   public:
    SelectionBridge(SurfaceHost&           host,
                    CockpitState&          state,
                    PaneRegistry&          panes,
                    SelectionBridgeOptions options);

    SelectionBridge(const SelectionBridge&)            = delete;
    SelectionBridge& operator=(const SelectionBridge&) = delete;

    // Listens on the channel.  Once per session: a second call while
    // subscribed does nothing and returns false.
    bool subscribe();
    void unsubscribe();
    bool subscribed() const { return subscription_.active(); }

    // Capability is resolved once, when the surface is created.
    BridgeCapability resolve_capability(const std::string& label);
    BridgeCapability capability(const std::string& label) const;
    void             forget(const std::string& label);

    // Scripts to inject into a new surface (empty when the host cannot inject).
    std::vector<std::string> init_scripts_for(const std::string& label) const;

    void handle_message(const ChannelMessage& message);

    // Reads the clipboard into the selection.  Returns false when the
    // clipboard is unavailable or holds only whitespace; the selection is then
    // left unchanged.
    bool paste_from_clipboard();

    const SelectionBridgeOptions& options() const { return options_; }

   private:
    SurfaceHost&           host_;
    CockpitState&          state_;
    PaneRegistry&          panes_;
    SelectionBridgeOptions options_;
    Subscription           subscription_;
};

}   // namespace lectern
