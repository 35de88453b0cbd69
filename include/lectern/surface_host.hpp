#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <lectern/geometry.hpp>
#include <lectern/subscription.hpp>

namespace lectern
{

using SurfaceHandle = uint64_t;

inline constexpr SurfaceHandle INVALID_SURFACE = 0;

struct SurfaceCreateRequest
{
    std::string              label;
    std::string              url;
    PhysicalRect             rect;
    std::vector<std::string> init_scripts;
};

// Delivered once per create_surface() call, on the UI thread.
struct SurfaceCreateResult
{
    bool          ok     = false;
    SurfaceHandle handle = INVALID_SURFACE;
    std::string   error;
};

// A message published by script running inside a child surface.
struct ChannelMessage
{
    std::string source_label;
    std::string payload_json;
};

// The host window and the secondary rendering surfaces it can embed.
// Surfaces are addressed by string label.  Operations on a label with no live
// surface return false; none of them throw.
class SurfaceHost
{
   public:
    using CreateCallback  = std::function<void(const SurfaceCreateResult&)>;
    using WindowEventFn   = std::function<void()>;
    using ChannelListener = std::function<void(const ChannelMessage&)>;

    virtual ~SurfaceHost() = default;

    // Asynchronous: on_done fires later, never from inside this call.
    virtual void create_surface(const SurfaceCreateRequest& request, CreateCallback on_done) = 0;

    virtual std::optional<SurfaceHandle> get_by_label(const std::string& label) const = 0;

    virtual bool set_position(const std::string& label, int32_t x, int32_t y) = 0;
    virtual bool set_size(const std::string& label, uint32_t width, uint32_t height) = 0;
    virtual bool show(const std::string& label)                               = 0;
    virtual bool set_focus(const std::string& label)                          = 0;

    virtual bool navigate(const std::string& label, const std::string& url) = 0;
    virtual bool go_back(const std::string& label)                          = 0;
    virtual bool go_forward(const std::string& label)                       = 0;
    virtual bool reload(const std::string& label)                           = 0;
    virtual bool close(const std::string& label)                            = 0;

    virtual Subscription on_window_moved(WindowEventFn fn)         = 0;
    virtual Subscription on_window_resized(WindowEventFn fn)       = 0;
    virtual Subscription on_scale_factor_changed(WindowEventFn fn) = 0;

    // Host window inner position (top-left of the client area) in physical
    // pixels.  Returns false when the window is gone.
    virtual bool   window_inner_position(double& x, double& y) const = 0;
    virtual double window_scale_factor() const                       = 0;

    // Subscribe to a named channel addressed to the host's own surface.
    virtual Subscription listen(const std::string& channel, ChannelListener fn) = 0;

    // True when the host can inject initialization scripts into child
    // surfaces (the prerequisite for the selection channel).
    virtual bool supports_init_scripts() const = 0;

    virtual std::optional<std::string> read_clipboard_text() = 0;
};

}   // namespace lectern
