#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <lectern/geometry.hpp>
#include <lectern/surface_host.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../anim/frame_queue.hpp"
#include "host_layout.hpp"

namespace lectern
{

enum class SurfaceState
{
    Absent,       // never ensured, or closed
    Unmeasured,   // waiting for the host rectangle to become measurable
    Creating,     // create request issued, ack outstanding
    Created,
    GaveUp,       // layout never became measurable within the retry budget
    Failed,       // the host reported a creation error
};

const char* surface_state_name(SurfaceState state);

// Reads the host window's inner position and scale factor.  nullopt when the
// window is gone.
std::optional<WindowMetrics> query_window_metrics(const SurfaceHost& host);

// Sole owner of the rendering surfaces behind pane labels.  Every other
// component reaches a surface through these operations, by label.
//
// Per label: Absent -> Unmeasured -> Creating -> Created, ending in GaveUp or
// Failed when creation cannot happen.  All host failures are logged and
// contained; nothing here throws.
class WebviewLifecycleManager
{
   public:
    using ScriptProvider = std::function<std::vector<std::string>(const std::string& label)>;
    using CreatedFn      = std::function<void(const std::string& label)>;

    WebviewLifecycleManager(SurfaceHost& host,
                            HostLayout&  layout,
                            FrameQueue&  frames,
                            uint32_t     retry_attempts);
    ~WebviewLifecycleManager();

    WebviewLifecycleManager(const WebviewLifecycleManager&)            = delete;
    WebviewLifecycleManager& operator=(const WebviewLifecycleManager&) = delete;

    void set_script_provider(ScriptProvider provider) { script_provider_ = std::move(provider); }
    void set_on_created(CreatedFn fn) { on_created_ = std::move(fn); }

    // Create the surface for `label` once its host rectangle is measurable, or
    // reposition and show the existing one.
    void ensure(const std::string& label, const std::string& desired_url);

    // Normalizes and forwards to the live surface.  A navigate while the
    // surface is still being created replaces the URL it will load.
    bool navigate(const std::string& label, const std::string& url);
    bool go_back(const std::string& label);
    bool go_forward(const std::string& label);
    bool reload(const std::string& label);

    // Re-applies the host rectangle to the live surface.  No-op (false) when
    // there is no surface or the host element is unmounted.
    bool sync_bounds(const std::string& label);

    // Best-effort destroy.  Idempotent; returns true only when a live surface
    // was asked to close.
    bool close(const std::string& label);
    void close_all();

    SurfaceState state(const std::string& label) const;
    bool         has_surface(const std::string& label) const;
    uint32_t     attempts(const std::string& label) const;
    std::string  target_url(const std::string& label) const;

    uint32_t retry_attempts() const { return retry_attempts_; }

   private:
    struct Record
    {
        SurfaceState   state = SurfaceState::Absent;
        std::string    url;
        std::string    requested_url;
        uint32_t       attempts   = 0;
        uint64_t       generation = 0;
        FrameRequestId retry      = INVALID_FRAME_REQUEST;
        SurfaceHandle  handle     = INVALID_SURFACE;
    };

    void attempt(const std::string& label);
    void schedule_retry(const std::string& label, Record& rec);
    void on_create_result(const std::string&         label,
                          uint64_t                   generation,
                          const SurfaceCreateResult& result);
    bool apply_rect(const std::string& label, const PhysicalRect& rect);

    std::optional<PhysicalRect> physical_rect_for(const std::string& label) const;

    SurfaceHost& host_;
    HostLayout&  layout_;
    FrameQueue&  frames_;
    uint32_t     retry_attempts_;

    ScriptProvider script_provider_;
    CreatedFn      on_created_;

    std::unordered_map<std::string, Record> records_;
    uint64_t                                next_generation_ = 1;

    // Create acks can outlive the manager; they hold a weak reference to this.
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

}   // namespace lectern
