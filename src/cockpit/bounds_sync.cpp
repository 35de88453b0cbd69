#include "bounds_sync.hpp"

#include <lectern/logger.hpp>

namespace lectern
{

BoundsSynchronizer::BoundsSynchronizer(SurfaceHost&             host,
                                       HostLayout&              layout,
                                       FrameQueue&              frames,
                                       WebviewLifecycleManager& lifecycle,
                                       uint32_t                 burst_frames)
    : host_(host), layout_(layout), frames_(frames), lifecycle_(lifecycle), burst_frames_(burst_frames)
{
}

BoundsSynchronizer::~BoundsSynchronizer()
{
    stop();
}

void BoundsSynchronizer::start()
{
    if (running_)
        return;
    running_ = true;
    window_subs_.push_back(host_.on_window_moved([this]() { resync_all(); }));
    window_subs_.push_back(host_.on_window_resized([this]() { resync_all(); }));
    window_subs_.push_back(host_.on_scale_factor_changed(
        [this]()
        {
            LECTERN_LOG_DEBUG("bounds", "Scale factor changed to {}", host_.window_scale_factor());
            resync_all();
        }));
}

void BoundsSynchronizer::stop()
{
    stop_burst();
    detach_all();
    window_subs_.clear();
    running_ = false;
}

void BoundsSynchronizer::attach(const std::string& label)
{
    if (pane_subs_.count(label))
        return;
    pane_subs_.emplace(label,
                       layout_.observe(label,
                                       [this](const std::string& l, const HostRect&) { resync(l); }));
}

void BoundsSynchronizer::detach(const std::string& label)
{
    auto it = pane_subs_.find(label);
    if (it == pane_subs_.end())
        return;
    it->second.reset();
    pane_subs_.erase(it);
}

void BoundsSynchronizer::detach_all()
{
    pane_subs_.clear();
}

bool BoundsSynchronizer::is_attached(const std::string& label) const
{
    return pane_subs_.count(label) > 0;
}

// ─── Settle burst ───────────────────────────────────────────────────────────

void BoundsSynchronizer::start_burst()
{
    if (burst_frames_ == 0)
        return;
    burst_remaining_ = burst_frames_;
    if (burst_request_ == INVALID_FRAME_REQUEST)
        burst_request_ = frames_.request([this]() { burst_tick(); });
}

void BoundsSynchronizer::stop_burst()
{
    if (burst_request_ != INVALID_FRAME_REQUEST)
    {
        frames_.cancel(burst_request_);
        burst_request_ = INVALID_FRAME_REQUEST;
    }
    burst_remaining_ = 0;
}

void BoundsSynchronizer::burst_tick()
{
    burst_request_ = INVALID_FRAME_REQUEST;
    if (burst_remaining_ == 0)
        return;

    resync_all();
    --burst_remaining_;

    if (burst_remaining_ > 0)
        burst_request_ = frames_.request([this]() { burst_tick(); });
    else
        LECTERN_LOG_TRACE("bounds", "Settle burst finished");
}

// ─── Resync ─────────────────────────────────────────────────────────────────

void BoundsSynchronizer::resync(const std::string& label)
{
    // Missing surface or unmounted host: nothing to align.
    lifecycle_.sync_bounds(label);
}

void BoundsSynchronizer::resync_all()
{
    for (const auto& label : attached_labels())
        resync(label);
}

std::vector<std::string> BoundsSynchronizer::attached_labels() const
{
    std::vector<std::string> labels;
    labels.reserve(pane_subs_.size());
    for (const auto& [label, sub] : pane_subs_)
        labels.push_back(label);
    return labels;
}

}   // namespace lectern
