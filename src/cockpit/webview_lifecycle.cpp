#include "webview_lifecycle.hpp"

#include <lectern/logger.hpp>

#include "../core/url.hpp"

namespace lectern
{

const char* surface_state_name(SurfaceState state)
{
    switch (state)
    {
        case SurfaceState::Absent:
            return "absent";
        case SurfaceState::Unmeasured:
            return "unmeasured";
        case SurfaceState::Creating:
            return "creating";
        case SurfaceState::Created:
            return "created";
        case SurfaceState::GaveUp:
            return "gave-up";
        case SurfaceState::Failed:
            return "failed";
    }
    return "unknown";
}

std::optional<WindowMetrics> query_window_metrics(const SurfaceHost& host)
{
    WindowMetrics m;
    if (!host.window_inner_position(m.x, m.y))
        return std::nullopt;
    m.scale = host.window_scale_factor();
    if (!(m.scale > 0.0))
        m.scale = 1.0;
    return m;
}

WebviewLifecycleManager::WebviewLifecycleManager(SurfaceHost& host,
                                                 HostLayout&  layout,
                                                 FrameQueue&  frames,
                                                 uint32_t     retry_attempts)
    : host_(host), layout_(layout), frames_(frames), retry_attempts_(retry_attempts)
{
}

WebviewLifecycleManager::~WebviewLifecycleManager()
{
    for (auto& [label, rec] : records_)
    {
        if (rec.retry != INVALID_FRAME_REQUEST)
            frames_.cancel(rec.retry);
    }
}

// ─── Creation ───────────────────────────────────────────────────────────────

void WebviewLifecycleManager::ensure(const std::string& label, const std::string& desired_url)
{
    Record& rec = records_[label];
    rec.url     = normalize_url(desired_url);

    switch (rec.state)
    {
        case SurfaceState::Creating:
            // The ack will pick up the new URL.
            return;
        case SurfaceState::Unmeasured:
            if (rec.retry != INVALID_FRAME_REQUEST)
                return;
            break;
        default:
            break;
    }

    rec.attempts = 0;
    attempt(label);
}

void WebviewLifecycleManager::schedule_retry(const std::string& label, Record& rec)
{
    rec.state = SurfaceState::Unmeasured;
    ++rec.attempts;
    rec.retry = frames_.request([this, label]() { attempt(label); });
}

void WebviewLifecycleManager::attempt(const std::string& label)
{
    auto it = records_.find(label);
    if (it == records_.end())
        return;
    Record& rec = it->second;
    rec.retry   = INVALID_FRAME_REQUEST;

    auto rect = physical_rect_for(label);
    if (!rect)
    {
        if (rec.attempts >= retry_attempts_)
        {
            rec.state = SurfaceState::GaveUp;
            LECTERN_LOG_WARN("lifecycle",
                             "Host for '{}' never became measurable after {} attempts",
                             label,
                             rec.attempts);
            return;
        }
        LECTERN_LOG_TRACE("lifecycle", "Host for '{}' not measurable (attempt {})", label, rec.attempts);
        schedule_retry(label, rec);
        return;
    }

    if (host_.get_by_label(label))
    {
        // Attach to the surface that already exists.
        apply_rect(label, *rect);
        if (!host_.show(label))
            LECTERN_LOG_WARN("lifecycle", "show('{}') failed", label);
        rec.state = SurfaceState::Created;
        LECTERN_LOG_DEBUG("lifecycle", "Reattached existing surface '{}'", label);
        return;
    }

    SurfaceCreateRequest req;
    req.label = label;
    req.url   = rec.url;
    req.rect  = *rect;
    if (script_provider_)
        req.init_scripts = script_provider_(label);

    rec.state          = SurfaceState::Creating;
    rec.requested_url  = rec.url;
    const uint64_t gen = next_generation_++;
    rec.generation     = gen;

    LECTERN_LOG_DEBUG("lifecycle",
                      "Creating surface '{}' at {},{} {}x{} -> {}",
                      label,
                      rect->x,
                      rect->y,
                      rect->width,
                      rect->height,
                      rec.url);

    std::weak_ptr<int> alive = alive_;
    host_.create_surface(req,
                         [this, alive, label, gen](const SurfaceCreateResult& result)
                         {
                             if (alive.expired())
                                 return;
                             on_create_result(label, gen, result);
                         });
}

void WebviewLifecycleManager::on_create_result(const std::string&         label,
                                               uint64_t                   generation,
                                               const SurfaceCreateResult& result)
{
    auto it = records_.find(label);
    if (it == records_.end() || it->second.generation != generation
        || it->second.state != SurfaceState::Creating)
    {
        // Closed (or re-created) while the request was in flight.
        if (result.ok)
        {
            LECTERN_LOG_DEBUG("lifecycle", "Discarding stale surface '{}'", label);
            if (!host_.close(label))
                LECTERN_LOG_WARN("lifecycle", "close('{}') of stale surface failed", label);
        }
        return;
    }

    Record& rec = it->second;
    if (!result.ok)
    {
        rec.state = SurfaceState::Failed;
        LECTERN_LOG_WARN("lifecycle", "Surface '{}' creation failed: {}", label, result.error);
        return;
    }

    rec.state  = SurfaceState::Created;
    rec.handle = result.handle;
    if (!host_.show(label))
        LECTERN_LOG_WARN("lifecycle", "show('{}') failed", label);
    if (!host_.set_focus(label))
        LECTERN_LOG_DEBUG("lifecycle", "set_focus('{}') failed", label);

    LECTERN_LOG_INFO("lifecycle", "Surface '{}' created", label);

    if (rec.url != rec.requested_url && !host_.navigate(label, rec.url))
        LECTERN_LOG_WARN("lifecycle", "navigate('{}') failed", label);

    // The host rectangle may have moved while creation was pending.
    sync_bounds(label);

    if (on_created_)
        on_created_(label);
}

// ─── Navigation ─────────────────────────────────────────────────────────────

bool WebviewLifecycleManager::navigate(const std::string& label, const std::string& url)
{
    const std::string normalized = normalize_url(url);
    if (normalized.empty())
        return false;

    auto it = records_.find(label);
    if (it != records_.end())
    {
        it->second.url = normalized;
        if (it->second.state == SurfaceState::Creating)
            return true;
    }

    if (!host_.get_by_label(label))
        return false;
    if (!host_.navigate(label, normalized))
    {
        LECTERN_LOG_WARN("lifecycle", "navigate('{}') failed", label);
        return false;
    }
    return true;
}

bool WebviewLifecycleManager::go_back(const std::string& label)
{
    return host_.get_by_label(label) && host_.go_back(label);
}

bool WebviewLifecycleManager::go_forward(const std::string& label)
{
    return host_.get_by_label(label) && host_.go_forward(label);
}

bool WebviewLifecycleManager::reload(const std::string& label)
{
    return host_.get_by_label(label) && host_.reload(label);
}

// ─── Bounds ─────────────────────────────────────────────────────────────────

std::optional<PhysicalRect> WebviewLifecycleManager::physical_rect_for(const std::string& label) const
{
    auto rect = layout_.measure(label);
    if (!rect || !is_measurable(*rect))
        return std::nullopt;
    auto metrics = query_window_metrics(host_);
    if (!metrics)
        return std::nullopt;
    return to_physical(*rect, *metrics);
}

bool WebviewLifecycleManager::apply_rect(const std::string& label, const PhysicalRect& rect)
{
    bool ok = true;
    if (!host_.set_position(label, rect.x, rect.y))
    {
        LECTERN_LOG_WARN("bounds", "set_position('{}') failed", label);
        ok = false;
    }
    if (!host_.set_size(label, rect.width, rect.height))
    {
        LECTERN_LOG_WARN("bounds", "set_size('{}') failed", label);
        ok = false;
    }
    return ok;
}

bool WebviewLifecycleManager::sync_bounds(const std::string& label)
{
    auto it = records_.find(label);
    if (it == records_.end() || it->second.state != SurfaceState::Created)
        return false;

    auto rect = layout_.measure(label);
    if (!rect)
        return false;   // host unmounted
    auto metrics = query_window_metrics(host_);
    if (!metrics)
        return false;

    return apply_rect(label, to_physical(*rect, *metrics));
}

// ─── Teardown ───────────────────────────────────────────────────────────────

bool WebviewLifecycleManager::close(const std::string& label)
{
    auto it = records_.find(label);
    if (it != records_.end())
    {
        if (it->second.retry != INVALID_FRAME_REQUEST)
            frames_.cancel(it->second.retry);
        records_.erase(it);
    }

    if (!host_.get_by_label(label))
        return false;

    if (!host_.close(label))
    {
        LECTERN_LOG_WARN("lifecycle", "close('{}') failed", label);
        return false;
    }
    LECTERN_LOG_DEBUG("lifecycle", "Closed surface '{}'", label);
    return true;
}

void WebviewLifecycleManager::close_all()
{
    std::vector<std::string> labels;
    labels.reserve(records_.size());
    for (const auto& [label, rec] : records_)
        labels.push_back(label);
    for (const auto& label : labels)
        close(label);
}

// ─── Queries ────────────────────────────────────────────────────────────────

SurfaceState WebviewLifecycleManager::state(const std::string& label) const
{
    auto it = records_.find(label);
    return it == records_.end() ? SurfaceState::Absent : it->second.state;
}

bool WebviewLifecycleManager::has_surface(const std::string& label) const
{
    return host_.get_by_label(label).has_value();
}

uint32_t WebviewLifecycleManager::attempts(const std::string& label) const
{
    auto it = records_.find(label);
    return it == records_.end() ? 0 : it->second.attempts;
}

std::string WebviewLifecycleManager::target_url(const std::string& label) const
{
    auto it = records_.find(label);
    return it == records_.end() ? std::string() : it->second.url;
}

}   // namespace lectern
