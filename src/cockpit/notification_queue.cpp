#include "notification_queue.hpp"

#include <algorithm>
#include <lectern/logger.hpp>

namespace lectern
{

uint64_t NotificationQueue::post(NotificationKind kind, std::string message, FrameTime now)
{
    if (kind == NotificationKind::Error)
        LECTERN_LOG_WARN("ui", "{}", message);
    else
        LECTERN_LOG_DEBUG("ui", "{}", message);

    Notification n;
    n.id         = next_id_++;
    n.kind       = kind;
    n.message    = std::move(message);
    n.expires_at = now + std::chrono::milliseconds(ttl_ms_);
    items_.push_back(std::move(n));
    return items_.back().id;
}

size_t NotificationQueue::prune(FrameTime now)
{
    size_t before = items_.size();
    std::erase_if(items_, [now](const Notification& n) { return n.expires_at <= now; });
    return before - items_.size();
}

void NotificationQueue::dismiss(uint64_t id)
{
    std::erase_if(items_, [id](const Notification& n) { return n.id == id; });
}

const Notification* NotificationQueue::latest(NotificationKind kind) const
{
    auto it = std::find_if(items_.rbegin(),
                           items_.rend(),
                           [kind](const Notification& n) { return n.kind == kind; });
    return it == items_.rend() ? nullptr : &*it;
}

}   // namespace lectern
