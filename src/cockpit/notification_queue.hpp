#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../anim/frame_queue.hpp"

namespace lectern
{

enum class NotificationKind
{
    Info,
    Success,
    Error,
};

struct Notification
{
    uint64_t         id = 0;
    NotificationKind kind = NotificationKind::Info;
    std::string      message;
    FrameTime        expires_at;
};

// Transient toasts for user-actionable outcomes.
class NotificationQueue
{
   public:
    explicit NotificationQueue(uint32_t ttl_ms = 4000) : ttl_ms_(ttl_ms) {}

    uint64_t post(NotificationKind kind, std::string message, FrameTime now);

    // Drops expired toasts.  Returns how many were removed.
    size_t prune(FrameTime now);

    void dismiss(uint64_t id);
    void clear() { items_.clear(); }

    const std::vector<Notification>& items() const { return items_; }
    bool                             empty() const { return items_.empty(); }

    // Most recent toast of a kind, or nullptr.
    const Notification* latest(NotificationKind kind) const;

   private:
    uint32_t                  ttl_ms_;
    std::vector<Notification> items_;
    uint64_t                  next_id_ = 1;
};

}   // namespace lectern
