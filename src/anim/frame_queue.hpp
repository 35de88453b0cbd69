#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace lectern
{

using FrameRequestId = uint64_t;
using FrameClock     = std::chrono::steady_clock;
using FrameTime      = FrameClock::time_point;

inline constexpr FrameRequestId INVALID_FRAME_REQUEST = 0;

// "Run this on the next frame" scheduling for the UI thread.
//
// Callbacks requested before tick() starts run during that tick; callbacks
// requested from inside a running callback are deferred to the following
// tick, so a callback that re-requests itself runs once per frame.
class FrameQueue
{
   public:
    using Callback = std::function<void()>;

    FrameQueue() = default;

    FrameQueue(const FrameQueue&)            = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    FrameRequestId request(Callback cb);

    // Returns true if the request was still pending.
    bool cancel(FrameRequestId id);

    // Runs one frame worth of callbacks.  Returns the number that ran.
    size_t tick();

    size_t   pending() const { return entries_.size(); }
    uint64_t frame_number() const { return frame_number_; }

   private:
    struct Entry
    {
        FrameRequestId id;
        Callback       callback;
    };

    std::vector<Entry> entries_;
    FrameRequestId     next_id_      = 1;
    uint64_t           frame_number_ = 0;
};

}   // namespace lectern
