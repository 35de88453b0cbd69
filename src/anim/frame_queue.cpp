#include "frame_queue.hpp"

#include <algorithm>
#include <utility>

namespace lectern
{

FrameRequestId FrameQueue::request(Callback cb)
{
    FrameRequestId id = next_id_++;
    entries_.push_back(Entry{id, std::move(cb)});
    return id;
}

bool FrameQueue::cancel(FrameRequestId id)
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

size_t FrameQueue::tick()
{
    ++frame_number_;

    // Everything with an id below this watermark was requested before the tick.
    const FrameRequestId watermark = next_id_;
    size_t               ran       = 0;

    for (;;)
    {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [watermark](const Entry& e) { return e.id < watermark; });
        if (it == entries_.end())
            break;

        // Remove before running: the callback may request or cancel entries.
        Callback cb = std::move(it->callback);
        entries_.erase(it);
        if (cb)
            cb();
        ++ran;
    }
    return ran;
}

}   // namespace lectern
