#pragma once

#include <algorithm>
#include <cstdint>
#include <lectern/subscription.hpp>
#include <memory>
#include <utility>
#include <vector>

namespace lectern
{

// Callback registry whose entries are removed through Subscription handles.
// Handles stay safe to release after the list itself is gone.
template <typename Fn>
class ListenerList
{
   public:
    ListenerList() : state_(std::make_shared<State>()) {}

    ListenerList(const ListenerList&)            = delete;
    ListenerList& operator=(const ListenerList&) = delete;

    Subscription add(Fn fn)
    {
        uint64_t id = state_->next_id++;
        state_->entries.emplace_back(id, std::move(fn));

        std::weak_ptr<State> weak = state_;
        return Subscription(
            [weak, id]()
            {
                auto s = weak.lock();
                if (!s)
                    return;
                std::erase_if(s->entries, [id](const auto& e) { return e.first == id; });
            });
    }

    // Invokes a snapshot, so listeners may add or remove entries while running.
    template <typename... Args>
    void notify(Args&&... args) const
    {
        std::vector<Fn> snapshot;
        snapshot.reserve(state_->entries.size());
        for (const auto& e : state_->entries)
            snapshot.push_back(e.second);
        for (auto& fn : snapshot)
        {
            if (fn)
                fn(args...);
        }
    }

    size_t size() const { return state_->entries.size(); }
    bool   empty() const { return state_->entries.empty(); }

   private:
    struct State
    {
        std::vector<std::pair<uint64_t, Fn>> entries;
        uint64_t                             next_id = 1;
    };

    std::shared_ptr<State> state_;
};

}   // namespace lectern
