#include "host_layout.hpp"

#include <algorithm>

namespace lectern
{

HostLayout::HostLayout() : observers_(std::make_shared<Observers>()) {}

HostLayout::~HostLayout() = default;

void HostLayout::update(const std::string& label, const HostRect& rect)
{
    auto it = rects_.find(label);
    if (it != rects_.end() && it->second == rect)
        return;
    rects_[label] = rect;

    // Copy: an observer may subscribe or unsubscribe while being notified.
    std::vector<ObserverFn> to_notify;
    for (const auto& obs : observers_->list)
    {
        if (obs.label == label && obs.fn)
            to_notify.push_back(obs.fn);
    }
    for (auto& fn : to_notify)
        fn(label, rect);
}

void HostLayout::unmount(const std::string& label)
{
    rects_.erase(label);
}

std::optional<HostRect> HostLayout::measure(const std::string& label) const
{
    auto it = rects_.find(label);
    if (it == rects_.end())
        return std::nullopt;
    return it->second;
}

bool HostLayout::is_mounted(const std::string& label) const
{
    return rects_.count(label) > 0;
}

Subscription HostLayout::observe(const std::string& label, ObserverFn fn)
{
    uint64_t id = observers_->next_id++;
    observers_->list.push_back(Observer{id, label, std::move(fn)});

    std::weak_ptr<Observers> weak = observers_;
    return Subscription(
        [weak, id]()
        {
            auto obs = weak.lock();
            if (!obs)
                return;
            auto& list = obs->list;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [id](const Observer& o) { return o.id == id; }),
                       list.end());
        });
}

size_t HostLayout::observer_count() const
{
    return observers_->list.size();
}

}   // namespace lectern
