#pragma once

#include <cstdint>
#include <functional>
#include <lectern/geometry.hpp>
#include <lectern/subscription.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lectern
{

// Latest measured host rectangle per pane label.  The UI pushes measurements
// every frame; observers of a label hear about it only when the rectangle
// actually changed (the layout resize observer).
class HostLayout
{
   public:
    using ObserverFn = std::function<void(const std::string& label, const HostRect& rect)>;

    HostLayout();
    ~HostLayout();

    HostLayout(const HostLayout&)            = delete;
    HostLayout& operator=(const HostLayout&) = delete;

    void update(const std::string& label, const HostRect& rect);

    // The host element went away.  Later measure() calls return nullopt.
    void unmount(const std::string& label);

    std::optional<HostRect> measure(const std::string& label) const;
    bool                    is_mounted(const std::string& label) const;

    Subscription observe(const std::string& label, ObserverFn fn);

    size_t observer_count() const;

   private:
    struct Observer
    {
        uint64_t    id;
        std::string label;
        ObserverFn  fn;
    };

    // Shared with Subscription closures so an unsubscribe after the layout is
    // destroyed is harmless.
    struct Observers
    {
        std::vector<Observer> list;
        uint64_t              next_id = 1;
    };

    std::unordered_map<std::string, HostRect> rects_;
    std::shared_ptr<Observers>                observers_;
};

}   // namespace lectern
