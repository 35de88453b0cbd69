#pragma once

#include <functional>
#include <utility>

namespace lectern
{

// Owns one listener registration.  The unsubscribe function runs exactly
// once: on reset(), on reassignment, or when the handle is destroyed.
class Subscription
{
   public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe))
    {
    }

    ~Subscription() { reset(); }

    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : unsubscribe_(std::move(other.unsubscribe_))
    {
        other.unsubscribe_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            unsubscribe_       = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    void reset()
    {
        auto fn      = std::move(unsubscribe_);
        unsubscribe_ = nullptr;
        if (fn)
            fn();
    }

    bool active() const { return static_cast<bool>(unsubscribe_); }

   private:
    std::function<void()> unsubscribe_;
};

}   // namespace lectern
