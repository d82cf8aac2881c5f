#include <rig_session/input_events.hpp>
#include <algorithm>

namespace rig_session {

ScopedListeners::~ScopedListeners() {
    release();
}

ScopedListeners::ScopedListeners(ScopedListeners&& other) noexcept
    : hub_(other.hub_), id_(other.id_)
{
    other.hub_ = nullptr;
    other.id_ = 0;
}

ScopedListeners& ScopedListeners::operator=(ScopedListeners&& other) noexcept {
    if (this != &other) {
        release();
        hub_ = other.hub_;
        id_ = other.id_;
        other.hub_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void ScopedListeners::release() {
    if (!hub_) return;
    hub_->unsubscribe(id_);
    hub_ = nullptr;
    id_ = 0;
}

ScopedListeners InputEventHub::subscribe(PointerHandler on_move, PointerHandler on_up, KeyHandler on_key) {
    Subscription s;
    s.id = next_id_++;
    s.on_move = std::move(on_move);
    s.on_up = std::move(on_up);
    s.on_key = std::move(on_key);
    subscriptions_.push_back(std::move(s));
    return ScopedListeners(this, subscriptions_.back().id);
}

void InputEventHub::unsubscribe(std::uint64_t id) {
    subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
        [id](const Subscription& s) { return s.id == id; }), subscriptions_.end());
}

bool InputEventHub::is_subscribed(std::uint64_t id) const {
    return std::any_of(subscriptions_.begin(), subscriptions_.end(),
        [id](const Subscription& s) { return s.id == id; });
}

// Dispatch works on a snapshot so handlers can change the subscription list.
void InputEventHub::dispatch_pointer_move(const PointerEvent& event) {
    const std::vector<Subscription> snapshot = subscriptions_;
    for (const auto& s : snapshot)
        if (s.on_move && is_subscribed(s.id)) s.on_move(event);
}

void InputEventHub::dispatch_pointer_up(const PointerEvent& event) {
    const std::vector<Subscription> snapshot = subscriptions_;
    for (const auto& s : snapshot)
        if (s.on_up && is_subscribed(s.id)) s.on_up(event);
}

void InputEventHub::dispatch_key_down(Key key) {
    const std::vector<Subscription> snapshot = subscriptions_;
    for (const auto& s : snapshot)
        if (s.on_key && is_subscribed(s.id)) s.on_key(key);
}

std::size_t InputEventHub::listener_count() const {
    std::size_t n = 0;
    for (const auto& s : subscriptions_) {
        if (s.on_move) ++n;
        if (s.on_up) ++n;
        if (s.on_key) ++n;
    }
    return n;
}

} // namespace rig_session
