#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <functional>
#include <vector>

namespace rig_session {

enum class Key { Escape, Enter, Delete, Other };

// Pointer position already projected into scene space.
struct PointerEvent {
    Eigen::Vector3d world = Eigen::Vector3d::Zero();
};

class InputEventHub;

// Move-only handle for one registered listener set. Destroying or releasing
// the handle unregisters every listener it owns; releasing twice is a no-op.
// The hub must outlive the handle.
class ScopedListeners {
public:
    ScopedListeners() = default;
    ~ScopedListeners();

    ScopedListeners(const ScopedListeners&) = delete;
    ScopedListeners& operator=(const ScopedListeners&) = delete;
    ScopedListeners(ScopedListeners&& other) noexcept;
    ScopedListeners& operator=(ScopedListeners&& other) noexcept;

    void release();
    bool active() const { return hub_ != nullptr; }

private:
    friend class InputEventHub;
    ScopedListeners(InputEventHub* hub, std::uint64_t id) : hub_(hub), id_(id) {}

    InputEventHub* hub_ = nullptr;
    std::uint64_t id_ = 0;
};

// Routes pointer and keyboard events from the host window to whoever is
// subscribed. Handlers may subscribe or release during dispatch; a set
// released mid-dispatch is not called again.
class InputEventHub {
public:
    using PointerHandler = std::function<void(const PointerEvent&)>;
    using KeyHandler = std::function<void(Key)>;

    [[nodiscard]] ScopedListeners subscribe(PointerHandler on_move, PointerHandler on_up, KeyHandler on_key);

    void dispatch_pointer_move(const PointerEvent& event);
    void dispatch_pointer_up(const PointerEvent& event);
    void dispatch_key_down(Key key);

    // Individual handlers currently registered (a full set counts three).
    std::size_t listener_count() const;

private:
    friend class ScopedListeners;

    struct Subscription {
        std::uint64_t id = 0;
        PointerHandler on_move;
        PointerHandler on_up;
        KeyHandler on_key;
    };

    void unsubscribe(std::uint64_t id);
    bool is_subscribed(std::uint64_t id) const;

    std::vector<Subscription> subscriptions_;
    std::uint64_t next_id_ = 1;
};

} // namespace rig_session
