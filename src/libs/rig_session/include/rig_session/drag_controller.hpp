#pragma once

#include <rig_model/drag_payload.hpp>
#include <rig_model/types.hpp>
#include <rig_session/input_events.hpp>
#include <rig_session/notifications.hpp>
#include <optional>
#include <string>

namespace rig_session {

class PlacementStore;
class PreviewSink;

enum class DragState { Idle, Dragging, Targeting };

enum class DragOutcome { None, Committed, NoTarget, Cancelled };

// Drives one drag from the palette to a slot. While a drag is active the
// controller holds a listener set on the hub; every way out of the drag
// (commit, release without target, Escape, a new drag, destruction) drops
// it exactly once and releases the preview.
class DragController {
public:
    DragController(PlacementStore& store, InputEventHub& hub,
        PreviewSink* preview = nullptr, NotificationSink* notices = nullptr);
    ~DragController();

    DragController(const DragController&) = delete;
    DragController& operator=(const DragController&) = delete;

    void begin_drag(rig_model::SlotType type, const std::string& name,
        const std::optional<std::string>& asset_reference = std::nullopt);
    // Maps the payload category to a slot type; unknown categories are
    // rejected with an error notice and leave the controller idle.
    bool begin_drag(const rig_model::DragPayload& payload);

    // Same paths the hub listeners take; callable directly by hosts and tests.
    void pointer_move(const Eigen::Vector3d& world);
    DragOutcome pointer_up();
    DragOutcome key_down(Key key);

    DragState state() const { return state_; }
    bool active() const { return state_ != DragState::Idle; }
    DragOutcome last_outcome() const { return last_outcome_; }

private:
    void show_ghost(const rig_model::Slot& slot);
    // Re-checks the held target after the store regenerated its slots.
    void slots_changed();
    void finish(DragOutcome outcome);
    void notify(NotificationKind kind, const std::string& message);

    PlacementStore& store_;
    InputEventHub& hub_;
    PreviewSink* preview_ = nullptr;
    NotificationSink* notices_ = nullptr;
    ScopedListeners listeners_;
    DragState state_ = DragState::Idle;
    DragOutcome last_outcome_ = DragOutcome::None;
};

const char* to_string(DragState state);
const char* to_string(DragOutcome outcome);

} // namespace rig_session
