#include <rig_session/drag_controller.hpp>
#include <rig_session/logging.hpp>
#include <rig_session/placement_store.hpp>
#include <rig_session/preview.hpp>
#include <rig_loaders/json_loader.hpp>
#include <rig_placement/orientation.hpp>
#include <rig_placement/slot_generator.hpp>
#include <rig_placement/slot_resolver.hpp>
#include <algorithm>
#include <cctype>

namespace rig_session {

namespace {

std::string lowercase(const char* s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// "Placed Wheel on left • START"; side and zone are omitted when absent.
std::string placed_message(const rig_model::PlacedComponent& placed, const rig_model::Slot& slot) {
    std::string msg = "Placed " + placed.name;
    if (slot.side) msg += " on " + lowercase(rig_placement::to_string(*slot.side));
    auto zone = slot.meta.find("zone");
    if (zone != slot.meta.end() && !zone->second.empty()) msg += " • " + zone->second;
    return msg;
}

} // namespace

DragController::DragController(PlacementStore& store, InputEventHub& hub,
    PreviewSink* preview, NotificationSink* notices)
    : store_(store), hub_(hub), preview_(preview), notices_(notices)
{
    store_.set_slots_changed_callback([this] { slots_changed(); });
}

DragController::~DragController() {
    store_.set_slots_changed_callback(nullptr);
    if (!active()) return;
    store_.cancel();
    listeners_.release();
    if (preview_) preview_->release_preview();
}

void DragController::begin_drag(rig_model::SlotType type, const std::string& name,
    const std::optional<std::string>& asset_reference)
{
    if (active()) {
        // Replaced, not cancelled: no notice, just drop what the old drag held.
        listeners_.release();
        if (preview_) preview_->release_preview();
        state_ = DragState::Idle;
    }

    store_.begin_drag(type, name.empty() ? rig_placement::display_name(type) : name, asset_reference);
    listeners_ = hub_.subscribe(
        [this](const PointerEvent& e) { pointer_move(e.world); },
        [this](const PointerEvent&) { pointer_up(); },
        [this](Key key) { key_down(key); });
    state_ = DragState::Dragging;
}

bool DragController::begin_drag(const rig_model::DragPayload& payload) {
    const auto type = rig_loaders::slot_type_for_category(payload.category);
    if (!type) {
        session_logger()->warn("drag_rejected id={} category={}", payload.id, payload.category);
        notify(NotificationKind::Error, "Cannot place \"" + payload.name + "\": unknown category " + payload.category);
        return false;
    }
    begin_drag(*type, payload.name, payload.model_reference);
    return true;
}

void DragController::pointer_move(const Eigen::Vector3d& world) {
    if (!active()) return;
    const auto& session = store_.drag_session();
    if (!session.dragged_type) return;

    const std::vector<rig_model::Slot> candidates = store_.valid_slots(*session.dragged_type);
    const rig_model::Slot* nearest = rig_placement::nearest_free_slot(world, candidates, store_.snap_tolerance());

    if (preview_) preview_->release_preview();
    if (!nearest) {
        store_.update_target(std::nullopt);
        state_ = DragState::Dragging;
        return;
    }

    store_.update_target(nearest->id);
    state_ = DragState::Targeting;
    show_ghost(*nearest);
}

void DragController::show_ghost(const rig_model::Slot& slot) {
    if (!preview_) return;
    GhostPreview ghost;
    ghost.slot_id = slot.id;
    ghost.type = slot.type;
    ghost.position = slot.position;
    ghost.rotation = rig_placement::calculate_orientation(slot);
    ghost.name = store_.drag_session().name;
    preview_->attach_preview(ghost);
}

void DragController::slots_changed() {
    if (state_ != DragState::Targeting) return;
    const auto& session = store_.drag_session();

    std::optional<rig_model::Slot> target;
    if (session.dragged_type && session.target_slot_id) {
        for (const auto& s : store_.valid_slots(*session.dragged_type))
            if (s.id == *session.target_slot_id) target = s;
    }

    if (preview_) preview_->release_preview();
    if (!target) {
        session_logger()->info("drag_target_lost slot={}", session.target_slot_id.value_or(""));
        store_.update_target(std::nullopt);
        state_ = DragState::Dragging;
        return;
    }
    // Same id, possibly a new position.
    show_ghost(*target);
}

DragOutcome DragController::pointer_up() {
    if (!active()) return DragOutcome::None;

    if (state_ == DragState::Targeting && store_.drag_session().target_slot_id) {
        const rig_model::Slot* target = store_.find_slot(*store_.drag_session().target_slot_id);
        const std::optional<rig_model::Slot> slot = target ? std::optional<rig_model::Slot>(*target) : std::nullopt;
        if (auto placed = store_.commit()) {
            notify(NotificationKind::Success, placed_message(*placed, *slot));
            finish(DragOutcome::Committed);
            return last_outcome_;
        }
    }

    store_.cancel();
    notify(NotificationKind::Error, "No valid slot found. Release over a highlighted slot.");
    finish(DragOutcome::NoTarget);
    return last_outcome_;
}

DragOutcome DragController::key_down(Key key) {
    if (!active() || key != Key::Escape) return DragOutcome::None;

    store_.cancel();
    notify(NotificationKind::Info, "Placement cancelled");
    finish(DragOutcome::Cancelled);
    return last_outcome_;
}

void DragController::finish(DragOutcome outcome) {
    listeners_.release();
    if (preview_) preview_->release_preview();
    state_ = DragState::Idle;
    last_outcome_ = outcome;
    session_logger()->debug("drag_finished outcome={}", to_string(outcome));
}

void DragController::notify(NotificationKind kind, const std::string& message) {
    if (notices_) notices_->notify({ kind, message });
}

const char* to_string(DragState state) {
    switch (state) {
    case DragState::Idle:
        return "idle";
    case DragState::Dragging:
        return "dragging";
    case DragState::Targeting:
        return "targeting";
    }
    return "idle";
}

const char* to_string(DragOutcome outcome) {
    switch (outcome) {
    case DragOutcome::None:
        return "none";
    case DragOutcome::Committed:
        return "committed";
    case DragOutcome::NoTarget:
        return "no_target";
    case DragOutcome::Cancelled:
        return "cancelled";
    }
    return "none";
}

} // namespace rig_session
