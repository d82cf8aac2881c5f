#include <rig_session/placement_store.hpp>
#include <rig_session/logging.hpp>
#include <rig_session/notifications.hpp>
#include <rig_placement/geometry.hpp>
#include <rig_placement/orientation.hpp>
#include <rig_placement/slot_generator.hpp>
#include <rig_placement/slot_resolver.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace rig_session {

PlacementStore::PlacementStore(const rig_model::GeometryParameters& params, NotificationSink* notices)
    : params_(rig_placement::sanitize_parameters(params)), notices_(notices)
{
    slots_ = rig_placement::generate_slots(params_);
}

void PlacementStore::set_snap_tolerance(double tolerance) {
    if (!std::isfinite(tolerance) || tolerance <= 0) {
        session_logger()->warn("snap_tolerance_rejected value={}", tolerance);
        return;
    }
    snap_tolerance_ = tolerance;
}

rig_model::DerivedDimensions PlacementStore::dimensions() const {
    return rig_placement::derive(params_);
}

const rig_model::Slot* PlacementStore::find_slot(const std::string& slot_id) const {
    for (const auto& s : slots_)
        if (s.id == slot_id) return &s;
    return nullptr;
}

const rig_model::PlacedComponent* PlacementStore::find_component(const std::string& component_id) const {
    for (const auto& c : components_)
        if (c.id == component_id) return &c;
    return nullptr;
}

bool PlacementStore::is_slot_occupied(const std::string& slot_id) const {
    return rig_placement::is_slot_occupied(slot_id, components_);
}

std::vector<rig_model::Slot> PlacementStore::valid_slots(rig_model::SlotType type) const {
    return rig_placement::get_valid_slots(type, slots_, params_, components_);
}

void PlacementStore::update_parameters(const rig_model::GeometryParameters& params) {
    params_ = rig_placement::sanitize_parameters(params);
    const rig_model::DerivedDimensions dims = dimensions();
    session_logger()->info("parameters_updated model={} L={} N={} D={} R={}",
        rig_placement::to_string(params_.model), params_.axis_length, params_.belt_width,
        dims.overall_length, dims.overall_width);
    regenerate_slots();
}

void PlacementStore::regenerate_slots() {
    slots_ = rig_placement::generate_slots(params_);
    session_logger()->debug("slots_regenerated count={}", slots_.size());

    // A hovered or targeted slot that no longer exists is dropped.
    if (drag_.target_slot_id && !find_slot(*drag_.target_slot_id)) drag_.target_slot_id.reset();
    if (drag_.hovered_slot_id && !find_slot(*drag_.hovered_slot_id)) drag_.hovered_slot_id.reset();

    refresh_stale_bindings();
    if (slots_changed_) slots_changed_();
}

void PlacementStore::refresh_stale_bindings() {
    stale_ = rig_placement::find_stale_bindings(components_, slots_);
    if (stale_.empty()) return;

    for (const auto& b : stale_)
        session_logger()->warn("stale_binding component={} slot={} reason={}",
            b.component_id, b.slot_id, rig_placement::to_string(b.reason));
    if (notices_) {
        notices_->notify({ NotificationKind::Warning,
            fmt::format("{} placed component{} no longer match{} a slot", stale_.size(),
                stale_.size() == 1 ? "" : "s", stale_.size() == 1 ? "es" : "") });
    }
}

void PlacementStore::begin_drag(rig_model::SlotType type, const std::string& name,
    const std::optional<std::string>& asset_reference)
{
    if (drag_.dragged_type)
        session_logger()->info("drag_replaced previous_type={}", rig_placement::to_string(*drag_.dragged_type));
    drag_ = {};
    drag_.dragged_type = type;
    drag_.name = name;
    drag_.asset_reference = asset_reference;
    session_logger()->info("drag_begin type={} name=\"{}\"", rig_placement::to_string(type), name);
}

void PlacementStore::update_target(const std::optional<std::string>& slot_id) {
    if (!drag_.dragged_type) return;
    drag_.target_slot_id = slot_id;
    drag_.hovered_slot_id = slot_id;
}

std::optional<rig_model::PlacedComponent> PlacementStore::commit() {
    if (!drag_.dragged_type || !drag_.target_slot_id) return std::nullopt;

    auto placed = bind(*drag_.dragged_type, *drag_.target_slot_id, drag_.name, drag_.asset_reference);
    if (placed) drag_ = {};
    return placed;
}

void PlacementStore::cancel() {
    if (drag_.dragged_type)
        session_logger()->info("drag_cancelled type={}", rig_placement::to_string(*drag_.dragged_type));
    drag_ = {};
}

std::optional<rig_model::PlacedComponent> PlacementStore::place_component(rig_model::SlotType type,
    const std::string& slot_id, const std::string& name, const std::optional<std::string>& asset_reference)
{
    return bind(type, slot_id, name, asset_reference);
}

std::optional<rig_model::PlacedComponent> PlacementStore::bind(rig_model::SlotType type, const std::string& slot_id,
    const std::string& name, const std::optional<std::string>& asset_reference)
{
    const rig_model::Slot* slot = find_slot(slot_id);
    if (!slot) {
        session_logger()->warn("placement_rejected slot={} reason=missing_slot", slot_id);
        return std::nullopt;
    }
    if (slot->type != type) {
        session_logger()->warn("placement_rejected slot={} reason=type_mismatch type={} slot_type={}",
            slot_id, rig_placement::to_string(type), rig_placement::to_string(slot->type));
        return std::nullopt;
    }
    if (is_slot_occupied(slot_id)) {
        session_logger()->warn("placement_rejected slot={} reason=occupied", slot_id);
        return std::nullopt;
    }

    rig_model::PlacedComponent c;
    c.id = next_component_id();
    c.type = type;
    c.slot_id = slot_id;
    c.position = slot->position;
    c.rotation = rig_placement::calculate_orientation(*slot);
    c.asset_reference = asset_reference;
    c.name = name.empty() ? rig_placement::display_name(type) : name;
    components_.push_back(c);

    session_logger()->info("placement_committed id={} type={} slot={} pos=({}, {}, {})",
        c.id, rig_placement::to_string(type), slot_id, c.position.x(), c.position.y(), c.position.z());
    return c;
}

bool PlacementStore::remove_component(const std::string& component_id) {
    auto it = std::find_if(components_.begin(), components_.end(),
        [&](const rig_model::PlacedComponent& c) { return c.id == component_id; });
    if (it == components_.end()) return false;

    session_logger()->info("component_removed id={} slot={}", it->id, it->slot_id);
    components_.erase(it);
    stale_ = rig_placement::find_stale_bindings(components_, slots_);
    return true;
}

std::string PlacementStore::next_component_id() {
    return fmt::format("comp-{:06}", next_serial_++);
}

} // namespace rig_session
