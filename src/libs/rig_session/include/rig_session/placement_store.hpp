#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <rig_model/types.hpp>
#include <rig_placement/binding_check.hpp>
#include <rig_placement/rig_constants.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rig_session {

class NotificationSink;

// Session-scoped source of truth for the rig being edited: parameters, the
// slots generated from them, placed components and the drag in progress.
// State changes only through the transition functions below.
class PlacementStore {
public:
    explicit PlacementStore(const rig_model::GeometryParameters& params = {}, NotificationSink* notices = nullptr);

    void set_notification_sink(NotificationSink* notices) { notices_ = notices; }
    NotificationSink* notification_sink() const { return notices_; }

    void set_snap_tolerance(double tolerance);
    double snap_tolerance() const { return snap_tolerance_; }

    // Called after every slot regeneration, once a vanished target has been
    // dropped from the drag session.
    void set_slots_changed_callback(std::function<void()> callback) { slots_changed_ = std::move(callback); }

    const rig_model::GeometryParameters& parameters() const { return params_; }
    rig_model::DerivedDimensions dimensions() const;
    const rig_model::SlotList& slots() const { return slots_; }
    const rig_model::PlacedComponentList& components() const { return components_; }
    const std::vector<rig_placement::StaleBinding>& stale_bindings() const { return stale_; }
    const rig_model::DragSession& drag_session() const { return drag_; }
    bool is_dragging() const { return drag_.dragged_type.has_value(); }

    const rig_model::Slot* find_slot(const std::string& slot_id) const;
    const rig_model::PlacedComponent* find_component(const std::string& component_id) const;
    bool is_slot_occupied(const std::string& slot_id) const;

    // Slots a part of `type` may be dropped on right now.
    std::vector<rig_model::Slot> valid_slots(rig_model::SlotType type) const;

    // Sanitizes, stores, regenerates slots and re-checks every binding.
    void update_parameters(const rig_model::GeometryParameters& params);
    void regenerate_slots();

    // Starts a new drag session, replacing any session in progress.
    void begin_drag(rig_model::SlotType type, const std::string& name,
        const std::optional<std::string>& asset_reference = std::nullopt);
    // Sets or clears both the target and the hover indicator.
    void update_target(const std::optional<std::string>& slot_id);
    // Binds the dragged part to the current target. The target is re-checked
    // against the live slot set; on failure nothing changes.
    std::optional<rig_model::PlacedComponent> commit();
    void cancel();

    // Direct bind without a drag (used when a rig file is loaded).
    std::optional<rig_model::PlacedComponent> place_component(rig_model::SlotType type, const std::string& slot_id,
        const std::string& name, const std::optional<std::string>& asset_reference = std::nullopt);
    bool remove_component(const std::string& component_id);

private:
    std::optional<rig_model::PlacedComponent> bind(rig_model::SlotType type, const std::string& slot_id,
        const std::string& name, const std::optional<std::string>& asset_reference);
    void refresh_stale_bindings();
    std::string next_component_id();

    rig_model::GeometryParameters params_;
    rig_model::SlotList slots_;
    rig_model::PlacedComponentList components_;
    std::vector<rig_placement::StaleBinding> stale_;
    rig_model::DragSession drag_;
    NotificationSink* notices_ = nullptr;
    double snap_tolerance_ = rig_placement::rig::default_snap_tolerance;
    std::uint64_t next_serial_ = 1;
    std::function<void()> slots_changed_;
};

} // namespace rig_session
