#include <rig_placement/slot_resolver.hpp>
#include <rig_placement/geometry.hpp>
#include <algorithm>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace rig_placement {

namespace {

using rig_model::Side;
using rig_model::Slot;
using rig_model::SlotType;

// Two distances closer than this count as a tie.
constexpr double kTieEps = 1e-12;

bool has_side(const Slot& slot, Side side) {
    return slot.side && *slot.side == side;
}

std::string meta_value(const Slot& slot, const std::string& key) {
    auto it = slot.meta.find(key);
    if (it == slot.meta.end()) return {};
    return it->second;
}

void filter_engine_mount_slots(std::vector<Slot>& slots, const rig_model::GeometryParameters& params) {
    if (!params.engine_type) {
        slots.clear();
        return;
    }
    const bool central = *params.engine_type == rig_model::EngineType::Central;
    slots.erase(std::remove_if(slots.begin(), slots.end(), [central](const Slot& s) {
        return has_side(s, Side::Center) != central;
    }), slots.end());
}

// Placed stop buttons are counted per side through the slot they are bound to.
void filter_stop_button_slots(std::vector<Slot>& slots, const std::vector<Slot>& all_slots,
    const rig_model::GeometryParameters& params, const std::vector<rig_model::PlacedComponent>& placed)
{
    if (!params.stop_button_side) {
        slots.clear();
        return;
    }

    std::unordered_map<std::string, const Slot*> by_id;
    for (const auto& s : all_slots)
        by_id[s.id] = &s;

    int motor_count = 0;
    int opposite_count = 0;
    for (const auto& c : placed) {
        if (c.type != SlotType::StopButton) continue;
        auto it = by_id.find(c.slot_id);
        if (it == by_id.end()) continue;
        if (has_side(*it->second, Side::Motor)) ++motor_count;
        if (has_side(*it->second, Side::Opposite)) ++opposite_count;
    }

    const int max_count = stop_button_limits(params.model).max;
    const rig_model::StopButtonSide side = *params.stop_button_side;
    const bool motor_allowed = (side == rig_model::StopButtonSide::Motor || side == rig_model::StopButtonSide::Both)
        && motor_count < max_count;
    const bool opposite_allowed = (side == rig_model::StopButtonSide::Opposite || side == rig_model::StopButtonSide::Both)
        && opposite_count < max_count;

    std::string zone;
    if (params.stop_button_end == rig_model::StopButtonEnd::Start) zone = "START";
    if (params.stop_button_end == rig_model::StopButtonEnd::End) zone = "END";

    slots.erase(std::remove_if(slots.begin(), slots.end(), [&](const Slot& s) {
        const bool side_ok = (has_side(s, Side::Motor) && motor_allowed) || (has_side(s, Side::Opposite) && opposite_allowed);
        if (!side_ok) return true;
        return !zone.empty() && meta_value(s, "zone") != zone;
    }), slots.end());
}

void filter_side_guide_slots(std::vector<Slot>& slots, const rig_model::GeometryParameters& params) {
    if (!params.side_guide_enabled || !validate_side_guide_height(params.side_guide_height).valid)
        slots.clear();
}

} // namespace

std::vector<rig_model::Slot> get_valid_slots(rig_model::SlotType dragged_type,
    const std::vector<rig_model::Slot>& all_slots,
    const rig_model::GeometryParameters& params,
    const std::vector<rig_model::PlacedComponent>& placed)
{
    std::unordered_set<std::string> occupied;
    for (const auto& c : placed)
        occupied.insert(c.slot_id);

    std::vector<Slot> valid;
    for (const auto& s : all_slots) {
        if (s.type != dragged_type) continue;
        if (occupied.count(s.id) != 0) continue;
        valid.push_back(s);
    }

    switch (dragged_type) {
    case SlotType::EngineMount:
        filter_engine_mount_slots(valid, params);
        break;
    case SlotType::StopButton:
        filter_stop_button_slots(valid, all_slots, params, placed);
        break;
    case SlotType::SideGuideBracket:
        filter_side_guide_slots(valid, params);
        break;
    case SlotType::Sensor:
    case SlotType::Wheel:
    case SlotType::FrameLeg:
        break;
    }
    return valid;
}

const rig_model::Slot* nearest_free_slot(const Eigen::Vector3d& query,
    const std::vector<rig_model::Slot>& candidates,
    double tolerance)
{
    const Slot* nearest = nullptr;
    double best = std::numeric_limits<double>::infinity();
    for (const auto& s : candidates) {
        const double d = (s.position - query).norm();
        if (d < best - kTieEps) {
            best = d;
            nearest = &s;
        }
    }
    if (!nearest || !(best <= tolerance)) return nullptr;
    return nearest;
}

bool is_slot_occupied(const std::string& slot_id, const std::vector<rig_model::PlacedComponent>& placed) {
    return std::any_of(placed.begin(), placed.end(), [&](const rig_model::PlacedComponent& c) {
        return c.slot_id == slot_id;
    });
}

} // namespace rig_placement
