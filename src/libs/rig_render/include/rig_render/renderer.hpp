#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <rig_model/types.hpp>
#include <rig_view/view.hpp>
#include <optional>
#include <string>
#include <unordered_set>

struct ImDrawList;

namespace rig_render {

using rig_view::View;

// Belt outline (D x R), axis length marks and rails.
void render_rig_frame(ImDrawList* draw_list,
    const rig_model::GeometryParameters& params,
    const rig_model::DerivedDimensions& dims,
    const View& view);

// Slots of every type. Ids in valid_slot_ids are ringed at the radius a drop
// snaps within, occupied slots are greyed and the hovered slot is emphasised.
void render_slots(ImDrawList* draw_list,
    const rig_model::SlotList& slots,
    const rig_model::PlacedComponentList& placed,
    const std::unordered_set<std::string>& valid_slot_ids,
    const std::optional<std::string>& hovered_slot_id,
    double snap_tolerance,
    const View& view);

void render_components(ImDrawList* draw_list,
    const rig_model::PlacedComponentList& placed,
    const View& view);

// Marker for one part at `position`, facing the projected forward axis of
// `rotation`.
void render_part_marker(ImDrawList* draw_list,
    rig_model::SlotType type,
    const Eigen::Vector3d& position,
    const Eigen::Quaterniond& rotation,
    unsigned int fill,
    unsigned int border,
    const View& view);

unsigned int slot_type_color(rig_model::SlotType type);

} // namespace rig_render
