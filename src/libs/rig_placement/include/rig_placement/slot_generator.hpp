#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <rig_model/types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rig_placement {

// Enumerates every slot the frame offers for the given parameters.
// Order is fixed: engine mounts, stop buttons, sensors, side-guide brackets,
// wheels, frame legs; motor/left before opposite/right; then by index.
// Ids depend only on (type, side, index), so regenerating with equal
// parameters reproduces them exactly.
std::vector<rig_model::Slot> generate_slots(const rig_model::GeometryParameters& params);

// Height (scene units) of the horizontal plane a slot family lies on.
double mounting_height(rig_model::SlotType type, const rig_model::GeometryParameters& params);

std::string make_slot_id(rig_model::SlotType type, rig_model::Side side, int index);

const char* to_string(rig_model::SlotType type);
const char* to_string(rig_model::Side side);
std::optional<rig_model::SlotType> slot_type_from_string(std::string_view s);

// Display name used for notices and default component names.
const char* display_name(rig_model::SlotType type);

} // namespace rig_placement
