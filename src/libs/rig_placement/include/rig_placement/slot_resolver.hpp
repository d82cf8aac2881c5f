#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <rig_model/types.hpp>
#include <rig_placement/rig_constants.hpp>
#include <string>
#include <vector>

namespace rig_placement {

// Slots a component of dragged_type may bind to right now: same type, not
// referenced by any placed component, and allowed by the current parameters
// (engine type, stop-button side/end/limits, side-guide feature). Occupancy is
// evaluated against `placed` on every call. Generation order is preserved.
std::vector<rig_model::Slot> get_valid_slots(rig_model::SlotType dragged_type,
    const std::vector<rig_model::Slot>& all_slots,
    const rig_model::GeometryParameters& params,
    const std::vector<rig_model::PlacedComponent>& placed);

// Closest candidate to query if its distance is <= tolerance, else nullptr.
// Equidistant candidates resolve to the earliest one in the sequence.
// The returned pointer refers into `candidates`.
const rig_model::Slot* nearest_free_slot(const Eigen::Vector3d& query,
    const std::vector<rig_model::Slot>& candidates,
    double tolerance = rig::default_snap_tolerance);

bool is_slot_occupied(const std::string& slot_id, const std::vector<rig_model::PlacedComponent>& placed);

} // namespace rig_placement
