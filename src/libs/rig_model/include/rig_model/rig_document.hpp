#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <rig_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rig_model {

struct EditorSettings {
    double snap_tolerance = 0.04;   // scene units
    std::string log_file;           // empty -> default logger
    std::string log_level = "info";
};

// A placement recorded in a rig file, re-bound on load.
struct PlacementRequest {
    SlotType type = SlotType::Sensor;
    std::string slot_id;
    std::string name;
    std::optional<std::string> asset_reference;
};

struct RigDocument {
    std::string name;
    GeometryParameters parameters;
    EditorSettings editor;
    std::vector<PlacementRequest> placements;
};

} // namespace rig_model
