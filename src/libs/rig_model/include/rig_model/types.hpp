#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rig_model {

enum class SlotType {
    EngineMount,
    StopButton,
    Sensor,
    SideGuideBracket,
    Wheel,
    FrameLeg
};

enum class Side { Motor, Opposite, Center, Left, Right, Start, End };

// Typed attachment point on the frame. Positions are in scene units.
// Occupancy is not stored: a slot is occupied while some PlacedComponent
// carries its id.
struct Slot {
    std::string id;
    SlotType type = SlotType::Sensor;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    Eigen::Vector3d normal = Eigen::Vector3d::UnitY();  // primary facing direction
    Eigen::Vector3d up = Eigen::Vector3d::UnitZ();      // disambiguates roll about normal
    std::optional<Side> side;
    std::map<std::string, std::string> meta;            // index, total, zone, corner, ...
};

struct PlacedComponent {
    std::string id;
    SlotType type = SlotType::Sensor;
    std::string slot_id;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    Eigen::Quaterniond rotation = Eigen::Quaterniond::Identity();
    std::optional<std::string> asset_reference;
    std::string name;
};

// Transient state of the drag in progress (all empty when idle).
struct DragSession {
    std::optional<SlotType> dragged_type;
    std::string name;
    std::optional<std::string> asset_reference;
    std::optional<std::string> target_slot_id;
    std::optional<std::string> hovered_slot_id;
};

using SlotList = std::vector<Slot>;
using PlacedComponentList = std::vector<PlacedComponent>;

} // namespace rig_model
