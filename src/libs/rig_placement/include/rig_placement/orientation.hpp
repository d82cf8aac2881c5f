#pragma once

#include <rig_model/types.hpp>
#include <Eigen/Geometry>

namespace rig_placement {

// Rotation taking local +Z (forward) onto slot.normal and local +Y onto the
// component of slot.up orthogonal to the normal. The basis is right-handed:
// right = up x normal. A zero normal falls back to +Z, and an up axis that is
// zero or (nearly) parallel to the normal falls back to +Y (+X when the normal
// itself lies along Y).
Eigen::Quaterniond calculate_orientation(const rig_model::Slot& slot);

// XYZ Euler angles in radians (rotation = Rx * Ry * Rz).
Eigen::Vector3d orientation_euler_xyz(const Eigen::Quaterniond& rotation);

} // namespace rig_placement
