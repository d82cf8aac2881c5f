#include <rig_placement/orientation.hpp>
#include <cmath>

namespace rig_placement {

namespace {

constexpr double kAxisEps = 1e-9;
// |sin| of the angle between normal and up below which up is treated as parallel.
constexpr double kParallelEps = 1e-6;

Eigen::Vector3d fallback_up(const Eigen::Vector3d& normal) {
    if (std::abs(normal.dot(Eigen::Vector3d::UnitY())) > 1.0 - kParallelEps)
        return Eigen::Vector3d::UnitX();
    return Eigen::Vector3d::UnitY();
}

} // namespace

Eigen::Quaterniond calculate_orientation(const rig_model::Slot& slot) {
    Eigen::Vector3d normal = slot.normal;
    if (!normal.allFinite() || normal.norm() < kAxisEps)
        normal = Eigen::Vector3d::UnitZ();
    normal.normalize();

    Eigen::Vector3d up = slot.up;
    if (!up.allFinite() || up.norm() < kAxisEps)
        up = fallback_up(normal);
    up.normalize();

    Eigen::Vector3d right = up.cross(normal);
    if (right.norm() < kParallelEps) {
        up = fallback_up(normal);
        right = up.cross(normal);
    }
    right.normalize();
    const Eigen::Vector3d corrected_up = normal.cross(right).normalized();

    Eigen::Matrix3d basis;
    basis.col(0) = right;
    basis.col(1) = corrected_up;
    basis.col(2) = normal;

    Eigen::Quaterniond q(basis);
    q.normalize();
    return q;
}

Eigen::Vector3d orientation_euler_xyz(const Eigen::Quaterniond& rotation) {
    return rotation.toRotationMatrix().eulerAngles(0, 1, 2);
}

} // namespace rig_placement
