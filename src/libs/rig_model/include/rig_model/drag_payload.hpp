#pragma once

#include <Eigen/Core>
#include <optional>
#include <string>

namespace rig_model {

struct BoundingBox {
    Eigen::Vector3d min = Eigen::Vector3d::Zero();
    Eigen::Vector3d max = Eigen::Vector3d::Zero();
};

// Record handed from the component palette to the placement engine when a
// drag starts. Only id, name and category are always present.
struct DragPayload {
    std::string id;
    std::string name;
    std::string category;
    std::optional<std::string> model_reference;
    std::optional<std::string> original_reference;
    std::optional<BoundingBox> bounding_box;
    Eigen::Vector3d center = Eigen::Vector3d::Zero();
};

} // namespace rig_model
