#pragma once

#include <rig_model/types.hpp>
#include <string>

namespace rig_session {

// Ghost of the dragged part, shown at the targeted slot.
struct GhostPreview {
    std::string slot_id;
    rig_model::SlotType type = rig_model::SlotType::Sensor;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    Eigen::Quaterniond rotation = Eigen::Quaterniond::Identity();
    std::string name;
};

// Owner of the preview resource. At most one ghost is attached at a time;
// release_preview() is a no-op when nothing is attached.
class PreviewSink {
public:
    virtual ~PreviewSink() = default;
    virtual void release_preview() = 0;
    virtual void attach_preview(const GhostPreview& preview) = 0;
};

} // namespace rig_session
