#include <rig_view/view.hpp>
#include <rig_placement/rig_constants.hpp>
#include <rig_placement/slot_resolver.hpp>
#include <algorithm>

namespace rig_view {

float pixel_scale(const View& view) {
    return view.zoom * pixels_per_unit;
}

void world_to_screen(const View& view, const Eigen::Vector3d& world, float& screen_x, float& screen_y) {
    const float s = pixel_scale(view);
    screen_x = static_cast<float>(world.x()) * s + view.offset_x;
    screen_y = static_cast<float>(world.z()) * s + view.offset_y;
}

Eigen::Vector3d screen_to_world(const View& view, float screen_x, float screen_y, double plane_y) {
    const double s = pixel_scale(view);
    return Eigen::Vector3d((screen_x - view.offset_x) / s, plane_y, (screen_y - view.offset_y) / s);
}

View fit_view(float region_min_x, float region_min_y, float region_width, float region_height,
    const rig_model::DerivedDimensions& dims)
{
    View view;
    view.offset_x = region_min_x + region_width * 0.5f;
    view.offset_y = region_min_y + region_height * 0.5f;

    const float rig_w = static_cast<float>(rig_placement::rig::to_scene(dims.overall_length)) * pixels_per_unit;
    const float rig_h = static_cast<float>(rig_placement::rig::to_scene(dims.overall_width)) * pixels_per_unit;
    if (rig_w <= 0 || rig_h <= 0 || region_width <= 0 || region_height <= 0) return view;
    view.zoom = std::clamp(0.8f * std::min(region_width / rig_w, region_height / rig_h), min_zoom, max_zoom);
    return view;
}

double snap_radius(const View& view, double snap_tolerance) {
    return std::max(snap_tolerance, static_cast<double>(min_snap_radius_px) / pixel_scale(view));
}

float snap_radius_px(const View& view, double snap_tolerance) {
    return static_cast<float>(snap_radius(view, snap_tolerance)) * pixel_scale(view);
}

Eigen::Vector3d snap_pointer(const View& view,
    const Eigen::Vector3d& pointer,
    const std::vector<rig_model::Slot>& candidates,
    double snap_tolerance)
{
    const rig_model::Slot* slot = rig_placement::nearest_free_slot(pointer, candidates, snap_radius(view, snap_tolerance));
    return slot ? slot->position : pointer;
}

} // namespace rig_view
