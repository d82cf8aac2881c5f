#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <rig_model/types.hpp>
#include <vector>

namespace rig_view {

// Top-down projection: scene x runs right, scene z runs down the screen.
struct View {
    float offset_x = 0;
    float offset_y = 0;
    float zoom = 1.0f;
};

// Screen pixels per scene unit at zoom 1.
constexpr float pixels_per_unit = 20.0f;

constexpr float min_zoom = 0.1f;
constexpr float max_zoom = 40.0f;

// Drop targets are never smaller than this on screen, however far the view
// is zoomed out.
constexpr float min_snap_radius_px = 10.0f;

float pixel_scale(const View& view);

void world_to_screen(const View& view, const Eigen::Vector3d& world, float& screen_x, float& screen_y);

// Screen point to scene point on the horizontal plane at plane_y.
Eigen::Vector3d screen_to_world(const View& view, float screen_x, float screen_y, double plane_y);

// View centred on the region with the D x R outline (millimetres) filling
// most of it.
View fit_view(float region_min_x, float region_min_y, float region_width, float region_height,
    const rig_model::DerivedDimensions& dims);

// Capture radius for a drop target, in scene units and in pixels: the snap
// tolerance or min_snap_radius_px, whichever is larger on screen.
double snap_radius(const View& view, double snap_tolerance);
float snap_radius_px(const View& view, double snap_tolerance);

// A pointer within snap_radius of a candidate is moved onto the nearest one,
// so the resolver sees an exact hit; otherwise it is returned unchanged.
Eigen::Vector3d snap_pointer(const View& view,
    const Eigen::Vector3d& pointer,
    const std::vector<rig_model::Slot>& candidates,
    double snap_tolerance);

} // namespace rig_view
