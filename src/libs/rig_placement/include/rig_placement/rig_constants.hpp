#pragma once

namespace rig_placement {

// Shared frame constants (used by the generator, resolver and canvas).
// Everything here is in mm except the snap tolerance; the generator converts
// to scene units with scene_scale.

namespace rig {

constexpr double scene_scale = 0.01;

// Overall width margin, identical for every model family.
constexpr double width_margin = 67.0;

constexpr double dps50_length_offset = 55.0;
constexpr double dps60_length_offset = 70.0;
constexpr double dps96_length_offset = 100.0;

// Editing bounds, step applies to all three.
constexpr double length_min = 300.0;
constexpr double length_max = 20000.0;
constexpr double width_min = 100.0;
constexpr double width_max = 2000.0;
constexpr double frame_height_min = 300.0;
constexpr double frame_height_max = 1500.0;
constexpr double dimension_step = 1.0;

constexpr double side_guide_height_min = 15.0;
constexpr double side_guide_height_max = 250.0;

constexpr int stop_button_min = 1;
constexpr int dps50_stop_button_max = 6;
constexpr int wide_stop_button_max = 12;   // DPS60, DPS96

// Frame section below the belt plane (belt top is y = 0).
constexpr double frame_section_height = 300.0;
constexpr double rail_height = 100.0;

constexpr double engine_lift = 50.0;           // above frame section
constexpr double engine_side_inset = 100.0;
constexpr double stop_button_lift = 20.0;      // above rail
constexpr double rail_inset = 50.0;
constexpr double sensor_lift = 30.0;
constexpr double sensor_end_inset = 200.0;
constexpr double side_guide_pitch = 300.0;
constexpr double leg_pitch = 1000.0;
constexpr double intermediate_leg_min_length = 2000.0;

// Pointer snap radius in scene units.
constexpr double default_snap_tolerance = 0.04;

inline constexpr double to_scene(double mm) {
    return mm * scene_scale;
}

} // namespace rig
} // namespace rig_placement
