#pragma once

#include <optional>

namespace rig_model {

enum class ConveyorModel { DPS50, DPS60, DPS96 };

enum class EngineType { Normal, Redactor, Central };

enum class StopButtonSide { Motor, Opposite, Both };

enum class StopButtonEnd { Start, End, Both };

struct StopButtonCount {
    int motor = 0;
    int opposite = 0;
};

// User-editable description of one conveyor frame. Lengths in mm.
// Overall length/width (D, R) are not stored here; use rig_placement::derive().
struct GeometryParameters {
    double axis_length = 1000;   // L, axis to axis
    double belt_width = 500;     // N
    ConveyorModel model = ConveyorModel::DPS50;
    std::optional<EngineType> engine_type;

    bool side_guide_enabled = false;
    double side_guide_height = 100;

    std::optional<StopButtonSide> stop_button_side;
    std::optional<StopButtonEnd> stop_button_end;
    StopButtonCount stop_button_count;

    bool supporting_frame = false;
    double frame_height = 300;
    bool frame_wheels = false;
};

struct DerivedDimensions {
    double overall_length = 0;   // D
    double overall_width = 0;    // R
};

} // namespace rig_model
