#pragma once

#include <rig_model/geometry_parameters.hpp>
#include <string>

namespace rig_placement {

struct ParameterCheck {
    bool valid = true;
    std::string error;
};

struct StopButtonLimits {
    int min = 0;
    int max = 0;
};

double model_offset(rig_model::ConveyorModel model);

// D = L + model_offset(model), R = N + width_margin. L and N are clamped into
// the editing bounds first, so the result is always finite and positive.
rig_model::DerivedDimensions derive(const rig_model::GeometryParameters& params);

// Rounds to the nearest step, then clamps. Non-finite values map to min_value.
double round_and_clamp(double value, double min_value, double max_value, double step);
double round_and_clamp_length(double value);
double round_and_clamp_width(double value);
double round_and_clamp_frame_height(double value);

ParameterCheck validate_side_guide_height(double height);
StopButtonLimits stop_button_limits(rig_model::ConveyorModel model);
ParameterCheck validate_stop_button_count(int count, rig_model::ConveyorModel model);

// Editing boundary: every bounded field is brought into range.
rig_model::GeometryParameters sanitize_parameters(rig_model::GeometryParameters params);

const char* to_string(rig_model::ConveyorModel model);

} // namespace rig_placement
