#include <rig_placement/geometry.hpp>
#include <rig_placement/rig_constants.hpp>
#include <algorithm>
#include <cmath>

namespace rig_placement {

namespace {

using namespace rig;

int clamp_count(int count, int min_count, int max_count) {
    return std::max(min_count, std::min(max_count, count));
}

bool side_includes_motor(const std::optional<rig_model::StopButtonSide>& side) {
    return side && (*side == rig_model::StopButtonSide::Motor || *side == rig_model::StopButtonSide::Both);
}

bool side_includes_opposite(const std::optional<rig_model::StopButtonSide>& side) {
    return side && (*side == rig_model::StopButtonSide::Opposite || *side == rig_model::StopButtonSide::Both);
}

} // namespace

double model_offset(rig_model::ConveyorModel model) {
    switch (model) {
    case rig_model::ConveyorModel::DPS50:
        return dps50_length_offset;
    case rig_model::ConveyorModel::DPS60:
        return dps60_length_offset;
    case rig_model::ConveyorModel::DPS96:
        return dps96_length_offset;
    }
    return dps50_length_offset;
}

rig_model::DerivedDimensions derive(const rig_model::GeometryParameters& params) {
    const double length = round_and_clamp(params.axis_length, length_min, length_max, 0.0);
    const double width = round_and_clamp(params.belt_width, width_min, width_max, 0.0);

    rig_model::DerivedDimensions out;
    out.overall_length = length + model_offset(params.model);
    out.overall_width = width + width_margin;
    return out;
}

double round_and_clamp(double value, double min_value, double max_value, double step) {
    if (!std::isfinite(value)) return min_value;
    double rounded = value;
    if (step > 0.0)
        rounded = std::round(value / step) * step;
    return std::max(min_value, std::min(max_value, rounded));
}

double round_and_clamp_length(double value) {
    return round_and_clamp(value, length_min, length_max, dimension_step);
}

double round_and_clamp_width(double value) {
    return round_and_clamp(value, width_min, width_max, dimension_step);
}

double round_and_clamp_frame_height(double value) {
    return round_and_clamp(value, frame_height_min, frame_height_max, dimension_step);
}

ParameterCheck validate_side_guide_height(double height) {
    if (!std::isfinite(height) || height < side_guide_height_min)
        return { false, "Height must be at least 15 mm" };
    if (height > side_guide_height_max)
        return { false, "Height must not exceed 250 mm" };
    return {};
}

StopButtonLimits stop_button_limits(rig_model::ConveyorModel model) {
    switch (model) {
    case rig_model::ConveyorModel::DPS50:
        return { stop_button_min, dps50_stop_button_max };
    case rig_model::ConveyorModel::DPS60:
    case rig_model::ConveyorModel::DPS96:
        return { stop_button_min, wide_stop_button_max };
    }
    return { stop_button_min, dps50_stop_button_max };
}

ParameterCheck validate_stop_button_count(int count, rig_model::ConveyorModel model) {
    const StopButtonLimits limits = stop_button_limits(model);
    const std::string model_name = to_string(model);
    if (count < limits.min) {
        return { false, "Min " + std::to_string(limits.min) + " stop button" + (limits.min > 1 ? "s" : "")
            + " required for " + model_name };
    }
    if (count > limits.max) {
        return { false, "Max " + std::to_string(limits.max) + " stop buttons allowed for " + model_name
            + " (min " + std::to_string(limits.min) + ")" };
    }
    return {};
}

rig_model::GeometryParameters sanitize_parameters(rig_model::GeometryParameters params) {
    params.axis_length = round_and_clamp_length(params.axis_length);
    params.belt_width = round_and_clamp_width(params.belt_width);
    params.frame_height = round_and_clamp_frame_height(params.frame_height);
    params.side_guide_height = round_and_clamp(params.side_guide_height,
        side_guide_height_min, side_guide_height_max, dimension_step);

    const StopButtonLimits limits = stop_button_limits(params.model);
    params.stop_button_count.motor = clamp_count(params.stop_button_count.motor,
        side_includes_motor(params.stop_button_side) ? limits.min : 0, limits.max);
    params.stop_button_count.opposite = clamp_count(params.stop_button_count.opposite,
        side_includes_opposite(params.stop_button_side) ? limits.min : 0, limits.max);
    return params;
}

const char* to_string(rig_model::ConveyorModel model) {
    switch (model) {
    case rig_model::ConveyorModel::DPS50:
        return "DPS50";
    case rig_model::ConveyorModel::DPS60:
        return "DPS60";
    case rig_model::ConveyorModel::DPS96:
        return "DPS96";
    }
    return "DPS50";
}

} // namespace rig_placement
