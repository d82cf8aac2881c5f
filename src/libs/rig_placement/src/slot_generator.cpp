#include <rig_placement/slot_generator.hpp>
#include <rig_placement/geometry.hpp>
#include <rig_placement/rig_constants.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace rig_placement {

namespace {

using namespace rig;
using rig_model::Side;
using rig_model::Slot;
using rig_model::SlotType;

// Frame extents in scene units.
struct FrameExtents {
    double axis_length = 0;      // L
    double overall_length = 0;   // D
    double overall_width = 0;    // R
};

FrameExtents frame_extents(const rig_model::GeometryParameters& params) {
    const rig_model::DerivedDimensions dims = derive(params);
    FrameExtents out;
    out.axis_length = to_scene(round_and_clamp(params.axis_length, length_min, length_max, 0.0));
    out.overall_length = to_scene(dims.overall_length);
    out.overall_width = to_scene(dims.overall_width);
    return out;
}

Slot make_slot(SlotType type, Side side, int index,
    const Eigen::Vector3d& position, const Eigen::Vector3d& normal, const Eigen::Vector3d& up)
{
    Slot s;
    s.id = make_slot_id(type, side, index);
    s.type = type;
    s.position = position;
    s.normal = normal;
    s.up = up;
    s.side = side;
    s.meta["index"] = std::to_string(index);
    return s;
}

// Normal pointing across the belt, towards the centre line.
Eigen::Vector3d inward_normal(double z) {
    return Eigen::Vector3d(0.0, 0.0, z > 0 ? -1.0 : 1.0);
}

const char* engine_type_name(rig_model::EngineType type) {
    switch (type) {
    case rig_model::EngineType::Normal:
        return "NORMAL";
    case rig_model::EngineType::Redactor:
        return "REDACTOR";
    case rig_model::EngineType::Central:
        return "CENTRAL";
    }
    return "NORMAL";
}

void add_engine_mount_slots(std::vector<Slot>& out, const FrameExtents& frame, rig_model::EngineType engine) {
    const double y = to_scene(frame_section_height + engine_lift);
    const double motor_z = -frame.overall_width / 2 + to_scene(engine_side_inset);
    const Eigen::Vector3d normal = Eigen::Vector3d::UnitY();
    const Eigen::Vector3d up = Eigen::Vector3d::UnitZ();

    if (engine == rig_model::EngineType::Central) {
        Slot s = make_slot(SlotType::EngineMount, Side::Center, 0, Eigen::Vector3d(0.0, y, 0.0), normal, up);
        s.meta["engine_type"] = engine_type_name(engine);
        out.push_back(std::move(s));
        return;
    }

    Slot motor = make_slot(SlotType::EngineMount, Side::Motor, 0, Eigen::Vector3d(0.0, y, motor_z), normal, up);
    motor.meta["engine_type"] = engine_type_name(engine);
    out.push_back(std::move(motor));

    Slot opposite = make_slot(SlotType::EngineMount, Side::Opposite, 0, Eigen::Vector3d(0.0, y, -motor_z), normal, up);
    opposite.meta["engine_type"] = engine_type_name(engine);
    out.push_back(std::move(opposite));
}

// Evenly spaced run along the axis length; a single slot sits at the centre.
void add_stop_button_run(std::vector<Slot>& out, double length, double y, double z, int count, Side side) {
    const double start_x = -length / 2;
    const double spacing = count > 1 ? length / (count - 1) : 0.0;
    const char* rail_side = side == Side::Motor ? "LEFT" : "RIGHT";

    for (int i = 0; i < count; ++i) {
        const double x = count == 1 ? 0.0 : start_x + i * spacing;
        Slot s = make_slot(SlotType::StopButton, side, i, Eigen::Vector3d(x, y, z), inward_normal(z), Eigen::Vector3d::UnitY());
        s.meta["total"] = std::to_string(count);
        s.meta["zone"] = i == 0 ? "START" : (i == count - 1 ? "END" : "CENTER");
        s.meta["rail_side"] = rail_side;
        out.push_back(std::move(s));
    }
}

void add_stop_button_slots(std::vector<Slot>& out, const FrameExtents& frame,
    const rig_model::GeometryParameters& params)
{
    const double y = to_scene(rail_height + stop_button_lift);
    const double motor_z = -frame.overall_width / 2 + to_scene(rail_inset);
    const double opposite_z = frame.overall_width / 2 - to_scene(rail_inset);
    const int max_count = stop_button_limits(params.model).max;
    const rig_model::StopButtonSide side = *params.stop_button_side;

    if (side == rig_model::StopButtonSide::Motor || side == rig_model::StopButtonSide::Both) {
        const int count = std::clamp(params.stop_button_count.motor, 0, max_count);
        add_stop_button_run(out, frame.axis_length, y, motor_z, count, Side::Motor);
    }
    if (side == rig_model::StopButtonSide::Opposite || side == rig_model::StopButtonSide::Both) {
        const int count = std::clamp(params.stop_button_count.opposite, 0, max_count);
        add_stop_button_run(out, frame.axis_length, y, opposite_z, count, Side::Opposite);
    }
}

void add_sensor_slots(std::vector<Slot>& out, const FrameExtents& frame) {
    const double y = to_scene(rail_height + sensor_lift);
    const double motor_z = -frame.overall_width / 2 + to_scene(rail_inset);
    const double opposite_z = frame.overall_width / 2 - to_scene(rail_inset);
    const double start_x = -frame.overall_length / 2 + to_scene(sensor_end_inset);
    const double end_x = frame.overall_length / 2 - to_scene(sensor_end_inset);

    for (const auto& [side, z] : { std::pair{ Side::Motor, motor_z }, std::pair{ Side::Opposite, opposite_z } }) {
        Slot start = make_slot(SlotType::Sensor, side, 0, Eigen::Vector3d(start_x, y, z), inward_normal(z), Eigen::Vector3d::UnitY());
        start.meta["zone"] = "START";
        out.push_back(std::move(start));

        Slot end = make_slot(SlotType::Sensor, side, 1, Eigen::Vector3d(end_x, y, z), inward_normal(z), Eigen::Vector3d::UnitY());
        end.meta["zone"] = "END";
        out.push_back(std::move(end));
    }
}

void add_side_guide_bracket_slots(std::vector<Slot>& out, const FrameExtents& frame,
    const rig_model::GeometryParameters& params)
{
    const double y = to_scene(rail_height);
    const double length_mm = round_and_clamp(params.axis_length, length_min, length_max, 0.0);
    const int count = static_cast<int>(std::floor(length_mm / side_guide_pitch));
    const double pitch = to_scene(side_guide_pitch);

    for (const auto& [side, z] : { std::pair{ Side::Left, -frame.overall_width / 2 }, std::pair{ Side::Right, frame.overall_width / 2 } }) {
        for (int i = 0; i < count; ++i) {
            const double x = -frame.axis_length / 2 + (i + 0.5) * pitch;
            out.push_back(make_slot(SlotType::SideGuideBracket, side, i, Eigen::Vector3d(x, y, z), inward_normal(z), Eigen::Vector3d::UnitY()));
        }
    }
}

// X positions along one long edge: both corners plus evenly spread
// intermediates once the frame is long enough.
std::vector<double> edge_stations(const FrameExtents& frame, double overall_length_mm) {
    const double half = frame.overall_length / 2;
    std::vector<double> xs;
    xs.push_back(-half);
    if (overall_length_mm > intermediate_leg_min_length) {
        const int intermediate = static_cast<int>(std::floor(overall_length_mm / leg_pitch)) - 1;
        for (int i = 1; i <= intermediate; ++i)
            xs.push_back(-half + (i * frame.overall_length) / (intermediate + 1));
    }
    xs.push_back(half);
    return xs;
}

void add_edge_slots(std::vector<Slot>& out, SlotType type, const FrameExtents& frame, double overall_length_mm,
    double y, const Eigen::Vector3d& normal)
{
    const std::vector<double> xs = edge_stations(frame, overall_length_mm);
    for (const auto& [side, z] : { std::pair{ Side::Left, -frame.overall_width / 2 }, std::pair{ Side::Right, frame.overall_width / 2 } }) {
        const char* edge = side == Side::Left ? "left" : "right";
        for (std::size_t i = 0; i < xs.size(); ++i) {
            Slot s = make_slot(type, side, static_cast<int>(i), Eigen::Vector3d(xs[i], y, z), normal, Eigen::Vector3d::UnitX());
            if (i == 0)
                s.meta["corner"] = std::string("front_") + edge;
            else if (i + 1 == xs.size())
                s.meta["corner"] = std::string("back_") + edge;
            else
                s.meta["intermediate"] = "true";
            out.push_back(std::move(s));
        }
    }
}

std::string lower_key(const char* name) {
    std::string out;
    for (const char* p = name; *p; ++p)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
    return out;
}

std::string normalized(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '-' || c == ' ')
            out.push_back('_');
        else
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

std::vector<rig_model::Slot> generate_slots(const rig_model::GeometryParameters& params) {
    std::vector<Slot> slots;
    const FrameExtents frame = frame_extents(params);
    const double overall_length_mm = derive(params).overall_length;

    if (params.engine_type)
        add_engine_mount_slots(slots, frame, *params.engine_type);

    if (params.stop_button_side)
        add_stop_button_slots(slots, frame, params);

    add_sensor_slots(slots, frame);

    if (params.side_guide_enabled && validate_side_guide_height(params.side_guide_height).valid)
        add_side_guide_bracket_slots(slots, frame, params);

    if (params.frame_wheels)
        add_edge_slots(slots, SlotType::Wheel, frame, overall_length_mm,
            mounting_height(SlotType::Wheel, params), Eigen::Vector3d::UnitY());

    if (params.supporting_frame)
        add_edge_slots(slots, SlotType::FrameLeg, frame, overall_length_mm,
            mounting_height(SlotType::FrameLeg, params), -Eigen::Vector3d::UnitY());

    return slots;
}

double mounting_height(rig_model::SlotType type, const rig_model::GeometryParameters& params) {
    switch (type) {
    case SlotType::EngineMount:
        return to_scene(frame_section_height + engine_lift);
    case SlotType::StopButton:
        return to_scene(rail_height + stop_button_lift);
    case SlotType::Sensor:
        return to_scene(rail_height + sensor_lift);
    case SlotType::SideGuideBracket:
        return to_scene(rail_height);
    case SlotType::Wheel:
        return -to_scene(round_and_clamp(params.frame_height, frame_height_min, frame_height_max, 0.0));
    case SlotType::FrameLeg:
        return -to_scene(frame_section_height) / 2;
    }
    return 0.0;
}

std::string make_slot_id(rig_model::SlotType type, rig_model::Side side, int index) {
    return lower_key(to_string(type)) + "_" + lower_key(to_string(side)) + "_" + std::to_string(index);
}

const char* to_string(rig_model::SlotType type) {
    switch (type) {
    case SlotType::EngineMount:
        return "ENGINE_MOUNT";
    case SlotType::StopButton:
        return "STOP_BUTTON";
    case SlotType::Sensor:
        return "SENSOR";
    case SlotType::SideGuideBracket:
        return "SIDE_GUIDE_BRACKET";
    case SlotType::Wheel:
        return "WHEEL";
    case SlotType::FrameLeg:
        return "FRAME_LEG";
    }
    return "SENSOR";
}

const char* to_string(rig_model::Side side) {
    switch (side) {
    case Side::Motor:
        return "MOTOR";
    case Side::Opposite:
        return "OPPOSITE";
    case Side::Center:
        return "CENTER";
    case Side::Left:
        return "LEFT";
    case Side::Right:
        return "RIGHT";
    case Side::Start:
        return "START";
    case Side::End:
        return "END";
    }
    return "CENTER";
}

std::optional<rig_model::SlotType> slot_type_from_string(std::string_view s) {
    const std::string key = normalized(s);
    for (SlotType type : { SlotType::EngineMount, SlotType::StopButton, SlotType::Sensor,
             SlotType::SideGuideBracket, SlotType::Wheel, SlotType::FrameLeg }) {
        if (key == to_string(type)) return type;
    }
    return std::nullopt;
}

const char* display_name(rig_model::SlotType type) {
    switch (type) {
    case SlotType::EngineMount:
        return "Engine";
    case SlotType::StopButton:
        return "Stop Button";
    case SlotType::Sensor:
        return "Sensor";
    case SlotType::SideGuideBracket:
        return "Side Guide";
    case SlotType::Wheel:
        return "Wheel";
    case SlotType::FrameLeg:
        return "Frame Leg";
    }
    return "Component";
}

} // namespace rig_placement
