#include <rig_loaders/default_rig.hpp>

namespace rig_loaders {

rig_model::RigDocument generate_default_rig() {
    rig_model::RigDocument out;
    out.name = "DPS50 demo conveyor (default)";

    auto& p = out.parameters;
    p.axis_length = 3000;
    p.belt_width = 600;
    p.model = rig_model::ConveyorModel::DPS50;
    p.engine_type = rig_model::EngineType::Normal;
    p.side_guide_enabled = true;
    p.side_guide_height = 80;
    p.stop_button_side = rig_model::StopButtonSide::Both;
    p.stop_button_end = rig_model::StopButtonEnd::Both;
    p.stop_button_count = { 2, 2 };
    p.supporting_frame = true;
    p.frame_height = 700;
    p.frame_wheels = true;

    auto place = [&](rig_model::SlotType type, const char* slot_id, const char* name) {
        rig_model::PlacementRequest req;
        req.type = type;
        req.slot_id = slot_id;
        req.name = name;
        out.placements.push_back(std::move(req));
    };
    place(rig_model::SlotType::EngineMount, "engine_mount_motor_0", "Drive unit 0.37 kW");
    place(rig_model::SlotType::FrameLeg, "frame_leg_left_0", "Support leg");
    place(rig_model::SlotType::FrameLeg, "frame_leg_right_0", "Support leg");
    place(rig_model::SlotType::Sensor, "sensor_motor_0", "Inductive sensor");
    return out;
}

std::vector<rig_model::DragPayload> default_palette() {
    auto entry = [](const char* id, const char* name, const char* category) {
        rig_model::DragPayload p;
        p.id = id;
        p.name = name;
        p.category = category;
        return p;
    };
    return {
        entry("palette-engine", "Drive unit", "engine"),
        entry("palette-stop", "Emergency stop", "stop_button"),
        entry("palette-sensor", "Inductive sensor", "sensor"),
        entry("palette-guide", "Side guide bracket", "side-guide"),
        entry("palette-wheel", "Swivel caster", "wheel"),
        entry("palette-leg", "Support leg", "support-leg"),
    };
}

} // namespace rig_loaders
