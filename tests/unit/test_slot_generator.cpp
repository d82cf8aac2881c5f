#include <rig_placement/slot_generator.hpp>

#include <catch2/catch.hpp>
#include <algorithm>
#include <string>
#include <vector>

using rig_model::GeometryParameters;
using rig_model::Side;
using rig_model::SlotType;

namespace {

std::vector<std::string> ids_of(const std::vector<rig_model::Slot>& slots, SlotType type) {
    std::vector<std::string> out;
    for (const auto& s : slots)
        if (s.type == type) out.push_back(s.id);
    return out;
}

const rig_model::Slot* find(const std::vector<rig_model::Slot>& slots, const std::string& id) {
    for (const auto& s : slots)
        if (s.id == id) return &s;
    return nullptr;
}

GeometryParameters full_rig() {
    GeometryParameters p;
    p.axis_length = 6000;
    p.belt_width = 1200;
    p.engine_type = rig_model::EngineType::Normal;
    p.side_guide_enabled = true;
    p.side_guide_height = 100;
    p.stop_button_side = rig_model::StopButtonSide::Both;
    p.stop_button_count = { 3, 2 };
    p.supporting_frame = true;
    p.frame_wheels = true;
    p.frame_height = 800;
    return p;
}

} // namespace

TEST_CASE("generate_slots: plain frame offers only sensors", "[slots]") {
    const auto slots = rig_placement::generate_slots(GeometryParameters{});
    REQUIRE(slots.size() == 4);
    CHECK(slots[0].id == "sensor_motor_0");
    CHECK(slots[1].id == "sensor_motor_1");
    CHECK(slots[2].id == "sensor_opposite_0");
    CHECK(slots[3].id == "sensor_opposite_1");
    CHECK(slots[0].meta.at("zone") == "START");
    CHECK(slots[1].meta.at("zone") == "END");
}

TEST_CASE("generate_slots: families appear in fixed order", "[slots]") {
    const auto slots = rig_placement::generate_slots(full_rig());
    std::vector<SlotType> order;
    for (const auto& s : slots)
        if (order.empty() || order.back() != s.type) order.push_back(s.type);

    const std::vector<SlotType> expected = { SlotType::EngineMount, SlotType::StopButton, SlotType::Sensor,
        SlotType::SideGuideBracket, SlotType::Wheel, SlotType::FrameLeg };
    CHECK(order == expected);
}

TEST_CASE("generate_slots: deterministic for equal parameters", "[slots]") {
    const auto a = rig_placement::generate_slots(full_rig());
    const auto b = rig_placement::generate_slots(full_rig());
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].id == b[i].id);
        CHECK(a[i].position.isApprox(b[i].position));
    }
}

TEST_CASE("generate_slots: slot ids are unique", "[slots]") {
    auto slots = rig_placement::generate_slots(full_rig());
    std::vector<std::string> ids;
    for (const auto& s : slots) ids.push_back(s.id);
    std::sort(ids.begin(), ids.end());
    CHECK(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}

TEST_CASE("generate_slots: engine mounts follow the engine type", "[slots]") {
    GeometryParameters p;
    CHECK(ids_of(rig_placement::generate_slots(p), SlotType::EngineMount).empty());

    p.engine_type = rig_model::EngineType::Redactor;
    CHECK(ids_of(rig_placement::generate_slots(p), SlotType::EngineMount)
        == std::vector<std::string>{ "engine_mount_motor_0", "engine_mount_opposite_0" });

    p.engine_type = rig_model::EngineType::Central;
    const auto slots = rig_placement::generate_slots(p);
    REQUIRE(ids_of(slots, SlotType::EngineMount) == std::vector<std::string>{ "engine_mount_center_0" });
    CHECK(find(slots, "engine_mount_center_0")->meta.at("engine_type") == "CENTRAL");
}

TEST_CASE("generate_slots: stop buttons per side with zones", "[slots]") {
    const auto slots = rig_placement::generate_slots(full_rig());
    CHECK(ids_of(slots, SlotType::StopButton) == std::vector<std::string>{
        "stop_button_motor_0", "stop_button_motor_1", "stop_button_motor_2",
        "stop_button_opposite_0", "stop_button_opposite_1" });

    CHECK(find(slots, "stop_button_motor_0")->meta.at("zone") == "START");
    CHECK(find(slots, "stop_button_motor_1")->meta.at("zone") == "CENTER");
    CHECK(find(slots, "stop_button_motor_2")->meta.at("zone") == "END");
    CHECK(find(slots, "stop_button_opposite_1")->meta.at("total") == "2");
    CHECK(find(slots, "stop_button_motor_1")->position.x() == Approx(0.0).margin(1e-9));
    CHECK(*find(slots, "stop_button_opposite_0")->side == Side::Opposite);
}

TEST_CASE("generate_slots: side guides need the feature and a valid height", "[slots]") {
    GeometryParameters p;
    p.side_guide_enabled = true;
    p.side_guide_height = 100;
    // 1000 mm axis, 300 mm pitch -> three brackets per side
    CHECK(ids_of(rig_placement::generate_slots(p), SlotType::SideGuideBracket).size() == 6);

    p.side_guide_height = 10;
    CHECK(ids_of(rig_placement::generate_slots(p), SlotType::SideGuideBracket).empty());

    p.side_guide_height = 100;
    p.side_guide_enabled = false;
    CHECK(ids_of(rig_placement::generate_slots(p), SlotType::SideGuideBracket).empty());
}

TEST_CASE("generate_slots: wheels on the floor at every edge station", "[slots]") {
    const auto slots = rig_placement::generate_slots(full_rig());
    const auto wheels = ids_of(slots, SlotType::Wheel);
    // D = 6055 -> 2 corners + 5 intermediates per long edge
    REQUIRE(wheels.size() == 14);
    CHECK(wheels.front() == "wheel_left_0");
    CHECK(wheels.back() == "wheel_right_6");

    const auto* first = find(slots, "wheel_left_0");
    CHECK(first->position.x() == Approx(-30.275));
    CHECK(first->position.y() == Approx(-8.0));
    CHECK(first->position.z() == Approx(-6.335));
    CHECK(first->normal.isApprox(Eigen::Vector3d::UnitY()));
    CHECK(first->meta.at("corner") == "front_left");
    CHECK(find(slots, "wheel_right_6")->meta.at("corner") == "back_right");
    CHECK(find(slots, "wheel_left_3")->meta.at("intermediate") == "true");
}

TEST_CASE("generate_slots: short frames get corners only", "[slots]") {
    GeometryParameters p;
    p.supporting_frame = true;
    const auto legs = ids_of(rig_placement::generate_slots(p), SlotType::FrameLeg);
    CHECK(legs == std::vector<std::string>{ "frame_leg_left_0", "frame_leg_left_1", "frame_leg_right_0", "frame_leg_right_1" });
}

TEST_CASE("mounting_height matches generated slots", "[slots]") {
    const auto params = full_rig();
    for (const auto& s : rig_placement::generate_slots(params))
        CHECK(s.position.y() == Approx(rig_placement::mounting_height(s.type, params)));
}

TEST_CASE("slot type names", "[slots]") {
    CHECK(rig_placement::make_slot_id(SlotType::StopButton, Side::Motor, 2) == "stop_button_motor_2");
    CHECK(std::string(rig_placement::to_string(SlotType::SideGuideBracket)) == "SIDE_GUIDE_BRACKET");
    CHECK(rig_placement::slot_type_from_string("frame-leg") == SlotType::FrameLeg);
    CHECK(rig_placement::slot_type_from_string("Stop Button") == SlotType::StopButton);
    CHECK_FALSE(rig_placement::slot_type_from_string("belt").has_value());
    CHECK(std::string(rig_placement::display_name(SlotType::EngineMount)) == "Engine");
}
