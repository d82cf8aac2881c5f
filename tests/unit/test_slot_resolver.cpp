#include <rig_placement/slot_generator.hpp>
#include <rig_placement/slot_resolver.hpp>

#include <catch2/catch.hpp>
#include <algorithm>

using rig_model::GeometryParameters;
using rig_model::SlotType;

namespace {

GeometryParameters wheeled_rig() {
    GeometryParameters p;
    p.axis_length = 6000;
    p.belt_width = 1200;
    p.frame_wheels = true;
    return p;
}

rig_model::PlacedComponent placed_on(const rig_model::Slot& slot, const std::string& id) {
    rig_model::PlacedComponent c;
    c.id = id;
    c.type = slot.type;
    c.slot_id = slot.id;
    c.position = slot.position;
    return c;
}

rig_model::Slot bare_slot(const std::string& id, const Eigen::Vector3d& position) {
    rig_model::Slot s;
    s.id = id;
    s.type = SlotType::Wheel;
    s.position = position;
    return s;
}

bool contains(const std::vector<rig_model::Slot>& slots, const std::string& id) {
    return std::any_of(slots.begin(), slots.end(), [&](const rig_model::Slot& s) { return s.id == id; });
}

} // namespace

TEST_CASE("nearest_free_slot: snaps inside tolerance only", "[resolver]") {
    const auto params = wheeled_rig();
    const auto slots = rig_placement::generate_slots(params);
    const auto wheels = rig_placement::get_valid_slots(SlotType::Wheel, slots, params, {});
    REQUIRE_FALSE(wheels.empty());
    const Eigen::Vector3d target = wheels.front().position;

    const auto* near = rig_placement::nearest_free_slot(target + Eigen::Vector3d(0.03, 0, 0), wheels);
    REQUIRE(near != nullptr);
    CHECK(near->id == wheels.front().id);

    CHECK(rig_placement::nearest_free_slot(target + Eigen::Vector3d(0.05, 0, 0), wheels) == nullptr);
}

TEST_CASE("nearest_free_slot: empty candidates", "[resolver]") {
    CHECK(rig_placement::nearest_free_slot(Eigen::Vector3d::Zero(), {}, 100.0) == nullptr);
}

TEST_CASE("nearest_free_slot: picks the closest candidate", "[resolver]") {
    const std::vector<rig_model::Slot> candidates = {
        bare_slot("a", Eigen::Vector3d(1.0, 0, 0)),
        bare_slot("b", Eigen::Vector3d(0.2, 0, 0)),
        bare_slot("c", Eigen::Vector3d(0.5, 0, 0)),
    };
    const auto* s = rig_placement::nearest_free_slot(Eigen::Vector3d::Zero(), candidates, 2.0);
    REQUIRE(s != nullptr);
    CHECK(s->id == "b");
}

TEST_CASE("nearest_free_slot: ties go to the earliest candidate", "[resolver]") {
    const std::vector<rig_model::Slot> candidates = {
        bare_slot("first", Eigen::Vector3d(0.01, 0, 0)),
        bare_slot("second", Eigen::Vector3d(-0.01, 0, 0)),
        bare_slot("third", Eigen::Vector3d(0, 0.01, 0)),
    };
    const auto* s = rig_placement::nearest_free_slot(Eigen::Vector3d::Zero(), candidates);
    REQUIRE(s != nullptr);
    CHECK(s->id == "first");
}

TEST_CASE("nearest_free_slot: distance exactly at tolerance still snaps", "[resolver]") {
    const std::vector<rig_model::Slot> candidates = { bare_slot("edge", Eigen::Vector3d(0.5, 0, 0)) };
    CHECK(rig_placement::nearest_free_slot(Eigen::Vector3d::Zero(), candidates, 0.5) != nullptr);
}

TEST_CASE("get_valid_slots: never returns an occupied slot", "[resolver]") {
    const auto params = wheeled_rig();
    const auto slots = rig_placement::generate_slots(params);
    const auto all_wheels = rig_placement::get_valid_slots(SlotType::Wheel, slots, params, {});

    std::vector<rig_model::PlacedComponent> placed;
    for (std::size_t i = 0; i < all_wheels.size(); i += 2)
        placed.push_back(placed_on(all_wheels[i], "c" + std::to_string(i)));

    const auto valid = rig_placement::get_valid_slots(SlotType::Wheel, slots, params, placed);
    CHECK(valid.size() == all_wheels.size() - placed.size());
    for (const auto& s : valid)
        CHECK_FALSE(rig_placement::is_slot_occupied(s.id, placed));
}

TEST_CASE("get_valid_slots: only the dragged type, in generation order", "[resolver]") {
    const auto params = wheeled_rig();
    const auto slots = rig_placement::generate_slots(params);
    const auto valid = rig_placement::get_valid_slots(SlotType::Sensor, slots, params, {});
    REQUIRE(valid.size() == 4);
    CHECK(valid[0].id == "sensor_motor_0");
    CHECK(valid[3].id == "sensor_opposite_1");
    CHECK(rig_placement::get_valid_slots(SlotType::FrameLeg, slots, params, {}).empty());
}

TEST_CASE("get_valid_slots: engine mounts need a matching engine type", "[resolver]") {
    GeometryParameters p;
    p.engine_type = rig_model::EngineType::Normal;
    const auto slots = rig_placement::generate_slots(p);
    CHECK(rig_placement::get_valid_slots(SlotType::EngineMount, slots, p, {}).size() == 2);

    // Stale slot list from a normal engine, parameters switched to central.
    p.engine_type = rig_model::EngineType::Central;
    CHECK(rig_placement::get_valid_slots(SlotType::EngineMount, slots, p, {}).empty());

    p.engine_type.reset();
    CHECK(rig_placement::get_valid_slots(SlotType::EngineMount, slots, p, {}).empty());
}

TEST_CASE("get_valid_slots: stop buttons filtered by side and end", "[resolver]") {
    GeometryParameters p;
    p.stop_button_side = rig_model::StopButtonSide::Both;
    p.stop_button_count = { 3, 3 };
    const auto slots = rig_placement::generate_slots(p);
    CHECK(rig_placement::get_valid_slots(SlotType::StopButton, slots, p, {}).size() == 6);

    auto motor_only = p;
    motor_only.stop_button_side = rig_model::StopButtonSide::Motor;
    const auto motor = rig_placement::get_valid_slots(SlotType::StopButton, slots, motor_only, {});
    REQUIRE(motor.size() == 3);
    for (const auto& s : motor)
        CHECK(*s.side == rig_model::Side::Motor);

    auto start_only = p;
    start_only.stop_button_end = rig_model::StopButtonEnd::Start;
    const auto start = rig_placement::get_valid_slots(SlotType::StopButton, slots, start_only, {});
    REQUIRE(start.size() == 2);
    CHECK(contains(start, "stop_button_motor_0"));
    CHECK(contains(start, "stop_button_opposite_0"));
}

TEST_CASE("get_valid_slots: per-side stop button limit", "[resolver]") {
    GeometryParameters p;
    p.stop_button_side = rig_model::StopButtonSide::Both;
    p.stop_button_count = { 6, 1 };
    const auto slots = rig_placement::generate_slots(p);

    std::vector<rig_model::PlacedComponent> placed;
    for (const auto& s : slots)
        if (s.type == SlotType::StopButton && *s.side == rig_model::Side::Motor)
            placed.push_back(placed_on(s, s.id + "-part"));
    REQUIRE(placed.size() == 6);

    // Six on the motor rail reach the DPS50 limit; the opposite rail is unaffected.
    const auto valid = rig_placement::get_valid_slots(SlotType::StopButton, slots, p, placed);
    REQUIRE(valid.size() == 1);
    CHECK(valid[0].id == "stop_button_opposite_0");
}

TEST_CASE("get_valid_slots: side guides need the feature", "[resolver]") {
    GeometryParameters p;
    p.side_guide_enabled = true;
    const auto slots = rig_placement::generate_slots(p);
    CHECK(rig_placement::get_valid_slots(SlotType::SideGuideBracket, slots, p, {}).size() == 6);

    p.side_guide_enabled = false;
    CHECK(rig_placement::get_valid_slots(SlotType::SideGuideBracket, slots, p, {}).empty());
}
