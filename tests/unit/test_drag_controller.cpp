#include <rig_session/drag_controller.hpp>
#include <rig_session/input_events.hpp>
#include <rig_session/notifications.hpp>
#include <rig_session/placement_store.hpp>
#include <rig_session/preview.hpp>
#include <rig_placement/orientation.hpp>

#include <catch2/catch.hpp>
#include <string>
#include <vector>

using rig_model::SlotType;
using rig_session::DragController;
using rig_session::DragOutcome;
using rig_session::DragState;
using rig_session::Key;
using rig_session::NotificationKind;

namespace {

// Records preview calls in order: "release" or "attach:<slot id>".
class RecordingPreview : public rig_session::PreviewSink {
public:
    void release_preview() override {
        calls.push_back("release");
        attached = false;
    }
    void attach_preview(const rig_session::GhostPreview& preview) override {
        calls.push_back("attach:" + preview.slot_id);
        last = preview;
        attached = true;
    }

    std::vector<std::string> calls;
    rig_session::GhostPreview last;
    bool attached = false;
};

rig_model::GeometryParameters test_rig() {
    rig_model::GeometryParameters p;
    p.axis_length = 6000;
    p.belt_width = 1200;
    p.frame_wheels = true;
    p.stop_button_side = rig_model::StopButtonSide::Motor;
    p.stop_button_count = { 2, 0 };
    return p;
}

class DragFixture {
protected:
    rig_session::NotificationLog notices;
    rig_session::PlacementStore store{ test_rig() };
    rig_session::InputEventHub hub;
    RecordingPreview preview;
    DragController controller{ store, hub, &preview, &notices };

    Eigen::Vector3d slot_position(const std::string& id) const {
        const auto* s = store.find_slot(id);
        REQUIRE(s != nullptr);
        return s->position;
    }
    void move_to(const Eigen::Vector3d& world) { hub.dispatch_pointer_move({ world }); }
    void release() { hub.dispatch_pointer_up({}); }
};

} // namespace

TEST_CASE_METHOD(DragFixture, "DragController: drop on a slot commits one component", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    CHECK(controller.state() == DragState::Dragging);
    CHECK(hub.listener_count() == 3);

    move_to(slot_position("wheel_left_0") + Eigen::Vector3d(0.01, 0, 0.01));
    CHECK(controller.state() == DragState::Targeting);
    CHECK(store.drag_session().hovered_slot_id == std::string("wheel_left_0"));

    release();
    CHECK(controller.last_outcome() == DragOutcome::Committed);
    CHECK(controller.state() == DragState::Idle);
    CHECK(hub.listener_count() == 0);

    REQUIRE(store.components().size() == 1);
    const auto& placed = store.components().front();
    const auto* slot = store.find_slot("wheel_left_0");
    CHECK(placed.slot_id == "wheel_left_0");
    CHECK(placed.position == slot->position);
    CHECK(placed.rotation.isApprox(rig_placement::calculate_orientation(*slot)));

    REQUIRE(notices.last() != nullptr);
    CHECK(notices.last()->kind == NotificationKind::Success);
    CHECK(notices.last()->message == "Placed Caster on left");
}

TEST_CASE_METHOD(DragFixture, "DragController: an occupied slot is not offered twice", "[drag]") {
    const Eigen::Vector3d target = slot_position("wheel_left_0");

    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(target);
    release();
    REQUIRE(store.components().size() == 1);

    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(target);
    CHECK(controller.state() == DragState::Dragging);
    CHECK_FALSE(store.drag_session().target_slot_id.has_value());

    release();
    CHECK(controller.last_outcome() == DragOutcome::NoTarget);
    CHECK(store.components().size() == 1);
    REQUIRE(notices.last() != nullptr);
    CHECK(notices.last()->kind == NotificationKind::Error);
    CHECK(notices.last()->message == "No valid slot found. Release over a highlighted slot.");
    CHECK(hub.listener_count() == 0);
}

TEST_CASE_METHOD(DragFixture, "DragController: Escape cancels without placing", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(slot_position("wheel_right_3"));
    REQUIRE(controller.state() == DragState::Targeting);

    hub.dispatch_key_down(Key::Escape);
    CHECK(controller.last_outcome() == DragOutcome::Cancelled);
    CHECK(controller.state() == DragState::Idle);
    CHECK(store.components().empty());
    CHECK_FALSE(store.is_dragging());
    CHECK(hub.listener_count() == 0);
    CHECK_FALSE(preview.attached);
    REQUIRE(notices.last() != nullptr);
    CHECK(notices.last()->kind == NotificationKind::Info);
    CHECK(notices.last()->message == "Placement cancelled");
}

TEST_CASE_METHOD(DragFixture, "DragController: other keys are ignored", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    CHECK(controller.key_down(Key::Enter) == DragOutcome::None);
    CHECK(controller.state() == DragState::Dragging);
    CHECK(hub.listener_count() == 3);
}

TEST_CASE_METHOD(DragFixture, "DragController: leaving a slot clears the target", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(slot_position("wheel_left_2"));
    REQUIRE(controller.state() == DragState::Targeting);

    move_to(Eigen::Vector3d(1000, 0, 1000));
    CHECK(controller.state() == DragState::Dragging);
    CHECK_FALSE(store.drag_session().hovered_slot_id.has_value());
    CHECK_FALSE(preview.attached);
}

TEST_CASE_METHOD(DragFixture, "DragController: preview is released before every attach", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(slot_position("wheel_left_0"));
    move_to(slot_position("wheel_left_1"));
    move_to(slot_position("wheel_left_1"));
    release();

    REQUIRE_FALSE(preview.calls.empty());
    for (std::size_t i = 0; i < preview.calls.size(); ++i) {
        if (preview.calls[i].rfind("attach:", 0) == 0) {
            REQUIRE(i > 0);
            CHECK(preview.calls[i - 1] == "release");
        }
    }
    CHECK(preview.calls[1] == "attach:wheel_left_0");
    CHECK(preview.calls.back() == "release");
    CHECK_FALSE(preview.attached);
}

TEST_CASE_METHOD(DragFixture, "DragController: ghost carries the slot orientation", "[drag]") {
    controller.begin_drag(SlotType::StopButton, "E-stop");
    move_to(slot_position("stop_button_motor_1"));
    REQUIRE(preview.attached);

    const auto* slot = store.find_slot("stop_button_motor_1");
    CHECK(preview.last.slot_id == "stop_button_motor_1");
    CHECK(preview.last.position == slot->position);
    CHECK(preview.last.rotation.isApprox(rig_placement::calculate_orientation(*slot)));
    CHECK(preview.last.name == "E-stop");

    release();
    REQUIRE(notices.last() != nullptr);
    CHECK(notices.last()->message == "Placed E-stop on motor • END");
}

TEST_CASE_METHOD(DragFixture, "DragController: a new drag replaces the one in flight", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(slot_position("wheel_left_0"));
    const std::size_t notices_before = notices.entries().size();

    controller.begin_drag(SlotType::Sensor, "Sensor");
    CHECK(hub.listener_count() == 3);
    CHECK(controller.state() == DragState::Dragging);
    CHECK(store.drag_session().dragged_type == SlotType::Sensor);
    CHECK_FALSE(preview.attached);
    CHECK(notices.entries().size() == notices_before);

    move_to(slot_position("sensor_opposite_0"));
    release();
    REQUIRE(store.components().size() == 1);
    CHECK(store.components().front().type == SlotType::Sensor);
    CHECK(hub.listener_count() == 0);
}

TEST_CASE_METHOD(DragFixture, "DragController: payload categories map to slot types", "[drag]") {
    rig_model::DragPayload payload;
    payload.id = "7";
    payload.name = "Swivel caster";
    payload.category = "caster";
    payload.model_reference = "assets/caster.glb";

    REQUIRE(controller.begin_drag(payload));
    CHECK(store.drag_session().dragged_type == SlotType::Wheel);
    move_to(slot_position("wheel_right_0"));
    release();

    REQUIRE(store.components().size() == 1);
    CHECK(store.components().front().name == "Swivel caster");
    CHECK(store.components().front().asset_reference == std::string("assets/caster.glb"));
}

TEST_CASE_METHOD(DragFixture, "DragController: unknown payload category is rejected", "[drag]") {
    rig_model::DragPayload payload;
    payload.name = "Mystery part";
    payload.category = "belt-cleaner";

    CHECK_FALSE(controller.begin_drag(payload));
    CHECK(controller.state() == DragState::Idle);
    CHECK(hub.listener_count() == 0);
    CHECK_FALSE(store.is_dragging());
    REQUIRE(notices.last() != nullptr);
    CHECK(notices.last()->kind == NotificationKind::Error);
}

TEST_CASE_METHOD(DragFixture, "DragController: input while idle does nothing", "[drag]") {
    CHECK(controller.pointer_up() == DragOutcome::None);
    controller.pointer_move(slot_position("wheel_left_0"));
    CHECK(controller.state() == DragState::Idle);
    CHECK(preview.calls.empty());
    CHECK(notices.entries().empty());
}

TEST_CASE("DragController: destruction releases listeners and the session", "[drag]") {
    rig_session::PlacementStore store(test_rig());
    rig_session::InputEventHub hub;
    RecordingPreview preview;
    {
        DragController controller(store, hub, &preview);
        controller.begin_drag(SlotType::Wheel, "Caster");
        controller.pointer_move(store.find_slot("wheel_left_0")->position);
        REQUIRE(hub.listener_count() == 3);
        REQUIRE(preview.attached);
    }
    CHECK(hub.listener_count() == 0);
    CHECK_FALSE(store.is_dragging());
    CHECK_FALSE(preview.attached);
}

TEST_CASE("DragController: tolerance comes from the store", "[drag]") {
    rig_session::PlacementStore store(test_rig());
    rig_session::InputEventHub hub;
    DragController controller(store, hub);
    const Eigen::Vector3d target = store.find_slot("wheel_left_0")->position;

    controller.begin_drag(SlotType::Wheel, "Caster");
    controller.pointer_move(target + Eigen::Vector3d(0.05, 0, 0));
    CHECK(controller.state() == DragState::Dragging);

    store.set_snap_tolerance(0.1);
    controller.pointer_move(target + Eigen::Vector3d(0.05, 0, 0));
    CHECK(controller.state() == DragState::Targeting);
}

TEST_CASE_METHOD(DragFixture, "DragController: a target removed by regeneration drops back to dragging", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(slot_position("wheel_left_0"));
    REQUIRE(controller.state() == DragState::Targeting);
    REQUIRE(preview.attached);

    auto params = store.parameters();
    params.frame_wheels = false;
    store.update_parameters(params);

    CHECK(controller.state() == DragState::Dragging);
    CHECK_FALSE(store.drag_session().target_slot_id.has_value());
    CHECK_FALSE(preview.attached);
    CHECK(preview.calls.back() == "release");

    release();
    CHECK(controller.last_outcome() == DragOutcome::NoTarget);
    CHECK(store.components().empty());
    CHECK(hub.listener_count() == 0);
}

TEST_CASE_METHOD(DragFixture, "DragController: a surviving target moves its ghost", "[drag]") {
    controller.begin_drag(SlotType::Wheel, "Caster");
    move_to(slot_position("wheel_left_0"));
    REQUIRE(controller.state() == DragState::Targeting);
    const Eigen::Vector3d before = preview.last.position;

    auto params = store.parameters();
    params.belt_width = 1600;
    store.update_parameters(params);

    CHECK(controller.state() == DragState::Targeting);
    REQUIRE(preview.attached);
    CHECK(preview.last.slot_id == "wheel_left_0");
    CHECK(preview.last.position == slot_position("wheel_left_0"));
    CHECK_FALSE(preview.last.position.isApprox(before));
    const auto n = preview.calls.size();
    CHECK(preview.calls[n - 2] == "release");
    CHECK(preview.calls[n - 1] == "attach:wheel_left_0");

    release();
    CHECK(controller.last_outcome() == DragOutcome::Committed);
    REQUIRE(store.components().size() == 1);
    CHECK(store.components().front().position == slot_position("wheel_left_0"));
}
