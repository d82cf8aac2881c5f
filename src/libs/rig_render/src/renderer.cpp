#include <rig_render/renderer.hpp>
#include <rig_placement/rig_constants.hpp>
#include <rig_placement/slot_generator.hpp>
#include "imgui.h"
#include <algorithm>
#include <unordered_set>

namespace rig_render {

namespace {

ImVec2 to_screen(const View& view, double wx, double wz) {
    const float s = rig_view::pixel_scale(view);
    return ImVec2(static_cast<float>(wx) * s + view.offset_x, static_cast<float>(wz) * s + view.offset_y);
}

float marker_radius(rig_model::SlotType type) {
    switch (type) {
    case rig_model::SlotType::EngineMount:
        return 0.9f;
    case rig_model::SlotType::Wheel:
    case rig_model::SlotType::FrameLeg:
        return 0.6f;
    case rig_model::SlotType::StopButton:
    case rig_model::SlotType::Sensor:
    case rig_model::SlotType::SideGuideBracket:
        return 0.4f;
    }
    return 0.4f;
}

} // namespace

unsigned int slot_type_color(rig_model::SlotType type) {
    switch (type) {
    case rig_model::SlotType::EngineMount:
        return IM_COL32(230, 140, 60, 255);
    case rig_model::SlotType::StopButton:
        return IM_COL32(220, 60, 60, 255);
    case rig_model::SlotType::Sensor:
        return IM_COL32(90, 170, 230, 255);
    case rig_model::SlotType::SideGuideBracket:
        return IM_COL32(170, 130, 220, 255);
    case rig_model::SlotType::Wheel:
        return IM_COL32(200, 200, 90, 255);
    case rig_model::SlotType::FrameLeg:
        return IM_COL32(150, 150, 160, 255);
    }
    return IM_COL32(200, 200, 200, 255);
}

void render_rig_frame(ImDrawList* draw_list,
    const rig_model::GeometryParameters& params,
    const rig_model::DerivedDimensions& dims,
    const View& view)
{
    if (!draw_list) return;
    using rig_placement::rig::to_scene;

    const unsigned int belt_fill = IM_COL32(45, 45, 48, 255);
    const unsigned int belt_border = IM_COL32(110, 110, 115, 255);
    const unsigned int axis_color = IM_COL32(90, 90, 95, 255);
    const unsigned int text_color = IM_COL32(220, 220, 220, 255);

    const double half_d = to_scene(dims.overall_length) / 2;
    const double half_r = to_scene(dims.overall_width) / 2;
    const double half_l = to_scene(params.axis_length) / 2;

    const ImVec2 min_pt = to_screen(view, -half_d, -half_r);
    const ImVec2 max_pt = to_screen(view, half_d, half_r);
    draw_list->AddRectFilled(min_pt, max_pt, belt_fill);
    draw_list->AddRect(min_pt, max_pt, belt_border, 0.0f, 0, 2.0f);

    // Drum axes.
    for (double x : { -half_l, half_l })
        draw_list->AddLine(to_screen(view, x, -half_r), to_screen(view, x, half_r), axis_color, 1.0f);

    const std::string label = std::string(rig_placement::to_string(params.model)) + "  D=" +
        std::to_string(static_cast<int>(dims.overall_length)) + "  R=" + std::to_string(static_cast<int>(dims.overall_width));
    const ImVec2 label_pos = to_screen(view, -half_d, -half_r);
    draw_list->AddText(ImVec2(label_pos.x, label_pos.y - ImGui::GetTextLineHeight() - 4.0f), text_color, label.c_str());
}

void render_slots(ImDrawList* draw_list,
    const rig_model::SlotList& slots,
    const rig_model::PlacedComponentList& placed,
    const std::unordered_set<std::string>& valid_slot_ids,
    const std::optional<std::string>& hovered_slot_id,
    double snap_tolerance,
    const View& view)
{
    if (!draw_list) return;

    const unsigned int idle_color = IM_COL32(120, 120, 125, 140);
    const unsigned int occupied_color = IM_COL32(80, 80, 85, 200);
    const unsigned int valid_color = IM_COL32(80, 200, 120, 255);
    const unsigned int hovered_color = IM_COL32(255, 220, 80, 255);

    std::unordered_set<std::string> occupied;
    for (const auto& c : placed)
        occupied.insert(c.slot_id);

    const float snap_px = rig_view::snap_radius_px(view, snap_tolerance);

    for (const auto& s : slots) {
        const ImVec2 center = to_screen(view, s.position.x(), s.position.z());
        const float radius = std::min(snap_px, std::max(3.0f, marker_radius(s.type) * 0.5f * rig_view::pixel_scale(view)));

        if (hovered_slot_id && *hovered_slot_id == s.id) {
            draw_list->AddCircleFilled(center, snap_px, hovered_color);
        } else if (valid_slot_ids.count(s.id) != 0) {
            draw_list->AddCircle(center, snap_px, valid_color, 0, 2.0f);
        }

        if (occupied.count(s.id) != 0)
            draw_list->AddCircleFilled(center, radius, occupied_color);
        else
            draw_list->AddCircle(center, radius, idle_color, 0, 1.0f);
    }
}

void render_part_marker(ImDrawList* draw_list,
    rig_model::SlotType type,
    const Eigen::Vector3d& position,
    const Eigen::Quaterniond& rotation,
    unsigned int fill,
    unsigned int border,
    const View& view)
{
    if (!draw_list) return;

    const ImVec2 center = to_screen(view, position.x(), position.z());
    const float radius = std::max(4.0f, marker_radius(type) * rig_view::pixel_scale(view) * 0.5f);
    draw_list->AddCircleFilled(center, radius, fill);
    draw_list->AddCircle(center, radius, border, 0, 1.5f);

    // Forward axis in the ground plane; vertical parts show no heading.
    const Eigen::Vector3d forward = rotation * Eigen::Vector3d::UnitZ();
    const Eigen::Vector2d flat(forward.x(), forward.z());
    if (flat.norm() > 1e-6) {
        const Eigen::Vector2d dir = flat.normalized();
        const ImVec2 tip(center.x + static_cast<float>(dir.x()) * radius * 1.8f,
            center.y + static_cast<float>(dir.y()) * radius * 1.8f);
        draw_list->AddLine(center, tip, border, 2.0f);
    }
}

void render_components(ImDrawList* draw_list,
    const rig_model::PlacedComponentList& placed,
    const View& view)
{
    if (!draw_list) return;
    const unsigned int border = IM_COL32(235, 235, 235, 255);
    const unsigned int text_color = IM_COL32(220, 220, 220, 255);

    for (const auto& c : placed) {
        render_part_marker(draw_list, c.type, c.position, c.rotation, slot_type_color(c.type), border, view);
        if (view.zoom >= 1.5f) {
            const ImVec2 p = to_screen(view, c.position.x(), c.position.z());
            draw_list->AddText(ImVec2(p.x + 8.0f, p.y + 6.0f), text_color, c.name.c_str());
        }
    }
}

} // namespace rig_render
