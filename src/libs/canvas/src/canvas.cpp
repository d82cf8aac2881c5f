#include <canvas/canvas.hpp>
#include <rig_loaders/json_loader.hpp>
#include <rig_placement/slot_generator.hpp>
#include <rig_render/preview_renderer.hpp>
#include <rig_session/drag_controller.hpp>
#include <rig_session/input_events.hpp>
#include <rig_session/logging.hpp>
#include <rig_session/notifications.hpp>
#include <rig_session/placement_store.hpp>
#include <rig_view/view.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace {

const float pick_radius_px = 10.0f;

unsigned int notice_color(rig_session::NotificationKind kind) {
    switch (kind) {
    case rig_session::NotificationKind::Success:
        return IM_COL32(80, 200, 120, 255);
    case rig_session::NotificationKind::Error:
        return IM_COL32(230, 80, 80, 255);
    case rig_session::NotificationKind::Warning:
        return IM_COL32(235, 180, 60, 255);
    case rig_session::NotificationKind::Info:
        return IM_COL32(150, 180, 230, 255);
    }
    return IM_COL32(220, 220, 220, 255);
}

} // namespace

namespace canvas {

RigCanvas::RigCanvas() = default;

RigCanvas::~RigCanvas() = default;

void RigCanvas::set_session(rig_session::PlacementStore* store,
    rig_session::InputEventHub* hub,
    rig_session::DragController* controller,
    rig_render::PreviewRenderer* preview)
{
    store_ = store;
    hub_ = hub;
    controller_ = controller;
    preview_ = preview;
    fitted_ = false;
}

void RigCanvas::pan(float dx, float dy) {
    view_.offset_x += dx;
    view_.offset_y += dy;
}

void RigCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = std::clamp(view_.zoom * zoom_delta, rig_view::min_zoom, rig_view::max_zoom);
    float factor = new_zoom / view_.zoom;
    view_.offset_x = screen_x - (screen_x - view_.offset_x) * factor;
    view_.offset_y = screen_y - (screen_y - view_.offset_y) * factor;
    view_.zoom = new_zoom;
}

Eigen::Vector3d RigCanvas::screen_to_world(float screen_x, float screen_y, double plane_y) const {
    return rig_view::screen_to_world(view_, screen_x, screen_y, plane_y);
}

void RigCanvas::world_to_screen(const Eigen::Vector3d& world, float& screen_x, float& screen_y) const {
    rig_view::world_to_screen(view_, world, screen_x, screen_y);
}

void RigCanvas::fit_to_rig(ImVec2 region_min, float region_width, float region_height) {
    const rig_model::DerivedDimensions dims = store_ ? store_->dimensions() : rig_model::DerivedDimensions{};
    view_ = rig_view::fit_view(region_min.x, region_min.y, region_width, region_height, dims);
    fitted_ = true;
}

void RigCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const float grid_thickness = 1.0f;

    const Eigen::Vector3d top_left = screen_to_world(region_min.x, region_min.y, 0.0);
    const Eigen::Vector3d bottom_right = screen_to_world(region_max.x, region_max.y, 0.0);

    if (grid_step_ * rig_view::pixel_scale(view_) < 8.0f) return;

    const double start_x = std::floor(top_left.x() / grid_step_) * grid_step_;
    const double start_z = std::floor(top_left.z() / grid_step_) * grid_step_;

    for (double wx = start_x; wx <= bottom_right.x() + grid_step_; wx += grid_step_) {
        float sx, sy;
        world_to_screen(Eigen::Vector3d(wx, 0.0, 0.0), sx, sy);
        dl->AddLine(ImVec2(sx, region_min.y), ImVec2(sx, region_max.y), grid_color, grid_thickness);
    }
    for (double wz = start_z; wz <= bottom_right.z() + grid_step_; wz += grid_step_) {
        float sx, sy;
        world_to_screen(Eigen::Vector3d(0.0, 0.0, wz), sx, sy);
        dl->AddLine(ImVec2(region_min.x, sy), ImVec2(region_max.x, sy), grid_color, grid_thickness);
    }
}

// The pointer is projected onto the plane the dragged slot family lies on,
// so snapping distances are measured in that plane.
double RigCanvas::pointer_plane_height() const {
    if (!store_ || !store_->drag_session().dragged_type) return 0.0;
    return rig_placement::mounting_height(*store_->drag_session().dragged_type, store_->parameters());
}

// Scene point handed to the hub. Within the on-screen capture ring of a
// valid slot the pointer lands on the slot itself.
Eigen::Vector3d RigCanvas::drag_pointer(float screen_x, float screen_y) const {
    const Eigen::Vector3d world = screen_to_world(screen_x, screen_y, pointer_plane_height());
    if (!store_ || !store_->drag_session().dragged_type) return world;
    return rig_view::snap_pointer(view_, world, store_->valid_slots(*store_->drag_session().dragged_type),
        store_->snap_tolerance());
}

std::optional<std::string> RigCanvas::pick_component_at(float screen_x, float screen_y) const {
    if (!store_) return std::nullopt;
    const auto& placed = store_->components();
    for (auto it = placed.rbegin(); it != placed.rend(); ++it) {
        float sx, sy;
        world_to_screen(it->position, sx, sy);
        const float dx = sx - screen_x;
        const float dy = sy - screen_y;
        if (dx * dx + dy * dy <= pick_radius_px * pick_radius_px) return it->id;
    }
    return std::nullopt;
}

void RigCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    const bool dragging_part = controller_ && controller_->active();
    if (dragging_part && hub_) {
        const rig_session::PointerEvent pointer{ drag_pointer(mouse.x, mouse.y) };
        if (ImGui::IsKeyPressed(ImGuiKey_Escape, false)) {
            hub_->dispatch_key_down(rig_session::Key::Escape);
        } else if (ImGui::IsMouseReleased(0)) {
            hub_->dispatch_pointer_up(pointer);
        } else if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f || !was_dragging_) {
            hub_->dispatch_pointer_move(pointer);
        }
    }
    if (was_dragging_ && !(controller_ && controller_->active()) && preview_)
        preview_->reset_motion();
    was_dragging_ = controller_ && controller_->active();

    hovered_component_id_ = in_region ? pick_component_at(mouse.x, mouse.y) : std::nullopt;

    // Right click removes a placed part.
    if (ImGui::IsMouseClicked(1) && in_region && !dragging_part && store_ && hovered_component_id_) {
        store_->remove_component(*hovered_component_id_);
        hovered_component_id_.reset();
    }

    if ((ImGui::IsMouseClicked(0) || ImGui::IsMouseClicked(2)) && in_region && !dragging_part) {
        panning_ = true;
        pan_start_x_ = mouse.x;
        pan_start_y_ = mouse.y;
        pan_start_offset_x_ = view_.offset_x;
        pan_start_offset_y_ = view_.offset_y;
    }
    if (ImGui::IsMouseReleased(0) || ImGui::IsMouseReleased(2))
        panning_ = false;

    if (panning_) {
        view_.offset_x = pan_start_offset_x_ + (mouse.x - pan_start_x_);
        view_.offset_y = pan_start_offset_y_ + (mouse.y - pan_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }
}

bool RigCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);
    if (!fitted_) fit_to_rig(region_min, region_width, region_height);

    handle_input(region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);
    if (!store_) return true;

    rig_render::render_rig_frame(draw_list, store_->parameters(), store_->dimensions(), view_);

    std::unordered_set<std::string> valid_ids;
    const auto& session = store_->drag_session();
    if (session.dragged_type) {
        for (const auto& s : store_->valid_slots(*session.dragged_type))
            valid_ids.insert(s.id);
    }
    rig_render::render_slots(draw_list, store_->slots(), store_->components(), valid_ids, session.hovered_slot_id,
        store_->snap_tolerance(), view_);
    rig_render::render_components(draw_list, store_->components(), view_);

    if (preview_) {
        preview_->tick(ImGui::GetIO().DeltaTime);
        preview_->draw(draw_list, view_);
    }

    if (hovered_component_id_) {
        if (const auto* c = store_->find_component(*hovered_component_id_)) {
            ImGui::BeginTooltip();
            ImGui::Text("%s", c->name.c_str());
            ImGui::TextDisabled("%s  %s", rig_placement::to_string(c->type), c->slot_id.c_str());
            ImGui::TextDisabled("right click to remove");
            ImGui::EndTooltip();
        }
    }
    return true;
}

void RigCanvas::draw_palette(const std::vector<rig_model::DragPayload>& palette) {
    ImGui::TextUnformatted("Components");
    ImGui::Separator();
    for (const auto& entry : palette) {
        ImGui::PushID(entry.id.c_str());
        ImGui::Button(entry.name.c_str(), ImVec2(-1.0f, 0.0f));
        // Drags start on press; the payload goes through its wire format
        // exactly as an external palette would hand it over.
        if (ImGui::IsItemActivated() && controller_) {
            const std::string wire = rig_loaders::drag_payload_to_json(entry);
            if (auto payload = rig_loaders::parse_drag_payload(wire))
                controller_->begin_drag(*payload);
            else
                rig_session::session_logger()->error("palette_payload_invalid id={}", entry.id);
        }
        ImGui::PopID();
    }
}

void RigCanvas::draw_notifications(const rig_session::NotificationLog& log, float region_width) {
    ImDrawList* dl = ImGui::GetForegroundDrawList();
    if (!dl) return;

    const auto& entries = log.entries();
    const std::size_t shown = std::min<std::size_t>(entries.size(), 4);
    const ImVec2 origin = ImGui::GetMainViewport()->Pos;
    float y = origin.y + 12.0f;
    for (std::size_t i = entries.size() - shown; i < entries.size(); ++i) {
        const auto& n = entries[i];
        const ImVec2 size = ImGui::CalcTextSize(n.message.c_str());
        const float x = origin.x + region_width - size.x - 24.0f;
        dl->AddRectFilled(ImVec2(x - 8.0f, y - 4.0f), ImVec2(x + size.x + 8.0f, y + size.y + 4.0f), IM_COL32(30, 30, 34, 230), 4.0f);
        dl->AddText(ImVec2(x, y), notice_color(n.kind), n.message.c_str());
        y += size.y + 12.0f;
    }
}

} // namespace canvas
