#pragma once

#include <rig_model/drag_payload.hpp>
#include <rig_model/types.hpp>
#include <rig_render/renderer.hpp>
#include <optional>
#include <string>
#include <vector>

struct ImVec2;

namespace rig_session {
class DragController;
class InputEventHub;
class NotificationLog;
class PlacementStore;
}
namespace rig_render {
class PreviewRenderer;
}

namespace canvas {

// Top-down editor view of one rig. Pans and zooms like a map, forwards
// pointer and keyboard input to the input hub while a drag is active and
// draws frame, slots, placed parts and the drag ghost.
class RigCanvas {
public:
    RigCanvas();
    ~RigCanvas();

    void set_session(rig_session::PlacementStore* store,
        rig_session::InputEventHub* hub,
        rig_session::DragController* controller,
        rig_render::PreviewRenderer* preview);

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);

    // Screen point to scene point on the horizontal plane at plane_y.
    Eigen::Vector3d screen_to_world(float screen_x, float screen_y, double plane_y) const;
    void world_to_screen(const Eigen::Vector3d& world, float& screen_x, float& screen_y) const;

    // Re-centre and fit the frame on the next draw.
    void request_fit() { fitted_ = false; }
    void set_offset(float ox, float oy) { view_.offset_x = ox; view_.offset_y = oy; }
    void set_zoom(float z) { view_.zoom = z; }
    const rig_render::View& view() const { return view_; }

    bool update_and_draw(float region_width, float region_height);

    // Palette column: pressing an entry starts a drag with its payload.
    void draw_palette(const std::vector<rig_model::DragPayload>& palette);
    void draw_notifications(const rig_session::NotificationLog& log, float region_width);

private:
    rig_session::PlacementStore* store_ = nullptr;
    rig_session::InputEventHub* hub_ = nullptr;
    rig_session::DragController* controller_ = nullptr;
    rig_render::PreviewRenderer* preview_ = nullptr;
    rig_render::View view_;
    float grid_step_ = 5.0f;   // scene units
    bool fitted_ = false;
    bool panning_ = false;
    float pan_start_x_ = 0;
    float pan_start_y_ = 0;
    float pan_start_offset_x_ = 0;
    float pan_start_offset_y_ = 0;
    bool was_dragging_ = false;
    std::optional<std::string> hovered_component_id_;

    void fit_to_rig(ImVec2 region_min, float region_width, float region_height);
    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(float region_width, float region_height);
    double pointer_plane_height() const;
    Eigen::Vector3d drag_pointer(float screen_x, float screen_y) const;
    std::optional<std::string> pick_component_at(float screen_x, float screen_y) const;
};

} // namespace canvas
