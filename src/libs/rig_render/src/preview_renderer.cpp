#include <rig_render/preview_renderer.hpp>
#include "imgui.h"

namespace rig_render {

namespace {

const char* ghost_track = "ghost";

} // namespace

void PreviewRenderer::release_preview() {
    ghost_.reset();
}

void PreviewRenderer::attach_preview(const rig_session::GhostPreview& preview) {
    ghost_ = preview;
    animator_.set_target(ghost_track, preview.position);
}

void PreviewRenderer::draw(ImDrawList* draw_list, const View& view) const {
    if (!draw_list || !ghost_) return;
    const unsigned int fill = (slot_type_color(ghost_->type) & 0x00FFFFFFu) | 0x80000000u;
    const unsigned int border = IM_COL32(255, 220, 80, 220);
    render_part_marker(draw_list, ghost_->type, animator_.get_current(ghost_track), ghost_->rotation, fill, border, view);
}

} // namespace rig_render
