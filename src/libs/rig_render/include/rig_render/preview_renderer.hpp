#pragma once

#include <animation/ghost_animator.hpp>
#include <rig_render/renderer.hpp>
#include <rig_session/preview.hpp>
#include <optional>

namespace rig_render {

// Owns the single drag ghost. The ghost glides between targets instead of
// jumping; the motion track survives a release so the next attach eases
// from where the last ghost was shown.
class PreviewRenderer : public rig_session::PreviewSink {
public:
    void release_preview() override;
    void attach_preview(const rig_session::GhostPreview& preview) override;

    void tick(float dt) { animator_.tick(dt); }
    void draw(ImDrawList* draw_list, const View& view) const;
    // Forget the motion track (e.g. when the drag ends).
    void reset_motion() { animator_.clear(); }

    bool has_preview() const { return ghost_.has_value(); }
    const std::optional<rig_session::GhostPreview>& preview() const { return ghost_; }

private:
    std::optional<rig_session::GhostPreview> ghost_;
    animation::GhostAnimator animator_;
};

} // namespace rig_render
