#include <animation/ghost_animator.hpp>
#include <algorithm>

namespace animation {

namespace {

// Snap distance in scene units (0.5 mm).
constexpr double settle_eps = 0.005;

double ease_out(double t) {
    if (t >= 1.0) return 1.0;
    return 1.0 - (1.0 - t) * (1.0 - t);
}

} // namespace

GhostAnimator::GhostAnimator() = default;

void GhostAnimator::set_target(const std::string& id, const Eigen::Vector3d& target) {
    auto it = state_.find(id);
    if (it == state_.end()) {
        State s;
        s.current = target;
        s.target = target;
        state_[id] = s;
    } else {
        it->second.target = target;
    }
}

void GhostAnimator::tick(float dt) {
    if (dt <= 0.f) return;
    double step = duration_ > 0.f ? static_cast<double>(dt) / static_cast<double>(duration_) : 1.0;
    step = ease_out(std::min(1.0, step));
    for (auto& [id, s] : state_) {
        s.current += (s.target - s.current) * step;
        if ((s.target - s.current).norm() < settle_eps)
            s.current = s.target;
    }
}

Eigen::Vector3d GhostAnimator::get_current(const std::string& id) const {
    auto it = state_.find(id);
    if (it == state_.end()) return Eigen::Vector3d::Zero();
    return it->second.current;
}

bool GhostAnimator::is_settled(const std::string& id) const {
    auto it = state_.find(id);
    if (it == state_.end()) return true;
    return it->second.current == it->second.target;
}

} // namespace animation
