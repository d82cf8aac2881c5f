#pragma once

#include <Eigen/Core>
#include <string>
#include <unordered_map>

namespace animation {

// Eases scene positions towards their targets, one track per id. A new id
// starts at its target; later targets are approached over `duration`.
class GhostAnimator {
public:
    GhostAnimator();
    void set_duration(float seconds) { duration_ = seconds; }
    float duration() const { return duration_; }

    void set_target(const std::string& id, const Eigen::Vector3d& target);
    void tick(float dt);
    Eigen::Vector3d get_current(const std::string& id) const;
    bool has(const std::string& id) const { return state_.count(id) != 0; }
    bool is_settled(const std::string& id) const;
    void remove(const std::string& id) { state_.erase(id); }
    void clear() { state_.clear(); }

private:
    struct State {
        Eigen::Vector3d current = Eigen::Vector3d::Zero();
        Eigen::Vector3d target = Eigen::Vector3d::Zero();
    };
    std::unordered_map<std::string, State> state_;
    float duration_ = 0.12f;
};

} // namespace animation
