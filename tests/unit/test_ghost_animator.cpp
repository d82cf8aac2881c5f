#include <animation/ghost_animator.hpp>

#include <catch2/catch.hpp>

TEST_CASE("GhostAnimator: a new track starts at its target", "[animation]") {
    animation::GhostAnimator a;
    a.set_target("ghost", Eigen::Vector3d(1, 2, 3));
    CHECK(a.has("ghost"));
    CHECK(a.get_current("ghost") == Eigen::Vector3d(1, 2, 3));
    CHECK(a.is_settled("ghost"));
}

TEST_CASE("GhostAnimator: eases towards a moved target", "[animation]") {
    animation::GhostAnimator a;
    a.set_duration(0.2f);
    a.set_target("ghost", Eigen::Vector3d::Zero());
    a.set_target("ghost", Eigen::Vector3d(10, 0, 0));

    a.tick(0.1f);
    const double x = a.get_current("ghost").x();
    CHECK(x == Approx(7.5).epsilon(1e-4));
    CHECK_FALSE(a.is_settled("ghost"));

    a.tick(0.2f);
    CHECK(a.get_current("ghost") == Eigen::Vector3d(10, 0, 0));
    CHECK(a.is_settled("ghost"));
}

TEST_CASE("GhostAnimator: non-positive ticks and unknown ids", "[animation]") {
    animation::GhostAnimator a;
    a.set_target("ghost", Eigen::Vector3d::Zero());
    a.set_target("ghost", Eigen::Vector3d(0, 0, 4));
    a.tick(0.0f);
    CHECK(a.get_current("ghost") == Eigen::Vector3d::Zero());

    CHECK(a.get_current("missing") == Eigen::Vector3d::Zero());
    CHECK(a.is_settled("missing"));

    a.remove("ghost");
    CHECK_FALSE(a.has("ghost"));
}
