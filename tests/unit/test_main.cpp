#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // Placement code logs every transition; keep test output readable.
    spdlog::set_level(spdlog::level::err);
    return Catch::Session().run(argc, argv);
}
