// Conveyor rig editor: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <rig_loaders/default_rig.hpp>
#include <rig_loaders/json_loader.hpp>
#include <rig_placement/geometry.hpp>
#include <rig_placement/rig_constants.hpp>
#include <rig_render/preview_renderer.hpp>
#include <rig_session/drag_controller.hpp>
#include <rig_session/input_events.hpp>
#include <rig_session/logging.hpp>
#include <rig_session/notifications.hpp>
#include <rig_session/placement_store.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

rig_model::RigDocument load_rig(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        if (auto loaded = rig_loaders::load_rig_document_from_json_file(explicit_path)) return std::move(*loaded);
        (void)fprintf(stderr, "Could not load rig file %s, using defaults\n", explicit_path.c_str());
    }
    const char* rig_paths[] = { "data/example_rig.json", "example_rig.json" };
    for (const char* path : rig_paths) {
        if (auto loaded = rig_loaders::load_rig_document_from_json_file(path)) return std::move(*loaded);
    }
    return rig_loaders::generate_default_rig();
}

void apply_placements(rig_session::PlacementStore& store, const rig_model::RigDocument& doc) {
    for (const auto& req : doc.placements) {
        if (!store.place_component(req.type, req.slot_id, req.name, req.asset_reference))
            rig_session::session_logger()->warn("rig_placement_skipped slot={}", req.slot_id);
    }
}

// Parameter side panel. Edits are applied through the store so slots are
// regenerated and bindings re-checked on every change.
void draw_parameter_panel(rig_session::PlacementStore& store) {
    rig_model::GeometryParameters p = store.parameters();
    bool changed = false;

    const char* models[] = { "DPS50", "DPS60", "DPS96" };
    int model = static_cast<int>(p.model);
    if (ImGui::Combo("Model", &model, models, 3)) {
        p.model = static_cast<rig_model::ConveyorModel>(model);
        changed = true;
    }

    float length = static_cast<float>(p.axis_length);
    if (ImGui::DragFloat("L (mm)", &length, 10.0f, static_cast<float>(rig_placement::rig::length_min),
            static_cast<float>(rig_placement::rig::length_max), "%.0f")) {
        p.axis_length = length;
        changed = true;
    }
    float width = static_cast<float>(p.belt_width);
    if (ImGui::DragFloat("N (mm)", &width, 5.0f, static_cast<float>(rig_placement::rig::width_min),
            static_cast<float>(rig_placement::rig::width_max), "%.0f")) {
        p.belt_width = width;
        changed = true;
    }

    const char* engines[] = { "None", "Normal", "Redactor", "Central" };
    int engine = p.engine_type ? static_cast<int>(*p.engine_type) + 1 : 0;
    if (ImGui::Combo("Engine", &engine, engines, 4)) {
        if (engine == 0)
            p.engine_type.reset();
        else
            p.engine_type = static_cast<rig_model::EngineType>(engine - 1);
        changed = true;
    }

    const char* stop_sides[] = { "None", "Motor", "Opposite", "Both" };
    int stop_side = p.stop_button_side ? static_cast<int>(*p.stop_button_side) + 1 : 0;
    if (ImGui::Combo("Stop buttons", &stop_side, stop_sides, 4)) {
        if (stop_side == 0)
            p.stop_button_side.reset();
        else
            p.stop_button_side = static_cast<rig_model::StopButtonSide>(stop_side - 1);
        changed = true;
    }
    if (p.stop_button_side) {
        const rig_placement::StopButtonLimits limits = rig_placement::stop_button_limits(p.model);
        changed |= ImGui::SliderInt("Motor side", &p.stop_button_count.motor, 0, limits.max);
        changed |= ImGui::SliderInt("Opposite side", &p.stop_button_count.opposite, 0, limits.max);
    }

    changed |= ImGui::Checkbox("Side guide", &p.side_guide_enabled);
    if (p.side_guide_enabled) {
        float height = static_cast<float>(p.side_guide_height);
        if (ImGui::DragFloat("Guide height", &height, 1.0f, static_cast<float>(rig_placement::rig::side_guide_height_min),
                static_cast<float>(rig_placement::rig::side_guide_height_max), "%.0f")) {
            p.side_guide_height = height;
            changed = true;
        }
    }

    changed |= ImGui::Checkbox("Supporting frame", &p.supporting_frame);
    changed |= ImGui::Checkbox("Frame wheels", &p.frame_wheels);
    if (p.supporting_frame || p.frame_wheels) {
        float frame_height = static_cast<float>(p.frame_height);
        if (ImGui::DragFloat("Frame height", &frame_height, 5.0f, static_cast<float>(rig_placement::rig::frame_height_min),
                static_cast<float>(rig_placement::rig::frame_height_max), "%.0f")) {
            p.frame_height = frame_height;
            changed = true;
        }
    }

    if (changed) store.update_parameters(p);

    const rig_model::DerivedDimensions dims = store.dimensions();
    ImGui::Separator();
    ImGui::Text("D = %.0f mm  R = %.0f mm", dims.overall_length, dims.overall_width);
    ImGui::Text("%zu slots, %zu placed", store.slots().size(), store.components().size());
    if (!store.stale_bindings().empty())
        ImGui::TextColored(ImVec4(0.92f, 0.7f, 0.24f, 1.0f), "%zu stale bindings", store.stale_bindings().size());
}

} // namespace

int main(int argc, char* argv[])
{
    std::string rig_path;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--rig" && i + 1 < argc) {
            rig_path = argv[++i];
        }
    }

    const rig_model::RigDocument rig = load_rig(rig_path);
    if (!rig_session::configure_session_logging({ rig.editor.log_file, rig.editor.log_level }))
        (void)fprintf(stderr, "Could not open log file %s, logging to console\n", rig.editor.log_file.c_str());
    rig_session::session_logger()->info("rig_loaded name=\"{}\" placements={}", rig.name, rig.placements.size());

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    const std::string title = rig.name.empty() ? std::string("Conveyor rig") : "Conveyor rig - " + rig.name;
    SDL_Window* window = SDL_CreateWindow(title.c_str(), window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    rig_session::NotificationLog notices;
    rig_session::PlacementStore store(rig.parameters, &notices);
    store.set_snap_tolerance(rig.editor.snap_tolerance);
    apply_placements(store, rig);

    rig_session::InputEventHub hub;
    rig_render::PreviewRenderer preview;
    rig_session::DragController controller(store, hub, &preview, &notices);
    const std::vector<rig_model::DragPayload> palette = rig_loaders::default_palette();

    canvas::RigCanvas rig_canvas;
    rig_canvas.set_session(&store, &hub, &controller, &preview);

    const float side_panel_width = 300.0f;
    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Rig", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        ImGui::BeginChild("side_panel", ImVec2(side_panel_width, 0), true);
        draw_parameter_panel(store);
        ImGui::Spacing();
        rig_canvas.draw_palette(palette);
        if (ImGui::Button("Fit view", ImVec2(-1.0f, 0.0f)))
            rig_canvas.request_fit();
        ImGui::EndChild();

        ImGui::SameLine();
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove);
            rig_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();
        rig_canvas.draw_notifications(notices, io.DisplaySize.x);

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
