// Metro timeline viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <metro_animation/frame_scheduler.hpp>
#include <metro_canvas/map_controller.hpp>
#include <metro_canvas/navigation.hpp>
#include <metro_layout/layout_cache.hpp>
#include <metro_layout/layout_constants.hpp>
#include <metro_layout/station_filter.hpp>
#include <metro_layout/time_scale.hpp>
#include <metro_layout/timeline_config.hpp>
#include <metro_loaders/demo_catalog.hpp>
#include <metro_loaders/json_loader.hpp>
#include <metro_logging/logging.hpp>
#include <metro_render/map_canvas.hpp>
#include <metro_render/style.hpp>
#include <metro_render/svg_export.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

struct Options {
    std::string stations_path;
    std::string config_path;
    std::string export_svg_path;
};

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        bool ok = true;
        if (arg == "--stations") ok = value(opts.stations_path);
        else if (arg == "--config") ok = value(opts.config_path);
        else if (arg == "--export-svg") ok = value(opts.export_svg_path);
        else ok = false;
        if (!ok) {
            (void)fprintf(stderr,
                "usage: metro_viewer [--stations <file.json>] [--config <file.json>] [--export-svg <out.svg>]\n");
            return std::nullopt;
        }
    }
    return opts;
}

void draw_sidebar(metro_canvas::MapController& controller,
    const metro_model::TimelineConfig& config,
    const metro_layout::TimeScale& scale,
    const metro_layout::MetroLayout& layout,
    const metro_render::MapCanvas& map_canvas)
{
    const auto& state = controller.state();

    ImGui::TextUnformatted("Lines");
    for (auto line : metro_model::all_lines) {
        const auto& ls = metro_render::line_style(line);
        bool visible = state.line_visible(line);
        const ImVec4 col(((ls.color >> 16) & 0xff) / 255.0f, ((ls.color >> 8) & 0xff) / 255.0f,
            (ls.color & 0xff) / 255.0f, 1.0f);
        ImGui::PushStyleColor(ImGuiCol_CheckMark, col);
        if (ImGui::Checkbox(ls.display_name, &visible))
            controller.apply([line](const metro_canvas::MapViewState& s) { return metro_canvas::apply_toggle_line(s, line); });
        ImGui::PopStyleColor();
    }
    if (ImGui::Button("Show all lines")) controller.apply(metro_canvas::apply_show_all_lines);

    ImGui::Separator();
    bool all_labels = state.show_all_labels;
    if (ImGui::Checkbox("All labels", &all_labels)) controller.apply(metro_canvas::apply_toggle_labels);

    char search[128] = {};
    std::snprintf(search, sizeof(search), "%s", state.search_query.c_str());
    if (ImGui::InputTextWithHint("##search", "Search stations", search, sizeof(search))) {
        const std::string query = search;
        controller.apply([&query](const metro_canvas::MapViewState& s) { return metro_canvas::apply_set_search(s, query); });
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Eras");
    for (const auto& era : config.eras) {
        const bool active = state.focused_era == era.id;
        if (ImGui::Selectable(era.label.c_str(), active)) {
            if (active) controller.apply([](const metro_canvas::MapViewState& s) { return metro_canvas::apply_focus_era(s, ""); });
            else controller.focus_era(era, scale);
        }
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Navigation");
    if (ImGui::Button("+")) controller.zoom_in();
    ImGui::SameLine();
    if (ImGui::Button("-")) controller.zoom_out();
    ImGui::SameLine();
    if (ImGui::Button("Reset")) controller.reset_view();
    ImGui::Text("zoom %.2fx", metro_canvas::current_zoom(state, controller.limits()));
    if (map_canvas.cursor_in_map()) {
        const double year = map_canvas.cursor_year();
        ImGui::Text("cursor %.0f %s", year < 0 ? -year : year, year < 0 ? "BCE" : "CE");
    }

    ImGui::Separator();
    if (!state.journey_mode) {
        if (ImGui::Button("Start journey"))
            controller.start_journey(metro_canvas::build_journey(config, layout.stations));
    } else {
        ImGui::Text("Journey %zu / %zu", state.journey_index + 1, controller.journey().size());
        if (ImGui::Button("< Prev")) controller.journey_prev();
        ImGui::SameLine();
        if (ImGui::Button("Next >")) controller.journey_next();
        ImGui::SameLine();
        if (ImGui::Button("End")) controller.end_journey();
    }

    if (!state.selected_station_id.empty()) {
        ImGui::Separator();
        for (const auto& ps : layout.stations) {
            if (ps.station.id != state.selected_station_id) continue;
            ImGui::TextWrapped("%s", ps.station.name.c_str());
            ImGui::TextDisabled("%s", ps.station.year_label.c_str());
            for (auto line : ps.station.lines) {
                ImGui::BulletText("%s", metro_render::line_style(line).display_name);
            }
            ImGui::TextDisabled("%s%s", metro_model::significance_name(ps.station.significance),
                ps.placement_exhausted ? " (crowded)" : "");
            if (ImGui::Button("Center")) controller.focus_point(ps.coords, metro_layout::layout::focus_duration_ms);
            break;
        }
    }

    if (!state.search_query.empty()) {
        ImGui::Separator();
        const metro_model::Era* era = metro_layout::find_era(config, state.focused_era);
        const auto matches = metro_layout::filter_stations(layout.stations, state.search_query, era);
        ImGui::Text("%zu matches", matches.size());
        for (const auto* ps : matches) {
            if (ImGui::Selectable(ps->station.name.c_str(), ps->station.id == state.selected_station_id)) {
                const std::string id = ps->station.id;
                controller.apply([&id](const metro_canvas::MapViewState& s) { return metro_canvas::apply_select_station(s, id); });
                controller.focus_point(ps->coords, metro_layout::layout::focus_duration_ms);
            }
        }
    }
}

} // namespace

int main(int argc, char* argv[])
{
    auto opts = parse_args(argc, argv);
    if (!opts) return 1;

    auto log = metro_logging::get_logger("viewer");
    const std::string log_path = metro_logging::enable_file_log("metro_timeline_latest.log");
    if (!log_path.empty()) log->info("logging to {}", log_path);

    metro_model::TimelineConfig config = metro_layout::default_timeline_config();
    if (!opts->config_path.empty()) {
        auto loaded = metro_loaders::load_timeline_config_from_json_file(opts->config_path, config);
        if (!loaded) {
            log->error("could not load timeline config '{}'", opts->config_path);
            return 1;
        }
        config = std::move(*loaded);
    }
    const auto issues = metro_layout::validate_timeline_config(config);
    if (!issues.empty()) {
        for (const auto& issue : issues) log->error("config {}: {}", issue.code, issue.message);
        return 1;
    }

    metro_model::StationSet catalog;
    if (!opts->stations_path.empty()) {
        auto loaded = metro_loaders::load_stations_from_json_file(opts->stations_path);
        if (!loaded) {
            log->error("could not load stations '{}'", opts->stations_path);
            return 1;
        }
        catalog = std::move(*loaded);
    } else {
        const char* station_paths[] = { "data/stations.json", "stations.json" };
        for (const char* path : station_paths) {
            auto loaded = metro_loaders::load_stations_from_json_file(path);
            if (loaded) {
                catalog = std::move(*loaded);
                break;
            }
        }
        if (catalog.stations.empty())
            catalog = metro_loaders::generate_demo_stations();
    }
    log->info("catalog '{}' with {} stations", catalog.name, catalog.stations.size());

    metro_layout::LayoutCache layout_cache;
    const metro_layout::TimeScale scale(config);

    if (!opts->export_svg_path.empty()) {
        const auto& layout = layout_cache.get(catalog.stations, config);
        return metro_render::export_svg_file(opts->export_svg_path, layout, config) ? 0 : 1;
    }

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        log->error("SDL_Init failed: {}", SDL_GetError());
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
    SDL_Window* window = SDL_CreateWindow("Metro Timeline", window_width, window_height, window_flags);
    if (!window) {
        log->error("SDL_CreateWindow failed: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        log->error("SDL_GL_CreateContext failed: {}", SDL_GetError());
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

    metro_animation::ManualFrameScheduler scheduler(static_cast<double>(SDL_GetTicks()));
    metro_canvas::MapController controller(scheduler, metro_canvas::limits_from(config.canvas));
    controller.set_on_view_changed([&log](const metro_model::Rect& view) {
        log->trace("view {:.1f} {:.1f} {:.1f} {:.1f}", view.x, view.y, view.width, view.height);
    });
    metro_render::MapCanvas map_canvas(controller, config);

    const float sidebar_width = 280.0f;
    std::uint64_t last_ticks = SDL_GetTicks();
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

        const std::uint64_t ticks = SDL_GetTicks();
        scheduler.advance(static_cast<double>(ticks - last_ticks));
        last_ticks = ticks;

        const auto& layout = layout_cache.get(catalog.stations, config);
        map_canvas.set_layout(&layout);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Metro Timeline", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        ImGui::BeginChild("sidebar", ImVec2(sidebar_width, 0), true);
        draw_sidebar(controller, config, scale, layout, map_canvas);
        ImGui::EndChild();
        ImGui::SameLine();

        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
            map_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.04f, 0.06f, 0.13f, 1.0f);
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
