#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "ui_panels.hpp"
#include "fractal_error.hpp"
#include "palette.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cmath>
#include <cstdio>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;
static const float MIN_SELECTION = 5.0f;   // smaller drags are treated as clicks
static const double WHEEL_FACTOR = 1.25;

// ---------------------------------------------------------------------------
// Event loop. Returns when the window is closed; AppState (and its GL
// texture) is destroyed before the caller tears down the GL context.
// ---------------------------------------------------------------------------
static void run_viewer(SDL_Window* window, ImGuiIO& io)
{
    AppState app;

    auto update_title = [&]() {
        char tbuf[128];
        std::snprintf(tbuf, sizeof(tbuf), "fracview  -  %s  [zoom: %.4gx]",
                      fractal_name(app.req.fractal), app.req.viewport.zoom_factor());
        SDL_SetWindowTitle(window, tbuf);
    };
    update_title();

    bool running = true;
    while (running) {
        // Block until an SDL event arrives or 50 ms elapses; the timeout
        // keeps the high-res progress bar moving.
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, 50)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        const float fw       = static_cast<float>(win_w);
        const float fh       = static_cast<float>(win_h);
        const float menu_h   = ImGui::GetFrameHeight();
        const float render_x = PANEL_WIDTH;
        const float render_y = menu_h;
        const float render_w = fw - PANEL_WIDTH;
        const float render_h = fh - menu_h - STATUS_HEIGHT;
        const int   irw      = static_cast<int>(render_w);
        const int   irh      = static_cast<int>(render_h);

        // Window resize: keep center and vertical extent, refit the width.
        if (irw > 0 && irh > 0 && (irw != app.req.width || irh != app.req.height)) {
            app.req.viewport = app.req.viewport.with_resolution(irw, irh);
            app.req.width    = irw;
            app.req.height   = irh;
            app.dirty        = true;
        }

        // Main fractal render
        if (app.dirty && irw > 0 && irh > 0) {
            try {
                app.renderer.render_into(app.req, app.pbuf);
                app.main_render_ms = app.renderer.last_render_ms;
                app.render_tex.ensure(app.pbuf.width, app.pbuf.height);
                app.render_tex.upload(app.pbuf);
                update_title();
            } catch (const FractalError& e) {
                spdlog::error("render failed: {}", e.what());
                app.status_msg = e.what();
            }
            app.dirty = false;
        }

        poll_highres_export(app);

        // -------------------------------------------------------------------
        // Menu bar
        // -------------------------------------------------------------------
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Save Image", "Ctrl+S"))
                    save_png(app);
                if (ImGui::MenuItem("Save High-Res Image", nullptr, false, !app.highres.active()))
                    start_highres_export(app);
                ImGui::Separator();
                if (ImGui::MenuItem("Exit")) running = false;
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                if (ImGui::MenuItem("Reset View", "R")) reset_view(app);
                if (ImGui::MenuItem("Zoom Out", "-"))   zoom_out(app);
                if (ImGui::MenuItem("Julia", "J", app.req.fractal.is_julia()))
                    set_julia_mode(app, !app.req.fractal.is_julia());
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Threads")) {
                const int hw = app.renderer.hw_concurrency;
                char buf[32];
                snprintf(buf, sizeof(buf), "Auto (%d)", hw);
                if (ImGui::MenuItem(buf, nullptr, app.thread_sel == 0)) {
                    app.thread_sel = 0;
                    app.renderer.set_thread_count(0);
                    app.dirty = true;
                }
                ImGui::Separator();
                for (int i = 1; i <= hw; ++i) {
                    snprintf(buf, sizeof(buf), "%d", i);
                    if (ImGui::MenuItem(buf, nullptr, app.thread_sel == i)) {
                        app.thread_sel = i;
                        app.renderer.set_thread_count(i);
                        app.dirty = true;
                    }
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Help")) {
                if (ImGui::MenuItem("About", "F1")) app.show_about = true;
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        // -------------------------------------------------------------------
        // Global keyboard shortcuts
        // -------------------------------------------------------------------
        if (ImGui::IsKeyPressed(ImGuiKey_F1))
            app.show_about = true;
        if (!io.WantTextInput) {
            if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl)
                save_png(app);
            if (ImGui::IsKeyPressed(ImGuiKey_R))
                reset_view(app);
            if (ImGui::IsKeyPressed(ImGuiKey_Minus) ||
                ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract))
                zoom_out(app);
            if (ImGui::IsKeyPressed(ImGuiKey_Equal) ||
                ImGui::IsKeyPressed(ImGuiKey_KeypadAdd)) {
                const Viewport& vp = app.req.viewport;
                app.req.viewport = vp.zoom_about(vp.pixel_width() * 0.5,
                                                 vp.pixel_height() * 0.5, 2.0);
                app.dirty = true;
            }
            if (ImGui::IsKeyPressed(ImGuiKey_J))
                set_julia_mode(app, !app.req.fractal.is_julia());
            // PageUp/Down: double or halve iteration count
            if (ImGui::IsKeyPressed(ImGuiKey_PageUp)) {
                app.req.max_iterations = std::min(app.req.max_iterations * 2, 8192);
                app.dirty = true;
            }
            if (ImGui::IsKeyPressed(ImGuiKey_PageDown)) {
                app.req.max_iterations = std::max(app.req.max_iterations / 2, 64);
                app.dirty = true;
            }
            // P / Shift+P: cycle palette forward / backward
            if (ImGui::IsKeyPressed(ImGuiKey_P)) {
                app.req.palette.id = next_palette(app.req.palette.id, io.KeyShift ? -1 : 1);
                app.dirty = true;
            }
        }

        draw_side_panel(app, io, menu_h, fh);

        // -------------------------------------------------------------------
        // Render area
        // -------------------------------------------------------------------
        ImGui::SetNextWindowPos(ImVec2(render_x, render_y));
        ImGui::SetNextWindowSize(ImVec2(render_w, render_h));
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
        ImGui::Begin("##render", nullptr,
            ImGuiWindowFlags_NoTitleBar            |
            ImGuiWindowFlags_NoResize              |
            ImGuiWindowFlags_NoMove                |
            ImGuiWindowFlags_NoBringToFrontOnFocus |
            ImGuiWindowFlags_NoScrollbar);
        ImGui::PopStyleVar();

        if (app.render_tex.id)
            ImGui::Image(app.render_tex.imgui_id(),
                         ImVec2(static_cast<float>(app.render_tex.w),
                                static_cast<float>(app.render_tex.h)));

        const bool render_hovered = ImGui::IsWindowHovered();
        const Viewport& vp = app.req.viewport;

        // Mouse wheel zoom (centered on cursor)
        if (render_hovered && io.MouseWheel != 0.0f && irw > 0 && irh > 0) {
            const double mx     = io.MousePos.x - render_x;
            const double my     = io.MousePos.y - render_y;
            const double factor = (io.MouseWheel > 0.0f) ? WHEEL_FACTOR : (1.0 / WHEEL_FACTOR);
            app.req.viewport = vp.zoom_about(mx, my, factor);
            app.dirty = true;
        }

        // Right-click drag: pan
        if (render_hovered &&
            ImGui::IsMouseClicked(ImGuiMouseButton_Right) && !app.zoom_boxing) {
            app.panning  = true;
            app.pan_last = io.MousePos;
        }
        if (app.panning) {
            if (ImGui::IsMouseDown(ImGuiMouseButton_Right)) {
                const float dx = io.MousePos.x - app.pan_last.x;
                const float dy = io.MousePos.y - app.pan_last.y;
                if (dx != 0.0f || dy != 0.0f) {
                    app.req.viewport = app.req.viewport.pan_pixels(dx, dy);
                    app.pan_last     = io.MousePos;
                    app.dirty        = true;
                }
            } else {
                app.panning = false;
            }
        }

        // Left-click drag: zoom box
        if (render_hovered &&
            ImGui::IsMouseClicked(ImGuiMouseButton_Left) && !app.panning) {
            app.zoom_boxing = true;
            app.zbox_start  = io.MousePos;
            app.zbox_end    = io.MousePos;
        }
        if (app.zoom_boxing) {
            app.zbox_end = io.MousePos;
            ImDrawList* dl = ImGui::GetWindowDrawList();
            dl->AddRectFilled(app.zbox_start, app.zbox_end, IM_COL32(255, 255, 255, 20));
            dl->AddRect(app.zbox_start, app.zbox_end, IM_COL32(255, 255, 255, 200),
                        0.0f, 0, 1.5f);

            if (!ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
                app.zoom_boxing = false;
                auto clamp_x = [&](float x) {
                    return std::min(std::max(static_cast<double>(x - render_x), 0.0),
                                    static_cast<double>(irw - 1));
                };
                auto clamp_y = [&](float y) {
                    return std::min(std::max(static_cast<double>(y - render_y), 0.0),
                                    static_cast<double>(irh - 1));
                };
                const PixelPoint p0 = {clamp_x(app.zbox_start.x), clamp_y(app.zbox_start.y)};
                const PixelPoint p1 = {clamp_x(app.zbox_end.x),   clamp_y(app.zbox_end.y)};
                if (std::abs(p1.x - p0.x) >= MIN_SELECTION ||
                    std::abs(p1.y - p0.y) >= MIN_SELECTION) {
                    try {
                        app.req.viewport = app.req.viewport.zoom_to_rect(p0, p1);
                        app.dirty = true;
                    } catch (const FractalError& e) {
                        spdlog::debug("zoom selection ignored: {}", e.what());
                    }
                }
            }
        }

        ImGui::End();  // ##render

        draw_status_bar(app, fw, fh);
        draw_about_dialog(app);

        // -------------------------------------------------------------------
        // Render
        // -------------------------------------------------------------------
        ImGui::Render();
        glViewport(0, 0, win_w, win_h);
        glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    (void)argc; (void)argv;

    auto stderr_logger = spdlog::stderr_color_mt("stderr_logger");
    spdlog::set_default_logger(stderr_logger);
    spdlog::set_pattern("[%^%l%$ +%o] %v");

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);

    SDL_Window* window = SDL_CreateWindow(
        "fracview",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1280, 720,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        fprintf(stderr, "SDL_GL_CreateContext error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    run_viewer(window, io);

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
