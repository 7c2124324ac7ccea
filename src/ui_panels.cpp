#include "ui_panels.hpp"
#include "app_state.hpp"
#include "fractal_error.hpp"
#include "palette.hpp"
#include "export.hpp"
#include "imgui.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <string>

static const float PANEL_WIDTH = 280.0f;

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------
void reset_view(AppState& app)
{
    app.req.viewport = app.req.viewport.reset();
    app.dirty = true;
}

void zoom_out(AppState& app)
{
    app.req.viewport = app.req.viewport.zoom_out();
    app.dirty = true;
}

void set_julia_mode(AppState& app, bool julia)
{
    if (julia == app.req.fractal.is_julia()) return;
    if (!julia) app.julia_c = app.req.fractal.julia_c;
    app.req.fractal = julia ? FractalKind::julia(app.julia_c) : FractalKind::mandelbrot();
    app.dirty = true;
}

// Format currently picked in the EXPORT section.
static ImageFormat selected_format(const AppState& app)
{
    return (app.exp_fmt == 1 && jxl_available()) ? ImageFormat::Jxl : ImageFormat::Png;
}

void save_png(AppState& app)
{
    if (app.pbuf.empty()) return;
    const ImageFormat fmt = selected_format(app);
    const std::string dir_err = ensure_directory(DEFAULT_EXPORT_DIR);
    if (!dir_err.empty()) {
        app.status_msg = "Failed to save: " + dir_err;
        spdlog::error("{}", dir_err);
        return;
    }
    const std::string path = export_file_name(DEFAULT_EXPORT_DIR, app.req.palette.id,
                                               app.pbuf.width, app.pbuf.height, false,
                                               image_format_ext(fmt), std::time(nullptr));
    const std::string err = export_image(path.c_str(), app.pbuf, fmt);
    if (err.empty()) {
        app.status_msg = "Saved as " + path;
        spdlog::info("saved {}", path);
    } else {
        app.status_msg = "Failed to save: " + err;
        spdlog::error("save {} failed: {}", path, err);
    }
}

void start_highres_export(AppState& app)
{
    if (app.highres.active()) return;

    int tw = HIGHRES_WIDTH, th = HIGHRES_HEIGHT;
    switch (app.highres_target) {
        case HIGHRES_2X: tw = app.req.width * 2; th = app.req.height * 2; break;
        case HIGHRES_4X: tw = app.req.width * 4; th = app.req.height * 4; break;
        default: break;
    }

    const std::string dir_err = ensure_directory(DEFAULT_EXPORT_DIR);
    if (!dir_err.empty()) {
        app.status_msg = "Failed to save: " + dir_err;
        return;
    }

    // Snapshot: the render keeps these bounds and this file format even if
    // the user navigates on or flips the format radio button.
    RenderRequest snap = app.req;
    snap.width  = tw;
    snap.height = th;
    app.highres_fmt  = selected_format(app);
    app.highres_path = export_file_name(DEFAULT_EXPORT_DIR, snap.palette.id, tw, th, true,
                                        image_format_ext(app.highres_fmt), std::time(nullptr));
    if (app.highres.start(snap, app.renderer)) {
        app.status_msg.clear();
        spdlog::info("high-res render {}x{} started", tw, th);
    } else {
        app.status_msg = "Failed to start high-res render";
    }
}

void poll_highres_export(AppState& app)
{
    std::unique_ptr<RenderJob> job = app.highres.take();
    if (!job) return;

    if (job->state() != JobState::Completed) {
        app.status_msg = "Failed to save: " + job->error();
        return;
    }
    const PixelBuffer buf = job->take_result();
    const std::string err = export_image(app.highres_path.c_str(), buf, app.highres_fmt);
    if (err.empty()) {
        app.status_msg = "Saved as " + app.highres_path;
        spdlog::info("saved {} ({:.0f} ms render)", app.highres_path, job->render_ms());
    } else {
        app.status_msg = "Failed to save: " + err;
        spdlog::error("save {} failed: {}", app.highres_path, err);
    }
}

static void restore_favorite(AppState& app, const FavoriteView& fav)
{
    // Keep the saved center and vertical extent, fit to the current window.
    RenderRequest r  = fav.to_request();
    r.viewport       = r.viewport.with_resolution(app.req.width, app.req.height);
    r.width          = app.req.width;
    r.height         = app.req.height;
    app.req          = r;
    if (r.fractal.is_julia()) app.julia_c = r.fractal.julia_c;
    app.dirty = true;
}

// ---------------------------------------------------------------------------
// Side panel: fractal, iterations, palette, navigation, favorites, export
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh)
{
    static const float STATUS_HEIGHT = 24.0f;

    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    // --- Fractal ---
    ImGui::TextDisabled("FRACTAL");
    ImGui::Separator();
    {
        int kind = app.req.fractal.is_julia() ? 1 : 0;
        if (ImGui::RadioButton("Mandelbrot", &kind, 0)) set_julia_mode(app, false);
        ImGui::SameLine();
        if (ImGui::RadioButton("Julia", &kind, 1))      set_julia_mode(app, true);

        if (app.req.fractal.is_julia()) {
            ComplexPoint& c = app.req.fractal.julia_c;
            ImGui::Text("re:"); ImGui::SameLine();
            ImGui::SetNextItemWidth(-1.0f);
            if (ImGui::DragScalar("##jre", ImGuiDataType_Double, &c.re, 0.0005f,
                                  nullptr, nullptr, "%.6f"))
                app.dirty = true;
            ImGui::Text("im:"); ImGui::SameLine();
            ImGui::SetNextItemWidth(-1.0f);
            if (ImGui::DragScalar("##jim", ImGuiDataType_Double, &c.im, 0.0005f,
                                  nullptr, nullptr, "%.6f"))
                app.dirty = true;
        }
    }

    // --- Iteration count ---
    ImGui::Spacing();
    ImGui::TextDisabled("ITERATIONS");
    ImGui::Separator();
    {
        int iter = app.req.max_iterations;
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##iter", &iter, 16, 8192, "%d",
                             ImGuiSliderFlags_Logarithmic)) {
            app.req.max_iterations = std::max(1, iter);
            app.dirty = true;
        }
    }

    // --- Palette ---
    ImGui::Spacing();
    ImGui::TextDisabled("PALETTE");
    ImGui::Separator();
    {
        Palette& pal = app.req.palette;
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::BeginCombo("##palette", palette_name(pal.id))) {
            for (int i = 0; i < PALETTE_COUNT; ++i) {
                const PaletteId id = static_cast<PaletteId>(i);
                if (ImGui::Selectable(palette_name(id), id == pal.id)) {
                    pal.id = id;
                    app.dirty = true;
                }
            }
            ImGui::EndCombo();
        }
        if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f) {
            pal.id = next_palette(pal.id, io.MouseWheel < 0.0f ? 1 : -1);
            app.dirty = true;
        }

        if (pal.id == PaletteId::UserDefined) {
            auto color_edit = [&](const char* label, Rgb& c) {
                float f[3] = {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f};
                if (ImGui::ColorEdit3(label, f)) {
                    c = {static_cast<uint8_t>(std::lround(f[0] * 255.0f)),
                         static_cast<uint8_t>(std::lround(f[1] * 255.0f)),
                         static_cast<uint8_t>(std::lround(f[2] * 255.0f))};
                    app.dirty = true;
                }
            };
            color_edit("From", pal.user_a);
            color_edit("To",   pal.user_b);
        }
    }

    // --- Navigation ---
    ImGui::Spacing();
    ImGui::TextDisabled("NAVIGATION");
    ImGui::Separator();
    {
        const float bw = (ImGui::GetContentRegionAvail().x - ImGui::GetStyle().ItemSpacing.x) * 0.5f;
        if (ImGui::Button("Reset View", ImVec2(bw, 0.0f))) reset_view(app);
        ImGui::SameLine();
        if (ImGui::Button("Zoom Out", ImVec2(bw, 0.0f)))   zoom_out(app);
        ImGui::TextDisabled("Left-drag: zoom box");
        ImGui::TextDisabled("Right-drag: pan   Wheel: zoom");
    }

    // --- Favorites ---
    ImGui::Spacing();
    ImGui::TextDisabled("FAVORITES");
    ImGui::Separator();
    {
        if (ImGui::Button("Add current view", ImVec2(-1.0f, 0.0f)))
            app.fav_selected = app.favorites.add(favorite_from_request(app.req));

        if (!app.favorites.empty()) {
            if (ImGui::BeginListBox("##favs", ImVec2(-1.0f, 5 * ImGui::GetTextLineHeightWithSpacing()))) {
                for (int i = 0; i < app.favorites.size(); ++i) {
                    const std::string label = app.favorites.at(i).label() + "##fav" + std::to_string(i);
                    if (ImGui::Selectable(label.c_str(), i == app.fav_selected,
                                          ImGuiSelectableFlags_AllowDoubleClick)) {
                        app.fav_selected = i;
                        if (ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left))
                            restore_favorite(app, app.favorites.at(i));
                    }
                }
                ImGui::EndListBox();
            }
            const bool has_sel = app.fav_selected >= 0 && app.fav_selected < app.favorites.size();
            const float bw = (ImGui::GetContentRegionAvail().x - ImGui::GetStyle().ItemSpacing.x) * 0.5f;
            ImGui::BeginDisabled(!has_sel);
            if (ImGui::Button("Restore", ImVec2(bw, 0.0f)) && has_sel)
                restore_favorite(app, app.favorites.at(app.fav_selected));
            ImGui::SameLine();
            if (ImGui::Button("Delete", ImVec2(bw, 0.0f)) && has_sel) {
                app.favorites.remove(app.fav_selected);
                app.fav_selected = -1;
            }
            ImGui::EndDisabled();
        }
    }

    // --- Export ---
    ImGui::Spacing();
    ImGui::TextDisabled("EXPORT");
    ImGui::Separator();
    {
        if (!jxl_available()) {
            ImGui::RadioButton("PNG", &app.exp_fmt, 0);
            ImGui::SameLine();
            ImGui::TextDisabled("JXL (not available)");
        } else {
            ImGui::RadioButton("PNG", &app.exp_fmt, 0);
            ImGui::SameLine();
            ImGui::RadioButton("JPEG XL", &app.exp_fmt, 1);
        }

        if (ImGui::Button("Save image", ImVec2(-1.0f, 0.0f)))
            save_png(app);

        ImGui::Spacing();
        char buf0[64], buf2[64], buf4[64];
        std::snprintf(buf0, sizeof(buf0), "%d x %d", HIGHRES_WIDTH, HIGHRES_HEIGHT);
        std::snprintf(buf2, sizeof(buf2), "2x  %d x %d", app.req.width * 2, app.req.height * 2);
        std::snprintf(buf4, sizeof(buf4), "4x  %d x %d", app.req.width * 4, app.req.height * 4);
        ImGui::RadioButton(buf0, &app.highres_target, HIGHRES_FIXED);
        ImGui::RadioButton(buf2, &app.highres_target, HIGHRES_2X);
        ImGui::RadioButton(buf4, &app.highres_target, HIGHRES_4X);

        if (app.highres.active()) {
            char prog[48];
            std::snprintf(prog, sizeof(prog), "Rendering high-res... %.0f%%",
                          app.highres.progress() * 100.0);
            ImGui::ProgressBar(static_cast<float>(app.highres.progress()),
                               ImVec2(-1.0f, 0.0f), prog);
        } else if (ImGui::Button("Save high-res image", ImVec2(-1.0f, 0.0f))) {
            start_highres_export(app);
        }

        if (!app.status_msg.empty())
            ImGui::TextWrapped("%s", app.status_msg.c_str());
    }

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
    static const float STATUS_HEIGHT = 24.0f;

    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();

    const Viewport&    vp = app.req.viewport;
    const ComplexPoint c  = vp.center();
    ImGui::Text("x: %.12f   y: %.12f   zoom: %.4gx   iter: %d   %.0f ms  [%dt]",
                c.re, c.im, vp.zoom_factor(), app.req.max_iterations,
                app.main_render_ms, app.renderer.thread_count);

    // Neighbouring pixels stop being distinguishable in double precision.
    const double scale = std::max({std::abs(c.re), std::abs(c.im), 1.0});
    if (vp.pixel_size() < scale * 1e-14) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f), "  precision limit");
    }

    ImGui::End();  // ##status
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (ImGui::BeginPopupModal("About##dlg", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("fracview");
        ImGui::Separator();
        ImGui::TextDisabled("Mandelbrot and Julia escape-time renderer");
        ImGui::TextDisabled("Multithreaded row-band rendering, %d hardware threads",
                            app.renderer.hw_concurrency);
        ImGui::TextDisabled("PNG%s export up to %d x %d",
                            jxl_available() ? " and JPEG XL" : "",
                            HIGHRES_WIDTH, HIGHRES_HEIGHT);
        ImGui::Spacing();
        ImGui::Text("Keys:  R reset   - zoom out   + zoom in   P palette");
        ImGui::Text("       J Julia   PgUp/PgDn iterations   Ctrl+S save");
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}
