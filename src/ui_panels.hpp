#pragma once

struct AppState;
struct ImGuiIO;

void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh);
void draw_status_bar(AppState& app, float fw, float fh);
void draw_about_dialog(AppState& app);

// Navigation and export actions shared by the panel, the menu and the
// keyboard shortcuts.
void reset_view(AppState& app);
void zoom_out(AppState& app);
void set_julia_mode(AppState& app, bool julia);
void save_png(AppState& app);
void start_highres_export(AppState& app);

// Picks up a finished high-resolution render and writes it out.
void poll_highres_export(AppState& app);
