#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "view_state.hpp"
#include "renderer.hpp"
#include "cpu_renderer.hpp"
#include "render_job.hpp"
#include "favorite.hpp"
#include "export.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB8, nw, nh, 0,
                     GL_RGB, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    void upload(const PixelBuffer& buf) {
        glBindTexture(GL_TEXTURE_2D, id);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);  // rows are 3*w bytes, not 4-aligned
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGB, GL_UNSIGNED_BYTE, buf.bytes());
    }

    ImTextureID imgui_id() const {
        return (ImTextureID)(intptr_t)id;
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// High-resolution export targets offered in the panel.
enum HighresTarget {
    HIGHRES_FIXED = 0,   // HIGHRES_WIDTH x HIGHRES_HEIGHT
    HIGHRES_2X    = 1,
    HIGHRES_4X    = 2,
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    // Current view. width/height track the render area; each render gets a
    // copy of this value.
    RenderRequest req;
    ComplexPoint  julia_c = DEFAULT_JULIA_C;   // kept while Mandelbrot is shown

    CpuRenderer renderer;
    PixelBuffer pbuf;
    bool        dirty          = true;
    double      main_render_ms = 0.0;

    bool        show_about     = false;

    // Favorites
    FavoriteList favorites;
    int          fav_selected  = -1;

    // Export
    int              exp_fmt        = 0;   // 0=PNG, 1=JXL
    int              highres_target = HIGHRES_FIXED;
    BackgroundRender highres;
    std::string      highres_path;      // file the running job will be written to
    ImageFormat      highres_fmt    = ImageFormat::Png;  // format fixed when the job started
    std::string      status_msg;

    // Thread count selector (0 = Auto)
    int thread_sel = 0;

    // Navigation
    bool   panning     = false;
    ImVec2 pan_last    = {};

    bool   zoom_boxing = false;
    ImVec2 zbox_start  = {};
    ImVec2 zbox_end    = {};

    // GL texture
    GlTex render_tex;
};
