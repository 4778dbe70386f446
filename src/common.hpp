#pragma once

#include <vector>

#include "universe.hpp"

#include "dear_imgui.hpp"

/* Not inline */ static const bool check_version = IMGUI_CHECKVERSION();

struct SDL_Renderer;
struct SDL_Texture;

// Streaming textures showing tiles (alive ~ black, dead ~ white), one texel per cell.
// A texture not asked for during a whole frame is released at the next `begin_frame`.
class screen_textures {
    struct blobT {
        SDL_Texture* texture;
        lifebox::vecT size;
        bool used;
    };

    SDL_Renderer* m_renderer;
    std::vector<blobT> m_blobs{};

public:
    explicit screen_textures(SDL_Renderer* renderer) : m_renderer(renderer) {}
    screen_textures(const screen_textures&) = delete;
    screen_textures& operator=(const screen_textures&) = delete;
    ~screen_textures();

    void begin_frame();

    // Valid until the end of the current frame.
    [[nodiscard]] ImTextureID make(lifebox::tile_const_ref tile);
};

// `main` owns the space and the textures; called once per frame between ImGui::NewFrame and ImGui::Render.
void frame_main(lifebox::universeT& universe, screen_textures& screen);

inline const int item_width = 220;

// Initial settings of the space window.
inline const lifebox::vecT init_size = lifebox::universeT::default_size;
inline const int init_cell_size = 10; // Pixels per cell.
inline const int init_interval = 50;  // ms between generations.
inline const bool init_show_grid = true;

inline const ImU32 grid_color = IM_COL32(0xCC, 0xCC, 0xCC, 255);
