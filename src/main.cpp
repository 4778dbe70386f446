// Host setup follows "example_sdl2_sdlrenderer2/main.cpp" in Dear ImGui:
// https://github.com/ocornut/imgui/blob/master/examples/example_sdl2_sdlrenderer2/main.cpp

#include <cstdlib>

#include <SDL.h>

#include "imgui_impl_sdl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include "common.hpp"

[[noreturn]] static void resource_failure(const char* what) {
    SDL_Log("Error: %s failed: %s", what, SDL_GetError());
    std::exit(EXIT_FAILURE);
}

// ABGR8888, as "imgui_impl_sdlrenderer2.cpp" uses.
static constexpr Uint32 alive_texel = 0xFF000000; // Black.
static constexpr Uint32 dead_texel = 0xFFFFFFFF;  // White.

screen_textures::~screen_textures() {
    for (const blobT& blob : m_blobs) {
        SDL_DestroyTexture(blob.texture);
    }
}

void screen_textures::begin_frame() {
    std::erase_if(m_blobs, [](const blobT& blob) {
        if (!blob.used) {
            SDL_DestroyTexture(blob.texture);
        }
        return !blob.used;
    });
    for (blobT& blob : m_blobs) {
        blob.used = false;
    }
}

ImTextureID screen_textures::make(const lifebox::tile_const_ref tile) {
    auto blob = std::ranges::find_if(m_blobs, [&](const blobT& b) { return !b.used && b.size == tile.size; });
    if (blob == m_blobs.end()) {
        SDL_Texture* const texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_ABGR8888,
                                                       SDL_TEXTUREACCESS_STREAMING, tile.size.x, tile.size.y);
        if (!texture) {
            resource_failure("SDL_CreateTexture");
        }
        SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_NONE);
        SDL_SetTextureScaleMode(texture, SDL_ScaleModeNearest);
        m_blobs.push_back({.texture = texture, .size = tile.size, .used = false});
        blob = m_blobs.end() - 1;
    }
    blob->used = true;

    void* pixels = nullptr;
    int pitch = 0;
    if (SDL_LockTexture(blob->texture, nullptr, &pixels, &pitch) != 0) {
        resource_failure("SDL_LockTexture");
    }
    tile.for_each_line([&](int y, std::span<const bool> line) {
        Uint32* const texels = reinterpret_cast<Uint32*>(static_cast<char*>(pixels) + y * pitch);
        std::ranges::transform(line, texels, [](bool b) { return b ? alive_texel : dead_texel; });
    });
    SDL_UnlockTexture(blob->texture);

    return (ImTextureID)(intptr_t)blob->texture;
}

static lifebox::universeT make_universe() {
    std::optional<lifebox::universeT> universe = lifebox::universeT::create(init_size);
    if (!universe) {
        SDL_Log("Error: invalid space size %dx%d; using %dx%d instead.", init_size.x, init_size.y,
                lifebox::universeT::default_size.x, lifebox::universeT::default_size.y);
        return lifebox::universeT{};
    }
    return std::move(*universe);
}

// False when the window is closed.
static bool poll_events() {
    for (SDL_Event event; SDL_PollEvent(&event);) {
        ImGui_ImplSDL2_ProcessEvent(&event);
        if (event.type == SDL_QUIT) {
            return false;
        }
    }
    return true;
}

static void present(SDL_Renderer* renderer) {
    ImGui::Render();
    const ImVec2 scale = ImGui::GetIO().DisplayFramebufferScale;
    SDL_RenderSetScale(renderer, scale.x, scale.y);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
    SDL_RenderPresent(renderer);
}

int main(int, char**) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        resource_failure("SDL_Init");
    }
#ifdef SDL_HINT_IME_SHOW_UI
    SDL_SetHint(SDL_HINT_IME_SHOW_UI, "1");
#endif

    SDL_Window* const window = SDL_CreateWindow("lifebox", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1024, 900,
                                                SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
        resource_failure("SDL_CreateWindow");
    }
    SDL_Renderer* const renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_PRESENTVSYNC | SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        resource_failure("SDL_CreateRenderer");
    }

    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.LogFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    {
        lifebox::universeT universe = make_universe();
        screen_textures screen(renderer); // Released before the renderer.

        // At most 100 fps; VSync usually limits it further.
        constexpr Uint64 min_frame_ms = 10;
        Uint64 frame_begin = SDL_GetTicks64();
        while (poll_events()) {
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            screen.begin_frame();
            frame_main(universe, screen);
            present(renderer);

            const Uint64 elapsed = SDL_GetTicks64() - frame_begin;
            if (elapsed < min_frame_ms) {
                SDL_Delay(Uint32(min_frame_ms - elapsed));
            }
            frame_begin = SDL_GetTicks64();
        }
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
