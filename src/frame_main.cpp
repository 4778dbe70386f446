#include <chrono>
#include <format>

#include "common.hpp"

// Controls for the space owned by `main`. The frame calls `display` (reads) and then `end_frame` (may tick).
class spaceT {
    using clockT = std::chrono::steady_clock;

    struct ctrlT {
        bool pause = false;
        int extra_step = 0;
        int interval = init_interval; // ms.
        clockT::time_point last_tick{};
    };

    ctrlT m_ctrl{};

    int m_cell_size = init_cell_size;
    bool m_show_grid = init_show_grid;
    bool m_show_text = false;

    char m_rle[512]{};
    std::string m_msg{};

    void place_rle(lifebox::universeT& universe) {
        const lifebox::vecT size = universe.size();
        bool placed = false;
        lifebox::parse_rle(m_rle, [&](long long w, long long h) -> std::optional<lifebox::tile_ref> {
            if (w > size.x || h > size.y) {
                m_msg = std::format("The pattern ({}x{}) is larger than the space ({}x{}).", w, h, size.x, size.y);
                return std::nullopt;
            }
            // Centered.
            const lifebox::vecT begin{.x = int(size.x - w) / 2, .y = int(size.y - h) / 2};
            placed = true;
            return universe.write_only().clip(begin, {.x = int(w), .y = int(h)});
        });
        if (placed) {
            m_msg.clear();
            m_ctrl.pause = true;
        } else if (m_msg.empty()) {
            m_msg = "No pattern found.";
        }
    }

    void display_ctrl(lifebox::universeT& universe) {
        ImGui::PushItemWidth(item_width);
        if (ImGui::Button("Restart")) {
            universe.reset();
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear")) {
            lifebox::fill(universe.write_only(), 0);
            m_ctrl.pause = true;
        }
        ImGui::SameLine();
        ImGui::Checkbox("Pause", &m_ctrl.pause);
        ImGui::SameLine();
        ImGui::PushItemFlag(ImGuiItemFlags_ButtonRepeat, true);
        if (ImGui::Button("+1")) {
            m_ctrl.extra_step = 1;
            m_ctrl.pause = true;
        }
        ImGui::PopItemFlag(); // ImGuiItemFlags_ButtonRepeat
        ImGui::SameLine();
        imgui_StrTooltip("(?)", "Left-click a cell to flip it.\n\n"
                                "+1: Pause the space and advance by one generation.");

        ImGui::Text("Generation: %d    Size: %d x %d    Alive: %d", universe.gen(), universe.width(),
                    universe.height(), lifebox::count(universe.data()));

        imgui_StepSliderInt("Interval", &m_ctrl.interval, 0, 400, 25, "%d ms");
        imgui_StepSliderInt("Cell size", &m_cell_size, 1, 20);
        ImGui::Checkbox("Grid", &m_show_grid);
        ImGui::SameLine();
        ImGui::Checkbox("Text", &m_show_text);

        ImGui::InputTextWithHint("##RLE", "RLE, e.g. bo$2bo$3o!", m_rle, std::size(m_rle));
        ImGui::SameLine();
        if (ImGui::Button("Place")) {
            place_rle(universe);
        }
        if (!m_msg.empty()) {
            imgui_StrDisabled(m_msg);
        }
        ImGui::PopItemWidth();
    }

    // Cells are `m_cell_size` squares; grid lines (if any) take the first pixel of each cell.
    void display_canvas(lifebox::universeT& universe, screen_textures& screen) {
        const lifebox::vecT size = universe.size();
        const ImVec2 canvas_size(size.x * m_cell_size, size.y * m_cell_size);
        const ImVec2 canvas_min = ImGui::GetCursorScreenPos();
        ImGui::Image(screen.make(universe.data()), canvas_size);

        ImDrawList* const drawlist = ImGui::GetWindowDrawList();
        if (m_show_grid && m_cell_size >= 4) {
            const ImVec2 canvas_max = canvas_min + canvas_size;
            for (int x = 0; x <= size.x; ++x) {
                const float px = canvas_min.x + x * m_cell_size;
                drawlist->AddLine({px, canvas_min.y}, {px, canvas_max.y}, grid_color);
            }
            for (int y = 0; y <= size.y; ++y) {
                const float py = canvas_min.y + y * m_cell_size;
                drawlist->AddLine({canvas_min.x, py}, {canvas_max.x, py}, grid_color);
            }
        }

        if (ImGui::IsItemHovered() && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            const ImVec2 pos = ImGui::GetIO().MousePos - canvas_min;
            const lifebox::vecT cell{.x = int(pos.x) / m_cell_size, .y = int(pos.y) / m_cell_size};
            const lifebox::tile_ref tile = universe.write_only();
            if (tile.contains(cell)) {
                tile.at(cell) = !tile.at(cell);
            }
        }
    }

    void display_text(const lifebox::universeT& universe) {
        if (auto child = imgui_ChildWindow("Text", ImGuiChildFlags_Borders, ImGuiWindowFlags_HorizontalScrollbar)) {
            // (The default font has no glyphs for "◻" and "◼".)
            imgui_Str(universe.render(lifebox::ascii_glyphs));
        }
    }

public:
    void display(lifebox::universeT& universe, screen_textures& screen) {
        display_ctrl(universe);
        ImGui::Separator();
        if (auto child = imgui_ChildWindow("Canvas", {}, ImGuiWindowFlags_HorizontalScrollbar)) {
            display_canvas(universe, screen);
            if (m_show_text) {
                display_text(universe);
            }
        }
    }

    void end_frame(lifebox::universeT& universe) {
        int count = std::exchange(m_ctrl.extra_step, 0);
        if (count == 0 && !m_ctrl.pause) {
            const clockT::time_point now = clockT::now();
            if (now - m_ctrl.last_tick >= std::chrono::milliseconds(m_ctrl.interval)) {
                m_ctrl.last_tick = now;
                count = 1;
            }
        }
        for (int c = 0; c < count; ++c) {
            universe.tick();
        }
    }
};

void frame_main(lifebox::universeT& universe, screen_textures& screen) {
    static spaceT space;

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                       ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
    if (auto window = imgui_Window("Main", flags)) {
        space.display(universe, screen);
    }

    space.end_frame(universe);
}
