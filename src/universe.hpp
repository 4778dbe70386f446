#pragma once

#include <optional>
#include <span>
#include <string>

#include "render.hpp"
#include "tile.hpp"

namespace lifebox {
    // A Game of Life space whose edges wrap around (torus).
    // The only transition is `tick`; the host is expected to call `render` / `tick` in turn, never concurrently.
    class universeT {
        tileT m_cells; // Row-major; (row, col) ~ (y, x).
        tileT m_next;  // Receives the next generation before being swapped in.
        torus_frame m_frame{};
        int m_gen = 0;

        explicit universeT(const vecT size);

    public:
        static constexpr vecT default_size{.x = 64, .y = 64};

        // 64x64, seeded with `seed`.
        universeT();

        // Empty if either dimension is not positive.
        static std::optional<universeT> create(const vecT size);

        // i ~ row * width + col; alive iff `i % 2 == 0 || i % 7 == 0`.
        static void seed(const tile_ref tile);

        void tick();
        void reset();

        std::string render(const glyphsT& glyphs = default_glyphs) const { //
            return render_text(m_cells.data(), glyphs);
        }

        int width() const { return m_cells.size().x; }
        int height() const { return m_cells.size().y; }
        vecT size() const { return m_cells.size(); }
        int gen() const { return m_gen; }

        std::span<const bool> cells() const {
            const tile_const_ref data = m_cells.data();
            return {data.data, size_t(data.size.xy())};
        }

        bool cell(int row, int col) const { return m_cells.data().at(col, row); }

        // Live cells among the 8 wrapped neighbors. A neighbor that wraps onto (row, col) itself
        // (only possible when the space is 1 cell wide or high) is not counted.
        int live_neighbor_count(int row, int col) const;

        tile_const_ref data() const { return m_cells.data(); }

        // For placing patterns; the generation counter is left unchanged.
        tile_ref write_only() { return m_cells.data(); }

        friend bool operator==(const universeT& a, const universeT& b) { return a.m_cells == b.m_cells; }
    };
} // namespace lifebox
