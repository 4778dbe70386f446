#pragma once

#include <string>
#include <string_view>

#include "tile_base.hpp"

namespace lifebox {
    // Two fixed symbols, one per cell state. Each may take several bytes (utf-8).
    struct glyphsT {
        std::string_view dead;
        std::string_view alive;
    };

    inline constexpr glyphsT default_glyphs{.dead = "◻", .alive = "◼"};
    inline constexpr glyphsT ascii_glyphs{.dead = ".", .alive = "o"};

    // One line per row, one glyph per cell; every row (including the last one) ends with '\n'.
    inline std::string render_text(const tile_const_ref tile, const glyphsT& glyphs = default_glyphs) {
        std::string str;
        str.reserve(tile.size.y * (tile.size.x * std::max(glyphs.dead.size(), glyphs.alive.size()) + 1));
        tile.for_each_line([&](std::span<const bool> line) {
            for (const bool b : line) {
                str += b ? glyphs.alive : glyphs.dead;
            }
            str += '\n';
        });
        return str;
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_render_text = [] {
            const bool data[6]{1, 0, 0, 0, 1, 1};
            const tile_const_ref tile{.size{.x = 3, .y = 2}, .stride = 3, .data = data};
            assert(render_text(tile, ascii_glyphs) == "o..\n.oo\n");
            assert(render_text(tile) == "◼◻◻\n◻◼◼\n");

            // Only the first two columns.
            const tile_const_ref clipped{.size{.x = 2, .y = 2}, .stride = 3, .data = data};
            assert(render_text(clipped, ascii_glyphs) == "o.\n.o\n");
        };
    }  // namespace _tests
#endif // ENABLE_TESTS
} // namespace lifebox
