#include "universe.hpp"

namespace lifebox {
    static const ruleT& life_rule() {
        static const ruleT rule = game_of_life();
        return rule;
    }

    universeT::universeT(const vecT size) : m_cells{size}, m_next{size} {
        assert(size.x > 0 && size.y > 0);
        seed(m_cells.data());
    }

    universeT::universeT() : universeT(default_size) {}

    std::optional<universeT> universeT::create(const vecT size) {
        if (size.x <= 0 || size.y <= 0) {
            return std::nullopt;
        }
        return universeT(size);
    }

    void universeT::seed(const tile_ref tile) {
        tile.for_each_line([w = tile.size.x](const int y, std::span<bool> line) {
            for (int x = 0; bool& b : line) {
                const int i = y * w + x;
                b = i % 2 == 0 || i % 7 == 0;
                ++x;
            }
        });
    }

    // `m_next` is fully overwritten before the swap, so no cell sees an already-updated neighbor.
    void universeT::tick() {
        step_torus(life_rule(), m_next.data(), m_cells.data(), m_frame);
        m_cells.swap(m_next);
        ++m_gen;
    }

    void universeT::reset() {
        seed(m_cells.data());
        m_gen = 0;
    }

    int universeT::live_neighbor_count(int row, int col) const {
        const tile_const_ref data = m_cells.data();
        assert(data.contains({col, row}));

        const int w = data.size.x, h = data.size.y;
        const int up = (row + h - 1) % h, dw = (row + 1) % h;
        const int l = (col + w - 1) % w, r = (col + 1) % w;
        const situT situ{
            data.at(l, up), data.at(col, up), data.at(r, up), //
            data.at(l, row), data.at(col, row), data.at(r, row), //
            data.at(l, dw), data.at(col, dw), data.at(r, dw), //
        };
        return count_neighbors(codeT{encode(situ) & torus_neighbor_mask(data.size)});
    }
} // namespace lifebox
