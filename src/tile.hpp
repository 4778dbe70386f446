#pragma once

#include <charconv>
#include <concepts>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "rule.hpp"
#include "tile_base.hpp"

namespace lifebox {
    inline int count(const tile_const_ref tile) {
        int c = 0;
        tile.for_each_line([&c](std::span<const bool> line) { c += int(std::ranges::count(line, true)); });
        return c;
    }

    inline void fill(const tile_ref tile, const bool v) {
        tile.for_each_line([v](std::span<bool> line) { std::ranges::fill(line, v); });
    }

    // (`dest` and `source` should not overlap.)
    inline void copy(const tile_ref dest, const tile_const_ref source) {
        assert(dest.size == source.size);
        source.for_each_line([&](int y, std::span<const bool> line) { std::ranges::copy(line, dest.line(y)); });
    }

    // Each cell is alive with probability `density`; the result depends only on the state of `rand`.
    inline void random_fill(const tile_ref tile, std::mt19937& rand, const double density) {
        const uint32_t bar = uint32_t(std::clamp(density, 0.0, 1.0) * std::mt19937::max());
        tile.for_each_line([&](std::span<bool> line) {
            for (bool& b : line) {
                b = rand() < bar;
            }
        });
    }

    // The cell at (x, y) of `source` goes to (x + by.x, y + by.y) of `dest`, wrapping at the edges.
    // (`dest` and `source` should not overlap.)
    inline void shift_copy(const tile_ref dest, const tile_const_ref source, const vecT by) {
        assert(dest.size == source.size);
        const vecT size = source.size;
        const auto wrap = [](int v, int n) { return ((v % n) + n) % n; };
        source.for_each_line([&](int y, std::span<const bool> line) {
            bool* const to = dest.line(wrap(y + by.y, size.y));
            for (int x = 0; x < size.x; ++x) {
                to[wrap(x + by.x, size.x)] = line[x];
            }
        });
    }

    namespace _misc {
        // Splits the body of an RLE pattern into runs; '!', the end of text and any unknown tag end the body.
        class rle_runs {
            std::string_view m_text;

        public:
            struct runT {
                int n;
                char tag; // 'b', 'o', '$' or '!'.
            };

            explicit rle_runs(std::string_view text) : m_text(text) {}

            runT next() {
                while (!m_text.empty() && std::string_view(" \t\r\n").find(m_text.front()) != std::string_view::npos) {
                    m_text.remove_prefix(1);
                }

                int n = 1;
                if (!m_text.empty() && m_text.front() >= '1' && m_text.front() <= '9') {
                    const auto [ptr, ec] = std::from_chars(m_text.data(), m_text.data() + m_text.size(), n);
                    if (ec != std::errc{}) {
                        return {0, '!'};
                    }
                    m_text.remove_prefix(ptr - m_text.data());
                }
                if (m_text.empty()) {
                    return {0, '!'};
                }

                const char tag = m_text.front();
                m_text.remove_prefix(1);
                if (tag == 'b' || tag == 'o' || tag == '$') {
                    return {n, tag};
                }
                return {0, '!'};
            }
        };
    } // namespace _misc

    // https://conwaylife.com/wiki/Run_Length_Encoded
    // `prepare(width, height)` returns the area to write the pattern into (dead cells included),
    // or nullopt to drop it. It is not called for an empty pattern.
    inline void parse_rle(std::string_view text, const auto& prepare) {
        static_assert(requires {
            { prepare((long long)(0), (long long)(0)) } -> std::same_as<std::optional<tile_ref>>;
        });

        // Comment lines and the "x = .., y = .." line.
        while (text.starts_with('#') || text.starts_with('x')) {
            const size_t nl = text.find('\n');
            text.remove_prefix(nl == text.npos ? text.size() : nl + 1);
        }

        long long width = 0, height = 0;
        {
            long long x = 0, y = 0;
            for (_misc::rle_runs runs(text);;) {
                const auto [n, tag] = runs.next();
                if (tag == '!') {
                    break;
                } else if (tag == '$') {
                    y += n, x = 0;
                } else {
                    x += n;
                    width = std::max(width, x);
                }
            }
            height = x == 0 ? y : y + 1;
        }
        if (width == 0 || height == 0) {
            return;
        }

        const std::optional<tile_ref> area = prepare(width, height);
        if (!area) {
            return;
        }
        assert(area->size.x == width && area->size.y == height);
        fill(*area, false);

        int x = 0, y = 0;
        for (_misc::rle_runs runs(text);;) {
            const auto [n, tag] = runs.next();
            if (tag == '!') {
                break;
            } else if (tag == '$') {
                y += n, x = 0;
            } else {
                std::fill_n(area->line(y) + x, n, tag == 'o');
                x += n;
            }
        }
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_parse_rle = [] {
            bool data[9]{};
            const tile_ref tile{.size{.x = 3, .y = 3}, .stride = 3, .data = data};
            int calls = 0;
            parse_rle("#N Glider\nx = 3, y = 3, rule = B3/S23\nbo$2bo$3o!", [&](long long w, long long h) {
                assert(w == 3 && h == 3);
                ++calls;
                return std::optional{tile};
            });
            assert(calls == 1);
            const bool glider[9]{0, 1, 0, 0, 0, 1, 1, 1, 1};
            assert(std::equal(data, data + 9, glider));

            parse_rle("!", [](long long, long long) -> std::optional<tile_ref> {
                assert(false);
                return std::nullopt;
            });
        };
    } // namespace _tests
#endif // ENABLE_TESTS

    // Bits of `codeT` that name a cell other than `s` on a torus of `size`.
    // On a torus 1 cell wide, 'a' and 'd' are `s` itself; on one 1 cell high, 'w' and 'x' are.
    inline int torus_neighbor_mask(const vecT size) {
        using enum codeT::bposE;
        if (size.x == 1 && size.y == 1) {
            return codeT::mask_s;
        }
        int mask = codeT::mask_all;
        if (size.x == 1) {
            mask &= ~((1 << bpos_a) | (1 << bpos_d));
        }
        if (size.y == 1) {
            mask &= ~((1 << bpos_w) | (1 << bpos_x));
        }
        return mask;
    }

    // A copy of a tile with a one-cell margin taken from the opposite edges, so that
    // every cell has its 8 toroidal neighbors around it. Reused by `step_torus`.
    class torus_frame {
        vecT m_size{};
        std::vector<char> m_cells{}; // (m_size.x + 2) * (m_size.y + 2)

        // y in [-1, m_size.y]; the returned pointer may be indexed in [-1, m_size.x].
        char* row(const int y) { return m_cells.data() + (y + 1) * (m_size.x + 2) + 1; }

    public:
        void load(const tile_const_ref source) {
            m_size = source.size;
            m_cells.resize(size_t(m_size.x + 2) * (m_size.y + 2));

            const int w = m_size.x, h = m_size.y;
            for (int y = -1; y <= h; ++y) {
                const bool* const from = source.line((y + h) % h);
                char* const to = row(y);
                std::copy_n(from, w, to);
                to[-1] = from[w - 1];
                to[w] = from[0];
            }
        }

        // Computes each cell of `dest` from the loaded tile.
        void apply(const ruleT& rule, const tile_ref dest) {
            assert(dest.size == m_size);
            const int mask = torus_neighbor_mask(m_size);

            // Moving one cell right: q <- w <- e, a <- s <- d, z <- x <- c.
            constexpr int keep = 0b110'110'110;
            for (int y = 0; y < m_size.y; ++y) {
                const char *up = row(y - 1), *cn = row(y), *dw = row(y + 1);
                const auto shift_in = [&](int code, int x) {
                    return ((code << 1) & keep) | (up[x] << codeT::bpos_e) | (cn[x] << codeT::bpos_d) | dw[x];
                };

                int code = shift_in(shift_in(0, -1), 0);
                bool* const out = dest.line(y);
                for (int x = 0; x < m_size.x; ++x) {
                    code = shift_in(code, x + 1);
                    out[x] = rule(codeT{code & mask});
                }
            }
        }
    };

    // The whole of `dest` is computed from `source` as it was before the call. `dest` and `source` must not overlap.
    inline void step_torus(const ruleT& rule, const tile_ref dest, const tile_const_ref source, torus_frame& frame) {
        assert(dest.size == source.size);
        frame.load(source);
        frame.apply(rule, dest);
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_torus_neighbor_mask = [] {
            assert(torus_neighbor_mask({5, 4}) == codeT::mask_all);
            assert(torus_neighbor_mask({1, 1}) == codeT::mask_s);
            assert(torus_neighbor_mask({1, 6}) == 0b111'010'111);
            assert(torus_neighbor_mask({6, 1}) == 0b101'111'101);
        };

        inline const testT test_step_torus = [] {
            // Every cell takes the state of its up-left neighbor, so the whole tile moves by (1, 1).
            const ruleT copy_q([](codeT code) { return code.get(codeT::bpos_q); });

            bool data[3][120]{};
            const tile_ref tile{.size{.x = 10, .y = 12}, .stride = 10, .data = data[0]};
            const tile_ref expected{.size{.x = 10, .y = 12}, .stride = 10, .data = data[1]};
            const tile_ref next{.size{.x = 10, .y = 12}, .stride = 10, .data = data[2]};
            random_fill(tile, testT::rand, 0.5);

            torus_frame frame{};
            for (int i = 0; i < 12; ++i) {
                shift_copy(expected, tile, {1, 1});
                step_torus(copy_q, next, tile, frame);
                assert(equal(next, expected));
                copy(tile, next);
            }
        };
    } // namespace _tests
#endif // ENABLE_TESTS

    // Owning, continuous storage for a tile; empty or at least 1x1.
    class tileT {
        vecT m_size{};
        std::unique_ptr<bool[]> m_data{};

    public:
        tileT() = default;

        explicit tileT(const vecT size) : m_size{size} {
            assert(size.x > 0 && size.y > 0);
            m_data = std::make_unique<bool[]>(size.xy());
        }

        explicit tileT(const tile_const_ref tile) : tileT(tile.size) { copy(data(), tile); }

        tileT(const tileT& other) : tileT() {
            if (!other.empty()) {
                m_size = other.m_size;
                m_data = std::make_unique<bool[]>(m_size.xy());
                std::copy_n(other.m_data.get(), m_size.xy(), m_data.get());
            }
        }
        tileT& operator=(const tileT& other) {
            tileT temp(other);
            swap(temp);
            return *this;
        }
        tileT(tileT&& other) noexcept : tileT() { swap(other); }
        tileT& operator=(tileT&& other) noexcept {
            swap(other);
            return *this;
        }

        void swap(tileT& other) noexcept {
            std::swap(m_size, other.m_size);
            m_data.swap(other.m_data);
        }

        bool empty() const { return !m_data; }
        vecT size() const { return m_size; }

        tile_ref data() {
            assert(!empty());
            return {.size = m_size, .stride = m_size.x, .data = m_data.get()};
        }
        tile_const_ref data() const {
            assert(!empty());
            return {.size = m_size, .stride = m_size.x, .data = m_data.get()};
        }

        friend bool operator==(const tileT& a, const tileT& b) {
            if (a.empty() || b.empty()) {
                return a.empty() && b.empty();
            }
            return equal(a.data(), b.data());
        }
    };

} // namespace lifebox
