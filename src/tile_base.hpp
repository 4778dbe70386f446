#pragma once

#include <algorithm>
#include <span>
#include <type_traits>

#include "rule.hpp"

namespace lifebox {
    struct vecT {
        int x, y;

        int xy() const { return x * y; }

        friend bool operator==(const vecT&, const vecT&) = default;
    };

    namespace _misc {
        // A rectangle of cells inside a row-major buffer; rows are `stride` elements apart.
        template <class T>
        struct tile_ref_ {
            vecT size;
            int stride;
            T* data; // Non-owning; (0, 0).

            operator tile_ref_<const T>() const
                requires(!std::is_const_v<T>)
            {
                return {.size = size, .stride = stride, .data = data};
            }

            bool contains(const vecT pos) const {
                return pos.x >= 0 && pos.x < size.x && pos.y >= 0 && pos.y < size.y;
            }

            T* line(const int y) const {
                assert(y >= 0 && y < size.y);
                return data + y * stride;
            }

            T& at(const int x, const int y) const {
                assert(contains({x, y}));
                return line(y)[x];
            }
            T& at(const vecT pos) const { return at(pos.x, pos.y); }

            // The `sub_size` area whose top-left corner is at `pos`.
            [[nodiscard]] tile_ref_ clip(const vecT pos, const vecT sub_size) const {
                assert(sub_size.x > 0 && sub_size.y > 0);
                assert(contains(pos) && pos.x + sub_size.x <= size.x && pos.y + sub_size.y <= size.y);
                return {.size = sub_size, .stride = stride, .data = &at(pos)};
            }

            // `fn(y, line)` or `fn(line)`, top to bottom.
            template <class Fn>
            void for_each_line(const Fn& fn) const {
                for (int y = 0; y < size.y; ++y) {
                    const std::span<T> row{line(y), size_t(size.x)};
                    if constexpr (std::is_invocable_v<const Fn&, int, std::span<T>>) {
                        fn(y, row);
                    } else {
                        fn(row);
                    }
                }
            }
        };
    } // namespace _misc

    using tile_ref = _misc::tile_ref_<bool>;
    using tile_const_ref = _misc::tile_ref_<const bool>;

    inline bool equal(const tile_const_ref a, const tile_const_ref b) {
        if (a.size != b.size) {
            return false;
        }
        for (int y = 0; y < a.size.y; ++y) {
            if (!std::equal(a.line(y), a.line(y) + a.size.x, b.line(y))) {
                return false;
            }
        }
        return true;
    }
} // namespace lifebox
