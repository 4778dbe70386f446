#pragma once

#include <array>
#include <bit>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <ctime>
#include <random>

#ifndef NDEBUG
#define ENABLE_TESTS
#endif // !NDEBUG

#define assert_implies(a, b) assert(!(a) || (b))

namespace lifebox {

#ifdef ENABLE_TESTS
    namespace _tests {
        // Runs `fn` once, during static initialization.
        struct testT {
            inline static std::mt19937 rand{(uint32_t)time(0)};
            testT(const auto& fn) noexcept { fn(); }
        };
    } // namespace _tests
#endif // ENABLE_TESTS

    // Cell `s` together with its 8 neighbors, laid out like the keys around 's':
    //   q w e
    //   a s d
    //   z x c
    struct situT {
        bool q, w, e;
        bool a, s, d;
        bool z, x, c;
    };

    // `situT` packed into 9 bits, `q` being the highest.
    struct codeT {
        int val;

        /*implicit*/ operator int() const {
            assert(val >= 0 && val < 512);
            return val;
        }

        // clang-format off
        enum bposE : int {
            bpos_q = 8, bpos_w = 7, bpos_e = 6,
            bpos_a = 5, bpos_s = 4, bpos_d = 3,
            bpos_z = 2, bpos_x = 1, bpos_c = 0
        };
        // clang-format on

        static constexpr int mask_s = 1 << bpos_s;
        static constexpr int mask_all = 0b111'111'111;

        bool get(bposE bpos) const { return (val >> bpos) & 1; }
    };

    inline codeT encode(const situT& situ) {
        // Indexed by `bposE`.
        const bool bits[9]{situ.c, situ.x, situ.z, situ.d, situ.s, situ.a, situ.e, situ.w, situ.q};
        int code = 0;
        for (int bpos = 0; bpos < 9; ++bpos) {
            code |= bits[bpos] << bpos;
        }
        return codeT{code};
    }

    inline situT decode(const codeT code) {
        using enum codeT::bposE;
        return {.q = code.get(bpos_q), .w = code.get(bpos_w), .e = code.get(bpos_e),
                .a = code.get(bpos_a), .s = code.get(bpos_s), .d = code.get(bpos_d),
                .z = code.get(bpos_z), .x = code.get(bpos_x), .c = code.get(bpos_c)};
    }

    inline void for_each_code(const auto& fn) {
        for (int val = 0; val < 512; ++val) {
            fn(codeT{val});
        }
    }

    // Live cells among the 8 neighbors; `s` is never counted.
    inline int count_neighbors(const codeT code) {
        return std::popcount(unsigned(code.val & ~codeT::mask_s));
    }

    // The state of `s` at the next generation, for each of the 512 neighborhoods.
    class ruleT {
        std::array<bool, 512> m_next{};

    public:
        ruleT() = default;
        explicit ruleT(const std::predicate<codeT> auto& fn) {
            for_each_code([&](codeT code) { m_next[code] = fn(code); });
        }

        bool operator()(const codeT code) const { return m_next[code]; }

        friend bool operator==(const ruleT&, const ruleT&) = default;
    };

    // B3/S23: a dead cell with exactly 3 live neighbors is born; a live cell with 2 or 3 survives.
    inline ruleT game_of_life() {
        return ruleT([](codeT code) {
            const int n = count_neighbors(code);
            return n == 3 || (n == 2 && code.get(codeT::bpos_s));
        });
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_codeT = [] {
            for_each_code([](codeT code) { assert(encode(decode(code)) == code); });

            const situT situ = decode(codeT{0b110'001'011});
            assert(situ.q && situ.w && !situ.e);
            assert(!situ.a && !situ.s && situ.d);
            assert(!situ.z && situ.x && situ.c);
        };

        inline const testT test_game_of_life = [] {
            const ruleT gol = game_of_life();
            for_each_code([&](codeT code) {
                const int n = count_neighbors(code);
                assert(n >= 0 && n <= 8);
                assert_implies(code.get(codeT::bpos_s), gol(code) == (n == 2 || n == 3));
                assert_implies(!code.get(codeT::bpos_s), gol(code) == (n == 3));
            });
        };
    } // namespace _tests
#endif // ENABLE_TESTS

} // namespace lifebox
