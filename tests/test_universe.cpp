#include <cassert>
#include <iostream>
#include "../src/universe.hpp"

using namespace lifebox;

static universeT make_empty(vecT size) {
    std::optional<universeT> u = universeT::create(size);
    assert(u.has_value());
    fill(u->write_only(), 0);
    return std::move(*u);
}

void test_default_size() {
    universeT u;
    assert(u.width() == 64);
    assert(u.height() == 64);
    assert(u.size() == universeT::default_size);
    assert(u.cells().size() == 64 * 64);
    assert(u.gen() == 0);
    std::cout << "PASSED: test_default_size\n";
}

void test_default_seed() {
    universeT u;
    const std::span<const bool> cells = u.cells();
    for (int i = 0; i < int(cells.size()); i++) {
        assert(cells[i] == (i % 2 == 0 || i % 7 == 0));
    }
    // Row-major: (row, col) ~ row * width + col.
    assert(u.cell(0, 0) == true);
    assert(u.cell(0, 1) == false);
    assert(u.cell(0, 7) == true);
    assert(u.cell(1, 1) == (65 % 2 == 0 || 65 % 7 == 0));
    assert(u.cell(1, 6) == true); // 70
    std::cout << "PASSED: test_default_seed\n";
}

void test_create_rejects_degenerate_size() {
    assert(!universeT::create({.x = 0, .y = 64}).has_value());
    assert(!universeT::create({.x = 64, .y = 0}).has_value());
    assert(!universeT::create({.x = 0, .y = 0}).has_value());
    assert(!universeT::create({.x = -3, .y = 5}).has_value());

    const std::optional<universeT> smallest = universeT::create({.x = 1, .y = 1});
    assert(smallest.has_value());
    assert(smallest->cells().size() == 1);
    std::cout << "PASSED: test_create_rejects_degenerate_size\n";
}

void test_cell_count_is_conserved() {
    std::optional<universeT> u = universeT::create({.x = 13, .y = 7});
    assert(u.has_value());
    assert(u->cells().size() == size_t(u->width() * u->height()));
    for (int i = 0; i < 20; i++) {
        u->tick();
        assert(u->cells().size() == 13 * 7);
        assert(u->width() == 13 && u->height() == 7);
    }
    assert(u->gen() == 20);
    std::cout << "PASSED: test_cell_count_is_conserved\n";
}

void test_determinism() {
    universeT a;
    universeT b;
    for (int gen = 0; gen < 50; gen++) {
        assert(a.render() == b.render());
        assert(a == b);
        a.tick();
        b.tick();
    }
    std::cout << "PASSED: test_determinism\n";
}

void test_render_is_idempotent() {
    universeT u;
    for (int gen = 0; gen < 5; gen++) {
        const std::string first = u.render();
        const std::string second = u.render();
        assert(first == second);
        u.tick();
    }
    std::cout << "PASSED: test_render_is_idempotent\n";
}

void test_render_layout() {
    // i: 0 1 2 3 | 4 5 6 7
    //    o . o . | o . o o
    std::optional<universeT> u = universeT::create({.x = 4, .y = 2});
    assert(u.has_value());
    assert(u->render(ascii_glyphs) == "o.o.\no.oo\n");
    assert(u->render() == "◼◻◼◻\n◼◻◼◼\n");

    universeT big;
    const std::string text = big.render();
    const std::string glyph = "◼";
    assert(text.size() == 64 * (64 * glyph.size() + 1));
    assert(text.starts_with("◼◻◼◻◼◻◼◼"));
    assert(text.back() == '\n');
    std::cout << "PASSED: test_render_layout\n";
}

void test_neighbor_count_bound() {
    universeT u;
    for (int gen = 0; gen < 4; gen++) {
        for (int row = 0; row < u.height(); row++) {
            for (int col = 0; col < u.width(); col++) {
                const int n = u.live_neighbor_count(row, col);
                assert(n >= 0 && n <= 8);
            }
        }
        u.tick();
    }

    universeT full = make_empty({.x = 6, .y = 6});
    fill(full.write_only(), 1);
    assert(full.live_neighbor_count(0, 0) == 8);
    assert(full.live_neighbor_count(3, 2) == 8);
    std::cout << "PASSED: test_neighbor_count_bound\n";
}

void test_toroidal_wraparound() {
    universeT u = make_empty({.x = 5, .y = 4});
    u.write_only().at(0, 0) = true; // (row 0, col 0)
    u.write_only().at(4, 3) = true; // (row 3, col 4)
    assert(u.live_neighbor_count(0, 0) == 1);
    assert(u.live_neighbor_count(3, 4) == 1);
    // Across a single edge.
    assert(u.live_neighbor_count(0, 4) == 2);
    assert(u.live_neighbor_count(3, 0) == 2);
    assert(u.live_neighbor_count(2, 2) == 0);
    std::cout << "PASSED: test_toroidal_wraparound\n";
}

void test_reset() {
    universeT u;
    const universeT fresh;
    for (int i = 0; i < 7; i++) {
        u.tick();
    }
    assert(u.gen() == 7);
    assert(!(u == fresh));
    u.reset();
    assert(u.gen() == 0);
    assert(u == fresh);
    assert(u.render() == fresh.render());
    std::cout << "PASSED: test_reset\n";
}

void test_snapshot_is_independent() {
    universeT u;
    const universeT snapshot = u;
    u.tick();
    assert(!(u == snapshot));
    assert(snapshot == universeT());

    universeT later = snapshot;
    later.tick();
    assert(later == u);
    std::cout << "PASSED: test_snapshot_is_independent\n";
}

int main() {
    test_default_size();
    test_default_seed();
    test_create_rejects_degenerate_size();
    test_cell_count_is_conserved();
    test_determinism();
    test_render_is_idempotent();
    test_render_layout();
    test_neighbor_count_bound();
    test_toroidal_wraparound();
    test_reset();
    test_snapshot_is_independent();

    std::cout << "\nAll universe tests passed!\n";
    return 0;
}
