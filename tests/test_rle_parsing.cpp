#include <cassert>
#include <iostream>
#include "../src/tile.hpp"

using namespace lifebox;

// Parse `rle` into a freshly sized tile; empty if there is nothing to place.
tileT parse(std::string_view rle) {
    tileT tile;
    parse_rle(rle, [&](long long w, long long h) {
        tile = tileT({.x = int(w), .y = int(h)});
        return std::optional{tile.data()};
    });
    return tile;
}

void test_plain_pattern() {
    const tileT blinker = parse("3o!");
    assert(blinker.size() == (vecT{3, 1}));
    assert(count(blinker.data()) == 3);

    const tileT glider = parse("bo$2bo$3o!");
    assert(glider.size() == (vecT{3, 3}));
    assert(glider.data().at(1, 0) && glider.data().at(2, 1));
    assert(glider.data().at(0, 2) && glider.data().at(1, 2) && glider.data().at(2, 2));
    assert(count(glider.data()) == 5);
    std::cout << "PASSED: test_plain_pattern\n";
}

// Lines starting with '#' and the 'x = ...' header are skipped.
void test_skips_header_and_comments() {
    const tileT block = parse("#C Comment line 1\n#N Block\nx = 2, y = 2, rule = B3/S23\n2o$2o!");
    assert(block.size() == (vecT{2, 2}));
    assert(count(block.data()) == 4);
    std::cout << "PASSED: test_skips_header_and_comments\n";
}

void test_run_counts_and_blank_rows() {
    // Rows 0 and 2 hold cells; row 1 is blank ("2$").
    const tileT tile = parse("o3bo2$5o!");
    assert(tile.size() == (vecT{5, 3}));
    assert(tile.data().at(0, 0) && tile.data().at(4, 0));
    assert(!tile.data().at(2, 0));
    assert(count(tile.data().clip({0, 1}, {5, 1})) == 0);
    assert(count(tile.data().clip({0, 2}, {5, 1})) == 5);
    std::cout << "PASSED: test_run_counts_and_blank_rows\n";
}

// Whitespace and line breaks may appear between runs; anything after '!' is ignored.
void test_whitespace_and_terminator() {
    const tileT tile = parse("2o\r\n b\n o!\n3o$3o!");
    assert(tile.size() == (vecT{4, 1}));
    assert(tile.data().at(0, 0) && tile.data().at(1, 0));
    assert(!tile.data().at(2, 0) && tile.data().at(3, 0));
    std::cout << "PASSED: test_whitespace_and_terminator\n";
}

void test_empty_pattern() {
    assert(parse("!").empty());
    assert(parse("").empty());
    assert(parse("#C nothing\n").empty());
    std::cout << "PASSED: test_empty_pattern\n";
}

int main() {
    test_plain_pattern();
    test_skips_header_and_comments();
    test_run_counts_and_blank_rows();
    test_whitespace_and_terminator();
    test_empty_pattern();

    std::cout << "\nAll RLE parsing tests passed!\n";
    return 0;
}
