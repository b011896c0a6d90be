#include "fbtrie_dp_table.hpp"
#include <cassert>
#include <iostream>

using namespace fbtrie;

void test_reset() {
    dp_table t(4, 2);
    assert(t.rows() == 7);
    assert(t.cols() == 5);
    for (uint32_t j = 0; j < t.cols(); ++j)
        assert(t.at(0, j) == j);

    t.reset(1, 0);
    assert(t.rows() == 2);
    assert(t.cols() == 2);
    assert(t.at(0, 0) == 0);
    assert(t.at(0, 1) == 1);
    std::cout << "  reset: PASS\n";
}

void test_fill_row() {
    std::string_view query = "sitting";
    dp_table t(7, 3);

    uint32_t m = t.fill_row(1, 'k', query);
    const uint32_t expect1[] = {1, 1, 2, 3, 4, 5, 6, 7};
    for (uint32_t j = 0; j < 8; ++j)
        assert(t.at(1, j) == expect1[j]);
    assert(m == 1);

    std::string_view cand = "kitten";
    for (uint32_t i = 1; i <= cand.size(); ++i)
        t.fill_row(i, cand[i - 1], query);
    assert(t.last(6) == 3);
    std::cout << "  fill_row: PASS\n";
}

void test_row_minimum() {
    // Row minimum is a lower bound for any extension of the path
    dp_table t(3, 2);
    assert(t.fill_row(1, 'x', "abc") == 1);
    assert(t.fill_row(2, 'y', "abc") == 2);
    assert(t.fill_row(3, 'z', "abc") == 3);

    assert(t.fill_row(1, 'a', "abc") == 0);
    assert(t.fill_row(2, 'b', "abc") == 0);
    assert(t.last(2) == 1);
    std::cout << "  row minimum: PASS\n";
}

void test_empty_query() {
    dp_table t(0, 2);
    assert(t.rows() == 3);
    assert(t.cols() == 1);
    assert(t.fill_row(1, 'a', "") == 1);
    assert(t.fill_row(2, 'b', "") == 2);
    assert(t.last(2) == 2);
    std::cout << "  empty query: PASS\n";
}

void test_sibling_overwrite() {
    // Rewriting row i for a sibling leaves row i-1 intact
    dp_table t(2, 1);
    t.fill_row(1, 'a', "ab");
    t.fill_row(2, 'b', "ab");
    assert(t.last(2) == 0);
    t.fill_row(2, 'x', "ab");
    assert(t.last(2) == 1);
    assert(t.at(1, 1) == 0);
    std::cout << "  sibling overwrite: PASS\n";
}

void test_depth_cap() {
    // Rows stop at the longest path, whatever the budget
    dp_table t(2, UINT32_MAX, 5);
    assert(t.rows() == 6);
    assert(t.cols() == 3);
    assert(t.at(0, 2) == 2);

    t.reset(3, 2, 100);
    assert(t.rows() == 6);

    t.reset(4, 2000000000u, 0);
    assert(t.rows() == 1);
    assert(t.last(0) == 4);
    std::cout << "  depth cap: PASS\n";
}

int main() {
    std::cout << "fbtrie_dp_table tests:\n";
    test_reset();
    test_fill_row();
    test_row_minimum();
    test_empty_query();
    test_sibling_overwrite();
    test_depth_cap();
    std::cout << "ALL PASSED\n";
    return 0;
}
