#include "fbtrie_support.hpp"
#include <cassert>
#include <iostream>

using namespace fbtrie;

void test_validate_word() {
    validate_word("");
    validate_word("hello");

    bool thrown = false;
    try {
        validate_word(std::string_view("ab\0cd", 5));
    } catch (const invalid_word_error& e) {
        thrown = true;
        assert(e.offset() == 2);
        assert(std::string(e.what()).find("offset 2") != std::string::npos);
    }
    assert(thrown);

    // Catchable as the standard base
    thrown = false;
    try {
        validate_word(std::string_view("\0", 1));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "  validate_word: PASS\n";
}

void test_search_budget() {
    constexpr auto c = search_budget::constant(3);
    static_assert(c.full == 3 && c.first == 3 && !c.relaxing);
    static_assert(c.limit(true) == 3 && c.limit(false) == 3);

    constexpr auto t = search_budget::two_phase(1, 4, 5);
    static_assert(t.full == 4 && t.first == 1 && t.split == 5 && t.relaxing);
    static_assert(t.limit(false) == 1);
    static_assert(t.limit(true) == 4);

    // first never exceeds full
    constexpr auto clamped = search_budget::two_phase(7, 2, 1);
    static_assert(clamped.first == 2);
    std::cout << "  search_budget: PASS\n";
}

void test_match_order() {
    match a{"bat", 1};
    match b{"cat", 0};
    match c{"cats", 1};
    assert(b < a);
    assert(a < c);
    assert(!(a < a));
    assert(a == (match{"bat", 1}));
    assert(!(a == (match{"bat", 2})));
    std::cout << "  match order: PASS\n";
}

void test_collapse_matches() {
    std::vector<match> found = {
        {"rat", 1}, {"cat", 0}, {"bat", 1}, {"cat", 0},
        {"cats", 1}, {"rat", 2}, {"bat", 1},
    };
    auto out = collapse_matches(found);
    assert(out.size() == 4);
    assert(out[0] == (match{"cat", 0}));
    assert(out[1] == (match{"bat", 1}));
    assert(out[2] == (match{"cats", 1}));
    assert(out[3] == (match{"rat", 1}));

    assert(collapse_matches({}).empty());
    std::cout << "  collapse_matches: PASS\n";
}

void test_reversed() {
    assert(reversed("") == "");
    assert(reversed("a") == "a");
    assert(reversed("kitten") == "nettik");
    std::cout << "  reversed: PASS\n";
}

void test_search_stats() {
    search_stats s{1, 2, 3, 4};
    s += search_stats{10, 20, 30, 40};
    assert(s.nodes_visited == 11);
    assert(s.rows_computed == 22);
    assert(s.rows_pruned == 33);
    assert(s.matches == 44);
    std::cout << "  search_stats: PASS\n";
}

void test_match_visitor() {
    auto keep_going = [](std::string_view, uint32_t) { return true; };
    auto no_result  = [](std::string_view, uint32_t) {};
    auto word_only  = [](std::string_view) { return true; };
    static_assert(match_visitor<decltype(keep_going)>);
    static_assert(!match_visitor<decltype(no_result)>);
    static_assert(!match_visitor<decltype(word_only)>);
    static_assert(!match_visitor<search_mode>);
    std::cout << "  match_visitor: PASS\n";
}

int main() {
    std::cout << "fbtrie_support tests:\n";
    test_validate_word();
    test_search_budget();
    test_match_order();
    test_collapse_matches();
    test_reversed();
    test_search_stats();
    test_match_visitor();
    std::cout << "ALL PASSED\n";
    return 0;
}
