#include "fbtrie_char_trie.hpp"
#include "fbtrie_edit_search.hpp"
#include <cassert>
#include <iostream>

using namespace fbtrie;

static char_trie make_trie(std::initializer_list<const char*> words,
                           child_order order = child_order::INSERTION) {
    char_trie t(order);
    for (const char* w : words) t.insert(w);
    return t;
}

static std::vector<match> run_search(const char_trie& t, std::string_view q,
                                     search_budget b,
                                     search_mode mode = search_mode::WHOLE_WORD) {
    edit_search<char_trie> s(t, q, b, mode);
    std::vector<match> out;
    bool done = s.run([&](std::string_view w, uint32_t d) {
        out.push_back(match{std::string(w), d});
        return true;
    });
    assert(done);
    return out;
}

template <typename V>
concept runnable = requires(edit_search<char_trie>& s, V v) { s.run(v); };

using word_visitor = bool (*)(std::string_view, uint32_t);

void test_visitor_constraint() {
    static_assert(runnable<word_visitor>);
    static_assert(!runnable<int>);
    static_assert(!runnable<bool (*)(int)>);
    static_assert(!runnable<void (*)(std::string_view)>);
    std::cout << "  visitor constraint: PASS\n";
}

void test_cat_scenario() {
    auto t = make_trie({"cat", "cats", "bat", "rat"});
    auto got = collapse_matches(t.fuzzy("cat", 1));
    std::vector<match> expect = {{"cat", 0}, {"bat", 1}, {"cats", 1}, {"rat", 1}};
    assert(got == expect);

    // No duplicates from a single trie
    assert(t.fuzzy("cat", 1).size() == 4);
    std::cout << "  cat scenario: PASS\n";
}

void test_kitten_scenario() {
    auto t = make_trie({"kitten"});
    auto got = t.fuzzy("sitting", 3);
    assert(got.size() == 1);
    assert(got[0] == (match{"kitten", 3}));
    assert(t.fuzzy("sitting", 2).empty());
    std::cout << "  kitten scenario: PASS\n";
}

void test_exact_match() {
    auto t = make_trie({"abc", "abd", "ab"});
    auto got = t.fuzzy("abc", 0);
    assert(got.size() == 1 && got[0] == (match{"abc", 0}));
    assert(t.fuzzy("abx", 0).empty());
    got = t.fuzzy("ab", 0);
    assert(got.size() == 1 && got[0] == (match{"ab", 0}));
    std::cout << "  exact match: PASS\n";
}

void test_empty_query() {
    auto t = make_trie({"", "a", "ab", "abc"});
    auto got = collapse_matches(t.fuzzy("", 1));
    std::vector<match> expect = {{"", 0}, {"a", 1}};
    assert(got == expect);

    got = collapse_matches(t.fuzzy("", 0));
    assert(got.size() == 1 && got[0] == (match{"", 0}));
    std::cout << "  empty query: PASS\n";
}

void test_depth_boundary() {
    // Longest possible match has query + k symbols
    auto t = make_trie({"abc", "abcd", "aaaaaaaaaaaaaaaaaaaa"});
    auto got = t.fuzzy("a", 2);
    assert(got.size() == 1);
    assert(got[0] == (match{"abc", 2}));

    auto t2 = make_trie({"ab", "x"});
    assert(t2.fuzzy("abcdefgh", 1).empty());
    got = t2.fuzzy("abcdefgh", 6);
    assert(got.size() == 1 && got[0] == (match{"ab", 6}));
    std::cout << "  depth boundary: PASS\n";
}

void test_distances_exact() {
    auto t = make_trie({"flaw", "lawn", "flown", "law"});
    auto got = collapse_matches(t.fuzzy("flaw", 2));
    std::vector<match> expect = {{"flaw", 0}, {"law", 1}, {"flown", 2}, {"lawn", 2}};
    assert(got == expect);
    std::cout << "  distances exact: PASS\n";
}

void test_prefix_mode() {
    auto t = make_trie({"car", "cart", "care", "carbon", "cat", "dog"},
                       child_order::SORTED);

    auto got = run_search(t, "car", search_budget::constant(0), search_mode::PREFIX);
    std::vector<match> expect = {{"car", 0}, {"carbon", 0}, {"care", 0}, {"cart", 0}};
    assert(got == expect);

    // Completions carry the distance of the matched prefix
    got = collapse_matches(t.fuzzy("cor", 1, search_mode::PREFIX));
    expect = {{"car", 1}, {"carbon", 1}, {"care", 1}, {"cart", 1}};
    assert(got == expect);

    // Empty prefix completes to the whole dictionary
    got = t.fuzzy("", 0, search_mode::PREFIX);
    assert(got.size() == 6);

    // Words shorter than the query still need a whole-word match
    auto t2 = make_trie({"ca", "cab"});
    got = collapse_matches(t2.fuzzy("cab", 1, search_mode::PREFIX));
    expect = {{"cab", 0}, {"ca", 1}};
    assert(got == expect);
    std::cout << "  prefix mode: PASS\n";
}

void test_early_stop() {
    char_trie t(child_order::SORTED);
    for (char a = 'a'; a <= 'z'; ++a)
        for (char b = 'a'; b <= 'z'; ++b)
            t.insert(std::string{a, b, 'x'});

    search_stats full{};
    std::size_t all = 0;
    bool finished = t.fuzzy("aax", 1, [&](std::string_view, uint32_t) {
        ++all;
        return true;
    }, search_mode::WHOLE_WORD, &full);
    assert(finished);
    assert(all == 51);
    assert(full.matches == 51);

    search_stats partial{};
    std::size_t seen = 0;
    bool done = t.fuzzy("aax", 1, [&](std::string_view w, uint32_t d) {
        ++seen;
        assert(w == "aax" && d == 0);
        return false;
    }, search_mode::WHOLE_WORD, &partial);
    assert(!done);
    assert(seen == 1);
    assert(partial.nodes_visited < full.nodes_visited);
    std::cout << "  early stop: PASS\n";
}

void test_pruning_stats() {
    char_trie t;
    for (const char* w : {"apple", "apply", "zebra", "zero", "quartz"}) t.insert(w);
    edit_search<char_trie> s(t, "apple", search_budget::constant(1));
    std::size_t n = 0;
    s.run([&](std::string_view, uint32_t) { ++n; return true; });
    assert(n == 2);
    assert(s.stats().matches == 2);
    assert(s.stats().rows_pruned >= 2);  // "ze" and "qu"
    assert(s.stats().rows_computed > s.stats().rows_pruned);

    // Running again resets the counters
    search_stats first = s.stats();
    s.run([](std::string_view, uint32_t) { return true; });
    assert(s.stats().nodes_visited == first.nodes_visited);
    std::cout << "  pruning stats: PASS\n";
}

void test_two_phase_budget() {
    auto t = make_trie({"kitten", "sitten"}, child_order::SORTED);

    // Reduced budget 0 on "sit": kitten is cut at depth 1,
    // sitten relaxes to the full budget after "sit"
    auto got = run_search(t, "sitting", search_budget::two_phase(0, 3, 3));
    assert(got.size() == 1);
    assert(got[0] == (match{"sitten", 2}));

    // With first == full it behaves like the constant budget
    got = collapse_matches(run_search(t, "sitting", search_budget::two_phase(3, 3, 3)));
    auto plain = collapse_matches(run_search(t, "sitting", search_budget::constant(3)));
    assert(got == plain);
    assert(got.size() == 2);
    std::cout << "  two-phase budget: PASS\n";
}

void test_huge_budget() {
    auto t = make_trie({"a", "bc", ""}, child_order::SORTED);

    // Budget far beyond any stored word: the table is sized by the trie
    edit_search<char_trie> s(t, "", search_budget::constant(UINT32_MAX));
    assert(s.table().rows() == 3);

    auto got = collapse_matches(run_search(t, "", search_budget::constant(UINT32_MAX)));
    assert(got.size() == 3);
    assert(got[0] == (match{"", 0}));
    assert(got[1] == (match{"a", 1}));
    assert(got[2] == (match{"bc", 2}));

    got = collapse_matches(run_search(t, "ab", search_budget::constant(2000000000u)));
    assert(got.size() == 3);
    assert(got[0] == (match{"a", 1}));
    assert(got[1] == (match{"", 2}));
    assert(got[2] == (match{"bc", 2}));

    got = collapse_matches(run_search(t, "ab",
        search_budget::two_phase(UINT32_MAX / 2, UINT32_MAX, 1)));
    assert(got.size() == 3);
    std::cout << "  huge budget: PASS\n";
}

int main() {
    std::cout << "fbtrie_edit_search tests:\n";
    test_visitor_constraint();
    test_cat_scenario();
    test_kitten_scenario();
    test_exact_match();
    test_empty_query();
    test_depth_boundary();
    test_distances_exact();
    test_prefix_mode();
    test_early_stop();
    test_pruning_stats();
    test_two_phase_budget();
    test_huge_budget();
    std::cout << "ALL PASSED\n";
    return 0;
}
