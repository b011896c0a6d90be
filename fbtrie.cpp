#include "fbtrie.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace fbtrie;

static fb_trie make_fb(std::initializer_list<const char*> words) {
    fb_trie t;
    for (const char* w : words) t.insert(w);
    return t;
}

void test_construction() {
    fb_trie t;
    assert(t.empty());
    assert(t.size() == 0);
    assert(t.forward().order() == child_order::SORTED);
    assert(t.backward().order() == child_order::SORTED);
    assert(t.fuzzy("anything", 3).empty());
    std::cout << "  construction: PASS\n";
}

void test_budgets() {
    static_assert(fb_trie::forward_budget(0) == 0);
    static_assert(fb_trie::forward_budget(1) == 0);
    static_assert(fb_trie::forward_budget(2) == 0);
    static_assert(fb_trie::forward_budget(3) == 1);
    static_assert(fb_trie::forward_budget(5) == 2);
    static_assert(fb_trie::backward_budget(0) == 0);
    static_assert(fb_trie::backward_budget(1) == 0);
    static_assert(fb_trie::backward_budget(2) == 1);
    static_assert(fb_trie::backward_budget(5) == 2);
    std::cout << "  budgets: PASS\n";
}

void test_insert_mirrors() {
    fb_trie t;
    assert(t.insert("abc"));
    assert(t.insert("abd"));
    assert(!t.insert("abc"));
    assert(t.size() == 2);
    assert(t.contains("abc"));
    assert(!t.contains("cba"));
    assert(t.forward().contains("abd"));
    assert(t.backward().contains("dba"));
    assert(t.backward().size() == 2);
    std::cout << "  insert mirrors: PASS\n";
}

void test_invalid_word() {
    fb_trie t;
    t.insert("fine");
    std::size_t fwd_nodes = t.forward().node_count();
    std::size_t bwd_nodes = t.backward().node_count();

    bool thrown = false;
    try {
        t.insert(std::string_view("fi\0ne", 5));
    } catch (const invalid_word_error& e) {
        thrown = true;
        assert(e.offset() == 2);
    }
    assert(thrown);
    assert(t.size() == 1);
    assert(t.forward().node_count() == fwd_nodes);
    assert(t.backward().node_count() == bwd_nodes);
    std::cout << "  invalid word: PASS\n";
}

void test_cat_scenario() {
    auto t = make_fb({"cat", "cats", "bat", "rat"});
    auto raw = t.fuzzy("cat", 1);

    // Forward pass: cat, cats. Backward pass: bat, cat, rat.
    std::vector<match> expect_raw = {
        {"cat", 0}, {"cats", 1}, {"bat", 1}, {"cat", 0}, {"rat", 1}};
    assert(raw == expect_raw);

    auto got = collapse_matches(raw);
    std::vector<match> expect = {{"cat", 0}, {"bat", 1}, {"cats", 1}, {"rat", 1}};
    assert(got == expect);
    std::cout << "  cat scenario: PASS\n";
}

void test_kitten_scenario() {
    auto t = make_fb({"kitten"});
    auto got = collapse_matches(t.fuzzy("sitting", 3));
    assert(got.size() == 1);
    assert(got[0] == (match{"kitten", 3}));
    assert(t.fuzzy("sitting", 2).empty());
    std::cout << "  kitten scenario: PASS\n";
}

void test_phase_split() {
    // Both edits in the first half: only the backward pass can see it
    {
        auto t = make_fb({"xycdef"});
        fb_stats s{};
        std::vector<match> got;
        t.fuzzy("abcdef", 2, [&](std::string_view w, uint32_t d) {
            got.push_back(match{std::string(w), d});
            return true;
        }, &s);
        assert(got.size() == 1);
        assert(got[0] == (match{"xycdef", 2}));
        assert(s.forward.matches == 0);
        assert(s.backward.matches == 1);
    }
    // Both edits in the second half: only the forward pass
    {
        auto t = make_fb({"abcdxy"});
        fb_stats s{};
        std::vector<match> got;
        t.fuzzy("abcdef", 2, [&](std::string_view w, uint32_t d) {
            got.push_back(match{std::string(w), d});
            return true;
        }, &s);
        assert(got.size() == 1);
        assert(got[0] == (match{"abcdxy", 2}));
        assert(s.forward.matches == 1);
        assert(s.backward.matches == 0);
    }
    std::cout << "  phase split: PASS\n";
}

void test_short_query() {
    auto t = make_fb({"s", "t", "st", "ts", "stt", ""});

    // One symbol: substitution, insertion and the empty word
    fb_stats s{};
    std::vector<match> raw;
    t.fuzzy("s", 1, [&](std::string_view w, uint32_t d) {
        raw.push_back(match{std::string(w), d});
        return true;
    }, &s);
    std::vector<match> expect = {{"s", 0}, {"", 1}, {"st", 1}, {"t", 1}, {"ts", 1}};
    assert(collapse_matches(raw) == expect);
    assert(raw.size() == expect.size());
    assert(s.backward.nodes_visited == 0);

    // Empty query: words up to k symbols
    auto got = collapse_matches(t.fuzzy("", 1));
    expect = {{"", 0}, {"s", 1}, {"t", 1}};
    assert(got == expect);
    std::cout << "  short query: PASS\n";
}

void test_exact_and_self() {
    auto t = make_fb({"alpha", "beta", "gamma", "delta", ""});
    for (const char* w : {"alpha", "beta", "gamma", "delta", ""}) {
        auto got = collapse_matches(t.fuzzy(w, 0));
        assert(got.size() == 1);
        assert(got[0] == (match{w, 0}));
    }
    assert(t.fuzzy("alphx", 0).empty());
    std::cout << "  exact and self: PASS\n";
}

void test_matches_plain_trie() {
    const char* words[] = {"street", "strait", "stream", "streets", "treat",
                           "strut", "sweet", "stet", "st", "eerts"};
    fb_trie fb;
    char_trie plain;
    for (const char* w : words) {
        fb.insert(w);
        plain.insert(w);
    }
    for (const char* q : {"street", "stret", "tseerts", "s", ""}) {
        for (uint32_t k = 0; k <= 4; ++k) {
            auto a = collapse_matches(fb.fuzzy(q, k));
            auto b = collapse_matches(plain.fuzzy(q, k));
            assert(a == b);
        }
    }
    std::cout << "  matches plain trie: PASS\n";
}

void test_early_stop() {
    auto t = make_fb({"cat", "cats", "bat", "rat"});
    fb_stats s{};
    int seen = 0;
    bool done = t.fuzzy("cat", 1, [&](std::string_view w, uint32_t) {
        ++seen;
        assert(w == "cat");
        return false;
    }, &s);
    assert(!done);
    assert(seen == 1);
    assert(s.backward.nodes_visited == 0);

    // Stop inside the backward pass: words arrive reversed back
    seen = 0;
    std::string last;
    done = t.fuzzy("cat", 1, [&](std::string_view w, uint32_t) {
        last = std::string(w);
        return ++seen < 3;
    });
    assert(!done);
    assert(seen == 3);
    assert(last == "bat");
    std::cout << "  early stop: PASS\n";
}

void test_print() {
    auto t = make_fb({"ab", "ac"});
    std::ostringstream os;
    t.print(os);
    assert(os.str() ==
           "a/\n"
           " ab\n"
           " ac\n"
           "/\n"
           " ba\n"
           " ca\n");
    std::cout << "  print: PASS\n";
}

void test_clear() {
    auto t = make_fb({"one", "two"});
    assert(t.memory_usage() > 0);
    t.clear();
    assert(t.empty());
    assert(t.forward().node_count() == 1);
    assert(t.backward().node_count() == 1);
    assert(t.fuzzy("one", 3).empty());
    std::cout << "  clear: PASS\n";
}

void test_huge_budget() {
    auto t = make_fb({"a", "bc", ""});

    auto got = collapse_matches(t.fuzzy("", UINT32_MAX));
    assert(got.size() == 3);
    assert(got[0] == (match{"", 0}));
    assert(got[1] == (match{"a", 1}));
    assert(got[2] == (match{"bc", 2}));

    got = collapse_matches(t.fuzzy("ab", 2000000000u));
    assert(got.size() == 3);
    assert(got[0] == (match{"a", 1}));
    assert(got[1] == (match{"", 2}));
    assert(got[2] == (match{"bc", 2}));

    got = collapse_matches(t.fuzzy("abcdef", UINT32_MAX));
    assert(got.size() == 3);

    fb_trie empty;
    assert(empty.fuzzy("ab", UINT32_MAX).empty());
    std::cout << "  huge budget: PASS\n";
}

int main() {
    std::cout << "fbtrie tests:\n";
    test_construction();
    test_budgets();
    test_insert_mirrors();
    test_invalid_word();
    test_cat_scenario();
    test_kitten_scenario();
    test_phase_split();
    test_short_query();
    test_exact_and_self();
    test_matches_plain_trie();
    test_early_stop();
    test_print();
    test_clear();
    test_huge_budget();
    std::cout << "ALL PASSED\n";
    return 0;
}
