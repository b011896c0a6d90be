#include "fbtrie_char_trie.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace fbtrie;

static std::vector<std::string> all_words(const char_trie& t) {
    std::vector<std::string> out;
    t.for_each_word([&](std::string_view w, uint32_t d) {
        assert(d == 0);
        out.emplace_back(w);
        return true;
    });
    return out;
}

void test_empty() {
    char_trie t;
    assert(t.empty());
    assert(t.size() == 0);
    assert(t.node_count() == 1);
    assert(t.edges(char_trie::ROOT).empty());
    assert(!t.contains(""));
    assert(all_words(t).empty());
    std::cout << "  empty: PASS\n";
}

void test_insert_contains() {
    char_trie t;
    assert(t.insert("cat"));
    assert(t.insert("cats"));
    assert(t.insert("bat"));
    assert(t.size() == 3);

    assert(t.contains("cat"));
    assert(t.contains("cats"));
    assert(t.contains("bat"));
    assert(!t.contains("ca"));
    assert(!t.contains("catsup"));
    assert(!t.contains(""));

    // root, c, a, t, $, s, $, b, a, t, $
    assert(t.node_count() == 11);
    std::cout << "  insert/contains: PASS\n";
}

void test_repeat_insert() {
    char_trie t;
    assert(t.insert("abc"));
    std::size_t nodes = t.node_count();
    assert(!t.insert("abc"));
    assert(t.size() == 1);
    assert(t.node_count() == nodes);

    // Prefix of a stored word is a new word
    assert(t.insert("ab"));
    assert(t.size() == 2);
    assert(t.node_count() == nodes + 1);
    std::cout << "  repeat insert: PASS\n";
}

void test_empty_word() {
    char_trie t;
    assert(t.insert(""));
    assert(t.contains(""));
    assert(t.size() == 1);
    auto words = all_words(t);
    assert(words.size() == 1 && words[0].empty());
    std::cout << "  empty word: PASS\n";
}

void test_invalid_word() {
    char_trie t;
    t.insert("ok");
    std::size_t nodes = t.node_count();

    bool thrown = false;
    try {
        t.insert(std::string_view("o\0k", 3));
    } catch (const invalid_word_error& e) {
        thrown = true;
        assert(e.offset() == 1);
    }
    assert(thrown);
    assert(t.size() == 1);
    assert(t.node_count() == nodes);
    assert(!t.contains(std::string_view("o\0k", 3)));
    std::cout << "  invalid word: PASS\n";
}

void test_insertion_order() {
    char_trie t(child_order::INSERTION);
    t.insert("zeta");
    t.insert("alpha");
    t.insert("mu");
    t.insert("al");
    auto words = all_words(t);
    // "al" ends below "alpha"'s a-l path, after its 'p' edge
    std::vector<std::string> expect = {"zeta", "alpha", "al", "mu"};
    assert(words == expect);
    std::cout << "  insertion order: PASS\n";
}

void test_sorted_order() {
    char_trie t(child_order::SORTED);
    assert(t.order() == child_order::SORTED);
    t.insert("zeta");
    t.insert("alpha");
    t.insert("mu");
    t.insert("al");
    t.insert("\xc3\xa9t\xc3\xa9");  // bytes >= 0x80 sort after ASCII
    auto words = all_words(t);
    std::vector<std::string> expect = {"al", "alpha", "mu", "zeta",
                                       "\xc3\xa9t\xc3\xa9"};
    assert(words == expect);

    // Terminator edge first
    auto es = t.edges(t.edges(t.edges(char_trie::ROOT)[0].child)[0].child);
    assert(es.size() == 2);
    assert(es[0].symbol == TERMINATOR);
    assert(es[1].symbol == 'p');
    std::cout << "  sorted order: PASS\n";
}

void test_for_each_word_prefix() {
    char_trie t(child_order::SORTED);
    t.insert("car");
    t.insert("cart");
    t.insert("care");
    t.insert("dog");

    // Walk to "car" by hand and enumerate below it
    char_trie::node_id n = char_trie::ROOT;
    for (char c : std::string_view("car")) {
        for (const auto& e : t.edges(n))
            if (e.symbol == c) { n = e.child; break; }
    }
    std::string path = "car";
    std::vector<match> got;
    bool done = t.for_each_word(n, path, 2, [&](std::string_view w, uint32_t d) {
        got.push_back(match{std::string(w), d});
        return true;
    });
    assert(done);
    assert(path == "car");
    assert(got.size() == 3);
    assert(got[0] == (match{"car", 2}));
    assert(got[1] == (match{"care", 2}));
    assert(got[2] == (match{"cart", 2}));
    std::cout << "  for_each_word below node: PASS\n";
}

void test_for_each_word_stop() {
    char_trie t(child_order::SORTED);
    for (const char* w : {"a", "b", "c", "d"}) t.insert(w);
    int seen = 0;
    bool done = t.for_each_word([&](std::string_view, uint32_t) {
        return ++seen < 2;
    });
    assert(!done);
    assert(seen == 2);
    std::cout << "  for_each_word stop: PASS\n";
}

void test_print() {
    char_trie t;
    t.insert("cat");
    t.insert("cats");
    t.insert("bat");
    std::ostringstream os;
    t.print(os);
    assert(os.str() ==
           "/\n"
           " cat/\n"
           "  cat\n"
           "  cats\n"
           " bat\n");
    std::cout << "  print: PASS\n";
}

void test_clear() {
    char_trie t;
    t.insert("one");
    t.insert("two");
    t.clear();
    assert(t.empty());
    assert(t.node_count() == 1);
    assert(!t.contains("one"));
    assert(t.insert("one"));
    std::cout << "  clear: PASS\n";
}

void test_memory_usage() {
    char_trie t;
    std::size_t before = t.memory_usage();
    for (int i = 0; i < 100; ++i) t.insert("word" + std::to_string(i));
    assert(t.memory_usage() > before);
    std::cout << "  memory_usage: PASS\n";
}

void test_max_length() {
    char_trie t;
    assert(t.max_length() == 0);
    t.insert("ab");
    t.insert("abcde");
    t.insert("");
    t.insert("xyz");
    assert(t.max_length() == 5);
    assert(!t.insert("abcde"));
    assert(t.max_length() == 5);
    t.clear();
    assert(t.max_length() == 0);
    std::cout << "  max_length: PASS\n";
}

int main() {
    std::cout << "fbtrie_char_trie tests:\n";
    test_empty();
    test_insert_contains();
    test_repeat_insert();
    test_empty_word();
    test_invalid_word();
    test_insertion_order();
    test_sorted_order();
    test_for_each_word_prefix();
    test_for_each_word_stop();
    test_print();
    test_clear();
    test_memory_usage();
    test_max_length();
    std::cout << "ALL PASSED\n";
    return 0;
}
