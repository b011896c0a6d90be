#include "fbtrie.hpp"
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace fbtrie;

// Plain full-table Levenshtein, independent of dp_table
static uint32_t levenshtein(std::string_view a, std::string_view b) {
    std::vector<std::vector<uint32_t>> d(a.size() + 1,
                                         std::vector<uint32_t>(b.size() + 1));
    for (size_t i = 0; i <= a.size(); ++i) d[i][0] = static_cast<uint32_t>(i);
    for (size_t j = 0; j <= b.size(); ++j) d[0][j] = static_cast<uint32_t>(j);
    for (size_t i = 1; i <= a.size(); ++i)
        for (size_t j = 1; j <= b.size(); ++j)
            d[i][j] = std::min({d[i - 1][j] + 1, d[i][j - 1] + 1,
                                d[i - 1][j - 1] + (a[i - 1] != b[j - 1] ? 1u : 0u)});
    return d[a.size()][b.size()];
}

static std::vector<match> brute_force(const std::vector<std::string>& dict,
                                      std::string_view q, uint32_t k) {
    std::vector<match> out;
    for (const auto& w : dict) {
        uint32_t d = levenshtein(w, q);
        if (d <= k) out.push_back(match{w, d});
    }
    return collapse_matches(out);
}

static std::vector<match> brute_force_prefix(const std::vector<std::string>& dict,
                                             std::string_view q, uint32_t k) {
    std::vector<match> out;
    for (const auto& w : dict) {
        std::string_view head(w);
        if (head.size() >= q.size()) head = head.substr(0, q.size());
        uint32_t d = levenshtein(head, q);
        if (d <= k) out.push_back(match{w, d});
    }
    return collapse_matches(out);
}

static std::string random_word(std::mt19937& rng, const std::string& alphabet,
                               int max_len) {
    int len = static_cast<int>(rng() % (max_len + 1));
    std::string s;
    for (int i = 0; i < len; ++i)
        s += alphabet[rng() % alphabet.size()];
    return s;
}

static bool subset_of(const std::vector<match>& small,
                      const std::vector<match>& big) {
    std::set<std::pair<std::string, uint32_t>> b;
    for (const auto& m : big) b.emplace(m.word, m.distance);
    for (const auto& m : small)
        if (!b.count({m.word, m.distance})) return false;
    return true;
}

int main() {
    std::mt19937 rng(42);
    const std::string alphabets[] = {"ab", "abc", "abcdef"};

    // Test 1: both structures agree with brute force
    std::cout << "Test 1: brute force agreement (small alphabets)...\n";
    int fail1 = 0, checks1 = 0;
    for (int round = 0; round < 150; ++round) {
        const std::string& alpha = alphabets[round % 3];
        std::vector<std::string> dict;
        char_trie plain;
        char_trie sorted(child_order::SORTED);
        fb_trie fb;
        int count = 1 + static_cast<int>(rng() % 40);
        for (int i = 0; i < count; ++i) {
            std::string w = random_word(rng, alpha, 7);
            dict.push_back(w);
            plain.insert(w);
            sorted.insert(w);
            fb.insert(w);
        }
        for (int qi = 0; qi < 10; ++qi) {
            std::string q = random_word(rng, alpha, 7);
            for (uint32_t k = 0; k <= 4; ++k) {
                auto expect = brute_force(dict, q, k);
                auto a = plain.fuzzy(q, k);
                auto b = collapse_matches(sorted.fuzzy(q, k));
                auto c = collapse_matches(fb.fuzzy(q, k));
                ++checks1;
                // One trie reports each word at most once
                if (a.size() != expect.size()) ++fail1;
                else if (collapse_matches(a) != expect) ++fail1;
                else if (b != expect || c != expect) ++fail1;
            }
        }
    }
    std::cout << "  " << (fail1 == 0 ? "PASS" : "FAIL") << " (" << fail1
              << "/" << checks1 << " failures)\n";

    // Test 2: result set grows with k, distances unchanged
    std::cout << "Test 2: monotonic in k...\n";
    int fail2 = 0;
    for (int round = 0; round < 50; ++round) {
        fb_trie fb;
        char_trie plain;
        for (int i = 0; i < 30; ++i) {
            std::string w = random_word(rng, "abcd", 8);
            fb.insert(w);
            plain.insert(w);
        }
        std::string q = random_word(rng, "abcd", 8);
        for (uint32_t k = 0; k < 4; ++k) {
            if (!subset_of(collapse_matches(fb.fuzzy(q, k)),
                           collapse_matches(fb.fuzzy(q, k + 1)))) ++fail2;
            if (!subset_of(plain.fuzzy(q, k), plain.fuzzy(q, k + 1))) ++fail2;
        }
    }
    std::cout << "  " << (fail2 == 0 ? "PASS" : "FAIL") << " (" << fail2 << " failures)\n";

    // Test 3: every stored word finds itself at distance 0, nothing else
    std::cout << "Test 3: self match at k = 0...\n";
    int fail3 = 0;
    {
        fb_trie fb;
        std::vector<std::string> words;
        std::set<std::string> seen;
        for (int i = 0; i < 2000; ++i) {
            std::string w = random_word(rng, "abcdefghijklmnopqrstuvwxyz", 12);
            if (seen.insert(w).second) words.push_back(w);
            fb.insert(w);
        }
        for (const auto& w : words) {
            auto got = collapse_matches(fb.fuzzy(w, 0));
            if (got.size() != 1 || got[0].word != w || got[0].distance != 0) ++fail3;
        }
        // Absent words have no exact match
        for (int i = 0; i < 500; ++i) {
            std::string q = random_word(rng, "abcdefghijklmnopqrstuvwxyz", 12);
            bool stored = seen.count(q) != 0;
            if (fb.fuzzy(q, 0).empty() == stored) ++fail3;
        }
    }
    std::cout << "  " << (fail3 == 0 ? "PASS" : "FAIL") << " (" << fail3 << " failures)\n";

    // Test 4: repeat inserts change nothing
    std::cout << "Test 4: idempotent insertion...\n";
    int fail4 = 0;
    for (int round = 0; round < 30; ++round) {
        fb_trie once, twice;
        char_trie plain_once, plain_twice;
        for (int i = 0; i < 25; ++i) {
            std::string w = random_word(rng, "abc", 6);
            once.insert(w);
            twice.insert(w);
            twice.insert(w);
            plain_once.insert(w);
            plain_twice.insert(w);
            plain_twice.insert(w);
        }
        if (once.size() != twice.size()) ++fail4;
        if (plain_once.node_count() != plain_twice.node_count()) ++fail4;
        std::string q = random_word(rng, "abc", 6);
        for (uint32_t k = 0; k <= 3; ++k) {
            if (once.fuzzy(q, k) != twice.fuzzy(q, k)) ++fail4;
            if (plain_once.fuzzy(q, k) != plain_twice.fuzzy(q, k)) ++fail4;
        }
    }
    std::cout << "  " << (fail4 == 0 ? "PASS" : "FAIL") << " (" << fail4 << " failures)\n";

    // Test 5: prefix mode against brute force on the query-length head
    std::cout << "Test 5: prefix mode...\n";
    int fail5 = 0;
    for (int round = 0; round < 60; ++round) {
        std::vector<std::string> dict;
        char_trie plain;
        for (int i = 0; i < 30; ++i) {
            std::string w = random_word(rng, "abc", 8);
            dict.push_back(w);
            plain.insert(w);
        }
        std::string q = random_word(rng, "abc", 4);
        for (uint32_t k = 0; k <= 2; ++k) {
            auto got = collapse_matches(plain.fuzzy(q, k, search_mode::PREFIX));
            if (got != brute_force_prefix(dict, q, k)) ++fail5;
        }
    }
    std::cout << "  " << (fail5 == 0 ? "PASS" : "FAIL") << " (" << fail5 << " failures)\n";

    // Test 6: natural-language style words, larger budgets
    std::cout << "Test 6: FB-trie vs char_trie on longer words...\n";
    int fail6 = 0;
    {
        std::vector<std::string> dict;
        fb_trie fb;
        char_trie plain;
        for (int i = 0; i < 3000; ++i) {
            std::string w = random_word(rng, "aeioulnrst", 10);
            dict.push_back(w);
            fb.insert(w);
            plain.insert(w);
        }
        for (int qi = 0; qi < 40; ++qi) {
            std::string q = random_word(rng, "aeioulnrst", 10);
            for (uint32_t k = 1; k <= 3; ++k) {
                auto a = collapse_matches(fb.fuzzy(q, k));
                auto b = collapse_matches(plain.fuzzy(q, k));
                if (a != b) ++fail6;
            }
        }
    }
    std::cout << "  " << (fail6 == 0 ? "PASS" : "FAIL") << " (" << fail6 << " failures)\n";

    bool all_pass = (fail1 == 0 && fail2 == 0 && fail3 == 0 &&
                     fail4 == 0 && fail5 == 0 && fail6 == 0);
    std::cout << "\n" << (all_pass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!") << "\n";
    return all_pass ? 0 : 1;
}
