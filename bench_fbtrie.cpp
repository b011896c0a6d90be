#include "fbtrie.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

using namespace fbtrie;

// Dictionary-like words: English letter frequencies, lengths around 8.
// Dense neighbourhoods keep the fuzzy result sets non-trivial.
std::string random_word(std::mt19937& rng) {
    static const double freq[26] = {
        8.2, 1.5, 2.8, 4.3, 12.7, 2.2, 2.0, 6.1, 7.0, 0.2, 0.8, 4.0, 2.4,
        6.7, 7.5, 1.9, 0.1, 6.0, 6.3, 9.1, 2.8, 1.0, 2.4, 0.2, 2.0, 0.1};
    static std::discrete_distribution<> letter(std::begin(freq), std::end(freq));
    std::normal_distribution<> len_dist(8.0, 2.5);

    int len = std::clamp(static_cast<int>(len_dist(rng) + 0.5), 2, 16);
    std::string s;
    s.reserve(len);
    for (int i = 0; i < len; ++i)
        s += static_cast<char>('a' + letter(rng));
    return s;
}

// Query derived from a stored word with `edits` random edits
std::string mutate(std::mt19937& rng, std::string w, int edits) {
    static const char letters[] = "abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<> letter(0, 25);
    for (int e = 0; e < edits; ++e) {
        int op = static_cast<int>(rng() % 3);
        if (w.empty()) op = 0;
        size_t pos = w.empty() ? 0 : rng() % w.size();
        if (op == 0) w.insert(w.begin() + pos, letters[letter(rng)]);
        else if (op == 1) w.erase(pos, 1);
        else w[pos] = letters[letter(rng)];
    }
    return w;
}

template<typename F>
double time_ms(F&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

struct BenchResult {
    std::string name;
    double      insert_ms;
    double      query_ms;
    size_t      nodes_visited;
    size_t      found;
    size_t      memory_bytes;
};

BenchResult benchmark_trie(const std::vector<std::string>& words,
                           const std::vector<std::string>& queries,
                           uint32_t k, std::vector<std::vector<match>>& results) {
    char_trie trie;
    BenchResult r{"char_trie", 0, 0, 0, 0, 0};

    r.insert_ms = time_ms([&]() {
        for (const auto& w : words) trie.insert(w);
    });

    results.clear();
    search_stats stats{};
    r.query_ms = time_ms([&]() {
        for (const auto& q : queries) {
            std::vector<match> found;
            trie.fuzzy(q, k, [&](std::string_view w, uint32_t d) {
                found.push_back(match{std::string(w), d});
                return true;
            }, search_mode::WHOLE_WORD, &stats);
            results.push_back(collapse_matches(std::move(found)));
        }
    });

    r.nodes_visited = stats.nodes_visited;
    for (const auto& res : results) r.found += res.size();
    r.memory_bytes = trie.memory_usage();
    return r;
}

BenchResult benchmark_fb_trie(const std::vector<std::string>& words,
                              const std::vector<std::string>& queries,
                              uint32_t k, std::vector<std::vector<match>>& results) {
    fb_trie trie;
    BenchResult r{"fb_trie", 0, 0, 0, 0, 0};

    r.insert_ms = time_ms([&]() {
        for (const auto& w : words) trie.insert(w);
    });

    results.clear();
    fb_stats stats{};
    r.query_ms = time_ms([&]() {
        for (const auto& q : queries) {
            std::vector<match> found;
            trie.fuzzy(q, k, [&](std::string_view w, uint32_t d) {
                found.push_back(match{std::string(w), d});
                return true;
            }, &stats);
            results.push_back(collapse_matches(std::move(found)));
        }
    });

    r.nodes_visited = stats.forward.nodes_visited + stats.backward.nodes_visited;
    for (const auto& res : results) r.found += res.size();
    r.memory_bytes = trie.memory_usage();
    return r;
}

void print_result(const BenchResult& r) {
    std::cout << std::left << std::setw(12) << r.name
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(12) << r.insert_ms
              << std::setw(12) << r.query_ms
              << std::setw(14) << r.nodes_visited
              << std::setw(10) << r.found
              << std::setw(14) << r.memory_bytes << "\n";
}

int main() {
    constexpr int WORD_COUNT  = 100000;
    constexpr int QUERY_COUNT = 200;

    std::mt19937 rng(12345);
    std::vector<std::string> words;
    words.reserve(WORD_COUNT);
    for (int i = 0; i < WORD_COUNT; ++i)
        words.push_back(random_word(rng));

    std::cout << "fbtrie benchmark: " << WORD_COUNT << " words, "
              << QUERY_COUNT << " queries per budget\n";

    bool all_match = true;
    for (uint32_t k = 1; k <= 3; ++k) {
        std::vector<std::string> queries;
        for (int i = 0; i < QUERY_COUNT; ++i)
            queries.push_back(mutate(rng, words[rng() % words.size()],
                                     static_cast<int>(k)));

        std::cout << "\nk = " << k << "\n";
        std::cout << std::left << std::setw(12) << "structure"
                  << std::right << std::setw(12) << "insert ms"
                  << std::setw(12) << "query ms"
                  << std::setw(14) << "nodes"
                  << std::setw(10) << "found"
                  << std::setw(14) << "bytes" << "\n";

        std::vector<std::vector<match>> plain_results, fb_results;
        print_result(benchmark_trie(words, queries, k, plain_results));
        print_result(benchmark_fb_trie(words, queries, k, fb_results));

        bool same = plain_results == fb_results;
        all_match = all_match && same;
        std::cout << "  results " << (same ? "match" : "DIFFER") << "\n";
    }

    return all_match ? 0 : 1;
}
