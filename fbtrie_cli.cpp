#include "fbtrie.hpp"
#include <cctype>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>

using namespace fbtrie;

static int usage() {
    std::cerr << "usage: fbtrie_cli QUERY K [trie|fbtrie]\n"
              << "  reads the dictionary from stdin, one word per line\n";
    return 1;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

template <typename TRIE>
static int run(TRIE& trie, const char* name, std::string_view query, uint32_t k) {
    std::cerr << "Reading from stdin...\n";
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(std::cin, line)) {
        ++lineno;
        try {
            trie.insert(trim(line));
        } catch (const invalid_word_error& e) {
            std::cerr << "line " << lineno << ": skipped, " << e.what() << "\n";
        }
    }

    std::cerr << "Processing query " << query << " " << k << "\n";

    std::vector<match> result;
    auto start = std::chrono::high_resolution_clock::now();
    result = collapse_matches(trie.fuzzy(query, k));
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    for (const auto& m : result)
        std::cout << m.distance << " " << m.word << "\n";

    std::cerr << "RESULT: " << query << "~" << k << ": [" << result.size()
              << " found] in " << std::fixed << std::setprecision(4) << ms
              << "ms using [" << name << "]\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) return usage();

    std::string_view query = argv[1];

    std::string_view k_arg = argv[2];
    uint32_t k = 0;
    auto [ptr, ec] = std::from_chars(k_arg.data(), k_arg.data() + k_arg.size(), k);
    if (ec != std::errc() || ptr != k_arg.data() + k_arg.size()) {
        std::cerr << "K must be a non-negative integer: " << k_arg << "\n";
        return usage();
    }

    std::string type = "trie";
    if (argc == 4) {
        type = argv[3];
        for (char& c : type)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (type == "fbtrie") {
        fb_trie trie;
        return run(trie, "fb_trie", query, k);
    }
    if (type != "trie")
        std::cerr << "Unknown trie type. Using default 'trie'\n";
    char_trie trie;
    return run(trie, "char_trie", query, k);
}
