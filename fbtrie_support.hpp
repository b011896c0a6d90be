#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace fbtrie {

// ============================================================================
// Forward declarations
// ============================================================================

class dp_table;
class char_trie;
class fb_trie;

template <typename TRIE>
class edit_search;

// ============================================================================
// Terminator
//
// Appended to every stored word. Must never occur inside a word.
// ============================================================================

inline constexpr char TERMINATOR = '\0';

// ============================================================================
// invalid_word_error -- word contains the terminator
// ============================================================================

class invalid_word_error : public std::invalid_argument {
    std::size_t offset_;

public:
    explicit invalid_word_error(std::size_t offset)
        : std::invalid_argument("fbtrie: word contains terminator at offset " +
                                std::to_string(offset)),
          offset_(offset) {}

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
};

inline void validate_word(std::string_view word) {
    std::size_t pos = word.find(TERMINATOR);
    if (pos != std::string_view::npos) throw invalid_word_error(pos);
}

// ============================================================================
// Options
// ============================================================================

enum class child_order : uint8_t {
    INSERTION,  // first-insertion order
    SORTED      // unsigned byte order, terminator first
};

enum class search_mode : uint8_t {
    WHOLE_WORD, // terminator must be reached within budget
    PREFIX      // query matched as a prefix, completions enumerated
};

// ============================================================================
// search_budget -- pruning strategy of an edit_search
//
// constant:  row minimum <= full at every depth.
// two_phase: row minimum <= first until column `split` is within `first`,
//            then row minimum <= full. Acceptance always uses full.
// ============================================================================

struct search_budget {
    uint32_t full  = 0;
    uint32_t first = 0;
    uint32_t split = 0;
    bool     relaxing = false;

    static constexpr search_budget constant(uint32_t k) noexcept {
        return {k, k, 0, false};
    }

    static constexpr search_budget two_phase(uint32_t first, uint32_t full,
                                             uint32_t split) noexcept {
        return {full, first < full ? first : full, split, true};
    }

    [[nodiscard]] constexpr uint32_t limit(bool relaxed) const noexcept {
        return relaxed ? full : first;
    }
};

// ============================================================================
// match -- one reported word
// ============================================================================

struct match {
    std::string word;
    uint32_t    distance = 0;

    bool operator==(const match&) const = default;

    bool operator<(const match& o) const noexcept {
        if (distance != o.distance) return distance < o.distance;
        return word < o.word;
    }
};

// Visitor of fuzzy results: bool(std::string_view word, uint32_t distance),
// false stops the search.
template <typename F>
concept match_visitor = std::is_invocable_r_v<bool, F&, std::string_view, uint32_t>;

// ============================================================================
// search_stats -- counters accumulated by one search
// ============================================================================

struct search_stats {
    std::size_t nodes_visited = 0;
    std::size_t rows_computed = 0;
    std::size_t rows_pruned   = 0;
    std::size_t matches       = 0;

    search_stats& operator+=(const search_stats& o) noexcept {
        nodes_visited += o.nodes_visited;
        rows_computed += o.rows_computed;
        rows_pruned   += o.rows_pruned;
        matches       += o.matches;
        return *this;
    }
};

// ============================================================================
// Helpers
// ============================================================================

inline std::string reversed(std::string_view s) {
    return std::string(s.rbegin(), s.rend());
}

// One entry per word at its minimum distance, sorted by (distance, word).
inline std::vector<match> collapse_matches(std::vector<match> found) {
    std::sort(found.begin(), found.end(),
              [](const match& a, const match& b) {
                  if (a.word != b.word) return a.word < b.word;
                  return a.distance < b.distance;
              });
    auto last = std::unique(found.begin(), found.end(),
                            [](const match& a, const match& b) {
                                return a.word == b.word;
                            });
    found.erase(last, found.end());
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace fbtrie
