#pragma once

#include "fbtrie_char_trie.hpp"
#include "fbtrie_dp_table.hpp"
#include "fbtrie_edit_search.hpp"
#include "fbtrie_support.hpp"

namespace fbtrie {

// ============================================================================
// fb_trie -- forward/backward trie pair for fuzzy dictionary search
//
// The forward trie holds the words, the backward trie holds them reversed.
// A query of n symbols is split at n/2. The forward pass matches the first
// half under a reduced budget and relaxes to k once that half is within it;
// the backward pass does the same for the reversed second half. Any word
// within k edits has one half within its reduced budget, so the two passes
// together find every match while pruning the wide top levels early.
//
// Reduced budgets (one query per pass):
//   forward  k1 = (k - 1) / 2   (0 when k == 0)
//   backward k2 = k / 2
// k1 + k2 + 1 >= k, so either the first half is within k1 or the second
// half is within k2. Queries under two symbols have no first half to
// relax on and are searched in one constant-budget pass.
// ============================================================================

struct fb_stats {
    search_stats forward{};
    search_stats backward{};
};

class fb_trie {
public:
    using size_type = std::size_t;

private:
    char_trie forward_{child_order::SORTED};
    char_trie backward_{child_order::SORTED};

public:
    // ------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------

    fb_trie() = default;

    // ------------------------------------------------------------------
    // Capacity
    // ------------------------------------------------------------------

    [[nodiscard]] bool empty() const noexcept { return forward_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return forward_.size(); }
    [[nodiscard]] size_type memory_usage() const noexcept {
        return forward_.memory_usage() + backward_.memory_usage();
    }

    [[nodiscard]] const char_trie& forward() const noexcept { return forward_; }
    [[nodiscard]] const char_trie& backward() const noexcept { return backward_; }

    // ------------------------------------------------------------------
    // Budgets
    // ------------------------------------------------------------------

    static constexpr uint32_t forward_budget(uint32_t k) noexcept {
        return k == 0 ? 0 : (k - 1) / 2;
    }

    static constexpr uint32_t backward_budget(uint32_t k) noexcept {
        return k / 2;
    }

    // ------------------------------------------------------------------
    // Modifiers
    // ------------------------------------------------------------------

    bool insert(std::string_view word) {
        validate_word(word);
        bool added = forward_.insert(word);
        backward_.insert(reversed(word));
        return added;
    }

    void clear() {
        forward_.clear();
        backward_.clear();
    }

    // ------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------

    [[nodiscard]] bool contains(std::string_view word) const noexcept {
        return forward_.contains(word);
    }

    // ------------------------------------------------------------------
    // Fuzzy search
    //
    // Forward results first, then backward. Not deduplicated: a word may
    // be reported by both passes (see collapse_matches).
    // ------------------------------------------------------------------

    template <match_visitor VISITOR>
    bool fuzzy(std::string_view query, uint32_t k, VISITOR&& visit,
               fb_stats* stats = nullptr) const {
        const uint32_t n     = static_cast<uint32_t>(query.size());
        const uint32_t split = n / 2;

        // An empty first half never relaxes at depth 0, so "x" would miss
        // "y" at k == 1. Short queries get one plain pass instead.
        if (split == 0) {
            edit_search<char_trie> plain(forward_, query,
                                         search_budget::constant(k));
            bool keep = plain.run(visit);
            if (stats) stats->forward += plain.stats();
            return keep;
        }

        edit_search<char_trie> fwd(forward_, query,
            search_budget::two_phase(forward_budget(k), k, split));
        bool keep = fwd.run(visit);
        if (stats) stats->forward += fwd.stats();
        if (!keep) return false;

        std::string rquery = reversed(query);
        edit_search<char_trie> bwd(backward_, rquery,
            search_budget::two_phase(backward_budget(k), k, n - split));

        std::string word;
        keep = bwd.run([&](std::string_view rword, uint32_t d) {
            word.assign(rword.rbegin(), rword.rend());
            return visit(std::string_view(word), d);
        });
        if (stats) stats->backward += bwd.stats();
        return keep;
    }

    [[nodiscard]] std::vector<match> fuzzy(std::string_view query,
                                           uint32_t k) const {
        std::vector<match> found;
        fuzzy(query, k, [&](std::string_view word, uint32_t d) {
            found.push_back(match{std::string(word), d});
            return true;
        });
        return found;
    }

    // ------------------------------------------------------------------
    // Debug dump
    // ------------------------------------------------------------------

    void print(std::ostream& os) const {
        forward_.print(os);
        backward_.print(os);
    }
};

} // namespace fbtrie
