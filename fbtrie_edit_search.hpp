#pragma once

#include "fbtrie_dp_table.hpp"
#include "fbtrie_support.hpp"

namespace fbtrie {

// ============================================================================
// edit_search -- branch-and-bound Levenshtein walk of a trie
//
// Depth-first over TRIE, one DP row per edge taken. A subtree is abandoned
// as soon as every cell of its row exceeds the budget in effect. Words are
// reported to a visitor `bool(std::string_view word, uint32_t distance)`;
// returning false stops the walk before any further node is visited.
//
// TRIE must provide ROOT, node_id, edges(node) over {symbol, child},
// max_length() and for_each_word(node, path, distance, visitor).
// The table only holds rows for paths the trie can contain, so k may be
// any uint32_t.
//
// Owns its table and path buffer: one instance per query, single thread.
// ============================================================================

template <typename TRIE>
class edit_search {
public:
    using trie_type = TRIE;
    using node_id   = typename TRIE::node_id;

private:
    const TRIE&      trie_;
    std::string_view query_;
    search_budget    budget_;
    search_mode      mode_;
    dp_table         table_;
    std::string      path_{};
    search_stats     stats_{};

    [[nodiscard]] uint32_t query_len() const noexcept {
        return static_cast<uint32_t>(query_.size());
    }

    // ------------------------------------------------------------------
    // walk -- visit `node`, whose path has i-1 symbols
    //
    // Row i-1 is valid on entry. `relaxed` is false only during the
    // first phase of a two_phase budget.
    // ------------------------------------------------------------------

    template <typename VISITOR>
    bool walk(node_id node, uint32_t i, bool relaxed, VISITOR& visit) {
        ++stats_.nodes_visited;

        // Query consumed: everything below is a completion at this distance
        if (mode_ == search_mode::PREFIX && i > query_len()) {
            uint32_t d = table_.last(i - 1);
            if (d > budget_.full) return true;
            return trie_.for_each_word(node, path_, d,
                [&](std::string_view word, uint32_t dist) {
                    ++stats_.matches;
                    return visit(word, dist);
                });
        }

        const uint32_t limit = budget_.limit(relaxed);

        for (const auto& e : trie_.edges(node)) {
            if (e.symbol == TERMINATOR) {
                uint32_t d = table_.last(i - 1);
                if (d <= budget_.full) {
                    ++stats_.matches;
                    if (!visit(std::string_view(path_), d)) return false;
                }
                continue;
            }

            // No word longer than query + budget can be within budget
            if (i >= table_.rows()) continue;

            uint32_t smallest = table_.fill_row(i, e.symbol, query_);
            ++stats_.rows_computed;

            bool child_relaxed = relaxed;
            if (!relaxed && table_.at(i, budget_.split) <= budget_.first) {
                child_relaxed = true;
            } else if (smallest > limit) {
                ++stats_.rows_pruned;
                continue;
            }

            path_.push_back(e.symbol);
            bool keep = walk(e.child, i + 1, child_relaxed, visit);
            path_.pop_back();
            if (!keep) return false;
        }
        return true;
    }

public:
    edit_search(const TRIE& trie, std::string_view query, search_budget budget,
                search_mode mode = search_mode::WHOLE_WORD)
        : trie_(trie), query_(query), budget_(budget), mode_(mode),
          table_(static_cast<uint32_t>(query.size()), budget.full,
                 static_cast<uint32_t>(std::min<std::size_t>(
                     trie.max_length(), dp_table::MAX_DEPTH))) {
        path_.reserve(table_.rows());
    }

    edit_search(const edit_search&) = delete;
    edit_search& operator=(const edit_search&) = delete;

    // Returns false if the visitor stopped the walk.
    template <match_visitor VISITOR>
    bool run(VISITOR&& visit) {
        stats_ = {};
        path_.clear();
        return walk(TRIE::ROOT, 1, !budget_.relaxing, visit);
    }

    [[nodiscard]] const search_stats& stats() const noexcept { return stats_; }
    [[nodiscard]] const search_budget& budget() const noexcept { return budget_; }
    [[nodiscard]] search_mode mode() const noexcept { return mode_; }
    [[nodiscard]] const dp_table& table() const noexcept { return table_; }
};

} // namespace fbtrie
