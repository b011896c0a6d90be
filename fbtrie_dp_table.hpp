#pragma once

#include "fbtrie_support.hpp"

namespace fbtrie {

// ============================================================================
// dp_table -- Levenshtein rows indexed by trie depth
//
// rows() x cols() cells in one flat buffer, cols() = query length + 1,
// rows() = min(query length + k, longest path) + 1.
// Row i holds the distances between the depth-i trie path and every query
// prefix. One instance per search; not safe to share between searches.
// ============================================================================

class dp_table {
    std::vector<uint32_t> cells_{};
    uint32_t rows_{};
    uint32_t cols_{};

public:
    static constexpr uint32_t MAX_DEPTH = UINT32_MAX - 1;

    dp_table() = default;

    dp_table(uint32_t query_len, uint32_t k, uint32_t max_depth = MAX_DEPTH) {
        reset(query_len, k, max_depth);
    }

    // Size for a query of query_len symbols under budget k and fill row 0.
    // Paths never exceed max_depth symbols, so rows beyond it are not kept.
    void reset(uint32_t query_len, uint32_t k, uint32_t max_depth = MAX_DEPTH) {
        uint64_t depth = std::min<uint64_t>(uint64_t(query_len) + k,
                                            std::min(max_depth, MAX_DEPTH));
        rows_ = static_cast<uint32_t>(depth) + 1;
        cols_ = query_len + 1;
        cells_.assign(std::size_t(rows_) * cols_, 0);
        for (uint32_t j = 0; j < cols_; ++j) cells_[j] = j;
    }

    [[nodiscard]] uint32_t rows() const noexcept { return rows_; }
    [[nodiscard]] uint32_t cols() const noexcept { return cols_; }

    [[nodiscard]] const uint32_t* row(uint32_t i) const noexcept {
        return cells_.data() + std::size_t(i) * cols_;
    }

    [[nodiscard]] uint32_t at(uint32_t i, uint32_t j) const noexcept {
        return row(i)[j];
    }

    // Distance between the depth-i path and the whole query.
    [[nodiscard]] uint32_t last(uint32_t i) const noexcept {
        return row(i)[cols_ - 1];
    }

    // ------------------------------------------------------------------
    // fill_row -- row i from row i-1 and the edge symbol; returns row min
    //
    // Requires 1 <= i < rows() and query.size() == cols() - 1.
    // ------------------------------------------------------------------

    uint32_t fill_row(uint32_t i, char symbol, std::string_view query) noexcept {
        const uint32_t* prev = row(i - 1);
        uint32_t* cur = cells_.data() + std::size_t(i) * cols_;

        cur[0] = i;
        uint32_t smallest = i;
        for (uint32_t j = 1; j < cols_; ++j) {
            uint32_t sub = prev[j - 1] + (symbol != query[j - 1] ? 1 : 0);
            uint32_t ins = prev[j] + 1;
            uint32_t del = cur[j - 1] + 1;
            uint32_t v = std::min(sub, std::min(ins, del));
            cur[j] = v;
            if (v < smallest) smallest = v;
        }
        return smallest;
    }

    [[nodiscard]] std::size_t memory_usage() const noexcept {
        return sizeof(*this) + cells_.capacity() * sizeof(uint32_t);
    }
};

} // namespace fbtrie
