#pragma once

#include "fbtrie_edit_search.hpp"
#include "fbtrie_support.hpp"
#include <ostream>
#include <span>

namespace fbtrie {

// ============================================================================
// char_trie -- byte trie with terminator edges, nodes in one arena
//
// Every stored word is its bytes followed by TERMINATOR. Node 0 is the
// root. Children are kept in insertion order or sorted by unsigned byte,
// chosen at construction.
// ============================================================================

class char_trie {
public:
    using size_type = std::size_t;
    using node_id   = uint32_t;

    static constexpr node_id ROOT = 0;

    struct edge {
        char    symbol;
        node_id child;
    };

private:
    struct node {
        std::vector<edge> edges;
    };

    std::vector<node> nodes_{};
    size_type         size_{};
    size_type         max_length_{};
    child_order       order_;

    static bool symbol_less(char a, char b) noexcept {
        return static_cast<uint8_t>(a) < static_cast<uint8_t>(b);
    }

    // ------------------------------------------------------------------
    // Edge lookup / creation
    // ------------------------------------------------------------------

    const edge* find_edge(node_id n, char symbol) const noexcept {
        const std::vector<edge>& es = nodes_[n].edges;
        if (order_ == child_order::SORTED) {
            auto it = std::lower_bound(es.begin(), es.end(), symbol,
                [](const edge& e, char c) { return symbol_less(e.symbol, c); });
            return (it != es.end() && it->symbol == symbol) ? &*it : nullptr;
        }
        for (const edge& e : es)
            if (e.symbol == symbol) return &e;
        return nullptr;
    }

    node_id add_child(node_id parent, char symbol) {
        // Grow the arena first: it may move the parent
        node_id child = static_cast<node_id>(nodes_.size());
        nodes_.emplace_back();

        std::vector<edge>& es = nodes_[parent].edges;
        if (order_ == child_order::SORTED) {
            auto it = std::lower_bound(es.begin(), es.end(), symbol,
                [](const edge& e, char c) { return symbol_less(e.symbol, c); });
            es.insert(it, edge{symbol, child});
        } else {
            es.push_back(edge{symbol, child});
        }
        return child;
    }

    // ------------------------------------------------------------------
    // Recursive helpers
    // ------------------------------------------------------------------

    template <typename VISITOR>
    bool for_each_impl(node_id n, std::string& path, uint32_t distance,
                       VISITOR& visit) const {
        for (const edge& e : nodes_[n].edges) {
            if (e.symbol == TERMINATOR) {
                if (!visit(std::string_view(path), distance)) return false;
                continue;
            }
            path.push_back(e.symbol);
            bool keep = for_each_impl(e.child, path, distance, visit);
            path.pop_back();
            if (!keep) return false;
        }
        return true;
    }

    void print_impl(std::ostream& os, node_id n, std::string& path,
                    std::string indent) const {
        const std::vector<edge>& es = nodes_[n].edges;
        if (es.size() > 1) {
            os << indent << path << "/\n";
            indent.push_back(' ');
        }
        for (const edge& e : es) {
            if (e.symbol == TERMINATOR) {
                os << indent << path << '\n';
                continue;
            }
            path.push_back(e.symbol);
            print_impl(os, e.child, path, indent);
            path.pop_back();
        }
    }

public:
    // ------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------

    explicit char_trie(child_order order = child_order::INSERTION)
        : order_(order) {
        nodes_.emplace_back();
    }

    char_trie(const char_trie&) = default;
    char_trie& operator=(const char_trie&) = default;
    char_trie(char_trie&&) noexcept = default;
    char_trie& operator=(char_trie&&) noexcept = default;

    // ------------------------------------------------------------------
    // Capacity
    // ------------------------------------------------------------------

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] size_type node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] child_order order() const noexcept { return order_; }

    // Length of the longest stored word, 0 when empty.
    [[nodiscard]] size_type max_length() const noexcept { return max_length_; }

    [[nodiscard]] size_type memory_usage() const noexcept {
        size_type total = sizeof(*this) + nodes_.capacity() * sizeof(node);
        for (const node& n : nodes_)
            total += n.edges.capacity() * sizeof(edge);
        return total;
    }

    // ------------------------------------------------------------------
    // Structure access (used by edit_search)
    // ------------------------------------------------------------------

    [[nodiscard]] std::span<const edge> edges(node_id n) const noexcept {
        return nodes_[n].edges;
    }

    // ------------------------------------------------------------------
    // Modifiers
    // ------------------------------------------------------------------

    // Returns false if the word was already stored. Throws
    // invalid_word_error, leaving the trie untouched, if the word
    // contains TERMINATOR.
    bool insert(std::string_view word) {
        validate_word(word);

        node_id n = ROOT;
        for (char c : word) {
            const edge* e = find_edge(n, c);
            n = e ? e->child : add_child(n, c);
        }
        if (find_edge(n, TERMINATOR)) return false;
        add_child(n, TERMINATOR);
        ++size_;
        if (word.size() > max_length_) max_length_ = word.size();
        return true;
    }

    void clear() {
        nodes_.clear();
        nodes_.emplace_back();
        size_ = 0;
        max_length_ = 0;
    }

    // ------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------

    [[nodiscard]] bool contains(std::string_view word) const noexcept {
        if (word.find(TERMINATOR) != std::string_view::npos) return false;
        node_id n = ROOT;
        for (char c : word) {
            const edge* e = find_edge(n, c);
            if (!e) return false;
            n = e->child;
        }
        return find_edge(n, TERMINATOR) != nullptr;
    }

    // ------------------------------------------------------------------
    // Enumeration
    //
    // Reports path + every word below n, all with the given distance.
    // path is restored on return. Returns false if the visitor stopped.
    // ------------------------------------------------------------------

    template <typename VISITOR>
    bool for_each_word(node_id n, std::string& path, uint32_t distance,
                       VISITOR&& visit) const {
        return for_each_impl(n, path, distance, visit);
    }

    template <typename VISITOR>
    bool for_each_word(VISITOR&& visit) const {
        std::string path;
        return for_each_impl(ROOT, path, 0, visit);
    }

    // ------------------------------------------------------------------
    // Fuzzy search -- every word within k edits of query
    // ------------------------------------------------------------------

    template <match_visitor VISITOR>
    bool fuzzy(std::string_view query, uint32_t k, VISITOR&& visit,
               search_mode mode = search_mode::WHOLE_WORD,
               search_stats* stats = nullptr) const {
        edit_search<char_trie> search(*this, query,
                                      search_budget::constant(k), mode);
        bool keep = search.run(visit);
        if (stats) *stats += search.stats();
        return keep;
    }

    [[nodiscard]] std::vector<match>
    fuzzy(std::string_view query, uint32_t k,
          search_mode mode = search_mode::WHOLE_WORD) const {
        std::vector<match> found;
        fuzzy(query, k, [&](std::string_view word, uint32_t d) {
            found.push_back(match{std::string(word), d});
            return true;
        }, mode);
        return found;
    }

    // ------------------------------------------------------------------
    // Debug dump
    // ------------------------------------------------------------------

    void print(std::ostream& os) const {
        std::string path;
        print_impl(os, ROOT, path, std::string());
    }
};

} // namespace fbtrie
