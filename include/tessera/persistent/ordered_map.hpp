#pragma once

/** \file ordered_map.hpp
 *  \brief Persistent ordered map (path-copying AVL tree).
 *
 * Nodes are immutable and shared through std::shared_ptr<const node>. A
 * mutation copies only the nodes on the path from the root to the touched
 * entry, so copying a map is O(1) and a copy never observes later mutations
 * of its source.
 *
 * Pointers and iterators into a map are invalidated by any mutation of that
 * map (the path nodes are replaced). Copies keep their own nodes alive.
 */

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace tessera::persistent {

template <class K, class V, class Compare = std::less<>>
class ordered_map {
    struct node;
    using node_ptr = std::shared_ptr<const node>;

    struct node {
        std::pair<K, V> entry;
        node_ptr left;
        node_ptr right;
        int height;

        node(std::pair<K, V> e, node_ptr l, node_ptr r)
            : entry(std::move(e)), left(std::move(l)), right(std::move(r)),
              height(1 + std::max(height_of(left), height_of(right))) {}
    };

public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<K, V>;

    static constexpr bool shallow_clonable = true;

    /** \brief In-order iterator. Holds the path of pending ancestors. */
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<K, V>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        const_iterator() = default;

        auto operator*() const -> reference { return stack_.back()->entry; }
        auto operator->() const -> pointer { return &stack_.back()->entry; }

        auto operator++() -> const_iterator& {
            const node* n = stack_.back();
            stack_.pop_back();
            push_left(n->right.get());
            return *this;
        }

        auto operator++(int) -> const_iterator {
            auto copy = *this;
            ++*this;
            return copy;
        }

        friend auto operator==(const const_iterator& a, const const_iterator& b) -> bool {
            if (a.stack_.empty() || b.stack_.empty()) return a.stack_.empty() == b.stack_.empty();
            return a.stack_.back() == b.stack_.back();
        }

    private:
        friend class ordered_map;

        void push_left(const node* n) {
            while (n != nullptr) {
                stack_.push_back(n);
                n = n->left.get();
            }
        }

        std::vector<const node*> stack_;
    };

    ordered_map() = default;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }

    void clear() noexcept {
        root_.reset();
        size_ = 0;
    }

    template <class Q>
    [[nodiscard]] auto find(const Q& k) const -> const V* {
        const node* n = root_.get();
        while (n != nullptr) {
            if (comp_(k, n->entry.first)) {
                n = n->left.get();
            } else if (comp_(n->entry.first, k)) {
                n = n->right.get();
            } else {
                return &n->entry.second;
            }
        }
        return nullptr;
    }

    template <class Q>
    [[nodiscard]] auto contains(const Q& k) const -> bool { return find(k) != nullptr; }

    /** \brief Insert or replace. Returns true when the key was new. */
    auto insert_or_assign(K k, V v) -> bool {
        bool inserted = false;
        root_ = insert_rec(root_, value_type(std::move(k), std::move(v)), comp_, inserted);
        if (inserted) ++size_;
        return inserted;
    }

    /** \brief Remove a key. Returns true when it was present. */
    template <class Q>
    auto erase(const Q& k) -> bool {
        bool erased = false;
        auto next = erase_rec(root_, k, comp_, erased);
        if (erased) {
            root_ = std::move(next);
            --size_;
        }
        return erased;
    }

    [[nodiscard]] auto begin() const -> const_iterator {
        const_iterator it;
        it.push_left(root_.get());
        return it;
    }

    [[nodiscard]] auto end() const -> const_iterator { return {}; }

    /** \brief First entry with key not less than k. */
    template <class Q>
    [[nodiscard]] auto lower_bound(const Q& k) const -> const_iterator {
        const_iterator it;
        const node* n = root_.get();
        while (n != nullptr) {
            if (!comp_(n->entry.first, k)) {
                it.stack_.push_back(n);
                n = n->left.get();
            } else {
                n = n->right.get();
            }
        }
        return it;
    }

    /** \brief First entry with key greater than k. */
    template <class Q>
    [[nodiscard]] auto upper_bound(const Q& k) const -> const_iterator {
        const_iterator it;
        const node* n = root_.get();
        while (n != nullptr) {
            if (comp_(k, n->entry.first)) {
                it.stack_.push_back(n);
                n = n->left.get();
            } else {
                n = n->right.get();
            }
        }
        return it;
    }

    [[nodiscard]] auto front_entry() const -> const value_type* {
        const node* n = root_.get();
        if (n == nullptr) return nullptr;
        while (n->left) n = n->left.get();
        return &n->entry;
    }

    [[nodiscard]] auto back_entry() const -> const value_type* {
        const node* n = root_.get();
        if (n == nullptr) return nullptr;
        while (n->right) n = n->right.get();
        return &n->entry;
    }

    template <class F>
    void for_each(F&& f) const {
        for (auto it = begin(); it != end(); ++it) {
            std::invoke(f, it->first, it->second);
        }
    }

    /** \brief Tree height; exposed for balance checks in tests. */
    [[nodiscard]] auto height() const noexcept -> int { return height_of(root_); }

    /** \brief True when both maps share the same root node. */
    [[nodiscard]] auto shares_root_with(const ordered_map& other) const noexcept -> bool {
        return root_ == other.root_;
    }

private:
    static auto height_of(const node_ptr& n) noexcept -> int { return n ? n->height : 0; }

    static auto make(value_type e, node_ptr l, node_ptr r) -> node_ptr {
        return std::make_shared<const node>(std::move(e), std::move(l), std::move(r));
    }

    // Rebuild a node whose children differ in height by at most two.
    static auto balance(value_type e, node_ptr l, node_ptr r) -> node_ptr {
        const int hl = height_of(l);
        const int hr = height_of(r);
        if (hl > hr + 1) {
            if (height_of(l->left) >= height_of(l->right)) {
                return make(l->entry, l->left, make(std::move(e), l->right, std::move(r)));
            }
            const node& lr = *l->right;
            return make(lr.entry, make(l->entry, l->left, lr.left),
                        make(std::move(e), lr.right, std::move(r)));
        }
        if (hr > hl + 1) {
            if (height_of(r->right) >= height_of(r->left)) {
                return make(r->entry, make(std::move(e), std::move(l), r->left), r->right);
            }
            const node& rl = *r->left;
            return make(rl.entry, make(std::move(e), std::move(l), rl.left),
                        make(r->entry, rl.right, r->right));
        }
        return make(std::move(e), std::move(l), std::move(r));
    }

    static auto insert_rec(const node_ptr& n, value_type&& e, const Compare& comp, bool& inserted)
        -> node_ptr {
        if (!n) {
            inserted = true;
            return make(std::move(e), nullptr, nullptr);
        }
        if (comp(e.first, n->entry.first)) {
            auto l = insert_rec(n->left, std::move(e), comp, inserted);
            return balance(n->entry, std::move(l), n->right);
        }
        if (comp(n->entry.first, e.first)) {
            auto r = insert_rec(n->right, std::move(e), comp, inserted);
            return balance(n->entry, n->left, std::move(r));
        }
        inserted = false;
        return make(std::move(e), n->left, n->right);
    }

    static auto remove_min(const node_ptr& n) -> node_ptr {
        if (!n->left) return n->right;
        return balance(n->entry, remove_min(n->left), n->right);
    }

    template <class Q>
    static auto erase_rec(const node_ptr& n, const Q& k, const Compare& comp, bool& erased)
        -> node_ptr {
        if (!n) {
            erased = false;
            return nullptr;
        }
        if (comp(k, n->entry.first)) {
            auto l = erase_rec(n->left, k, comp, erased);
            if (!erased) return n;
            return balance(n->entry, std::move(l), n->right);
        }
        if (comp(n->entry.first, k)) {
            auto r = erase_rec(n->right, k, comp, erased);
            if (!erased) return n;
            return balance(n->entry, n->left, std::move(r));
        }
        erased = true;
        if (!n->left) return n->right;
        if (!n->right) return n->left;
        const node* m = n->right.get();
        while (m->left) m = m->left.get();
        value_type successor = m->entry;
        return balance(std::move(successor), n->left, remove_min(n->right));
    }

    node_ptr root_;
    std::size_t size_{0};
    [[no_unique_address]] Compare comp_{};
};

/** \brief Persistent ordered set over ordered_map. */
template <class K, class Compare = std::less<>>
class ordered_set {
    struct unit {};

public:
    static constexpr bool shallow_clonable = true;

    auto insert(K k) -> bool { return map_.insert_or_assign(std::move(k), unit{}); }

    template <class Q>
    auto erase(const Q& k) -> bool { return map_.erase(k); }

    template <class Q>
    [[nodiscard]] auto contains(const Q& k) const -> bool { return map_.contains(k); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return map_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return map_.empty(); }

    [[nodiscard]] auto front() const -> const K* {
        const auto* e = map_.front_entry();
        return e ? &e->first : nullptr;
    }

    template <class F>
    void for_each(F&& f) const {
        map_.for_each([&](const K& k, const unit&) { std::invoke(f, k); });
    }

private:
    ordered_map<K, unit, Compare> map_;
};

} // namespace tessera::persistent
