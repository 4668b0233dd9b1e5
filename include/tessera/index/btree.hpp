#pragma once

/** \file btree.hpp
 *  \brief Ordered index: value -> set of keys, with range and extremum queries.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "tessera/backing.hpp"
#include "tessera/core/ops.hpp"
#include "tessera/core/text.hpp"
#include "tessera/keyset.hpp"
#include "tessera/query_result.hpp"

namespace tessera::index {

/** \brief Ordered lookups over values of type T (must be totally ordered by <). O(log n). */
template <class T, class KeySet = keyset::hash_set, class Backing = backing::std_ordered>
class BTree : public core::remove_then_insert<BTree<T, KeySet, Backing>> {
public:
    using map_type = typename Backing::template map<T, KeySet>;

    static constexpr bool shallow_clonable = map_type::shallow_clonable && KeySet::shallow_clonable;

    void insert(Seal, const Insert<T>& op) {
        map_.upsert(op.new_value, [] { return KeySet{}; },
                    [&](KeySet& ks) { ks.insert(op.key); });
    }

    void remove(Seal, const Remove<T>& op) {
        map_.modify(op.existing, [&](KeySet& ks) {
            ks.remove(op.key);
            return !ks.empty();
        });
    }

    [[nodiscard]] auto contains(const T& value) const -> bool { return map_.find(value) != nullptr; }
    [[nodiscard]] auto count_distinct() const -> std::size_t { return map_.size(); }

    [[nodiscard]] auto get_one(const T& value) const -> std::optional<Key> {
        const KeySet* ks = map_.find(value);
        if (ks == nullptr) return std::nullopt;
        return ks->first();
    }

    [[nodiscard]] auto get_all(const T& value) const -> UniqueKeys {
        UniqueKeys out;
        if (const KeySet* ks = map_.find(value)) append(out, *ks);
        return out;
    }

    /** \brief A key holding the smallest value. */
    [[nodiscard]] auto min_one() const -> std::optional<Key> {
        const auto* e = map_.front_entry();
        if (e == nullptr) return std::nullopt;
        return e->second.first();
    }

    /** \brief A key holding the largest value. */
    [[nodiscard]] auto max_one() const -> std::optional<Key> {
        const auto* e = map_.back_entry();
        if (e == nullptr) return std::nullopt;
        return e->second.first();
    }

    /** \brief Keys whose value lies in [lo, hi). */
    [[nodiscard]] auto range(const T& lo, const T& hi) const -> UniqueKeys {
        UniqueKeys out;
        for (auto it = map_.lower_bound(lo); it != map_.end() && it->first < hi; ++it) {
            append(out, it->second);
        }
        return out;
    }

    /** \brief Keys whose value lies in [lo, hi]. */
    [[nodiscard]] auto range_inclusive(const T& lo, const T& hi) const -> UniqueKeys {
        UniqueKeys out;
        for (auto it = map_.lower_bound(lo); it != map_.end() && !(hi < it->first); ++it) {
            append(out, it->second);
        }
        return out;
    }

    /** \brief Keys whose value is >= lo. */
    [[nodiscard]] auto range_from(const T& lo) const -> UniqueKeys {
        UniqueKeys out;
        for (auto it = map_.lower_bound(lo); it != map_.end(); ++it) append(out, it->second);
        return out;
    }

    /** \brief Keys whose value is < hi. */
    [[nodiscard]] auto range_to(const T& hi) const -> UniqueKeys {
        UniqueKeys out;
        for (auto it = map_.begin(); it != map_.end() && it->first < hi; ++it) {
            append(out, it->second);
        }
        return out;
    }

    /** \brief Keys of strings beginning with prefix. Only for T = std::string. */
    [[nodiscard]] auto starts_with(std::string_view prefix) const -> UniqueKeys {
        static_assert(std::is_same_v<T, std::string>, "starts_with requires BTree<std::string>");
        const std::optional<std::string> upper = core::prefix_successor(prefix);
        UniqueKeys out;
        for (auto it = map_.lower_bound(std::string(prefix)); it != map_.end(); ++it) {
            if (upper && !(it->first < *upper)) break;
            append(out, it->second);
        }
        return out;
    }

    [[nodiscard]] auto all() const -> UniqueKeys {
        UniqueKeys out;
        for (auto it = map_.begin(); it != map_.end(); ++it) append(out, it->second);
        return out;
    }

private:
    static void append(UniqueKeys& out, const KeySet& ks) {
        ks.for_each([&](Key k) { out.keys.push_back(k); });
    }

    map_type map_;
};

} // namespace tessera::index
