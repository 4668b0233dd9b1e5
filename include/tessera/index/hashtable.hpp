#pragma once

/** \file hashtable.hpp
 *  \brief Equality index: value -> set of keys.
 */

#include <cstddef>
#include <optional>

#include "tessera/backing.hpp"
#include "tessera/core/ops.hpp"
#include "tessera/keyset.hpp"
#include "tessera/query_result.hpp"

namespace tessera::index {

/** \brief Equality lookups over values of type T. O(1) average per operation.
 *
 * T must be hashable with std::hash and equality-comparable.
 */
template <class T, class KeySet = keyset::hash_set, class Backing = backing::std_hash>
class HashTable : public core::remove_then_insert<HashTable<T, KeySet, Backing>> {
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

    /** \brief Number of distinct indexed values. */
    [[nodiscard]] auto count_distinct() const -> std::size_t { return map_.size(); }

    /** \brief Number of records holding value. */
    [[nodiscard]] auto count(const T& value) const -> std::size_t {
        const KeySet* ks = map_.find(value);
        return ks ? ks->count() : 0;
    }

    [[nodiscard]] auto get_one(const T& value) const -> std::optional<Key> {
        const KeySet* ks = map_.find(value);
        if (ks == nullptr) return std::nullopt;
        return ks->first();
    }

    [[nodiscard]] auto get_all(const T& value) const -> UniqueKeys {
        UniqueKeys out;
        if (const KeySet* ks = map_.find(value)) {
            out.keys.reserve(ks->count());
            ks->for_each([&](Key k) { out.keys.push_back(k); });
        }
        return out;
    }

    /** \brief Every indexed key. */
    [[nodiscard]] auto all() const -> UniqueKeys {
        UniqueKeys out;
        map_.for_each([&](const T&, const KeySet& ks) {
            ks.for_each([&](Key k) { out.keys.push_back(k); });
        });
        return out;
    }

private:
    map_type map_;
};

} // namespace tessera::index
