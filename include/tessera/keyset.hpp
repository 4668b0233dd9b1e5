#pragma once

/** \file keyset.hpp
 *  \brief Sets of record keys sharing one indexed value.
 *
 * All backings expose the same members:
 *   insert(Key), remove(Key), contains(Key), count(), empty(),
 *   first() -> std::optional<Key>, for_each(fn(Key)).
 *
 * roaring_set is built on CRoaring's Roaring64Map and is unavailable when the
 * library was configured without CRoaring (TESSERA_NO_ROARING).
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <unordered_set>

#include "tessera/core/key.hpp"
#include "tessera/persistent/ordered_map.hpp"

#ifndef TESSERA_NO_ROARING
#include <roaring/roaring64map.hh>
#endif

namespace tessera::keyset {

/** \brief Hash-set backing. Default for leaf indexes. */
class hash_set {
public:
    static constexpr bool shallow_clonable = false;

    void insert(Key k) { keys_.insert(k); }
    void remove(Key k) { keys_.erase(k); }
    [[nodiscard]] auto contains(Key k) const -> bool { return keys_.contains(k); }
    [[nodiscard]] auto count() const noexcept -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys_.empty(); }

    [[nodiscard]] auto first() const -> std::optional<Key> {
        if (keys_.empty()) return std::nullopt;
        return *keys_.begin();
    }

    template <class F>
    void for_each(F&& f) const {
        for (Key k : keys_) f(k);
    }

private:
    std::unordered_set<Key> keys_;
};

/** \brief Ordered-set backing; iteration and first() follow key order. */
class ordered_set {
public:
    static constexpr bool shallow_clonable = false;

    void insert(Key k) { keys_.insert(k); }
    void remove(Key k) { keys_.erase(k); }
    [[nodiscard]] auto contains(Key k) const -> bool { return keys_.contains(k); }
    [[nodiscard]] auto count() const noexcept -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys_.empty(); }

    [[nodiscard]] auto first() const -> std::optional<Key> {
        if (keys_.empty()) return std::nullopt;
        return *keys_.begin();
    }

    template <class F>
    void for_each(F&& f) const {
        for (Key k : keys_) f(k);
    }

private:
    std::set<Key> keys_;
};

/** \brief Structurally shared backing used by the persistent index family. */
class persistent_set {
public:
    static constexpr bool shallow_clonable = true;

    void insert(Key k) { keys_.insert(k); }
    void remove(Key k) { keys_.erase(k); }
    [[nodiscard]] auto contains(Key k) const -> bool { return keys_.contains(k); }
    [[nodiscard]] auto count() const noexcept -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys_.empty(); }

    [[nodiscard]] auto first() const -> std::optional<Key> {
        const Key* k = keys_.front();
        if (k == nullptr) return std::nullopt;
        return *k;
    }

    template <class F>
    void for_each(F&& f) const {
        keys_.for_each([&](const Key& k) { f(k); });
    }

private:
    persistent::ordered_set<Key> keys_;
};

#ifndef TESSERA_NO_ROARING
/** \brief Compressed bitmap backing for dense key ranges. */
class roaring_set {
public:
    static constexpr bool shallow_clonable = false;

    void insert(Key k) { bitmap_.add(k.as_u64()); }
    void remove(Key k) { bitmap_.remove(k.as_u64()); }
    [[nodiscard]] auto contains(Key k) const -> bool { return bitmap_.contains(k.as_u64()); }
    [[nodiscard]] auto count() const -> std::size_t {
        return static_cast<std::size_t>(bitmap_.cardinality());
    }
    [[nodiscard]] auto empty() const -> bool { return bitmap_.isEmpty(); }

    [[nodiscard]] auto first() const -> std::optional<Key> {
        if (bitmap_.isEmpty()) return std::nullopt;
        return Key::unsafe_from_u64(bitmap_.minimum());
    }

    template <class F>
    void for_each(F&& f) const {
        for (std::uint64_t v : bitmap_) f(Key::unsafe_from_u64(v));
    }

private:
    roaring::Roaring64Map bitmap_;
};
#endif

} // namespace tessera::keyset
