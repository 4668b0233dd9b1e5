#pragma once

/** \file backing.hpp
 *  \brief Backing maps shared by HashTable, BTree and Grouped.
 *
 * Indexes are written once against this interface:
 *
 *   find(k) -> const V*              nullptr when absent
 *   upsert(k, make, f)               f(V&) on the entry, created from make() if absent
 *   modify(k, f) -> bool             f(V&) -> keep; erases the entry when keep is false.
 *                                    Returns false when k is absent.
 *   size(), empty(), for_each(fn(const K&, const V&))
 *
 * Ordered backings additionally provide begin(), end(), lower_bound(k),
 * upper_bound(k), front_entry() and back_entry(); iterators expose
 * ->first / ->second.
 *
 * A backing policy is a type with a nested alias template `map<K, V>`:
 * std_hash / std_ordered mutate in place; persistent_hash / persistent_ordered
 * copy the touched entry and share everything else. Each upsert/modify on a
 * persistent backing copies the whole mapped value, so values should
 * themselves be persistent (key sets, persistent indexes).
 */

#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <unordered_map>
#include <utility>

#include "tessera/persistent/hash_map.hpp"
#include "tessera/persistent/ordered_map.hpp"

namespace tessera::backing {

template <class M>
class std_map_backing {
public:
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    static constexpr bool shallow_clonable = false;

    [[nodiscard]] auto find(const key_type& k) const -> const mapped_type* {
        auto it = map_.find(k);
        return it == map_.end() ? nullptr : &it->second;
    }

    template <class Make, class F>
    void upsert(const key_type& k, Make&& make, F&& f) {
        auto it = map_.find(k);
        if (it == map_.end()) it = map_.emplace(k, std::invoke(make)).first;
        std::invoke(f, it->second);
    }

    template <class F>
    auto modify(const key_type& k, F&& f) -> bool {
        auto it = map_.find(k);
        if (it == map_.end()) return false;
        if (!std::invoke(f, it->second)) map_.erase(it);
        return true;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return map_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return map_.empty(); }

    template <class F>
    void for_each(F&& f) const {
        for (const auto& [k, v] : map_) std::invoke(f, k, v);
    }

    // Ordered backings only.
    [[nodiscard]] auto begin() const { return map_.begin(); }
    [[nodiscard]] auto end() const { return map_.end(); }
    [[nodiscard]] auto lower_bound(const key_type& k) const { return map_.lower_bound(k); }
    [[nodiscard]] auto upper_bound(const key_type& k) const { return map_.upper_bound(k); }

    [[nodiscard]] auto front_entry() const -> const typename M::value_type* {
        return map_.empty() ? nullptr : &*map_.begin();
    }

    [[nodiscard]] auto back_entry() const -> const typename M::value_type* {
        return map_.empty() ? nullptr : &*std::prev(map_.end());
    }

private:
    M map_;
};

template <class M>
class persistent_map_backing {
public:
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    static constexpr bool shallow_clonable = true;

    [[nodiscard]] auto find(const key_type& k) const -> const mapped_type* { return map_.find(k); }

    template <class Make, class F>
    void upsert(const key_type& k, Make&& make, F&& f) {
        const mapped_type* current = map_.find(k);
        mapped_type next = current ? *current : std::invoke(make);
        std::invoke(f, next);
        map_.insert_or_assign(k, std::move(next));
    }

    template <class F>
    auto modify(const key_type& k, F&& f) -> bool {
        const mapped_type* current = map_.find(k);
        if (current == nullptr) return false;
        mapped_type next = *current;
        if (std::invoke(f, next)) {
            map_.insert_or_assign(k, std::move(next));
        } else {
            map_.erase(k);
        }
        return true;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return map_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return map_.empty(); }

    template <class F>
    void for_each(F&& f) const {
        map_.for_each(std::forward<F>(f));
    }

    // Ordered backings only.
    [[nodiscard]] auto begin() const { return map_.begin(); }
    [[nodiscard]] auto end() const { return map_.end(); }
    [[nodiscard]] auto lower_bound(const key_type& k) const { return map_.lower_bound(k); }
    [[nodiscard]] auto upper_bound(const key_type& k) const { return map_.upper_bound(k); }
    [[nodiscard]] auto front_entry() const { return map_.front_entry(); }
    [[nodiscard]] auto back_entry() const { return map_.back_entry(); }

private:
    M map_;
};

struct std_hash {
    template <class K, class V>
    using map = std_map_backing<std::unordered_map<K, V>>;
};

struct std_ordered {
    template <class K, class V>
    using map = std_map_backing<std::map<K, V, std::less<>>>;
};

struct persistent_hash {
    template <class K, class V>
    using map = persistent_map_backing<persistent::hash_map<K, V>>;
};

struct persistent_ordered {
    template <class K, class V>
    using map = persistent_map_backing<persistent::ordered_map<K, V>>;
};

} // namespace tessera::backing
