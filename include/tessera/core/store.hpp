#pragma once

/** \file store.hpp
 *  \brief Canonical record storage owned by a Collection.
 *
 * A store maps Key to record and provides:
 *   find(k) -> const In*               nullptr when absent
 *   insert_or_assign(k, v) -> const In&   reference to the stored value
 *   modify(k, f(In&)) -> bool          false when absent
 *   extract(k) -> std::optional<In>
 *   size(), empty(), reserve(n), for_each(fn(Key, const In&))
 *
 * References returned by a store stay valid until the next mutation of the
 * store.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "tessera/core/key.hpp"
#include "tessera/persistent/ordered_map.hpp"

namespace tessera {

/** \brief Default store: std::unordered_map. Iteration order is unspecified. */
template <class In>
class hash_store {
public:
    static constexpr bool shallow_clonable = false;

    [[nodiscard]] auto find(Key k) const -> const In* {
        auto it = data_.find(k);
        return it == data_.end() ? nullptr : &it->second;
    }

    auto insert_or_assign(Key k, In v) -> const In& {
        return data_.insert_or_assign(k, std::move(v)).first->second;
    }

    template <class F>
    auto modify(Key k, F&& f) -> bool {
        auto it = data_.find(k);
        if (it == data_.end()) return false;
        std::invoke(f, it->second);
        return true;
    }

    auto extract(Key k) -> std::optional<In> {
        auto node = data_.extract(k);
        if (node.empty()) return std::nullopt;
        return std::optional<In>(std::move(node.mapped()));
    }

    void reserve(std::size_t n) { data_.reserve(n); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    template <class F>
    void for_each(F&& f) const {
        for (const auto& [k, v] : data_) std::invoke(f, k, v);
    }

private:
    std::unordered_map<Key, In> data_;
};

/** \brief std::map store; for_each visits records in key (insertion) order. */
template <class In>
class ordered_store {
public:
    static constexpr bool shallow_clonable = false;

    [[nodiscard]] auto find(Key k) const -> const In* {
        auto it = data_.find(k);
        return it == data_.end() ? nullptr : &it->second;
    }

    auto insert_or_assign(Key k, In v) -> const In& {
        return data_.insert_or_assign(k, std::move(v)).first->second;
    }

    template <class F>
    auto modify(Key k, F&& f) -> bool {
        auto it = data_.find(k);
        if (it == data_.end()) return false;
        std::invoke(f, it->second);
        return true;
    }

    auto extract(Key k) -> std::optional<In> {
        auto node = data_.extract(k);
        if (node.empty()) return std::nullopt;
        return std::optional<In>(std::move(node.mapped()));
    }

    void reserve(std::size_t) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    template <class F>
    void for_each(F&& f) const {
        for (const auto& [k, v] : data_) std::invoke(f, k, v);
    }

private:
    std::map<Key, In> data_;
};

/** \brief Structurally shared store. Copies are O(1) and independent. */
template <class In>
class persistent_store {
public:
    static constexpr bool shallow_clonable = true;

    [[nodiscard]] auto find(Key k) const -> const In* { return data_.find(k); }

    auto insert_or_assign(Key k, In v) -> const In& {
        data_.insert_or_assign(k, std::move(v));
        return *data_.find(k);
    }

    template <class F>
    auto modify(Key k, F&& f) -> bool {
        const In* current = data_.find(k);
        if (current == nullptr) return false;
        In next = *current;
        std::invoke(f, next);
        data_.insert_or_assign(k, std::move(next));
        return true;
    }

    auto extract(Key k) -> std::optional<In> {
        const In* current = data_.find(k);
        if (current == nullptr) return std::nullopt;
        std::optional<In> out(*current);
        data_.erase(k);
        return out;
    }

    void reserve(std::size_t) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    template <class F>
    void for_each(F&& f) const {
        data_.for_each(std::forward<F>(f));
    }

private:
    persistent::ordered_map<Key, In> data_;
};

} // namespace tessera
