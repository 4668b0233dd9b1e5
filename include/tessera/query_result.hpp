#pragma once

/** \file query_result.hpp
 *  \brief Resolution of index answers (made of Keys) into store references.
 *
 * An index query returns a value built from Keys: a bare Key, an optional,
 * a vector/array/pair/tuple of such, or a UniqueKeys set. query_result<R>
 * describes how to rebuild the same shape with every Key replaced by f(Key):
 *
 *   query_result<R>::resolved<U>     the shape with U in place of Key
 *   query_result<R>::map(r, f)       the rebuilt value
 *   query_result<R>::distinct        true when r names each key at most once
 *
 * Only distinct results may drive delete_where/update_where/take.
 * Results that carry no keys (numbers, bool, strings, Plain<T>) resolve to
 * themselves.
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "tessera/core/key.hpp"

namespace tessera {

/** \brief A list of keys known to contain no duplicates. */
struct UniqueKeys {
    std::vector<Key> keys;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return keys.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys.empty(); }
    [[nodiscard]] auto begin() const { return keys.begin(); }
    [[nodiscard]] auto end() const { return keys.end(); }
};

/** \brief Asserts that the wrapped result never repeats a key. The caller is responsible. */
template <class R>
struct UnsafeDistinct {
    R value;
};

/** \brief A query answer that carries no keys; returned unchanged. */
template <class T>
struct Plain {
    T value;
};

template <class R, class = void>
struct query_result;

template <class R>
inline constexpr bool is_distinct_result_v = query_result<R>::distinct;

template <class R, class U>
using resolved_t = typename query_result<R>::template resolved<U>;

template <>
struct query_result<Key> {
    static constexpr bool distinct = true;
    template <class U> using resolved = U;

    template <class F>
    static auto map(Key k, F& f) -> std::invoke_result_t<F&, Key> { return f(k); }
};

template <class T>
struct query_result<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
    static constexpr bool distinct = false;
    template <class U> using resolved = T;

    template <class F>
    static auto map(T v, F&) -> T { return v; }
};

template <>
struct query_result<std::string> {
    static constexpr bool distinct = false;
    template <class U> using resolved = std::string;

    template <class F>
    static auto map(std::string v, F&) -> std::string { return v; }
};

template <class T>
struct query_result<Plain<T>> {
    static constexpr bool distinct = false;
    template <class U> using resolved = T;

    template <class F>
    static auto map(Plain<T> v, F&) -> T { return std::move(v.value); }
};

template <>
struct query_result<UniqueKeys> {
    static constexpr bool distinct = true;
    template <class U> using resolved = std::vector<U>;

    template <class F>
    static auto map(UniqueKeys ks, F& f) -> std::vector<std::invoke_result_t<F&, Key>> {
        std::vector<std::invoke_result_t<F&, Key>> out;
        out.reserve(ks.keys.size());
        for (Key k : ks.keys) out.push_back(f(k));
        return out;
    }
};

template <class R>
struct query_result<UnsafeDistinct<R>> {
    static constexpr bool distinct = true;
    template <class U> using resolved = resolved_t<R, U>;

    template <class F>
    static auto map(UnsafeDistinct<R> r, F& f) -> resolved_t<R, std::invoke_result_t<F&, Key>> {
        return query_result<R>::map(std::move(r.value), f);
    }
};

template <class R>
struct query_result<std::optional<R>> {
    static constexpr bool distinct = query_result<R>::distinct;
    template <class U> using resolved = std::optional<resolved_t<R, U>>;

    template <class F>
    static auto map(std::optional<R> r, F& f)
        -> std::optional<resolved_t<R, std::invoke_result_t<F&, Key>>> {
        if (!r) return std::nullopt;
        return query_result<R>::map(std::move(*r), f);
    }
};

template <class R>
struct query_result<std::vector<R>> {
    static constexpr bool distinct = false;
    template <class U> using resolved = std::vector<resolved_t<R, U>>;

    template <class F>
    static auto map(std::vector<R> rs, F& f)
        -> std::vector<resolved_t<R, std::invoke_result_t<F&, Key>>> {
        std::vector<resolved_t<R, std::invoke_result_t<F&, Key>>> out;
        out.reserve(rs.size());
        for (auto& r : rs) out.push_back(query_result<R>::map(std::move(r), f));
        return out;
    }
};

template <class R, std::size_t N>
struct query_result<std::array<R, N>> {
    static constexpr bool distinct = false;
    template <class U> using resolved = std::array<resolved_t<R, U>, N>;

    template <class F>
    static auto map(std::array<R, N> rs, F& f)
        -> std::array<resolved_t<R, std::invoke_result_t<F&, Key>>, N> {
        return map_impl(std::move(rs), f, std::make_index_sequence<N>{});
    }

private:
    template <class F, std::size_t... I>
    static auto map_impl(std::array<R, N> rs, F& f, std::index_sequence<I...>)
        -> std::array<resolved_t<R, std::invoke_result_t<F&, Key>>, N> {
        return {{query_result<R>::map(std::move(rs[I]), f)...}};
    }
};

template <class A, class B>
struct query_result<std::pair<A, B>> {
    static constexpr bool distinct = false;
    template <class U> using resolved = std::pair<resolved_t<A, U>, resolved_t<B, U>>;

    template <class F>
    static auto map(std::pair<A, B> r, F& f) -> resolved<std::invoke_result_t<F&, Key>> {
        auto first = query_result<A>::map(std::move(r.first), f);
        auto second = query_result<B>::map(std::move(r.second), f);
        return {std::move(first), std::move(second)};
    }
};

template <class... Rs>
struct query_result<std::tuple<Rs...>> {
    static constexpr bool distinct = false;
    template <class U> using resolved = std::tuple<resolved_t<Rs, U>...>;

    template <class F>
    static auto map(std::tuple<Rs...> r, F& f) -> resolved<std::invoke_result_t<F&, Key>> {
        return map_impl(std::move(r), f, std::index_sequence_for<Rs...>{});
    }

private:
    template <class F, std::size_t... I>
    static auto map_impl(std::tuple<Rs...> r, F& f, std::index_sequence<I...>)
        -> resolved<std::invoke_result_t<F&, Key>> {
        // Braced initialization keeps left-to-right evaluation order.
        return resolved<std::invoke_result_t<F&, Key>>{
            query_result<Rs>::map(std::move(std::get<I>(r)), f)...};
    }
};

} // namespace tessera
