#pragma once

/** \file zip.hpp
 *  \brief Attach several indexes to one collection.
 *
 * Every operation is forwarded to each member in declaration order. Members
 * are read through _1() .. _16() or get<I>().
 */

#include <cstddef>
#include <tuple>
#include <utility>

#include "tessera/core/ops.hpp"
#include "tessera/core/shallow_clone.hpp"

namespace tessera::index {

template <class... Ix>
class Zip {
    static_assert(sizeof...(Ix) <= 16, "Zip supports at most 16 members");

public:
    static constexpr bool shallow_clonable = (is_shallow_clone_v<Ix> && ...);

    Zip() = default;
    explicit Zip(Ix... ix) : members_(std::move(ix)...) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        std::apply([&](auto&... m) { (m.insert(seal, op), ...); }, members_);
    }

    template <class In>
    void update(Seal seal, const Update<In>& op) {
        std::apply([&](auto&... m) { (m.update(seal, op), ...); }, members_);
    }

    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        std::apply([&](auto&... m) { (m.remove(seal, op), ...); }, members_);
    }

    template <std::size_t I>
    [[nodiscard]] auto get() const noexcept -> const std::tuple_element_t<I, std::tuple<Ix...>>& {
        return std::get<I>(members_);
    }

    decltype(auto) _1() const noexcept { return get<0>(); }
    decltype(auto) _2() const noexcept { return get<1>(); }
    decltype(auto) _3() const noexcept { return get<2>(); }
    decltype(auto) _4() const noexcept { return get<3>(); }
    decltype(auto) _5() const noexcept { return get<4>(); }
    decltype(auto) _6() const noexcept { return get<5>(); }
    decltype(auto) _7() const noexcept { return get<6>(); }
    decltype(auto) _8() const noexcept { return get<7>(); }
    decltype(auto) _9() const noexcept { return get<8>(); }
    decltype(auto) _10() const noexcept { return get<9>(); }
    decltype(auto) _11() const noexcept { return get<10>(); }
    decltype(auto) _12() const noexcept { return get<11>(); }
    decltype(auto) _13() const noexcept { return get<12>(); }
    decltype(auto) _14() const noexcept { return get<13>(); }
    decltype(auto) _15() const noexcept { return get<14>(); }
    decltype(auto) _16() const noexcept { return get<15>(); }

private:
    std::tuple<Ix...> members_;
};

template <class... Ix>
[[nodiscard]] auto zip(Ix... ix) -> Zip<Ix...> {
    return Zip<Ix...>(std::move(ix)...);
}

} // namespace tessera::index
