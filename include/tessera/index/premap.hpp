#pragma once

/** \file premap.hpp
 *  \brief Index a projection of each record.
 *
 * The projection may return a reference (indexing a field in place) or a
 * value (a derived key, computed per call and discarded afterwards).
 */

#include <functional>
#include <type_traits>
#include <utility>

#include "tessera/core/ops.hpp"
#include "tessera/core/shallow_clone.hpp"

namespace tessera::index {

template <class F, class Inner>
class Premap {
public:
    static constexpr bool shallow_clonable = is_shallow_clone_v<Inner>;

    Premap(F f, Inner inner) : f_(std::move(f)), inner_(std::move(inner)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        decltype(auto) v = std::invoke(f_, op.new_value);
        inner_.insert(seal, Insert<projected_t<decltype(v)>>{op.key, v});
    }

    template <class In>
    void update(Seal seal, const Update<In>& op) {
        decltype(auto) next = std::invoke(f_, op.new_value);
        decltype(auto) prev = std::invoke(f_, op.existing);
        inner_.update(seal, Update<projected_t<decltype(next)>>{op.key, next, prev});
    }

    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        decltype(auto) v = std::invoke(f_, op.existing);
        inner_.remove(seal, Remove<projected_t<decltype(v)>>{op.key, v});
    }

    [[nodiscard]] auto inner() const noexcept -> const Inner& { return inner_; }
    auto operator->() const noexcept -> const Inner* { return &inner_; }

private:
    template <class V>
    using projected_t = std::remove_cvref_t<V>;

    F f_;
    Inner inner_;
};

template <class F, class Inner>
[[nodiscard]] auto premap(F f, Inner inner) -> Premap<F, Inner> {
    return Premap<F, Inner>(std::move(f), std::move(inner));
}

} // namespace tessera::index
