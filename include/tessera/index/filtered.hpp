#pragma once

/** \file filtered.hpp
 *  \brief Forward only the records a selector accepts.
 *
 * The selector returns something testable and dereferenceable: a
 * std::optional<Out> (projecting while filtering) or a const Out* (nullptr to
 * reject). On update the selector runs on both values and the inner index
 * sees exactly one of update, remove, insert, or nothing.
 */

#include <functional>
#include <type_traits>
#include <utility>

#include "tessera/core/ops.hpp"
#include "tessera/core/shallow_clone.hpp"

namespace tessera::index {

template <class F, class Inner>
class Filtered {
public:
    static constexpr bool shallow_clonable = is_shallow_clone_v<Inner>;

    Filtered(F f, Inner inner) : f_(std::move(f)), inner_(std::move(inner)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        auto v = std::invoke(f_, op.new_value);
        if (v) inner_.insert(seal, Insert<selected_t<decltype(v)>>{op.key, *v});
    }

    template <class In>
    void update(Seal seal, const Update<In>& op) {
        auto next = std::invoke(f_, op.new_value);
        auto prev = std::invoke(f_, op.existing);
        using Out = selected_t<decltype(next)>;
        if (prev && next) {
            inner_.update(seal, Update<Out>{op.key, *next, *prev});
        } else if (prev) {
            inner_.remove(seal, Remove<Out>{op.key, *prev});
        } else if (next) {
            inner_.insert(seal, Insert<Out>{op.key, *next});
        }
    }

    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        auto v = std::invoke(f_, op.existing);
        if (v) inner_.remove(seal, Remove<selected_t<decltype(v)>>{op.key, *v});
    }

    [[nodiscard]] auto inner() const noexcept -> const Inner& { return inner_; }
    auto operator->() const noexcept -> const Inner* { return &inner_; }

private:
    template <class V>
    using selected_t = std::remove_cvref_t<decltype(*std::declval<V&>())>;

    F f_;
    Inner inner_;
};

template <class F, class Inner>
[[nodiscard]] auto filtered(F f, Inner inner) -> Filtered<F, Inner> {
    return Filtered<F, Inner>(std::move(f), std::move(inner));
}

/** \brief Filter by a boolean predicate, forwarding the record unchanged. */
template <class Pred, class Inner>
[[nodiscard]] auto filter(Pred pred, Inner inner) {
    auto select = [pred = std::move(pred)](const auto& v) -> const std::remove_cvref_t<decltype(v)>* {
        return std::invoke(pred, v) ? &v : nullptr;
    };
    return Filtered<decltype(select), Inner>(std::move(select), std::move(inner));
}

} // namespace tessera::index
