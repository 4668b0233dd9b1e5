#pragma once

/** \file mark_shallow.hpp
 *  \brief Declare an index cheap enough to copy during shallow_clone.
 *
 * Typical use: a Grouped aggregate with a handful of groups, where a deep copy
 * of the group table costs about as much as sharing it.
 */

#include <utility>

#include "tessera/core/ops.hpp"

namespace tessera::index {

template <class Inner>
class MarkShallow {
public:
    static constexpr bool shallow_clonable = true;

    explicit MarkShallow(Inner inner) : inner_(std::move(inner)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) { inner_.insert(seal, op); }
    template <class In>
    void update(Seal seal, const Update<In>& op) { inner_.update(seal, op); }
    template <class In>
    void remove(Seal seal, const Remove<In>& op) { inner_.remove(seal, op); }

    [[nodiscard]] auto inner() const noexcept -> const Inner& { return inner_; }
    auto operator->() const noexcept -> const Inner* { return &inner_; }

private:
    Inner inner_;
};

template <class Inner>
[[nodiscard]] auto mark_shallow(Inner inner) -> MarkShallow<Inner> {
    return MarkShallow<Inner>(std::move(inner));
}

} // namespace tessera::index
