#pragma once

/** \file generic.hpp
 *  \brief Aggregates assembled from plain functions.
 *
 * GenericAggregate takes an initial state, a query projection and a pair of
 * insert/remove rules; remove must undo insert. Updates are a remove of the
 * old value followed by an insert of the new one.
 *
 * MonoidalAggregate covers the common case of a commutative group: an
 * identity, an associative combine, and an inverse.
 */

#include <utility>

#include "tessera/core/ops.hpp"

namespace tessera::aggregation {

template <class In, class State, class Result>
class GenericAggregate : public core::remove_then_insert<GenericAggregate<In, State, Result>> {
public:
    using query_fn = Result (*)(const State&);
    using step_fn = void (*)(State&, const In&);

    static constexpr bool shallow_clonable = true;

    GenericAggregate(State initial, query_fn query, step_fn insert, step_fn remove)
        : state_(std::move(initial)), query_(query), insert_(insert), remove_(remove) {}

    void insert(Seal, const Insert<In>& op) { insert_(state_, op.new_value); }
    void remove(Seal, const Remove<In>& op) { remove_(state_, op.existing); }

    [[nodiscard]] auto get() const -> Result { return query_(state_); }
    [[nodiscard]] auto state() const noexcept -> const State& { return state_; }

private:
    State state_;
    query_fn query_;
    step_fn insert_;
    step_fn remove_;
};

template <class T>
class MonoidalAggregate {
public:
    using combine_fn = T (*)(const T&, const T&);
    using inverse_fn = T (*)(const T&);

    static constexpr bool shallow_clonable = true;

    MonoidalAggregate(T identity, combine_fn combine, inverse_fn inverse)
        : value_(std::move(identity)), combine_(combine), inverse_(inverse) {}

    void insert(Seal, const Insert<T>& op) { value_ = combine_(value_, op.new_value); }
    void update(Seal, const Update<T>& op) {
        value_ = combine_(combine_(value_, inverse_(op.existing)), op.new_value);
    }
    void remove(Seal, const Remove<T>& op) { value_ = combine_(value_, inverse_(op.existing)); }

    [[nodiscard]] auto get() const -> T { return value_; }

private:
    T value_;
    combine_fn combine_;
    inverse_fn inverse_;
};

} // namespace tessera::aggregation
