#pragma once

/** \file sum.hpp
 *  \brief Running total of the indexed values.
 */

#include "tessera/core/ops.hpp"

namespace tessera::aggregation {

template <class T>
class Sum {
public:
    static constexpr bool shallow_clonable = true;

    void insert(Seal, const Insert<T>& op) { sum_ = sum_ + op.new_value; }
    void update(Seal, const Update<T>& op) { sum_ = sum_ - op.existing + op.new_value; }
    void remove(Seal, const Remove<T>& op) { sum_ = sum_ - op.existing; }

    [[nodiscard]] auto get() const -> T { return sum_; }

private:
    T sum_{};
};

} // namespace tessera::aggregation
