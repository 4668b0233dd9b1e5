#pragma once

/** \file count.hpp
 *  \brief Number of live records.
 */

#include <cstddef>

#include "tessera/core/ops.hpp"

namespace tessera::aggregation {

template <class T = std::size_t>
class Count {
public:
    static constexpr bool shallow_clonable = true;

    template <class In>
    void insert(Seal, const Insert<In>&) { ++count_; }

    template <class In>
    void update(Seal, const Update<In>&) {}

    template <class In>
    void remove(Seal, const Remove<In>&) { --count_; }

    [[nodiscard]] auto get() const noexcept -> T { return count_; }

private:
    T count_{0};
};

} // namespace tessera::aggregation
