#pragma once

/** \file trivial.hpp
 *  \brief Index that maintains nothing; for collections queried by key only.
 */

#include "tessera/core/ops.hpp"

namespace tessera::index {

struct Trivial {
    static constexpr bool shallow_clonable = true;

    template <class In>
    void insert(Seal, const Insert<In>&) {}
    template <class In>
    void update(Seal, const Update<In>&) {}
    template <class In>
    void remove(Seal, const Remove<In>&) {}
};

} // namespace tessera::index
