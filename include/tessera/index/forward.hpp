#pragma once

/** \file forward.hpp
 *  \brief Wiring helper for hand-written struct-of-indexes types.
 *
 * A struct whose members are indexes becomes an index by forwarding each
 * operation to every member in declaration order:
 *
 * ```cpp
 * struct SessionIndex {
 *     ByUser by_user;
 *     ByExpiry by_expiry;
 *
 *     template <class Op>
 *     void insert(Seal s, const Op& op) { forward_each(s, op, by_user, by_expiry); }
 *     // update / remove likewise
 * };
 * ```
 */

#include "tessera/core/ops.hpp"

namespace tessera::index {

template <class In, class... Ix>
void forward_each(Seal seal, const Insert<In>& op, Ix&... ix) {
    (ix.insert(seal, op), ...);
}

template <class In, class... Ix>
void forward_each(Seal seal, const Update<In>& op, Ix&... ix) {
    (ix.update(seal, op), ...);
}

template <class In, class... Ix>
void forward_each(Seal seal, const Remove<In>& op, Ix&... ix) {
    (ix.remove(seal, op), ...);
}

} // namespace tessera::index
