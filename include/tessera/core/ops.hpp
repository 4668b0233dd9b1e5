#pragma once

/** \file ops.hpp
 *  \brief Operation descriptors passed to indexes, and the default update rule.
 *
 * Every index (leaf or composite) provides:
 *
 *   void insert(Seal, const Insert<In>&);
 *   void update(Seal, const Update<In>&);
 *   void remove(Seal, const Remove<In>&);
 *
 * The references inside a descriptor are valid only for the duration of the
 * call. An index must not retain them.
 */

#include "tessera/core/key.hpp"
#include "tessera/core/seal.hpp"

namespace tessera {

/** \brief A record that did not exist now exists. */
template <class In>
struct Insert {
    Key key;
    const In& new_value;
};

/** \brief A record changes value; `existing` is still in the store. */
template <class In>
struct Update {
    Key key;
    const In& new_value;
    const In& existing;
};

/** \brief A record is about to be deleted; `existing` is still in the store. */
template <class In>
struct Remove {
    Key key;
    const In& existing;
};

namespace core {

/** \brief CRTP base supplying update() as remove() followed by insert().
 *
 * Leaf indexes that only implement insert/remove derive from this. Indexes
 * that can do better (aggregates, Keys) define their own update, which hides
 * this one.
 */
template <class Derived>
struct remove_then_insert {
    template <class In>
    void update(Seal seal, const Update<In>& op) {
        auto& self = static_cast<Derived&>(*this);
        self.remove(seal, Remove<In>{op.key, op.existing});
        self.insert(seal, Insert<In>{op.key, op.new_value});
    }
};

} // namespace core
} // namespace tessera
