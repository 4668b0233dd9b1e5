#pragma once

/** \file keys.hpp
 *  \brief Index of live keys only; the usual inner index for Grouped.
 */

#include <cstddef>

#include "tessera/core/ops.hpp"
#include "tessera/keyset.hpp"
#include "tessera/query_result.hpp"

namespace tessera::index {

template <class KeySet = keyset::hash_set>
class Keys {
public:
    static constexpr bool shallow_clonable = KeySet::shallow_clonable;

    template <class In>
    void insert(Seal, const Insert<In>& op) { keys_.insert(op.key); }

    // The key set does not depend on the value.
    template <class In>
    void update(Seal, const Update<In>&) {}

    template <class In>
    void remove(Seal, const Remove<In>& op) { keys_.remove(op.key); }

    [[nodiscard]] auto all() const -> UniqueKeys {
        UniqueKeys out;
        out.keys.reserve(keys_.count());
        keys_.for_each([&](Key k) { out.keys.push_back(k); });
        return out;
    }

    [[nodiscard]] auto contains(Key key) const -> bool { return keys_.contains(key); }
    [[nodiscard]] auto count() const -> std::size_t { return keys_.count(); }

private:
    KeySet keys_;
};

} // namespace tessera::index
