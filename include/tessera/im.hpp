#pragma once

/** \file im.hpp
 *  \brief Persistent index family.
 *
 * The same index algorithms bound to structurally shared backings and key
 * sets. A Collection built from these and a persistent_store can be
 * shallow-cloned in O(1); clones are independent afterwards.
 */

#include <utility>

#include "tessera/backing.hpp"
#include "tessera/core/store.hpp"
#include "tessera/index/btree.hpp"
#include "tessera/index/grouped.hpp"
#include "tessera/index/hashtable.hpp"
#include "tessera/index/keys.hpp"
#include "tessera/keyset.hpp"

namespace tessera::im {

template <class T>
using HashTable = index::HashTable<T, keyset::persistent_set, backing::persistent_hash>;

template <class T>
using BTree = index::BTree<T, keyset::persistent_set, backing::persistent_ordered>;

using Keys = index::Keys<keyset::persistent_set>;

template <class GroupKey, class KeyFn, class MakeFn>
using Grouped = index::Grouped<GroupKey, KeyFn, MakeFn, backing::persistent_hash>;

template <class GroupKey, class KeyFn, class MakeFn>
[[nodiscard]] auto grouped(KeyFn key_fn, MakeFn make) -> Grouped<GroupKey, KeyFn, MakeFn> {
    return Grouped<GroupKey, KeyFn, MakeFn>(std::move(key_fn), std::move(make));
}

template <class In>
using Store = persistent_store<In>;

} // namespace tessera::im
