#pragma once

/** \file tessera.hpp
 *  \brief Umbrella header.
 */

#include "tessera/aggregation/boolean.hpp"
#include "tessera/aggregation/count.hpp"
#include "tessera/aggregation/generic.hpp"
#include "tessera/aggregation/mean.hpp"
#include "tessera/aggregation/stddev.hpp"
#include "tessera/aggregation/sum.hpp"
#include "tessera/collection.hpp"
#include "tessera/im.hpp"
#include "tessera/index/adapters.hpp"
#include "tessera/index/btree.hpp"
#include "tessera/index/filtered.hpp"
#include "tessera/index/forward.hpp"
#include "tessera/index/grouped.hpp"
#include "tessera/index/hashtable.hpp"
#include "tessera/index/keys.hpp"
#include "tessera/index/mark_shallow.hpp"
#include "tessera/index/premap.hpp"
#include "tessera/index/suffix_tree.hpp"
#include "tessera/index/trivial.hpp"
#include "tessera/index/zip.hpp"
