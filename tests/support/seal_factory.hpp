#pragma once

/** \file seal_factory.hpp
 *  \brief Test-only access to Seal, for driving indexes without a Collection.
 */

#include <tessera/core/seal.hpp>

namespace tessera::testing {

struct seal_factory {
  static auto make() -> Seal { return Seal{}; }
};

} // namespace tessera::testing
