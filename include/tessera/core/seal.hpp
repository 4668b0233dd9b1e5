#pragma once

/** \file seal.hpp
 *  \brief Capability token required by every index mutation method.
 *
 * Only Collection can mint a Seal, so application code holding a const
 * reference to an index (inside a query) cannot mutate it out of band.
 * Combinators receive a Seal and pass copies down to their members.
 */

namespace tessera {

template <class In, class Ix, class Store>
class Collection;

namespace testing {
struct seal_factory;
} // namespace testing

class Seal {
    constexpr Seal() noexcept = default;

    template <class, class, class>
    friend class tessera::Collection;
    friend struct testing::seal_factory;
};

} // namespace tessera
