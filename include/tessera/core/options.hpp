#pragma once

/** \file options.hpp
 *  \brief Collection configuration.
 */

#include <cstddef>

namespace tessera {

/** \brief Per-collection configuration. */
struct CollectionOptions {
    std::size_t reserve{0};  /**< records to pre-size the store for (hash stores only) */
    bool trace{false};       /**< log every mutation to stderr */
    bool debug{false};       /**< also log store size after each mutation */

    /** \brief Read TESSERA_TRACE / TESSERA_DEBUG from the environment.
     *
     * TESSERA_DEBUG implies trace.
     */
    [[nodiscard]] static auto from_env() -> CollectionOptions;
};

} // namespace tessera
