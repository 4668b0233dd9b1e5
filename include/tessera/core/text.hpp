#pragma once

/** \file text.hpp
 *  \brief Byte-string helpers for prefix ranges.
 */

#include <optional>
#include <string>
#include <string_view>

namespace tessera::core {

/** \brief Least string greater than every string that starts with prefix.
 *
 * Trailing 0xFF bytes are dropped and the last remaining byte is incremented.
 * Returns std::nullopt when no finite bound exists (empty prefix, or a prefix
 * made only of 0xFF bytes); the range is then unbounded above.
 */
[[nodiscard]] auto prefix_successor(std::string_view prefix) -> std::optional<std::string>;

} // namespace tessera::core
