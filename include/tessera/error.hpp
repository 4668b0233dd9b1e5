#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Invariant violations are not reported through this type; see
 *   core/diagnostics.hpp.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tessera::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  not_found = 6001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::not_found};  /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "collection.try_get" */
};

/** \brief Stable lowercase name of an error code ("not_found", ...). */
[[nodiscard]] auto to_string(error_code ec) noexcept -> std::string_view;

} // namespace tessera::core
