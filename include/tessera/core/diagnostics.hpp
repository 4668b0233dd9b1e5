#pragma once

/** \file diagnostics.hpp
 *  \brief Invariant checks and stderr tracing.
 *
 * Tracing is plain stderr output tagged "[tessera][component]". It is enabled
 * per collection through CollectionOptions (see core/options.hpp).
 *
 * An invariant violation means the store and an index disagree about which
 * keys exist. It is reported on stderr and raised as invariant_violation; it
 * is not an error callers are expected to recover from.
 */

#include <sstream>
#include <stdexcept>
#include <string>

namespace tessera::core {

/** \brief Raised when index/store consistency is broken. */
class invariant_violation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/** \brief Print "[tessera][component] invariant failed: message" and throw. */
[[noreturn]] void fail_invariant(const char* component, const std::string& message);

/** \brief Print "[tessera][component] message" to stderr. */
void trace(const char* component, const std::string& message);

} // namespace tessera::core

#define TESSERA_ENSURE(cond, component, msg) do { \
  if (!(cond)) { \
    std::ostringstream _tessera_oss; _tessera_oss << msg; \
    ::tessera::core::fail_invariant(component, _tessera_oss.str()); \
  } \
} while (0)
