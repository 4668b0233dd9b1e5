#include "tessera/error.hpp"

namespace tessera::core {

auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::not_found: return "not_found";
  }
  return "unknown";
}

} // namespace tessera::core
