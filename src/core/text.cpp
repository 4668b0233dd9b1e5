#include "tessera/core/text.hpp"

namespace tessera::core {

auto prefix_successor(std::string_view prefix) -> std::optional<std::string> {
    std::string upper(prefix);
    while (!upper.empty() && static_cast<unsigned char>(upper.back()) == 0xFF) {
        upper.pop_back();
    }
    if (upper.empty()) return std::nullopt;
    upper.back() = static_cast<char>(static_cast<unsigned char>(upper.back()) + 1);
    return upper;
}

} // namespace tessera::core
