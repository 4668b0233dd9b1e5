#pragma once

/** \file key.hpp
 *  \brief Record identifier handed out by a Collection.
 */

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace tessera {

/** \brief Opaque, process-local record identifier.
 *
 * Keys are allocated by Collection from a strictly increasing counter and are
 * never reused, even after the record they named is deleted. Indexes may
 * retain keys but never create them.
 */
struct Key {
    std::uint64_t id{0};

    /** \brief Build a key from a raw id. Only meaningful for ids obtained from as_u64(). */
    [[nodiscard]] static constexpr auto unsafe_from_u64(std::uint64_t raw) noexcept -> Key {
        return Key{raw};
    }

    [[nodiscard]] constexpr auto as_u64() const noexcept -> std::uint64_t { return id; }

    friend constexpr auto operator<=>(const Key&, const Key&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const Key& k) {
    return os << "Key(" << k.id << ")";
}

} // namespace tessera

template <>
struct std::hash<tessera::Key> {
    auto operator()(const tessera::Key& k) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(k.id);
    }
};
