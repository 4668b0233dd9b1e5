#pragma once

/** \file adapters.hpp
 *  \brief Index shapes decided at runtime: absent, fanned out, or one of two.
 *
 * - Optional<Ix>: an index that may be absent; operations are dropped when it is.
 * - FanOut<Container>: a std::vector or std::array of indexes, each seeing
 *   every operation in order.
 * - Either<L, R>: one of two indexes chosen when the collection is built.
 *
 * The choice is fixed at construction; queries only read it.
 */

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "tessera/core/ops.hpp"
#include "tessera/core/shallow_clone.hpp"

namespace tessera::index {

template <class Ix>
class Optional {
public:
    static constexpr bool shallow_clonable = is_shallow_clone_v<Ix>;

    Optional() = default;
    explicit Optional(std::optional<Ix> inner) : inner_(std::move(inner)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        if (inner_) inner_->insert(seal, op);
    }
    template <class In>
    void update(Seal seal, const Update<In>& op) {
        if (inner_) inner_->update(seal, op);
    }
    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        if (inner_) inner_->remove(seal, op);
    }

    [[nodiscard]] auto has_value() const noexcept -> bool { return inner_.has_value(); }
    /** \brief The inner index, or nullptr when absent. */
    [[nodiscard]] auto get() const noexcept -> const Ix* { return inner_ ? &*inner_ : nullptr; }

private:
    std::optional<Ix> inner_;
};

namespace detail {

template <class Container>
struct fan_out_traits {
    static constexpr bool shallow_clonable = false;
};

// A fixed number of members copies in constant time.
template <class Ix, std::size_t N>
struct fan_out_traits<std::array<Ix, N>> {
    static constexpr bool shallow_clonable = is_shallow_clone_v<Ix>;
};

} // namespace detail

template <class Container>
class FanOut {
public:
    using value_type = typename Container::value_type;

    static constexpr bool shallow_clonable = detail::fan_out_traits<Container>::shallow_clonable;

    FanOut() = default;
    explicit FanOut(Container members) : members_(std::move(members)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        for (auto& m : members_) m.insert(seal, op);
    }
    template <class In>
    void update(Seal seal, const Update<In>& op) {
        for (auto& m : members_) m.update(seal, op);
    }
    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        for (auto& m : members_) m.remove(seal, op);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return members_.size(); }
    [[nodiscard]] auto operator[](std::size_t i) const -> const value_type& { return members_[i]; }
    [[nodiscard]] auto begin() const { return members_.begin(); }
    [[nodiscard]] auto end() const { return members_.end(); }

private:
    Container members_;
};

template <class L, class R>
class Either {
public:
    static constexpr bool shallow_clonable = is_shallow_clone_v<L> && is_shallow_clone_v<R>;

    explicit Either(std::variant<L, R> inner) : inner_(std::move(inner)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        std::visit([&](auto& ix) { ix.insert(seal, op); }, inner_);
    }
    template <class In>
    void update(Seal seal, const Update<In>& op) {
        std::visit([&](auto& ix) { ix.update(seal, op); }, inner_);
    }
    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        std::visit([&](auto& ix) { ix.remove(seal, op); }, inner_);
    }

    [[nodiscard]] auto is_left() const noexcept -> bool { return inner_.index() == 0; }
    /** \brief The left index, or nullptr when the right one was chosen. */
    [[nodiscard]] auto left() const noexcept -> const L* { return std::get_if<0>(&inner_); }
    [[nodiscard]] auto right() const noexcept -> const R* { return std::get_if<1>(&inner_); }

private:
    std::variant<L, R> inner_;
};

template <class Ix>
[[nodiscard]] auto fan_out(std::vector<Ix> members) -> FanOut<std::vector<Ix>> {
    return FanOut<std::vector<Ix>>(std::move(members));
}

template <class Ix, std::size_t N>
[[nodiscard]] auto fan_out(std::array<Ix, N> members) -> FanOut<std::array<Ix, N>> {
    return FanOut<std::array<Ix, N>>(std::move(members));
}

template <class L, class R>
[[nodiscard]] auto either(std::variant<L, R> inner) -> Either<L, R> {
    return Either<L, R>(std::move(inner));
}

} // namespace tessera::index
