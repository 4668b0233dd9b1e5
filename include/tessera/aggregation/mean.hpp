#pragma once

/** \file mean.hpp
 *  \brief Arithmetic mean of the indexed values; 0 when empty.
 */

#include <cstdint>

#include "tessera/core/ops.hpp"

namespace tessera::aggregation {

template <class T>
class Mean {
public:
    static constexpr bool shallow_clonable = true;

    void insert(Seal, const Insert<T>& op) {
        sum_ += static_cast<double>(op.new_value);
        ++count_;
    }

    void update(Seal, const Update<T>& op) {
        sum_ += static_cast<double>(op.new_value) - static_cast<double>(op.existing);
    }

    void remove(Seal, const Remove<T>& op) {
        sum_ -= static_cast<double>(op.existing);
        --count_;
    }

    [[nodiscard]] auto get() const noexcept -> double {
        if (count_ == 0) return 0.0;
        return sum_ / static_cast<double>(count_);
    }

    [[nodiscard]] auto count() const noexcept -> std::uint64_t { return count_; }

private:
    double sum_{0.0};
    std::uint64_t count_{0};
};

} // namespace tessera::aggregation
