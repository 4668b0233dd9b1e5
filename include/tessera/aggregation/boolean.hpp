#pragma once

/** \file boolean.hpp
 *  \brief all/any over boolean values.
 */

#include <cstddef>

#include "tessera/core/ops.hpp"

namespace tessera::aggregation {

class Boolean {
public:
    static constexpr bool shallow_clonable = true;

    void insert(Seal, const Insert<bool>& op) {
        if (op.new_value) ++true_count_; else ++false_count_;
    }

    void update(Seal, const Update<bool>& op) {
        if (op.existing == op.new_value) return;
        if (op.new_value) {
            --false_count_;
            ++true_count_;
        } else {
            --true_count_;
            ++false_count_;
        }
    }

    void remove(Seal, const Remove<bool>& op) {
        if (op.existing) --true_count_; else --false_count_;
    }

    /** \brief True when no value is false (vacuously true when empty). */
    [[nodiscard]] auto all() const noexcept -> bool { return false_count_ == 0; }
    /** \brief True when at least one value is true. */
    [[nodiscard]] auto any() const noexcept -> bool { return true_count_ > 0; }

    [[nodiscard]] auto true_count() const noexcept -> std::size_t { return true_count_; }
    [[nodiscard]] auto false_count() const noexcept -> std::size_t { return false_count_; }
    [[nodiscard]] auto total_count() const noexcept -> std::size_t { return true_count_ + false_count_; }

private:
    std::size_t true_count_{0};
    std::size_t false_count_{0};
};

} // namespace tessera::aggregation
