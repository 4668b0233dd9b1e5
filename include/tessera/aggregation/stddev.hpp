#pragma once

/** \file stddev.hpp
 *  \brief Sample standard deviation maintained with Welford's online algorithm.
 *
 * State is (mean M, sum of squared deviations S, count n), O(1) regardless of
 * the number of samples.
 *
 *   insert x:  n += 1; M' = M + (x - M) / n;        S += (x - M) * (x - M')
 *   remove x:  M' = (n M - x) / (n - 1);            S -= (x - M) * (x - M'); n -= 1
 *   get:       0 if n < 2, else sqrt(S / (n - 1))
 *
 * Removing down to n <= 1 resets to the empty state. S is clamped at 0 after
 * a removal or update since rounding can drive it slightly negative. Long
 * high-variance streams accumulate rounding error; this is a known limit of
 * the incremental form, not a defect.
 */

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "tessera/core/ops.hpp"

namespace tessera::aggregation {

template <class T>
class StdDev {
public:
    static constexpr bool shallow_clonable = true;

    void insert(Seal, const Insert<T>& op) {
        const double x = static_cast<double>(op.new_value);
        ++count_;
        const double old_mean = mean_;
        mean_ = old_mean + (x - old_mean) / static_cast<double>(count_);
        sum_sq_diff_ += (x - old_mean) * (x - mean_);
    }

    void remove(Seal, const Remove<T>& op) {
        const double x = static_cast<double>(op.existing);
        const std::uint64_t n = count_;
        if (n <= 1) {
            reset();
            return;
        }
        const double old_mean = mean_;
        mean_ = (static_cast<double>(n) * old_mean - x) / static_cast<double>(n - 1);
        sum_sq_diff_ -= (x - old_mean) * (x - mean_);
        sum_sq_diff_ = std::max(sum_sq_diff_, 0.0);
        count_ = n - 1;
    }

    // Remove the old sample and add the new one in a single step; n is unchanged.
    void update(Seal, const Update<T>& op) {
        const double old_val = static_cast<double>(op.existing);
        const double new_val = static_cast<double>(op.new_value);
        const std::uint64_t n = count_;
        if (n == 0) return;
        if (n == 1) {
            mean_ = new_val;
            sum_sq_diff_ = 0.0;
            return;
        }
        const double nf = static_cast<double>(n);
        const double mean_without = (nf * mean_ - old_val) / (nf - 1.0);
        const double s_without = sum_sq_diff_ - (old_val - mean_) * (old_val - mean_without);
        const double new_mean = mean_without + (new_val - mean_without) / nf;
        mean_ = new_mean;
        sum_sq_diff_ = std::max(s_without + (new_val - mean_without) * (new_val - new_mean), 0.0);
    }

    [[nodiscard]] auto get() const -> double {
        if (count_ < 2) return 0.0;
        return std::sqrt(sum_sq_diff_ / static_cast<double>(count_ - 1));
    }

    [[nodiscard]] auto mean() const noexcept -> double { return mean_; }
    [[nodiscard]] auto count() const noexcept -> std::uint64_t { return count_; }

private:
    void reset() noexcept {
        mean_ = 0.0;
        sum_sq_diff_ = 0.0;
        count_ = 0;
    }

    double mean_{0.0};
    double sum_sq_diff_{0.0};
    std::uint64_t count_{0};
};

} // namespace tessera::aggregation
