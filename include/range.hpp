#pragma once

#include <limits>
#include <optional>
#include <string>
#include <type_traits>

#include "iter_error.hpp"
#include "iterator.hpp"
#include "logger.hpp"

namespace miniiter {

/**
 * @brief Arithmetic sequence start, start+step, ... bounded by an exclusive end.
 *
 * The direction of travel follows the sign of the step: a positive step stops
 * before reaching or passing end from below, a negative step stops before
 * reaching or passing end from above. A start already at or beyond the bound
 * produces an empty sequence.
 *
 * The cursor never wraps. If advancing would leave the range of T the
 * successor is necessarily past end, so the range is marked exhausted
 * instead.
 *
 * @tparam T any integral type other than bool
 */
template <typename T>
class Range final : public Iterator<T> {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                  "Range requires an integral element type");

public:
    /**
     * @brief Creates a range, rejecting a zero step.
     *
     * @param start first value produced
     * @param end exclusive bound in the direction of travel
     * @param step signed increment, must not be zero
     * @param error receives kInvalidStepSize on failure when non-null
     * @return the range, or std::nullopt when step is zero
     */
    static std::optional<Range> Create(T start, T end, T step, IterError* error = nullptr) {
        if (step == 0) {
            LOG_WARNING("Range rejected: start=%s end=%s step=0 (%s)",
                        std::to_string(start).c_str(), std::to_string(end).c_str(),
                        ToString(IterError::kInvalidStepSize));
            if (error != nullptr) {
                *error = IterError::kInvalidStepSize;
            }
            return std::nullopt;
        }
        return Range(start, end, step);
    }

    std::optional<T> Next() noexcept override {
        if (exhausted_) {
            return std::nullopt;
        }

        const T current = next_val_;
        if (IsDescending()) {
            if (current <= end_) {
                return std::nullopt;
            }
        } else if (current >= end_) {
            return std::nullopt;
        }

        if (WouldOverflow(current)) {
            exhausted_ = true;
        } else {
            next_val_ = static_cast<T>(current + step_);
        }
        return current;
    }

    T Start() const noexcept { return start_; }
    T End() const noexcept { return end_; }
    T Step() const noexcept { return step_; }

private:
    Range(T start, T end, T step)
        : start_(start), end_(end), step_(step), next_val_(start) {}

    bool IsDescending() const noexcept {
        if constexpr (std::is_signed_v<T>) {
            return step_ < 0;
        } else {
            return false;
        }
    }

    bool WouldOverflow(T current) const noexcept {
        if (IsDescending()) {
            return current < std::numeric_limits<T>::min() - step_;
        }
        return current > std::numeric_limits<T>::max() - step_;
    }

    T start_;
    T end_;
    T step_;
    T next_val_;
    bool exhausted_ = false;
};

} // namespace miniiter
