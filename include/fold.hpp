#pragma once

#include <utility>

#include "iterator.hpp"

namespace miniiter {

/**
 * @brief Left-reduces every remaining element of an iterator.
 *
 * Starting from init, applies acc = combine(acc, value) for each value in
 * production order and returns the final accumulator. An already exhausted
 * iterator returns init unchanged. Does not return for infinite iterators.
 *
 * @param combine binary function (Acc, T) -> Acc
 * @param iter iterator to drain; left exhausted
 * @param init initial accumulator
 */
template <typename Acc, typename T, typename Combine>
Acc Fold(Combine combine, Iterator<T>& iter, Acc init) {
    Acc acc = std::move(init);
    while (auto value = iter.Next()) {
        acc = combine(std::move(acc), std::move(*value));
    }
    return acc;
}

} // namespace miniiter
