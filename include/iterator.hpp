#pragma once

#include <memory>
#include <optional>
#include <utility>

namespace miniiter {

/**
 * @brief Generic interface for pull-based cursors.
 *
 * Every producer and consumer in the library derives from this class so
 * that generic algorithms such as Fold() can drain any of them through a
 * base reference. Implementations must guarantee:
 *  - Next() never throws.
 *  - Once Next() has returned std::nullopt it keeps returning std::nullopt.
 *
 * @tparam T element type produced by the cursor
 */
template <typename T>
class Iterator {
public:
    using Item = T;

    Iterator() = default;
    Iterator(const Iterator&) = delete;
    Iterator& operator=(const Iterator&) = delete;
    Iterator(Iterator&&) noexcept = default;
    Iterator& operator=(Iterator&&) noexcept = default;
    virtual ~Iterator() = default;

    /**
     * @return the next element, or std::nullopt once the sequence is exhausted
     */
    virtual std::optional<T> Next() noexcept = 0;
};

/**
 * @brief Wraps an arbitrary Iterator and enforces the exhaustion guarantee.
 *
 * The first std::nullopt from the wrapped iterator fuses the wrapper; from
 * then on Next() returns std::nullopt without touching the wrapped iterator.
 * Useful for iterators supplied by callers that may not honour the contract.
 */
template <typename T>
class FusedIterator final : public Iterator<T> {
public:
    explicit FusedIterator(std::unique_ptr<Iterator<T>> iter)
        : iter_(std::move(iter)), is_fused_(iter_ == nullptr) {}

    std::optional<T> Next() noexcept override {
        if (is_fused_) {
            return std::nullopt;
        }
        std::optional<T> value = iter_->Next();
        if (!value) {
            is_fused_ = true;
        }
        return value;
    }

    /**
     * @return true if the wrapper has observed exhaustion and will never
     *         yield again
     */
    bool IsFused() const noexcept { return is_fused_; }

private:
    std::unique_ptr<Iterator<T>> iter_;
    bool is_fused_;
};

template <typename T>
inline std::unique_ptr<FusedIterator<T>> MakeFused(std::unique_ptr<Iterator<T>> iter) {
    return std::make_unique<FusedIterator<T>>(std::move(iter));
}

} // namespace miniiter
