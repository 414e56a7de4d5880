#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "iterator.hpp"

namespace miniiter {

/**
 * @brief Walks a byte sequence front to back, one byte per Next().
 *
 * The bytes are borrowed; the caller must keep them alive for the lifetime
 * of the Stringer.
 */
class Stringer final : public Iterator<uint8_t> {
public:
    explicit Stringer(std::string_view bytes) noexcept : bytes_(bytes) {}

    std::optional<uint8_t> Next() noexcept override;

    // Index of the byte the next call will return
    size_t Position() const noexcept { return pos_; }

    size_t Remaining() const noexcept { return bytes_.size() - pos_; }

private:
    std::string_view bytes_;
    size_t pos_ = 0;
};

} // namespace miniiter
