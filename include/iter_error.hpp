#pragma once

#include <cstdint>

namespace miniiter {

/**
 * @brief Errors reported by fallible iterator factories.
 */
enum class IterError : uint8_t {
    // Range was asked to advance by zero
    kInvalidStepSize,
};

const char* ToString(IterError error) noexcept;

} // namespace miniiter
