#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "iter_error.hpp"

namespace miniiter {

/**
 * @brief Product of the integers in Range(1, n, 1).
 *
 * The range end is exclusive, so the result is 1 * 2 * ... * (n - 1):
 * Factorial(10) == 362880. Factorial(0) and Factorial(1) are 1. The product
 * wraps modulo 2^32 once it exceeds uint32_t.
 *
 * @param error receives the range construction error when non-null
 */
std::optional<uint32_t> Factorial(uint32_t n, IterError* error = nullptr);

/**
 * @brief CRC-32 (zlib polynomial) of a byte sequence, computed by folding a
 *        Stringer through zlib's crc32.
 */
uint32_t Crc32(std::string_view bytes);

} // namespace miniiter
