#include "../include/numeric.hpp"

#include <zlib.h>

#include "../include/fold.hpp"
#include "../include/logger.hpp"
#include "../include/range.hpp"
#include "../include/stringer.hpp"

namespace miniiter {

std::optional<uint32_t> Factorial(uint32_t n, IterError* error) {
    IterError err = IterError::kInvalidStepSize;
    auto range = Range<uint32_t>::Create(1, n, 1, &err);
    if (!range) {
        LOG_WARNING("Factorial(%u) failed: %s", n, ToString(err));
        if (error != nullptr) {
            *error = err;
        }
        return std::nullopt;
    }
    return Fold([](uint32_t acc, uint32_t v) { return acc * v; }, *range, uint32_t{1});
}

uint32_t Crc32(std::string_view bytes) {
    Stringer stringer(bytes);
    uLong seed = crc32(0L, Z_NULL, 0);
    uLong crc = Fold(
        [](uLong acc, uint8_t byte) {
            const Bytef b = byte;
            return crc32(acc, &b, 1);
        },
        stringer, seed);
    return static_cast<uint32_t>(crc);
}

} // namespace miniiter
