#include "../include/stringer.hpp"

namespace miniiter {

std::optional<uint8_t> Stringer::Next() noexcept {
    if (pos_ >= bytes_.size()) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(bytes_[pos_++]);
}

} // namespace miniiter
