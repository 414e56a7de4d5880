#include "../include/iter_error.hpp"

namespace miniiter {

const char* ToString(IterError error) noexcept {
    switch (error) {
        case IterError::kInvalidStepSize:
            return "InvalidStepSize";
    }
    return "Unknown";
}

} // namespace miniiter
