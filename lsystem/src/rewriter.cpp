#include <lsystem/rewriter.hpp>
#include <lsystem/debug_log.hpp>

namespace lsystem {

std::size_t checked_multiply(std::size_t a, std::size_t b, const char* context) {
    std::size_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        DEBUG_LOG("size overflow in %s: %zu * %zu", context, a, b);
        throw OverflowError(std::string(context) + ": " + std::to_string(a) + " * " +
                            std::to_string(b) + " does not fit in size_t");
    }
    return result;
}

std::size_t checked_add(std::size_t a, std::size_t b, const char* context) {
    std::size_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        DEBUG_LOG("size overflow in %s: %zu + %zu", context, a, b);
        throw OverflowError(std::string(context) + ": " + std::to_string(a) + " + " +
                            std::to_string(b) + " does not fit in size_t");
    }
    return result;
}

void check_state_length(std::size_t length, std::size_t limit, const char* context) {
    if (length > limit) {
        DEBUG_LOG("state length %zu exceeds limit %zu in %s", length, limit, context);
        throw OverflowError(std::string(context) + ": " + std::to_string(length) +
                            " symbols exceeds the limit of " + std::to_string(limit));
    }
}

} // namespace lsystem
