#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stealth {

// Broad classification of a recoverable failure.
// BadRegister is a special case of Other: an operand named a register that
// does not exist or does not produce a value.
enum class ErrorKind : std::uint8_t {
    Other,
    Type,
    BadRegister,
    Device,
};

// Thin error type that carries what we tried, what Vulkan said, and a human message.
// VkResult is stored as int32_t to avoid pulling <vulkan/vulkan.h> into every header.
struct Error {
    std::string operation; // e.g. "color convert"
    std::int32_t vkResult; // 0 (VK_SUCCESS) when not a Vulkan error
    std::string message;   // human-readable explanation
    ErrorKind kind = ErrorKind::Other;

    [[nodiscard]] bool isTypeError() const {
        return kind == ErrorKind::Type;
    }

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;
};

[[nodiscard]] const char* errorKindName(ErrorKind kind);

// Error unwrap hook used by Result<T>::orThrow() and by contract violations
// inside the pool.
// When STEALTH_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When STEALTH_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace stealth
