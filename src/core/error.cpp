#include <stealth/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace stealth {

#ifndef STEALTH_ENABLE_EXCEPTIONS
#define STEALTH_ENABLE_EXCEPTIONS 1
#endif

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Other:       return "other";
    case ErrorKind::Type:        return "type error";
    case ErrorKind::BadRegister: return "bad register";
    case ErrorKind::Device:      return "device";
    }
    return "unknown";
}

std::string Error::format() const {
    std::string out = "stealth: " + operation + " failed";

    if (kind == ErrorKind::Type || kind == ErrorKind::BadRegister) {
        out += " [";
        out += errorKindName(kind);
        out += "]";
    }

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

void throwError(const Error& e) {
#if STEALTH_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace stealth
