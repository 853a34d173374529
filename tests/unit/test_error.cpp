#include <stealth/error.hpp>

#include <cassert>
#include <cstdio>
#include <string>

int main() {
    // Vulkan error with message
    {
        stealth::Error e{"request device", -3, "GPU only supports Vulkan 1.2",
                         stealth::ErrorKind::Device};
        std::string s = e.format();
        assert(s.find("request device") != std::string::npos);
        assert(s.find("VkResult -3") != std::string::npos);
        assert(s.find("GPU only supports Vulkan 1.2") != std::string::npos);
        assert(!e.isTypeError());
    }

    // Non-Vulkan error defaults to the generic kind
    {
        stealth::Error e{"inscribe", 0, "rectangle does not match"};
        assert(e.kind == stealth::ErrorKind::Other);
        std::string s = e.format();
        assert(s.find("inscribe") != std::string::npos);
        assert(s.find("VkResult") == std::string::npos);
        assert(s.find("[") == std::string::npos);
        assert(s.find("rectangle does not match") != std::string::npos);
    }

    // Type errors are tagged
    {
        stealth::Error e{"color convert", 0, "whitepoints differ", stealth::ErrorKind::Type};
        assert(e.isTypeError());
        assert(e.format().find("[type error]") != std::string::npos);
    }

    // Bad register is not a type error
    {
        stealth::Error e{"crop", 0, "register 9 out of range", stealth::ErrorKind::BadRegister};
        assert(!e.isTypeError());
        assert(e.format().find("[bad register]") != std::string::npos);
    }

    // No message
    {
        stealth::Error e{"create instance", -1, ""};
        std::string s = e.format();
        assert(s.find("create instance") != std::string::npos);
        assert(s.find("VkResult -1") != std::string::npos);
    }

    assert(std::string(stealth::errorKindName(stealth::ErrorKind::Device)) == "device");

    std::printf("all error tests passed\n");
    return 0;
}
