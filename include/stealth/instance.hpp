#pragma once

#include <stealth/error.hpp>
#include <stealth/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stealth {

enum class Validation {
    Off,
    On,
};

#ifdef NDEBUG
inline constexpr Validation DefaultValidation = Validation::Off;
#else
inline constexpr Validation DefaultValidation = Validation::On;
#endif

// Headless instance. No WSI extensions are ever enabled.
// Thread safety: immutable after construction.
class Instance {
public:
    ~Instance();
    Instance(Instance&&) noexcept;
    Instance& operator=(Instance&&) noexcept;
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    [[nodiscard]] VkInstance native()     const { return instance_; }
    [[nodiscard]] VkInstance vkInstance() const { return native(); }
    [[nodiscard]] bool validationEnabled() const { return messenger_ != VK_NULL_HANDLE; }

private:
    friend class InstanceBuilder;
    Instance() = default;

    void destroy();

    VkInstance               instance_  = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
};

class InstanceBuilder {
public:
    InstanceBuilder& appName(std::string_view name);
    InstanceBuilder& requireVulkan(std::uint32_t major, std::uint32_t minor, std::uint32_t patch = 0);
    InstanceBuilder& validation(Validation v);
    InstanceBuilder& addExtension(const char* name);
    InstanceBuilder& addLayer(const char* name);

    [[nodiscard]] Result<Instance> build();

private:
    std::string              appName_    = "stealth";
    std::uint32_t            apiVersion_ = VK_API_VERSION_1_3;
    Validation               validation_ = DefaultValidation;
    std::vector<const char*> extensions_;
    std::vector<const char*> layers_;
};

// A physical device as reported by the instance. Does not own anything; the
// instance must outlive it.
struct Adapter {
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    std::string      name;
    VkPhysicalDeviceType type       = VK_PHYSICAL_DEVICE_TYPE_OTHER;
    std::uint32_t    apiVersion     = 0;
};

// All physical devices of the instance, discrete GPUs first.
[[nodiscard]] Result<std::vector<Adapter>> enumerateAdapters(const Instance& instance);

// Human readable name of a VkResult, for error messages.
[[nodiscard]] const char* vkResultName(std::int32_t result);

} // namespace stealth
