#pragma once

#include <stealth/error.hpp>
#include <stealth/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace stealth {

struct Adapter;

// Queue families picked for headless work. Presentation is never needed.
struct QueueFamilies {
    std::uint32_t compute  = UINT32_MAX; // graphics+compute or compute-only
    std::uint32_t transfer = UINT32_MAX; // dedicated transfer, UINT32_MAX = none

    [[nodiscard]] bool valid() const { return compute != UINT32_MAX; }

    [[nodiscard]] bool hasDedicatedTransfer() const {
        return transfer != UINT32_MAX && transfer != compute;
    }
};

// What a caller asks of an adapter when registering a device with the pool.
struct DeviceRequest {
    std::string              label = "stealth";
    std::vector<const char*> extensions;
    bool                     preferDedicatedTransfer = true;
};

// Thread safety: immutable after construction. VkQueue handles returned by
// accessors follow Vulkan queue externally-synchronized rules.
class Device {
public:
    // Blocks until the driver created the logical device or refused.
    [[nodiscard]] static Result<Device> create(const Adapter& adapter, const DeviceRequest& request);

    ~Device();
    Device(Device&&) noexcept;
    Device& operator=(Device&&) noexcept;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] VkDevice         native()           const { return device_; }
    [[nodiscard]] VkDevice         vkDevice()         const { return native(); }
    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkInstance       vkInstance()       const { return instance_; }
    [[nodiscard]] VkQueue          computeQueue()     const { return computeQueue_; }
    [[nodiscard]] VkQueue          transferQueue()    const { return transferQueue_; }
    [[nodiscard]] QueueFamilies    queueFamilies()    const { return families_; }
    [[nodiscard]] bool             hasDedicatedTransfer() const { return families_.hasDedicatedTransfer(); }
    [[nodiscard]] std::uint32_t    maxImageDimension2D()  const { return maxImageDimension2D_; }
    [[nodiscard]] const std::string& label()   const { return label_; }
    [[nodiscard]] const char*        gpuName() const { return gpuName_.c_str(); }

    // VK_EXT_memory_budget support (opportunistic).
    [[nodiscard]] bool hasMemoryBudget() const { return hasMemoryBudget_; }

    void waitIdle() const;

private:
    Device() = default;
    void destroy();

    VkInstance       instance_       = VK_NULL_HANDLE;
    VkDevice         device_         = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkQueue          computeQueue_   = VK_NULL_HANDLE;
    VkQueue          transferQueue_  = VK_NULL_HANDLE;
    QueueFamilies    families_;
    std::uint32_t    maxImageDimension2D_ = 0;
    std::string      label_;
    std::string      gpuName_;
    bool             hasMemoryBudget_ = false;
};

} // namespace stealth
