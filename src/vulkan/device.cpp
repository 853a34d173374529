#include <stealth/device.hpp>
#include <stealth/instance.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <set>
#include <string>
#include <vector>

namespace stealth {

void Device::destroy() {
    if (device_ != VK_NULL_HANDLE) {
        vkDestroyDevice(device_, nullptr);
    }
    device_         = VK_NULL_HANDLE;
    physicalDevice_ = VK_NULL_HANDLE;
    computeQueue_   = VK_NULL_HANDLE;
    transferQueue_  = VK_NULL_HANDLE;
    families_       = {};
}

Device::~Device() {
    destroy();
}

Device::Device(Device&& o) noexcept
    : instance_(o.instance_),
      device_(o.device_),
      physicalDevice_(o.physicalDevice_),
      computeQueue_(o.computeQueue_),
      transferQueue_(o.transferQueue_),
      families_(o.families_),
      maxImageDimension2D_(o.maxImageDimension2D_),
      label_(std::move(o.label_)),
      gpuName_(std::move(o.gpuName_)),
      hasMemoryBudget_(o.hasMemoryBudget_) {
    o.device_         = VK_NULL_HANDLE;
    o.physicalDevice_ = VK_NULL_HANDLE;
    o.computeQueue_   = VK_NULL_HANDLE;
    o.transferQueue_  = VK_NULL_HANDLE;
    o.families_       = {};
}

Device& Device::operator=(Device&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_            = o.instance_;
        device_              = o.device_;
        physicalDevice_      = o.physicalDevice_;
        computeQueue_        = o.computeQueue_;
        transferQueue_       = o.transferQueue_;
        families_            = o.families_;
        maxImageDimension2D_ = o.maxImageDimension2D_;
        label_               = std::move(o.label_);
        gpuName_             = std::move(o.gpuName_);
        hasMemoryBudget_     = o.hasMemoryBudget_;
        o.device_         = VK_NULL_HANDLE;
        o.physicalDevice_ = VK_NULL_HANDLE;
        o.computeQueue_   = VK_NULL_HANDLE;
        o.transferQueue_  = VK_NULL_HANDLE;
        o.families_       = {};
    }
    return *this;
}

void Device::waitIdle() const {
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);
    }
}

static QueueFamilies findQueueFamilies(VkPhysicalDevice gpu) {
    QueueFamilies result;

    std::uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, families.data());

    for (std::uint32_t i = 0; i < count; ++i) {
        bool hasGraphics = (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
        bool hasTransfer = (families[i].queueFlags & VK_QUEUE_TRANSFER_BIT) != 0;
        bool hasCompute  = (families[i].queueFlags & VK_QUEUE_COMPUTE_BIT)  != 0;

        // Compute queues implicitly support transfer.
        if (hasCompute && result.compute == UINT32_MAX) {
            result.compute = i;
        }

        // Prefer a transfer-only family (TRANSFER but not GRAPHICS or COMPUTE).
        if (hasTransfer && !hasGraphics && !hasCompute && result.transfer == UINT32_MAX) {
            result.transfer = i;
        }
    }

    return result;
}

static std::vector<VkExtensionProperties> deviceExtensions(VkPhysicalDevice gpu) {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> available(count);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, available.data());
    return available;
}

static bool hasExtension(const std::vector<VkExtensionProperties>& available, const char* name) {
    return std::any_of(available.begin(), available.end(), [&](const VkExtensionProperties& e) {
        return std::strcmp(e.extensionName, name) == 0;
    });
}

Result<Device> Device::create(const Adapter& adapter, const DeviceRequest& request) {
    if (adapter.physicalDevice == VK_NULL_HANDLE) {
        return Error{"request device", 0, "adapter has no physical device", ErrorKind::Device};
    }

    auto families = findQueueFamilies(adapter.physicalDevice);
    if (!families.valid()) {
        return Error{"request device", 0,
                     "adapter '" + adapter.name + "' has no compute capable queue family",
                     ErrorKind::Device};
    }
    if (!request.preferDedicatedTransfer) {
        families.transfer = UINT32_MAX;
    }

    auto available = deviceExtensions(adapter.physicalDevice);
    std::vector<const char*> extensions = request.extensions;
    for (auto* required : extensions) {
        if (!hasExtension(available, required)) {
            return Error{"request device", 0,
                         "Extension '" + std::string(required) + "' is not supported by '" +
                             adapter.name + "'",
                         ErrorKind::Device};
        }
    }

    bool haveMemoryBudget = hasExtension(available, VK_EXT_MEMORY_BUDGET_EXTENSION_NAME);
    if (haveMemoryBudget) {
        extensions.push_back(VK_EXT_MEMORY_BUDGET_EXTENSION_NAME);
    }

    std::set<std::uint32_t> uniqueFamilies = {families.compute};
    if (families.transfer != UINT32_MAX) {
        uniqueFamilies.insert(families.transfer);
    }

    std::vector<VkDeviceQueueCreateInfo> queueCIs;
    float priority = 1.0f;
    for (auto family : uniqueFamilies) {
        VkDeviceQueueCreateInfo qci{};
        qci.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qci.queueFamilyIndex = family;
        qci.queueCount       = 1;
        qci.pQueuePriorities = &priority;
        queueCIs.push_back(qci);
    }

    // Device buffers are addressed by shaders and synchronized with timeline
    // semaphores, both core since 1.2.
    VkPhysicalDeviceVulkan12Features features12{};
    features12.sType               = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    features12.bufferDeviceAddress = VK_TRUE;
    features12.timelineSemaphore   = VK_TRUE;

    VkPhysicalDeviceVulkan13Features features13{};
    features13.sType            = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    features13.synchronization2 = VK_TRUE;
    features12.pNext            = &features13;

    VkPhysicalDeviceFeatures2 features2{};
    features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features2.pNext = &features12;

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.pNext                   = &features2;
    ci.queueCreateInfoCount    = static_cast<std::uint32_t>(queueCIs.size());
    ci.pQueueCreateInfos       = queueCIs.data();
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();

    Device dev;
    VkResult vr = vkCreateDevice(adapter.physicalDevice, &ci, nullptr, &dev.device_);
    if (vr != VK_SUCCESS) {
        return Error{"request device", static_cast<std::int32_t>(vr),
                     std::string(vkResultName(vr)) + " on '" + adapter.name + "'",
                     ErrorKind::Device};
    }

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(adapter.physicalDevice, &props);

    dev.instance_            = adapter.instance;
    dev.physicalDevice_      = adapter.physicalDevice;
    dev.families_            = families;
    dev.maxImageDimension2D_ = props.limits.maxImageDimension2D;
    dev.label_               = request.label;
    dev.gpuName_             = props.deviceName;
    dev.hasMemoryBudget_     = haveMemoryBudget;

    vkGetDeviceQueue(dev.device_, families.compute, 0, &dev.computeQueue_);
    if (families.hasDedicatedTransfer()) {
        vkGetDeviceQueue(dev.device_, families.transfer, 0, &dev.transferQueue_);
    } else {
        dev.transferQueue_ = dev.computeQueue_;
    }

#ifndef NDEBUG
    std::fprintf(stderr, "[stealth::vulkan] device '%s' on %s (compute family %u%s)\n",
                 dev.label_.c_str(), dev.gpuName_.c_str(), families.compute,
                 families.hasDedicatedTransfer() ? ", dedicated transfer" : "");
#endif

    return dev;
}

} // namespace stealth
