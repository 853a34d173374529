#include <stealth/allocator.hpp>
#include <stealth/device.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>

namespace stealth {

Allocator::~Allocator() {
    if (allocator_ != nullptr) {
        vmaDestroyAllocator(allocator_);
    }
}

Allocator::Allocator(Allocator&& o) noexcept
    : allocator_(o.allocator_), device_(o.device_) {
    o.allocator_ = nullptr;
    o.device_    = VK_NULL_HANDLE;
}

Allocator& Allocator::operator=(Allocator&& o) noexcept {
    if (this != &o) {
        if (allocator_ != nullptr) {
            vmaDestroyAllocator(allocator_);
        }
        allocator_   = o.allocator_;
        device_      = o.device_;
        o.allocator_ = nullptr;
        o.device_    = VK_NULL_HANDLE;
    }
    return *this;
}

Result<Allocator> Allocator::create(const Device& device) {
    VmaAllocatorCreateInfo ci{};
    ci.instance         = device.vkInstance();
    ci.physicalDevice   = device.vkPhysicalDevice();
    ci.device           = device.vkDevice();
    ci.vulkanApiVersion = VK_API_VERSION_1_3;
    ci.flags            = VMA_ALLOCATOR_CREATE_BUFFER_DEVICE_ADDRESS_BIT;

    if (device.hasMemoryBudget()) {
        ci.flags |= VMA_ALLOCATOR_CREATE_EXT_MEMORY_BUDGET_BIT;
    }

    Allocator a;
    a.device_ = device.vkDevice();

    VkResult vr = vmaCreateAllocator(&ci, &a.allocator_);
    if (vr != VK_SUCCESS) {
        return Error{"create allocator", static_cast<std::int32_t>(vr),
                     "vmaCreateAllocator failed", ErrorKind::Device};
    }

    return a;
}

std::vector<HeapBudget> Allocator::queryBudget() const {
    VmaAllocatorInfo info{};
    vmaGetAllocatorInfo(allocator_, &info);

    VkPhysicalDeviceMemoryProperties memProps{};
    vkGetPhysicalDeviceMemoryProperties(info.physicalDevice, &memProps);

    std::uint32_t heapCount = memProps.memoryHeapCount;

    // VMA fills one VmaBudget per heap.
    std::vector<VmaBudget> vmaBudgets(heapCount);
    vmaGetHeapBudgets(allocator_, vmaBudgets.data());

    std::vector<HeapBudget> result(heapCount);
    for (std::uint32_t i = 0; i < heapCount; ++i) {
        result[i].usage    = vmaBudgets[i].usage;
        result[i].budget   = vmaBudgets[i].budget;
        result[i].heapSize = memProps.memoryHeaps[i].size;
        result[i].flags    = memProps.memoryHeaps[i].flags;
    }
    return result;
}

} // namespace stealth
