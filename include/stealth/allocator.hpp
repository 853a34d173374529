#pragma once

#include <stealth/error.hpp>
#include <stealth/result.hpp>
#include <stealth/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace stealth {

class Device;

// Per-heap memory budget snapshot.
// usage:    bytes currently allocated by this process.
// budget:   bytes estimated available to this process.
// heapSize: physical heap size from VkMemoryHeap::size.
struct HeapBudget {
    std::uint64_t usage = 0;
    std::uint64_t budget = 0;
    std::uint64_t heapSize = 0;
    VkMemoryHeapFlags flags = 0;
};

// Thread safety: thread-confined.
class Allocator {
public:
    [[nodiscard]] static Result<Allocator> create(const Device& device);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator native()       const { return allocator_; }
    [[nodiscard]] VmaAllocator vmaAllocator() const { return native(); }
    [[nodiscard]] VkDevice     vkDevice()     const { return device_; }

    // One entry per physical device heap. Without VK_EXT_memory_budget the
    // values come from VMA statistics.
    [[nodiscard]] std::vector<HeapBudget> queryBudget() const;

private:
    Allocator() = default;

    VmaAllocator allocator_ = nullptr;
    VkDevice device_ = VK_NULL_HANDLE;
};

} // namespace stealth
