#pragma once

#include <stealth/error.hpp>
#include <stealth/result.hpp>
#include <stealth/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>

namespace stealth {

class Allocator;

// A VMA-backed device buffer holding the bytes of one pool entry. Owns its allocation.
// Thread safety: immutable after construction.
class Buffer {
public:
    ~Buffer();
    Buffer(Buffer&&) noexcept;
    Buffer& operator=(Buffer&&) noexcept;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] VkBuffer     native()   const { return buffer_; }
    [[nodiscard]] VkBuffer     vkBuffer() const { return native(); }
    [[nodiscard]] VkDeviceSize size()     const { return size_; }

private:
    friend class BufferBuilder;
    Buffer() = default;

    VmaAllocator  allocator_  = nullptr;
    VkBuffer      buffer_     = VK_NULL_HANDLE;
    VmaAllocation allocation_ = nullptr;
    VkDeviceSize  size_       = 0;
};

class BufferBuilder {
public:
    explicit BufferBuilder(const Allocator& allocator);

    BufferBuilder& size(VkDeviceSize bytes);

    // STORAGE | TRANSFER_SRC | TRANSFER_DST, device-local. Image bytes in
    // their buffer layout, addressed by compute shaders.
    BufferBuilder& storageBuffer();

    BufferBuilder& usage(VkBufferUsageFlags flags);

    [[nodiscard]] Result<Buffer> build();

private:
    VmaAllocator       allocator_ = nullptr;
    VkDeviceSize       size_      = 0;
    VkBufferUsageFlags usage_     = 0;
};

} // namespace stealth
