#include <stealth/allocator.hpp>
#include <stealth/buffer.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4100) // unreferenced formal parameter
#pragma warning(disable : 4189) // local variable initialized but not referenced
#pragma warning(disable : 4244) // conversion, possible loss of data
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#endif
#include <vk_mem_alloc.h>
#if defined(_MSC_VER)
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include <string>

namespace stealth {

Buffer::~Buffer() {
    if (buffer_ != VK_NULL_HANDLE) {
        vmaDestroyBuffer(allocator_, buffer_, allocation_);
    }
}

Buffer::Buffer(Buffer&& o) noexcept
    : allocator_(o.allocator_), buffer_(o.buffer_), allocation_(o.allocation_), size_(o.size_) {
    o.allocator_  = nullptr;
    o.buffer_     = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
    o.size_       = 0;
}

Buffer& Buffer::operator=(Buffer&& o) noexcept {
    if (this != &o) {
        if (buffer_ != VK_NULL_HANDLE) {
            vmaDestroyBuffer(allocator_, buffer_, allocation_);
        }
        allocator_    = o.allocator_;
        buffer_       = o.buffer_;
        allocation_   = o.allocation_;
        size_         = o.size_;
        o.allocator_  = nullptr;
        o.buffer_     = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
        o.size_       = 0;
    }
    return *this;
}

BufferBuilder::BufferBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()) {}

BufferBuilder& BufferBuilder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

BufferBuilder& BufferBuilder::storageBuffer() {
    usage_ = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT |
             VK_BUFFER_USAGE_TRANSFER_SRC_BIT |
             VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return *this;
}

BufferBuilder& BufferBuilder::usage(VkBufferUsageFlags flags) {
    usage_ = flags;
    return *this;
}

Result<Buffer> BufferBuilder::build() {
    if (size_ == 0) {
        return Error{"create buffer", 0, "buffer size is 0, an empty image has no device storage"};
    }
    if (usage_ == 0) {
        return Error{"create buffer", 0, "no usage flags, call storageBuffer() or usage()"};
    }

    VkBufferCreateInfo bufCI{};
    bufCI.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufCI.size  = size_;
    bufCI.usage = usage_;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;

    Buffer buf;
    buf.allocator_ = allocator_;
    buf.size_      = size_;

    VkResult vr = vmaCreateBuffer(allocator_, &bufCI, &allocCI, &buf.buffer_, &buf.allocation_,
                                  nullptr);
    if (vr != VK_SUCCESS) {
        return Error{"create buffer", static_cast<std::int32_t>(vr),
                     "vmaCreateBuffer failed for " + std::to_string(size_) + " bytes",
                     ErrorKind::Device};
    }

    return buf;
}

} // namespace stealth
