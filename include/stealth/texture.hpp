#pragma once

#include <stealth/error.hpp>
#include <stealth/result.hpp>
#include <stealth/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace stealth {

class Allocator;

// A VMA-backed 2D VkImage with one color view.
class Texture {
public:
    ~Texture();
    Texture(Texture&&) noexcept;
    Texture& operator=(Texture&&) noexcept;
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    [[nodiscard]] VkImage     native()      const { return image_; }
    [[nodiscard]] VkImage     vkImage()     const { return native(); }
    [[nodiscard]] VkImageView vkImageView() const { return view_; }
    [[nodiscard]] VkFormat    format()      const { return format_; }
    [[nodiscard]] VkExtent2D  extent()      const { return extent_; }

private:
    friend class TextureBuilder;
    Texture() = default;

    void destroy();

    VmaAllocator  allocator_  = nullptr;
    VkDevice      device_     = VK_NULL_HANDLE;
    VkImage       image_      = VK_NULL_HANDLE;
    VkImageView   view_       = VK_NULL_HANDLE;
    VmaAllocation allocation_ = nullptr;
    VkFormat      format_     = VK_FORMAT_UNDEFINED;
    VkExtent2D    extent_     = {0, 0};
};

class TextureBuilder {
public:
    explicit TextureBuilder(const Allocator& allocator);

    TextureBuilder& size(std::uint32_t width, std::uint32_t height);
    TextureBuilder& format(VkFormat fmt);

    // STORAGE | SAMPLED | TRANSFER_SRC | TRANSFER_DST, as compute shaders
    // read and write pool textures.
    TextureBuilder& storage();

    TextureBuilder& usage(VkImageUsageFlags flags);

    [[nodiscard]] Result<Texture> build();

private:
    VmaAllocator      allocator_ = nullptr;
    VkDevice          device_    = VK_NULL_HANDLE;
    std::uint32_t     width_     = 0;
    std::uint32_t     height_    = 0;
    VkFormat          format_    = VK_FORMAT_UNDEFINED;
    VkImageUsageFlags usage_     = 0;
};

} // namespace stealth
