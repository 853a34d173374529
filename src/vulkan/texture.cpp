#include <stealth/allocator.hpp>
#include <stealth/texture.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

namespace stealth {

void Texture::destroy() {
    if (view_ != VK_NULL_HANDLE) {
        vkDestroyImageView(device_, view_, nullptr);
    }
    if (image_ != VK_NULL_HANDLE) {
        vmaDestroyImage(allocator_, image_, allocation_);
    }
    view_       = VK_NULL_HANDLE;
    image_      = VK_NULL_HANDLE;
    allocation_ = nullptr;
}

Texture::~Texture() {
    destroy();
}

Texture::Texture(Texture&& o) noexcept
    : allocator_(o.allocator_), device_(o.device_), image_(o.image_),
      view_(o.view_), allocation_(o.allocation_),
      format_(o.format_), extent_(o.extent_) {
    o.allocator_  = nullptr;
    o.device_     = VK_NULL_HANDLE;
    o.image_      = VK_NULL_HANDLE;
    o.view_       = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
}

Texture& Texture::operator=(Texture&& o) noexcept {
    if (this != &o) {
        destroy();
        allocator_  = o.allocator_;
        device_     = o.device_;
        image_      = o.image_;
        view_       = o.view_;
        allocation_ = o.allocation_;
        format_     = o.format_;
        extent_     = o.extent_;
        o.allocator_  = nullptr;
        o.device_     = VK_NULL_HANDLE;
        o.image_      = VK_NULL_HANDLE;
        o.view_       = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
    }
    return *this;
}

TextureBuilder::TextureBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()), device_(allocator.vkDevice()) {}

TextureBuilder& TextureBuilder::size(std::uint32_t width, std::uint32_t height) {
    width_  = width;
    height_ = height;
    return *this;
}

TextureBuilder& TextureBuilder::format(VkFormat fmt) {
    format_ = fmt;
    return *this;
}

TextureBuilder& TextureBuilder::storage() {
    usage_ = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_SAMPLED_BIT |
             VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    return *this;
}

TextureBuilder& TextureBuilder::usage(VkImageUsageFlags flags) {
    usage_ = flags;
    return *this;
}

Result<Texture> TextureBuilder::build() {
    if (width_ == 0 || height_ == 0) {
        return Error{"create texture", 0,
                     "texture size is 0, an empty image has no device storage"};
    }
    if (format_ == VK_FORMAT_UNDEFINED) {
        return Error{"create texture", 0,
                     "no device format for these samples"};
    }
    if (usage_ == 0) {
        return Error{"create texture", 0,
                     "no usage flags, call storage() or usage()"};
    }

    VkImageCreateInfo imageCI{};
    imageCI.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageCI.imageType     = VK_IMAGE_TYPE_2D;
    imageCI.format        = format_;
    imageCI.extent        = {width_, height_, 1};
    imageCI.mipLevels     = 1;
    imageCI.arrayLayers   = 1;
    imageCI.samples       = VK_SAMPLE_COUNT_1_BIT;
    imageCI.tiling        = VK_IMAGE_TILING_OPTIMAL;
    imageCI.usage         = usage_;
    imageCI.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    imageCI.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;

    Texture tex;
    tex.allocator_ = allocator_;
    tex.device_    = device_;
    tex.format_    = format_;
    tex.extent_    = {width_, height_};

    VkResult vr = vmaCreateImage(allocator_, &imageCI, &allocCI,
                                  &tex.image_, &tex.allocation_, nullptr);
    if (vr != VK_SUCCESS) {
        return Error{"create texture", static_cast<std::int32_t>(vr),
                     "vmaCreateImage failed", ErrorKind::Device};
    }

    VkImageViewCreateInfo viewCI{};
    viewCI.sType    = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewCI.image    = tex.image_;
    viewCI.viewType = VK_IMAGE_VIEW_TYPE_2D;
    viewCI.format   = format_;
    viewCI.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
    viewCI.subresourceRange.baseMipLevel   = 0;
    viewCI.subresourceRange.levelCount     = 1;
    viewCI.subresourceRange.baseArrayLayer = 0;
    viewCI.subresourceRange.layerCount     = 1;

    vr = vkCreateImageView(device_, &viewCI, nullptr, &tex.view_);
    if (vr != VK_SUCCESS) {
        return Error{"create texture view", static_cast<std::int32_t>(vr),
                     "vkCreateImageView failed for VMA-allocated image", ErrorKind::Device};
    }

    return tex;
}

} // namespace stealth
