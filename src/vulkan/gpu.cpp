#include <stealth/formats.hpp>
#include <stealth/gpu.hpp>
#include <stealth/instance.hpp>

namespace stealth {

Result<Gpu> Gpu::create(const Adapter& adapter, const DeviceRequest& request) {
    auto device = Device::create(adapter, request);
    if (!device.ok()) return device.error();

    auto allocator = Allocator::create(device.value());
    if (!allocator.ok()) return allocator.error();

    return Gpu(std::move(device).value(), std::move(allocator).value());
}

Result<Buffer> Gpu::createBuffer(const BufferLayout& layout) const {
    return BufferBuilder(allocator_)
        .size(layout.u64Len())
        .storageBuffer()
        .build();
}

Result<Texture> Gpu::createTexture(const Descriptor& desc) const {
    if (desc.texel.block != Block::Pixel) {
        return Error{"create texture", 0, "only pixel blocks map to device textures",
                     ErrorKind::Type};
    }

    VkFormat format = toVkFormat(desc.texel.samples);
    if (format == VK_FORMAT_UNDEFINED) {
        return Error{"create texture", 0, "samples have no device format", ErrorKind::Type};
    }

    return TextureBuilder(allocator_)
        .size(desc.layout.width(), desc.layout.height())
        .format(format)
        .storage()
        .build();
}

} // namespace stealth
