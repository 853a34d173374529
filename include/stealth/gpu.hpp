#pragma once

#include <stealth/allocator.hpp>
#include <stealth/buffer.hpp>
#include <stealth/descriptor.hpp>
#include <stealth/device.hpp>
#include <stealth/result.hpp>
#include <stealth/texture.hpp>

namespace stealth {

struct Adapter;

// A logical device together with its memory allocator.
// Declaration order matters: the allocator is destroyed before the device.
class Gpu {
public:
    // Blocking. Creates the device and its allocator.
    [[nodiscard]] static Result<Gpu> create(const Adapter& adapter, const DeviceRequest& request);

    [[nodiscard]] const Device&    device()    const { return device_; }
    [[nodiscard]] const Allocator& allocator() const { return allocator_; }

    // Device-local storage buffer holding layout.byteLen() bytes.
    [[nodiscard]] Result<Buffer> createBuffer(const BufferLayout& layout) const;

    // Storage texture for a descriptor. Fails for texels without a device
    // format or with blocks larger than one pixel.
    [[nodiscard]] Result<Texture> createTexture(const Descriptor& desc) const;

private:
    Gpu(Device device, Allocator allocator)
        : device_(std::move(device)), allocator_(std::move(allocator)) {}

    Device    device_;
    Allocator allocator_;
};

} // namespace stealth
