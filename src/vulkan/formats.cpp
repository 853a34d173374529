#include <stealth/formats.hpp>

namespace stealth {

VkFormat toVkFormat(Samples samples) {
    using P = SampleParts;
    using B = SampleBits;

    switch (samples.bits) {
    case B::Int8:
        switch (samples.parts) {
        case P::A:
        case P::R:
        case P::G:
        case P::B:
        case P::Luma:
            return VK_FORMAT_R8_UNORM;
        default:
            return VK_FORMAT_UNDEFINED;
        }
    case B::Int8x2:
        return samples.parts == P::LumaA ? VK_FORMAT_R8G8_UNORM : VK_FORMAT_UNDEFINED;
    case B::Int8x3:
        switch (samples.parts) {
        case P::Rgb: return VK_FORMAT_R8G8B8_UNORM;
        case P::Bgr: return VK_FORMAT_B8G8R8_UNORM;
        default:     return VK_FORMAT_UNDEFINED;
        }
    case B::Int8x4:
        switch (samples.parts) {
        case P::Rgba:
        case P::RgbX:
            return VK_FORMAT_R8G8B8A8_UNORM;
        case P::Bgra:
        case P::BgrX:
            return VK_FORMAT_B8G8R8A8_UNORM;
        case P::Abgr:
        case P::XBgr:
            return VK_FORMAT_A8B8G8R8_UNORM_PACK32;
        default:
            return VK_FORMAT_UNDEFINED;
        }
    case B::Int565:
        return samples.parts == P::Rgb ? VK_FORMAT_R5G6B5_UNORM_PACK16 : VK_FORMAT_UNDEFINED;
    case B::Int16:
        return VK_FORMAT_R16_UNORM;
    case B::Int16x2:
        return VK_FORMAT_R16G16_UNORM;
    case B::Int16x3:
        return VK_FORMAT_R16G16B16_UNORM;
    case B::Int16x4:
        return VK_FORMAT_R16G16B16A16_UNORM;
    case B::Int2101010:
        return samples.parts == P::Abgr ? VK_FORMAT_A2B10G10R10_UNORM_PACK32
                                        : VK_FORMAT_UNDEFINED;
    case B::Float16x4:
        return VK_FORMAT_R16G16B16A16_SFLOAT;
    case B::Float32x4:
        return VK_FORMAT_R32G32B32A32_SFLOAT;
    default:
        return VK_FORMAT_UNDEFINED;
    }
}

} // namespace stealth
