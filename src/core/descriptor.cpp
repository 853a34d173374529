#include <stealth/descriptor.hpp>
#include <stealth/error.hpp>

#include <cstring>
#include <limits>
#include <string>

namespace stealth {

std::optional<BufferLayout> BufferLayout::withRowLayout(const RowLayoutDescription& rows) {
    if (rows.texelStride > std::numeric_limits<std::uint8_t>::max())
        return std::nullopt;
    if (rows.rowStride > std::numeric_limits<std::uint32_t>::max())
        return std::nullopt;

    // Texels of one row must not alias each other or the next row.
    std::uint64_t rowBytes = rows.texelStride * rows.width;
    if (rowBytes > rows.rowStride)
        return std::nullopt;

    std::uint64_t total = rows.rowStride * rows.height;
    if (rows.height != 0 && total / rows.height != rows.rowStride)
        return std::nullopt;
    if (total > std::numeric_limits<std::size_t>::max())
        return std::nullopt;

    BufferLayout layout;
    layout.width_ = rows.width;
    layout.height_ = rows.height;
    layout.bytesPerTexel_ = static_cast<std::uint8_t>(rows.texelStride);
    layout.bytesPerRow_ = static_cast<std::uint32_t>(rows.rowStride);
    return layout;
}

std::optional<BufferLayout> BufferLayout::withTexel(const Texel& texel, std::uint32_t width,
                                                    std::uint32_t height) {
    std::uint64_t stride = sampleBytes(texel.samples.bits);
    return withRowLayout(RowLayoutDescription{
        .width = width,
        .height = height,
        .texelStride = stride,
        // withRowLayout checks the range anyways.
        .rowStride = stride * width,
    });
}

RowLayoutDescription BufferLayout::asRowLayout() const {
    return RowLayoutDescription{
        .width = width_,
        .height = height_,
        .texelStride = bytesPerTexel_,
        .rowStride = bytesPerRow_,
    };
}

std::uint32_t blockWidth(Block block) {
    switch (block) {
    case Block::Pixel:
        return 1;
    case Block::Sub1x2:
    case Block::Sub2x2:
        return 2;
    case Block::Sub1x4:
    case Block::Sub2x4:
    case Block::Sub4x4:
        return 4;
    }
    return 1;
}

std::uint32_t blockHeight(Block block) {
    switch (block) {
    case Block::Pixel:
    case Block::Sub1x2:
    case Block::Sub1x4:
        return 1;
    case Block::Sub2x2:
    case Block::Sub2x4:
        return 2;
    case Block::Sub4x4:
        return 4;
    }
    return 1;
}

std::uint8_t numComponents(SampleParts parts) {
    using P = SampleParts;
    switch (parts) {
    case P::A:
    case P::R:
    case P::G:
    case P::B:
    case P::Luma:
        return 1;
    case P::LumaA:
        return 2;
    case P::Rgb:
    case P::Bgr:
    case P::Yuv:
    case P::Lab:
    case P::LCh:
        return 3;
    case P::Rgba:
    case P::RgbX:
    case P::Bgra:
    case P::BgrX:
    case P::Argb:
    case P::XRgb:
    case P::Abgr:
    case P::XBgr:
    case P::LabA:
    case P::LChA:
        return 4;
    }
    return 0;
}

std::size_t sampleBytes(SampleBits bits) {
    using B = SampleBits;
    switch (bits) {
    case B::Int8:
    case B::Int332:
    case B::Int233:
        return 1;
    case B::Int8x2:
    case B::Int16:
    case B::Int565:
    case B::Int4x4:
    case B::Int444_:
    case B::Int_444:
        return 2;
    case B::Int8x3:
        return 3;
    case B::Int8x4:
    case B::Int16x2:
    case B::Int1010102:
    case B::Int2101010:
    case B::Int101010_:
    case B::Int_101010:
        return 4;
    case B::Int16x3:
        return 6;
    case B::Int16x4:
    case B::Float16x4:
        return 8;
    case B::Float32x4:
        return 16;
    }
    return 0;
}

Color Color::srgb() {
    return XyzColor{
        .primary = Primaries::Bt709,
        .transfer = Transfer::Srgb,
        .whitepoint = Whitepoint::D65,
        .luminance = Luminance::Sdr,
    };
}

Color Color::bt709() {
    return XyzColor{
        .primary = Primaries::Bt709,
        .transfer = Transfer::Bt709,
        .whitepoint = Whitepoint::D65,
        .luminance = Luminance::Sdr,
    };
}

std::optional<Whitepoint> Color::whitepoint() const {
    if (const auto* xyz = std::get_if<XyzColor>(&model_))
        return xyz->whitepoint;
    return std::nullopt;
}

bool Color::isConsistent(SampleParts parts) const {
    using P = SampleParts;
    if (std::holds_alternative<XyzColor>(model_)) {
        switch (parts) {
        case P::R:
        case P::G:
        case P::B:
        case P::A:
        case P::Rgb:
        case P::Bgr:
        case P::Rgba:
        case P::RgbX:
        case P::Bgra:
        case P::BgrX:
        case P::Argb:
        case P::XRgb:
        case P::Abgr:
        case P::XBgr:
            return true;
        default:
            return false;
        }
    }
    if (std::holds_alternative<OklabColor>(model_)) {
        return parts == P::LCh || parts == P::LChA;
    }
    // Scalars: the user assigns which meaning each channel has.
    return true;
}

Texel Texel::withSrgb(Samples samples) {
    return Texel{
        .block = Block::Pixel,
        .samples = samples,
        .color = Color::srgb(),
    };
}

std::optional<Texel> Texel::channelTexel(ColorChannel channel) const {
    using P = SampleParts;
    using B = SampleBits;

    std::optional<P> parts;
    switch (samples.parts) {
    case P::Rgb:
    case P::Bgr:
    case P::RgbX:
    case P::BgrX:
    case P::XRgb:
    case P::XBgr:
        if (channel == ColorChannel::R) parts = P::R;
        if (channel == ColorChannel::G) parts = P::G;
        if (channel == ColorChannel::B) parts = P::B;
        break;
    case P::Rgba:
    case P::Bgra:
    case P::Argb:
    case P::Abgr:
        if (channel == ColorChannel::R) parts = P::R;
        if (channel == ColorChannel::G) parts = P::G;
        if (channel == ColorChannel::B) parts = P::B;
        if (channel == ColorChannel::Alpha) parts = P::A;
        break;
    default:
        break;
    }

    if (!parts)
        return std::nullopt;

    switch (samples.bits) {
    case B::Int8:
    case B::Int8x3:
    case B::Int8x4:
        break;
    default:
        return std::nullopt;
    }

    return Texel{
        .block = block,
        .samples = Samples{.parts = *parts, .bits = B::Int8},
        .color = color,
    };
}

std::optional<Descriptor> Descriptor::withTexel(const Texel& texel, std::uint32_t width,
                                                std::uint32_t height) {
    auto layout = BufferLayout::withTexel(texel, width, height);
    if (!layout)
        return std::nullopt;
    return Descriptor{*layout, texel};
}

bool Descriptor::isConsistent() const {
    return sampleBytes(texel.samples.bits) == layout.bytesPerTexel();
}

std::uint32_t Descriptor::pixelWidth() const {
    return layout.width() * blockWidth(texel.block);
}

std::uint32_t Descriptor::pixelHeight() const {
    return layout.height() * blockHeight(texel.block);
}

ImageBuffer ImageBuffer::withLayout(const BufferLayout& layout) {
    ImageBuffer buffer;
    buffer.layout_ = layout;
    buffer.bytes_.assign(layout.byteLen(), 0);
    return buffer;
}

ImageBuffer ImageBuffer::withBytes(const BufferLayout& layout, const void* data,
                                   std::size_t size) {
    if (size != layout.byteLen()) {
        throwError(Error{"create image buffer", 0,
                         "got " + std::to_string(size) + " bytes for a layout of " +
                             std::to_string(layout.byteLen())});
    }

    ImageBuffer buffer = withLayout(layout);
    if (size != 0)
        std::memcpy(buffer.bytes_.data(), data, size);
    return buffer;
}

} // namespace stealth
