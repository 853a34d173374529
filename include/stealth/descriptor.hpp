#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace stealth {

struct Texel;

// Describe a row-major rectangular matrix layout.
//
// Only concerned with byte-buffer compatibility, not with the type or color of
// texels. Convert to a BufferLayout with BufferLayout::withRowLayout().
struct RowLayoutDescription {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint64_t texelStride = 0;
    std::uint64_t rowStride = 0;

    [[nodiscard]] bool operator==(const RowLayoutDescription&) const = default;
};

// The byte layout of a buffer.
//
// Invariant: the full byte length fits both a std::size_t and a std::uint64_t.
// Only constructible through the checked factories below.
class BufferLayout {
public:
    BufferLayout() = default;

    [[nodiscard]] static std::optional<BufferLayout> withRowLayout(const RowLayoutDescription& rows);
    [[nodiscard]] static std::optional<BufferLayout> withTexel(const Texel& texel, std::uint32_t width,
                                                               std::uint32_t height);

    [[nodiscard]] std::uint32_t width() const { return width_; }
    [[nodiscard]] std::uint32_t height() const { return height_; }
    [[nodiscard]] std::uint8_t bytesPerTexel() const { return bytesPerTexel_; }
    [[nodiscard]] std::uint32_t bytesPerRow() const { return bytesPerRow_; }

    [[nodiscard]] std::uint64_t u64Len() const { return static_cast<std::uint64_t>(bytesPerRow_) * height_; }
    [[nodiscard]] std::size_t byteLen() const { return static_cast<std::size_t>(bytesPerRow_) * height_; }

    [[nodiscard]] RowLayoutDescription asRowLayout() const;

    [[nodiscard]] bool operator==(const BufferLayout&) const = default;

private:
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    std::uint8_t bytesPerTexel_ = 0;
    std::uint32_t bytesPerRow_ = 0;
};

// Which part of the image a single texel refers to.
enum class Block : std::uint8_t {
    Pixel,  // single pixel
    Sub1x2, // two pixels across width
    Sub1x4, // four pixels across width
    Sub2x2,
    Sub2x4,
    Sub4x4,
};

[[nodiscard]] std::uint32_t blockWidth(Block block);
[[nodiscard]] std::uint32_t blockHeight(Block block);

// Which values are present in a texel. An X marks an encoded channel that is
// padding and may be disregarded.
enum class SampleParts : std::uint16_t {
    A,
    R,
    G,
    B,
    Luma,
    LumaA,
    Rgb,
    Bgr,
    Rgba,
    RgbX,
    Bgra,
    BgrX,
    Argb,
    XRgb,
    Abgr,
    XBgr,
    Yuv,
    Lab,
    LabA,
    LCh,
    LChA,
};

[[nodiscard]] std::uint8_t numComponents(SampleParts parts);

// How the values are encoded as bits in the texel bytes.
enum class SampleBits : std::uint8_t {
    Int8,
    Int332,
    Int233,
    Int16,
    Int4x4,
    Int_444,
    Int444_,
    Int565,
    Int8x2,
    Int8x3,
    Int8x4,
    Int16x2,
    Int16x3,
    Int16x4,
    Int1010102,
    Int2101010,
    Int101010_,
    Int_101010,
    Float16x4,
    Float32x4,
};

// Number of bytes of one texel with these samples.
[[nodiscard]] std::size_t sampleBytes(SampleBits bits);

struct Samples {
    SampleParts parts = SampleParts::Rgba;
    SampleBits bits = SampleBits::Int8x4;

    [[nodiscard]] bool operator==(const Samples&) const = default;
};

// A single channel, as selected by extract() and inject().
enum class ColorChannel : std::uint8_t {
    R,
    G,
    B,
    Luma,
    Alpha,
    Cb,
    Cr,
    L,
    LABa,
    LABb,
    C,
    LABh,
    X,
    Y,
    Z,
    Scalar0,
    Scalar1,
    Scalar2,
};

enum class Transfer : std::uint8_t {
    Bt709,
    Bt470M,
    Bt601,
    Smpte240,
    Linear,
    Srgb,
    Bt2020_10bit,
    Bt2020_12bit,
    Smpte2084,
    Bt2100Pq,
    Bt2100Hlg,
    Bt2100Scene,
};

enum class Luminance : std::uint8_t {
    Sdr,      // 100cd/m2
    Hdr,      // 10000cd/m2
    AdobeRgb, // 160cd/m2
};

enum class Primaries : std::uint8_t {
    Bt601_525,
    Bt601_625,
    Bt709,
    Smpte240,
    Bt2020,
    Bt2100,
};

enum class Whitepoint : std::uint8_t {
    A,
    B,
    C,
    D50,
    D55,
    D65,
    D75,
    E,
    F2,
    F7,
    F11,
};

// An rgb-ish additive model defined against the CIE 1931 XYZ observers.
struct XyzColor {
    Primaries primary = Primaries::Bt709;
    Transfer transfer = Transfer::Srgb;
    Whitepoint whitepoint = Whitepoint::D65;
    Luminance luminance = Luminance::Sdr;

    [[nodiscard]] bool operator==(const XyzColor&) const = default;
};

// Oklab, quantized as LCh.
struct OklabColor {
    [[nodiscard]] bool operator==(const OklabColor&) const = default;
};

// Plain coefficients with no physical interpretation.
struct ScalarsColor {
    Transfer transfer = Transfer::Linear;

    [[nodiscard]] bool operator==(const ScalarsColor&) const = default;
};

// The color tag of a texel. Open set: new models are added as new alternatives,
// and every dispatch over them lives in one member function below.
class Color {
public:
    using Model = std::variant<XyzColor, OklabColor, ScalarsColor>;

    Color() = default;
    Color(XyzColor c) : model_(c) {}      // NOLINT implicit
    Color(OklabColor c) : model_(c) {}    // NOLINT implicit
    Color(ScalarsColor c) : model_(c) {}  // NOLINT implicit

    [[nodiscard]] static Color srgb();
    [[nodiscard]] static Color bt709();

    [[nodiscard]] const Model& model() const { return model_; }
    [[nodiscard]] bool isXyz() const { return std::holds_alternative<XyzColor>(model_); }

    // Reference white of XYZ-class colors, nullopt for all others.
    [[nodiscard]] std::optional<Whitepoint> whitepoint() const;

    // Check if this color can be carried by a texel with these sample parts.
    // Scalars accept any parts.
    [[nodiscard]] bool isConsistent(SampleParts parts) const;

    [[nodiscard]] bool operator==(const Color&) const = default;

private:
    Model model_ = XyzColor{};
};

struct Texel {
    Block block = Block::Pixel;
    Samples samples;
    Color color;

    [[nodiscard]] static Texel withSrgb(Samples samples);

    // The texel describing one channel alone. nullopt if the channel is not
    // contained or can not be extracted on its own.
    [[nodiscard]] std::optional<Texel> channelTexel(ColorChannel channel) const;

    [[nodiscard]] bool operator==(const Texel&) const = default;
};

// Describes an image semantically: byte layout plus texel interpretation.
struct Descriptor {
    BufferLayout layout;
    Texel texel;

    [[nodiscard]] static std::optional<Descriptor> withTexel(const Texel& texel, std::uint32_t width,
                                                             std::uint32_t height);

    [[nodiscard]] std::optional<Texel> channelTexel(ColorChannel channel) const { return texel.channelTexel(channel); }

    // The texel byte size agrees with the layout.
    [[nodiscard]] bool isConsistent() const;

    [[nodiscard]] std::uint32_t pixelWidth() const;
    [[nodiscard]] std::uint32_t pixelHeight() const;

    [[nodiscard]] bool operator==(const Descriptor&) const = default;
};

// Host-resident bytes shaped by a BufferLayout.
class ImageBuffer {
public:
    // Zero-initialized storage of layout.byteLen() bytes.
    [[nodiscard]] static ImageBuffer withLayout(const BufferLayout& layout);

    // Copies `size` bytes; throws via throwError() when `size` differs from the layout.
    [[nodiscard]] static ImageBuffer withBytes(const BufferLayout& layout, const void* data,
                                               std::size_t size);

    [[nodiscard]] const BufferLayout& layout() const { return layout_; }
    [[nodiscard]] const std::uint8_t* data() const { return bytes_.data(); }
    [[nodiscard]] std::uint8_t* data() { return bytes_.data(); }
    [[nodiscard]] std::size_t size() const { return bytes_.size(); }

private:
    ImageBuffer() = default;

    BufferLayout layout_;
    std::vector<std::uint8_t> bytes_;
};

} // namespace stealth
