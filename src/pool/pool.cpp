#include <stealth/instance.hpp>
#include <stealth/loader.hpp>
#include <stealth/pool.hpp>
#include <stealth/program.hpp>

#include <cstring>
#include <string>
#include <type_traits>
#include <variant>

namespace stealth {

static std::string describeLayout(const BufferLayout& layout) {
    return std::to_string(layout.width()) + "x" + std::to_string(layout.height()) + " (" +
           std::to_string(layout.bytesPerTexel()) + " B/texel, " +
           std::to_string(layout.bytesPerRow()) + " B/row)";
}

static void requireSameLayout(const char* operation, const BufferLayout& ours,
                              const BufferLayout& theirs) {
    if (ours != theirs) {
        throwError(Error{operation, 0,
                         "layout " + describeLayout(theirs) + " does not match entry layout " +
                             describeLayout(ours)});
    }
}

const BufferLayout& ImageData::layout() const {
    return std::visit(
        [](const auto& data) -> const BufferLayout& {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, ImageBuffer>) {
                return data.layout();
            } else {
                return data.layout;
            }
        },
        storage_);
}

const std::uint8_t* ImageData::asBytes() const {
    if (const auto* host = std::get_if<ImageBuffer>(&storage_)) return host->data();
    return nullptr;
}

std::uint8_t* ImageData::asBytesMut() {
    if (auto* host = std::get_if<ImageBuffer>(&storage_)) return host->data();
    return nullptr;
}

std::optional<GpuKey> ImageData::gpu() const {
    if (const auto* buf = std::get_if<DeviceBufferData>(&storage_)) return buf->gpu;
    if (const auto* tex = std::get_if<DeviceTextureData>(&storage_)) return tex->gpu;
    return std::nullopt;
}

ImageData ImageData::hostAllocate() {
    ImageData previous(ImageBuffer::withLayout(layout()));
    std::swap(storage_, previous.storage_);
    return previous;
}

std::optional<Descriptor> PoolImage::descriptor() const {
    Descriptor desc{layout(), texel()};
    if (!desc.isConsistent()) return std::nullopt;
    return desc;
}

#if STEALTH_HAS_LOADERS
std::optional<LoadedImage> PoolImage::toLoadedImage() const {
    const std::uint8_t* bytes = asBytes();
    if (!bytes || texel() != Texel::withSrgb(Samples{SampleParts::Rgba, SampleBits::Int8x4})) {
        return std::nullopt;
    }

    // Decoded images have no row padding.
    const BufferLayout& rows = layout();
    if (rows.bytesPerRow() != static_cast<std::uint64_t>(rows.width()) * 4) return std::nullopt;

    return copyRgba8(rows.width(), rows.height(), bytes);
}
#endif

void PoolImageMut::setColor(const Color& color) {
    if (!color.isConsistent(image_->texel.samples.parts)) {
        throwError(Error{"set color", 0, "color can not describe the sample parts of the entry"});
    }
    image_->texel.color = color;
}

std::optional<ImageBuffer> PoolImageMut::hostCopy() const {
    const std::uint8_t* bytes = asBytes();
    if (!bytes) return std::nullopt;
    return ImageBuffer::withBytes(layout(), bytes, layout().byteLen());
}

ImageData PoolImageMut::replace(ImageData data) {
    requireSameLayout("replace image data", layout(), data.layout());
    std::swap(image_->data, data);
    return data;
}

void PoolImageMut::swap(ImageData& data) {
    requireSameLayout("swap image data", layout(), data.layout());
    std::swap(image_->data, data);
}

bool PoolImageMut::trade(ImageData& data) {
    if (meta().noRead) {
        swap(data);
        return true;
    }

    if (auto copy = hostCopy()) {
        data = ImageData(std::move(*copy));
        return true;
    }

    return false;
}

Result<GpuKey> Pool::requestDevice(const Adapter& adapter, const DeviceRequest& request) {
    auto gpu = Gpu::create(adapter, request);
    if (!gpu.ok()) return gpu.error();

    return devices_.insert(std::move(gpu).value());
}

GpuKey Pool::reinsertDevice(Gpu gpu) {
    return devices_.insert(std::move(gpu));
}

bool Pool::deviceInUse(GpuKey key) const {
    bool used = false;
    items_.forEach([&](PoolKey, const Image& image) { used = used || image.data.gpu() == key; });
    return used;
}

std::optional<std::pair<GpuKey, Gpu>> Pool::selectDevice(const Capabilities& caps) {
    // Capabilities are not matched against device limits yet.
    (void)caps;

    // Entries own storage from their device's allocator, so a device they
    // reference stays in the pool.
    for (GpuKey key : devices_.keys()) {
        if (deviceInUse(key)) continue;
        auto gpu = devices_.remove(key);
        return std::pair<GpuKey, Gpu>(key, std::move(*gpu));
    }
    return std::nullopt;
}

std::vector<const Device*> Pool::iterDevices() const {
    std::vector<const Device*> result;
    devices_.forEach([&](GpuKey, const Gpu& gpu) { result.push_back(&gpu.device()); });
    return result;
}

Pool& Pool::operator=(Pool&& other) noexcept {
    if (this != &other) {
        // Entries first, their storage belongs to our devices.
        items_ = std::move(other.items_);
        devices_ = std::move(other.devices_);
    }
    return *this;
}

PoolImageMut Pool::insertData(ImageData data, const Texel& texel) {
    PoolKey key = items_.insert(Image{ImageMeta{}, std::move(data), texel});
    return PoolImageMut(key, items_.get(key));
}

PoolImageMut Pool::insert(ImageBuffer buffer, const Texel& texel) {
    return insertData(ImageData(std::move(buffer)), texel);
}

PoolImageMut Pool::insertSrgb(const LoadedImage& image) {
    Texel texel = Texel::withSrgb(Samples{SampleParts::Rgba, SampleBits::Int8x4});

    auto layout = BufferLayout::withTexel(texel, image.width, image.height);
    if (!layout || image.channels != 4) {
        throwError(Error{"insert srgb image", 0,
                         "decoded image is not " + std::to_string(image.width) + "x" +
                             std::to_string(image.height) + " RGBA8"});
    }

    return insert(ImageBuffer::withBytes(*layout, image.pixels, image.sizeBytes()), texel);
}

PoolImageMut Pool::declare(const Descriptor& desc) {
    if (!desc.isConsistent()) {
        throwError(Error{"declare image", 0,
                         "texel size does not match layout " + describeLayout(desc.layout)});
    }
    return insertData(ImageData(LateBoundData{desc.layout}), desc.texel);
}

PoolImageMut Pool::allocateLike(PoolKey key) {
    const Image* source = items_.get(key);
    if (!source) {
        throwError(Error{"allocate like", 0,
                         "pool key " + std::to_string(key.index) + " does not name an entry"});
    }

    ImageBuffer buffer = ImageBuffer::withLayout(source->data.layout());
    if (const std::uint8_t* bytes = source->data.asBytes()) {
        std::memcpy(buffer.data(), bytes, buffer.size());
    }

    Texel texel = source->texel;
    return insertData(ImageData(std::move(buffer)), texel);
}

std::optional<PoolImageMut> Pool::entry(PoolKey key) {
    Image* image = items_.get(key);
    if (!image) return std::nullopt;
    return PoolImageMut(key, image);
}

std::optional<PoolImage> Pool::get(PoolKey key) const {
    const Image* image = items_.get(key);
    if (!image) return std::nullopt;
    return PoolImage(key, image);
}

std::optional<Image> Pool::remove(PoolKey key) {
    return items_.remove(key);
}

std::vector<PoolImage> Pool::iter() const {
    std::vector<PoolImage> result;
    result.reserve(items_.size());
    items_.forEach([&](PoolKey key, const Image& image) { result.push_back(PoolImage(key, &image)); });
    return result;
}

std::vector<PoolImageMut> Pool::iterMut() {
    std::vector<PoolImageMut> result;
    result.reserve(items_.size());
    items_.forEach([&](PoolKey key, Image& image) { result.push_back(PoolImageMut(key, &image)); });
    return result;
}

} // namespace stealth
