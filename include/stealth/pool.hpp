#pragma once

#include <stealth/buffer.hpp>
#include <stealth/descriptor.hpp>
#include <stealth/device.hpp>
#include <stealth/gpu.hpp>
#include <stealth/loader.hpp>
#include <stealth/result.hpp>
#include <stealth/slot_map.hpp>
#include <stealth/texture.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace stealth {

struct Adapter;
struct Capabilities;

struct PoolKeyTag {};
struct GpuKeyTag {};

using PoolKey = SlotKey<PoolKeyTag>;
using GpuKey  = SlotKey<GpuKeyTag>;

// Data of a generic device buffer, owned by one registered device.
struct DeviceBufferData {
    Buffer       buffer;
    BufferLayout layout;
    GpuKey       gpu;
};

// Data of a device texture, owned by one registered device.
struct DeviceTextureData {
    Texture      texture;
    BufferLayout layout;
    GpuKey       gpu;
};

// No data yet. The caller provides it when binding.
struct LateBoundData {
    BufferLayout layout;
};

// The bytes behind one pool entry, in exactly one storage form.
// Move-only since device storage owns Vulkan objects.
class ImageData {
public:
    using Storage = std::variant<LateBoundData, ImageBuffer, DeviceBufferData, DeviceTextureData>;

    ImageData(LateBoundData data) : storage_(std::move(data)) {}     // NOLINT implicit
    ImageData(ImageBuffer data) : storage_(std::move(data)) {}       // NOLINT implicit
    ImageData(DeviceBufferData data) : storage_(std::move(data)) {}  // NOLINT implicit
    ImageData(DeviceTextureData data) : storage_(std::move(data)) {} // NOLINT implicit

    [[nodiscard]] const BufferLayout& layout() const;

    [[nodiscard]] bool isHost()      const { return std::holds_alternative<ImageBuffer>(storage_); }
    [[nodiscard]] bool isLateBound() const { return std::holds_alternative<LateBoundData>(storage_); }
    [[nodiscard]] bool isDevice()    const { return !isHost() && !isLateBound(); }

    // Host bytes, null unless host allocated.
    [[nodiscard]] const std::uint8_t* asBytes() const;
    [[nodiscard]] std::uint8_t*       asBytesMut();

    // Owning device of device-resident data.
    [[nodiscard]] std::optional<GpuKey> gpu() const;

    [[nodiscard]] const Storage& storage() const { return storage_; }

    // Swap for a zeroed host buffer of the same layout, returning the old data.
    ImageData hostAllocate();

private:
    Storage storage_;
};

// Meta data distinct from the layout questions.
struct ImageMeta {
    // Contents need not be preserved. The entry may serve as scratch space
    // and is traded by swapping.
    bool noRead = false;
    // Logically immutable.
    bool noWrite = false;
};

// One pool entry.
struct Image {
    ImageMeta meta;
    ImageData data;
    Texel     texel;
};

// Read-only view of a pool entry. Valid while the pool is not modified.
class PoolImage {
public:
    [[nodiscard]] PoolKey             key()    const { return key_; }
    [[nodiscard]] const BufferLayout& layout() const { return image_->data.layout(); }
    [[nodiscard]] const Texel&        texel()  const { return image_->texel; }
    [[nodiscard]] const ImageMeta&    meta()   const { return image_->meta; }
    [[nodiscard]] const ImageData&    data()   const { return image_->data; }

    // nullopt when the texel does not agree with the byte layout.
    [[nodiscard]] std::optional<Descriptor> descriptor() const;

    // Host bytes, null unless host allocated.
    [[nodiscard]] const std::uint8_t* asBytes() const { return image_->data.asBytes(); }

#if STEALTH_HAS_LOADERS
    // Copy of a host-allocated sRGB RGBA8 entry, the inverse of
    // Pool::insertSrgb. nullopt for any other entry.
    [[nodiscard]] std::optional<LoadedImage> toLoadedImage() const;
#endif

private:
    friend class Pool;
    friend class PoolImageMut;
    PoolImage(PoolKey key, const Image* image) : key_(key), image_(image) {}

    PoolKey      key_;
    const Image* image_ = nullptr;
};

// Exclusive lease on a pool entry. Move-only.
//
// Ownership transfers (hostAllocate, replace, swap, trade) exchange the whole
// backing store in one step and hand the displaced data back to the caller.
// Layout mismatches are programmer errors and go through throwError().
class PoolImageMut {
public:
    PoolImageMut(PoolImageMut&&) noexcept = default;
    PoolImageMut& operator=(PoolImageMut&&) noexcept = default;
    PoolImageMut(const PoolImageMut&) = delete;
    PoolImageMut& operator=(const PoolImageMut&) = delete;

    [[nodiscard]] PoolKey             key()    const { return key_; }
    [[nodiscard]] const BufferLayout& layout() const { return image_->data.layout(); }
    [[nodiscard]] const Texel&        texel()  const { return image_->texel; }
    [[nodiscard]] const ImageMeta&    meta()   const { return image_->meta; }
    [[nodiscard]] const ImageData&    data()   const { return image_->data; }

    [[nodiscard]] std::optional<Descriptor> descriptor() const { return share().descriptor(); }

    [[nodiscard]] const std::uint8_t* asBytes() const { return image_->data.asBytes(); }
    [[nodiscard]] std::uint8_t*       asBytesMut() { return image_->data.asBytesMut(); }

    // Read-only view of the same entry, valid while this lease is.
    [[nodiscard]] PoolImage share() const { return PoolImage(key_, image_); }

    // Re-tag the color without touching data. The color must be able to
    // describe the current sample parts.
    void setColor(const Color& color);

    void setNoRead(bool noRead) { image_->meta.noRead = noRead; }
    void setNoWrite(bool noWrite) { image_->meta.noWrite = noWrite; }

    ImageData hostAllocate() { return image_->data.hostAllocate(); }

    // A host buffer with a copy of the bytes, nullopt unless host allocated.
    [[nodiscard]] std::optional<ImageBuffer> hostCopy() const;

    // Install `data`, returning the previous data.
    ImageData replace(ImageData data);

    void swap(ImageData& data);

    // Swap when the contents are disposable, else copy host bytes into
    // `data`. False when neither is possible; both sides are untouched then.
    [[nodiscard]] bool trade(ImageData& data);

private:
    friend class Pool;
    PoolImageMut(PoolKey key, Image* image) : key_(key), image_(image) {}

    PoolKey key_;
    Image*  image_ = nullptr;
};

// Owns image entries and the devices their data may live on.
//
// Thread safety: thread-confined. Handles borrow the pool and are invalidated
// by any insertion or removal.
class Pool {
public:
    Pool() = default;
    Pool(Pool&&) noexcept = default;
    Pool& operator=(Pool&& other) noexcept;
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // Blocking device creation on the adapter, registered under a fresh key.
    [[nodiscard]] Result<GpuKey> requestDevice(const Adapter& adapter, const DeviceRequest& request);

    // Register an already created device, e.g. one returned by selectDevice().
    GpuKey reinsertDevice(Gpu gpu);

    // Remove and return a device for a program: the first one no entry
    // holds storage on. Any such device is taken to satisfy the capabilities.
    [[nodiscard]] std::optional<std::pair<GpuKey, Gpu>> selectDevice(const Capabilities& caps);

    [[nodiscard]] std::vector<const Device*> iterDevices() const;
    [[nodiscard]] const Gpu* device(GpuKey key) const { return devices_.get(key); }

    // Host-backed entry from caller bytes.
    PoolImageMut insert(ImageBuffer buffer, const Texel& texel);

    // Host-backed sRGB RGBA8 entry from decoded pixels.
    PoolImageMut insertSrgb(const LoadedImage& image);

    // Late-bound entry. The descriptor must be consistent.
    PoolImageMut declare(const Descriptor& desc);

    // New host entry shaped like `key`, with a copy of its bytes when they
    // are host accessible and zeroes otherwise. The key must be live.
    PoolImageMut allocateLike(PoolKey key);

    [[nodiscard]] std::optional<PoolImageMut> entry(PoolKey key);
    [[nodiscard]] std::optional<PoolImage> get(PoolKey key) const;

    // The removed entry, nullopt for stale keys.
    std::optional<Image> remove(PoolKey key);

    [[nodiscard]] std::vector<PoolImage> iter() const;
    [[nodiscard]] std::vector<PoolImageMut> iterMut();

    [[nodiscard]] std::size_t size() const { return items_.size(); }

private:
    PoolImageMut insertData(ImageData data, const Texel& texel);
    [[nodiscard]] bool deviceInUse(GpuKey key) const;

    // Devices first: entries holding device storage are destroyed before them.
    SlotMap<GpuKey, Gpu>    devices_;
    SlotMap<PoolKey, Image> items_;
};

} // namespace stealth
