#pragma once

#include <stealth/error.hpp>
#include <stealth/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace stealth {

// Pixels decoded from an image file. Owns the pixel memory (freed by destructor).
// Always RGBA, 4 channels, one byte per channel, rows tightly packed.
struct LoadedImage {
    ~LoadedImage();
    LoadedImage(LoadedImage&&) noexcept;
    LoadedImage& operator=(LoadedImage&&) noexcept;
    LoadedImage(const LoadedImage&) = delete;
    LoadedImage& operator=(const LoadedImage&) = delete;

    unsigned char* pixels   = nullptr;
    std::uint32_t  width    = 0;
    std::uint32_t  height   = 0;
    std::uint32_t  channels = 0;

    [[nodiscard]] std::size_t sizeBytes() const {
        return static_cast<std::size_t>(width) * height * channels;
    }

private:
    friend Result<LoadedImage> loadImage(const std::filesystem::path&);
    friend Result<LoadedImage> loadImageFromMemory(const void*, std::size_t);
    friend LoadedImage copyRgba8(std::uint32_t, std::uint32_t, const std::uint8_t*);
    LoadedImage() = default;
};

#if STEALTH_HAS_LOADERS

// Decode an image file (PNG, JPG, BMP, PNM, etc.) via stb_image.
[[nodiscard]] Result<LoadedImage> loadImage(const std::filesystem::path& path);

// Decode an encoded image held in memory.
[[nodiscard]] Result<LoadedImage> loadImageFromMemory(const void* data, std::size_t size);

// Copy of tightly packed RGBA8 pixels, owned the same way as decoded ones.
[[nodiscard]] LoadedImage copyRgba8(std::uint32_t width, std::uint32_t height,
                                    const std::uint8_t* pixels);

#endif // STEALTH_HAS_LOADERS

} // namespace stealth
