#include <stealth/loader.hpp>

#if STEALTH_HAS_LOADERS
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4100) // unreferenced formal parameter
#pragma warning(disable : 4244) // conversion, possible loss of data
#pragma warning(disable : 4245) // signed/unsigned mismatch in initialization
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#if defined(_MSC_VER)
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
#endif // STEALTH_HAS_LOADERS

#include <climits>
#include <cstring>
#include <string>

namespace stealth {

#if STEALTH_HAS_LOADERS

LoadedImage::~LoadedImage() {
    if (pixels) {
        stbi_image_free(pixels);
    }
}

LoadedImage::LoadedImage(LoadedImage&& o) noexcept
    : pixels(o.pixels), width(o.width), height(o.height), channels(o.channels) {
    o.pixels = nullptr;
    o.width = 0;
    o.height = 0;
    o.channels = 0;
}

LoadedImage& LoadedImage::operator=(LoadedImage&& o) noexcept {
    if (this != &o) {
        if (pixels) {
            stbi_image_free(pixels);
        }
        pixels = o.pixels;
        width = o.width;
        height = o.height;
        channels = o.channels;
        o.pixels = nullptr;
        o.width = 0;
        o.height = 0;
        o.channels = 0;
    }
    return *this;
}

static Error decodeError(const char* operation, const std::string& source) {
    const char* reason = stbi_failure_reason();
    return Error{operation, 0,
                 "stbi_load failed: " + std::string(reason ? reason : "unknown error") +
                     " (source: " + source + ")"};
}

Result<LoadedImage> loadImage(const std::filesystem::path& path) {
    int w = 0, h = 0, ch = 0;
    unsigned char* pixels = stbi_load(path.string().c_str(), &w, &h, &ch, 4);
    if (!pixels) return decodeError("load image", path.string());

    LoadedImage image;
    image.pixels = pixels;
    image.width = static_cast<std::uint32_t>(w);
    image.height = static_cast<std::uint32_t>(h);
    image.channels = 4;
    return image;
}

Result<LoadedImage> loadImageFromMemory(const void* data, std::size_t size) {
    if (data == nullptr || size == 0 || size > static_cast<std::size_t>(INT_MAX)) {
        return Error{"load image from memory", 0,
                     "encoded size " + std::to_string(size) + " is not decodable"};
    }

    int w = 0, h = 0, ch = 0;
    unsigned char* pixels = stbi_load_from_memory(static_cast<const stbi_uc*>(data),
                                                  static_cast<int>(size), &w, &h, &ch, 4);
    if (!pixels) return decodeError("load image from memory", "memory");

    LoadedImage image;
    image.pixels = pixels;
    image.width = static_cast<std::uint32_t>(w);
    image.height = static_cast<std::uint32_t>(h);
    image.channels = 4;
    return image;
}

LoadedImage copyRgba8(std::uint32_t width, std::uint32_t height, const std::uint8_t* pixels) {
    LoadedImage image;
    image.width = width;
    image.height = height;
    image.channels = 4;
    if (image.sizeBytes() != 0) {
        image.pixels = static_cast<unsigned char*>(STBI_MALLOC(image.sizeBytes()));
        if (!image.pixels) throwError(Error{"copy image", 0, "out of host memory"});
        std::memcpy(image.pixels, pixels, image.sizeBytes());
    }
    return image;
}

#endif // STEALTH_HAS_LOADERS

} // namespace stealth
