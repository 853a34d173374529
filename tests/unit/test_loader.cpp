#include <stealth/loader.hpp>
#include <stealth/pool.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <string>

int main() {
    // 2x1 binary PPM: one red, one blue pixel.
    const std::string ppm = std::string("P6\n2 1\n255\n") +
                            std::string("\xff\x00\x00\x00\x00\xff", 6);

    {
        auto image = stealth::loadImageFromMemory(ppm.data(), ppm.size());
        assert(image.ok());
        const auto& loaded = image.value();
        assert(loaded.width == 2);
        assert(loaded.height == 1);
        assert(loaded.channels == 4);
        assert(loaded.sizeBytes() == 8);
        assert(loaded.pixels[0] == 0xff && loaded.pixels[1] == 0 && loaded.pixels[2] == 0);
        assert(loaded.pixels[3] == 0xff); // alpha filled in
        assert(loaded.pixels[6] == 0xff);
        std::printf("  decode ppm: ok\n");

        stealth::Pool pool;
        auto entry = pool.insertSrgb(loaded);
        assert(entry.layout().width() == 2);
        assert(entry.layout().bytesPerTexel() == 4);
        assert(entry.texel().color == stealth::Color::srgb());
        assert(entry.asBytes()[6] == 0xff);
        std::printf("  insert srgb: ok\n");

        auto exported = pool.get(entry.key())->toLoadedImage();
        assert(exported);
        assert(exported->width == 2 && exported->height == 1 && exported->channels == 4);
        assert(exported->pixels != loaded.pixels);
        for (std::size_t i = 0; i < loaded.sizeBytes(); ++i) {
            assert(exported->pixels[i] == loaded.pixels[i]);
        }

        // Only host sRGB RGBA8 entries convert back.
        auto late = pool.declare(entry.descriptor().value()).key();
        assert(!pool.get(late)->toLoadedImage());

        stealth::Texel gray = stealth::Texel::withSrgb(
            stealth::Samples{stealth::SampleParts::Luma, stealth::SampleBits::Int8});
        auto grayLayout = stealth::BufferLayout::withTexel(gray, 2, 1).value();
        auto luma = pool.insert(stealth::ImageBuffer::withLayout(grayLayout), gray).key();
        assert(!pool.get(luma)->toLoadedImage());
        std::printf("  to loaded image: ok\n");
    }

    {
        auto moved = stealth::loadImageFromMemory(ppm.data(), ppm.size());
        assert(moved.ok());
        stealth::LoadedImage owner = std::move(moved).value();
        assert(owner.pixels != nullptr);
        stealth::LoadedImage second = std::move(owner);
        assert(owner.pixels == nullptr);
        assert(second.width == 2);
        std::printf("  move: ok\n");
    }

    {
        const char garbage[] = "not an image";
        auto bad = stealth::loadImageFromMemory(garbage, sizeof(garbage));
        assert(!bad.ok());
        assert(bad.error().message.find("stbi_load failed") != std::string::npos);

        auto empty = stealth::loadImageFromMemory(nullptr, 0);
        assert(!empty.ok());

        auto missing = stealth::loadImage("/nonexistent/stealth_missing.png");
        assert(!missing.ok());
        std::printf("  failures: ok\n");
    }

    std::printf("all loader tests passed\n");
    return 0;
}
