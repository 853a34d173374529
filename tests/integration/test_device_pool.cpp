#include <stealth/stealth.hpp>
#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdio>

using namespace stealth;

int main() {
    auto instance = InstanceBuilder{}
                        .appName("test_device_pool")
                        .requireVulkan(1, 3)
                        .validation(Validation::Off)
                        .build();
    assert(instance.ok());

    auto adapters = enumerateAdapters(instance.value());
    assert(adapters.ok());
    assert(!adapters.value().empty());
    const Adapter& adapter = adapters.value().front();
    std::printf("  adapter %s: ok\n", adapter.name.c_str());

    Pool pool;
    auto key = pool.requestDevice(adapter, DeviceRequest{});
    assert(key.ok());
    assert(pool.iterDevices().size() == 1);

    const Gpu* gpu = pool.device(key.value());
    assert(gpu != nullptr);
    assert(gpu->device().vkDevice() != VK_NULL_HANDLE);
    assert(gpu->device().computeQueue() != VK_NULL_HANDLE);
    assert(gpu->allocator().vmaAllocator() != nullptr);
    assert(gpu->device().maxImageDimension2D() >= 4096);
    std::printf("  request device: ok\n");

    Descriptor desc =
        *Descriptor::withTexel(Texel::withSrgb(Samples{SampleParts::Rgba, SampleBits::Int8x4}), 64, 32);

    {
        auto buffer = gpu->createBuffer(desc.layout);
        assert(buffer.ok());
        assert(buffer.value().size() == desc.layout.u64Len());

        auto entry = pool.declare(desc);
        ImageData previous =
            entry.replace(DeviceBufferData{std::move(buffer).value(), desc.layout, key.value()});
        assert(previous.isLateBound());
        assert(entry.data().isDevice());
        assert(entry.data().gpu() == key.value());
        assert(entry.asBytes() == nullptr);

        // Device contents that must be preserved can not be traded.
        ImageData mine(LateBoundData{desc.layout});
        assert(!entry.trade(mine));
        assert(mine.isLateBound());

        // Disposable device contents are swapped out.
        entry.setNoRead(true);
        assert(entry.trade(mine));
        assert(mine.isDevice());
        assert(entry.data().isLateBound());
        std::printf("  device buffer entry: ok\n");
    }

    PoolKey textureEntry;
    {
        auto texture = gpu->createTexture(desc);
        assert(texture.ok());
        assert(texture.value().vkImageView() != VK_NULL_HANDLE);
        assert(texture.value().format() == VK_FORMAT_R8G8B8A8_UNORM);
        assert(texture.value().extent().width == 64);

        auto entry = pool.declare(desc);
        (void)entry.replace(DeviceTextureData{std::move(texture).value(), desc.layout, key.value()});
        textureEntry = entry.key();
        assert(entry.data().gpu() == key.value());
        std::printf("  device texture entry: ok\n");

        Texel blocks = desc.texel;
        blocks.block = Block::Sub2x2;
        auto rejected = gpu->createTexture(Descriptor{desc.layout, blocks});
        assert(!rejected.ok() && rejected.error().isTypeError());
        std::printf("  block texture rejected: ok\n");
    }

    {
        auto budgets = gpu->allocator().queryBudget();
        assert(!budgets.empty());
        std::printf("  memory budget: ok\n");
    }

    // Hand the device to a program and back.
    {
        CommandLog log;
        auto in = log.input(desc).value();
        (void)log.output(log.affine(in, Affine{}).value()).value();
        Program program = log.compile().value();

        // The texture entry still holds storage on the only device.
        assert(!pool.selectDevice(program.capabilities()));
        assert(pool.iterDevices().size() == 1);
        assert(pool.remove(textureEntry));

        auto selected = pool.selectDevice(program.capabilities());
        assert(selected);
        assert(selected->first == key.value());
        assert(selected->second.device().maxImageDimension2D() >=
               program.capabilities().maxImageDimension);
        assert(pool.iterDevices().empty());

        GpuKey back = pool.reinsertDevice(std::move(selected->second));
        assert(pool.device(back) != nullptr);
        assert(pool.device(key.value()) == nullptr);
        std::printf("  select and reinsert device: ok\n");
    }

    // Replacing a pool releases its entries before their devices.
    {
        Pool scratch;
        auto scratchKey = scratch.requestDevice(adapter, DeviceRequest{});
        assert(scratchKey.ok());
        const Gpu* scratchGpu = scratch.device(scratchKey.value());
        auto buffer = scratchGpu->createBuffer(desc.layout);
        assert(buffer.ok());
        (void)scratch.declare(desc).replace(
            DeviceBufferData{std::move(buffer).value(), desc.layout, scratchKey.value()});

        scratch = Pool{};
        assert(scratch.size() == 0);
        assert(scratch.iterDevices().empty());
        std::printf("  move-assign pool with device entries: ok\n");
    }

    std::printf("all device pool tests passed\n");
    return 0;
}
