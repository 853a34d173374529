#include <stealth/stealth.hpp>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <variant>
#include <vector>

// Composes a small badge onto a canvas on the host and prints the result.
// A real executor runs the lowered program on a device instead.

static void fillSolid(stealth::ImageData& dst, const std::vector<std::uint8_t>& texel) {
    std::uint8_t* bytes = dst.asBytesMut();
    for (std::size_t at = 0; at < dst.layout().byteLen(); at += texel.size()) {
        std::memcpy(bytes + at, texel.data(), texel.size());
    }
}

static void inscribe(const stealth::ImageData& below, const stealth::ImageData& above,
                     const stealth::Rectangle& at, stealth::ImageData& dst) {
    const auto& layout = below.layout();
    if (&dst != &below) std::memcpy(dst.asBytesMut(), below.asBytes(), layout.byteLen());

    const auto& small = above.layout();
    for (std::uint32_t row = 0; row < at.height(); ++row) {
        std::uint8_t* line = dst.asBytesMut() + (at.y + row) * layout.bytesPerRow() +
                             at.x * layout.bytesPerTexel();
        std::memcpy(line, above.asBytes() + row * small.bytesPerRow(), small.bytesPerRow());
    }
}

static bool runOnHost(const stealth::Program& program, stealth::Execution& execution) {
    for (const auto& op : program.ops()) {
        if (const auto* alloc = std::get_if<stealth::HighAllocate>(&op)) {
            (void)execution.data(alloc->id)->hostAllocate();
        } else if (const auto* cons = std::get_if<stealth::HighConstruct>(&op)) {
            const auto& solid = std::get<stealth::SolidOp>(cons->op);
            fillSolid(*execution.data(cons->dst), solid.texel);
        } else if (const auto* bin = std::get_if<stealth::HighBinary>(&op)) {
            const auto* place = std::get_if<stealth::InscribeOp>(&bin->op);
            if (!place) {
                std::fprintf(stderr, "[stealth::compose] only inscribe runs on the host\n");
                return false;
            }
            inscribe(*execution.data(bin->lhs), *execution.data(bin->rhs), place->placement,
                     *execution.data(bin->dst));
        } else if (std::holds_alternative<stealth::HighUnary>(op)) {
            std::fprintf(stderr, "[stealth::compose] unary ops need a device executor\n");
            return false;
        }
    }
    return true;
}

static int fail(const stealth::Error& error) {
    std::fprintf(stderr, "%s\n", error.format().c_str());
    return 1;
}

int main() {
    using namespace stealth;

    Texel rgba = Texel::withSrgb(Samples{SampleParts::Rgba, SampleBits::Int8x4});
    Descriptor canvasDesc = *Descriptor::withTexel(rgba, 8, 4);
    Descriptor badgeDesc = *Descriptor::withTexel(rgba, 2, 2);

    CommandLog log;
    auto canvas = log.input(canvasDesc).value();
    auto badge = log.solid(badgeDesc, {0xff, 0x80, 0x00, 0xff}).value();
    auto composed = log.inscribe(canvas, Rectangle{0, 0, 2, 2}, badge);
    if (!composed.ok()) return fail(composed.error());
    (void)log.output(composed.value()).value();

    auto program = log.compile();
    if (!program.ok()) return fail(program.error());
    program.value().dumpLog();

    Pool pool;
    PoolKey source = pool.insert(ImageBuffer::withLayout(canvasDesc.layout), rgba).key();
    PoolKey target = pool.declare(canvasDesc).key();

    Launcher launcher(program.value(), pool);
    if (auto r = launcher.bind(canvas, source); !r.ok()) return fail(r.error());
    if (auto r = launcher.bind(composed.value(), target); !r.ok()) return fail(r.error());

    auto execution = launcher.launch();
    if (!execution.ok()) return fail(execution.error());
    if (!runOnHost(program.value(), execution.value())) return 1;
    if (auto r = execution.value().retire(pool); !r.ok()) return fail(r.error());

    auto result = pool.get(target);
    const auto& layout = result->layout();
    for (std::uint32_t y = 0; y < layout.height(); ++y) {
        for (std::uint32_t x = 0; x < layout.width(); ++x) {
            const std::uint8_t* texel = result->asBytes() + y * layout.bytesPerRow() + x * 4;
            std::printf("%c", texel[3] ? '#' : '.');
        }
        std::printf("\n");
    }
    return 0;
}
