#include <stealth/command.hpp>
#include <stealth/launcher.hpp>
#include <stealth/pool.hpp>
#include <stealth/program.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>

using namespace stealth;

static Descriptor rgbaDesc(std::uint32_t w, std::uint32_t h) {
    return *Descriptor::withTexel(Texel::withSrgb(Samples{SampleParts::Rgba, SampleBits::Int8x4}),
                                  w, h);
}

static PoolKey hostEntry(Pool& pool, const Descriptor& desc, std::uint8_t value) {
    ImageBuffer buffer = ImageBuffer::withLayout(desc.layout);
    std::memset(buffer.data(), value, buffer.size());
    return pool.insert(std::move(buffer), desc.texel).key();
}

struct Affined {
    CommandLog log;
    Register in;
    Register out;
};

static Affined affineLog() {
    Affined a;
    a.in = a.log.input(rgbaDesc(4, 4)).value();
    a.out = a.log.affine(a.in, Affine{}).value();
    (void)a.log.output(a.out).value();
    return a;
}

static void testBind() {
    Affined a = affineLog();
    Program program = a.log.compile().value();

    Pool pool;
    PoolKey input = hostEntry(pool, rgbaDesc(4, 4), 1);
    PoolKey small = hostEntry(pool, rgbaDesc(2, 2), 1);

    Launcher launcher(program, pool);
    assert(launcher.bind(a.in, input).ok());
    assert(launcher.bind(a.out, input).ok());

    auto wrongType = launcher.bind(a.in, small);
    assert(!wrongType.ok() && wrongType.error().isTypeError());

    // Register 2 is the output instruction, not a bound value.
    auto notBindable = launcher.bind(Register{2}, input);
    assert(!notBindable.ok() && notBindable.error().kind == ErrorKind::BadRegister);

    auto gone = launcher.bind(a.in, PoolKey::null());
    assert(!gone.ok());

    std::printf("  bind: ok\n");
}

static void testUnboundInput() {
    Affined a = affineLog();
    Program program = a.log.compile().value();

    Pool pool;
    Launcher launcher(program, pool);
    auto execution = launcher.launch();
    assert(!execution.ok());

    std::printf("  unbound input: ok\n");
}

static void testLaunchAndRetire() {
    Affined a = affineLog();
    Program program = a.log.compile().value();

    Pool pool;
    PoolKey input = hostEntry(pool, rgbaDesc(4, 4), 5);
    PoolKey output = pool.declare(rgbaDesc(4, 4)).key();

    Launcher launcher(program, pool);
    assert(launcher.bind(a.in, input).ok());
    assert(launcher.bind(a.out, output).ok());

    auto launched = launcher.launch();
    assert(launched.ok());
    Execution execution = std::move(launched).value();
    assert(execution.size() == program.resourceCount());

    // The input was copied since its contents are preserved.
    ImageData* in = execution.data(program.resource(a.in));
    assert(in && in->isHost() && in->asBytes()[0] == 5);
    assert(pool.get(input)->asBytes()[0] == 5);
    assert(in->asBytes() != pool.get(input)->asBytes());

    // Stand-in for an executor: write the output resource.
    ImageData* out = execution.data(program.resource(a.out));
    assert(out && out->isLateBound());
    (void)out->hostAllocate();
    std::memset(out->asBytesMut(), 0x42, out->layout().byteLen());

    assert(execution.retire(pool).ok());
    assert(pool.get(output)->data().isHost());
    assert(pool.get(output)->asBytes()[0] == 0x42);
    assert(execution.data(program.resource(a.out))->isLateBound());

    assert(execution.data(ResourceId{}) == nullptr);
    assert(execution.data(ResourceId{99}) == nullptr);

    std::printf("  launch and retire: ok\n");
}

static void testDisposableInput() {
    Affined a = affineLog();
    Program program = a.log.compile().value();

    Pool pool;
    PoolKey input = hostEntry(pool, rgbaDesc(4, 4), 7);
    pool.entry(input)->setNoRead(true);
    PoolKey output = pool.declare(rgbaDesc(4, 4)).key();

    Launcher launcher(program, pool);
    assert(launcher.bind(a.in, input).ok());
    assert(launcher.bind(a.out, output).ok());

    Execution execution = launcher.launch().orThrow();
    assert(execution.data(program.resource(a.in))->asBytes()[0] == 7);
    assert(pool.get(input)->data().isLateBound());

    std::printf("  disposable input: ok\n");
}

static void testLateBoundInputFails() {
    Pool pool;
    PoolKey first = hostEntry(pool, rgbaDesc(4, 4), 1);
    PoolKey late = pool.declare(rgbaDesc(4, 4)).key();

    // Two inputs: the first is disposable, the second has nothing to read.
    CommandLog log;
    auto x = log.input(rgbaDesc(4, 4)).value();
    auto y = log.input(rgbaDesc(4, 4)).value();
    auto z = log.inscribe(x, Rectangle{0, 0, 4, 4}, y).value();
    (void)log.output(z).value();
    Program two = log.compile().value();

    pool.entry(first)->setNoRead(true);
    Launcher launcher(two, pool);
    assert(launcher.bind(x, first).ok());
    assert(launcher.bind(y, late).ok());

    auto execution = launcher.launch();
    assert(!execution.ok());

    // The swapped-out entry got its data back.
    assert(pool.get(first)->data().isHost());
    assert(pool.get(first)->asBytes()[0] == 1);

    std::printf("  late-bound input: ok\n");
}

static void testOutputTwice() {
    CommandLog log;
    auto s = log.solid(rgbaDesc(2, 2), {0, 0, 0, 0}).value();
    (void)log.output(s).value();
    (void)log.output(s).value();
    Program program = log.compile().value();
    assert(program.outputs().size() == 1);

    Pool pool;
    PoolKey target = pool.declare(rgbaDesc(2, 2)).key();
    Launcher launcher(program, pool);
    assert(launcher.bind(s, target).ok());

    Execution execution = launcher.launch().orThrow();
    ImageData* slot = execution.data(program.resource(s));
    (void)slot->hostAllocate();
    std::memset(slot->asBytesMut(), 9, slot->layout().byteLen());

    assert(execution.retire(pool).ok());
    assert(pool.get(target)->data().isHost());
    assert(pool.get(target)->asBytes()[0] == 9);

    std::printf("  register output twice: ok\n");
}

static void testOutputsShareEntry() {
    CommandLog log;
    auto in = log.input(rgbaDesc(4, 4)).value();
    auto first = log.affine(in, Affine{}).value();
    auto second = log.affine(in, Affine{}).value();
    (void)log.output(first).value();
    (void)log.output(second).value();
    Program program = log.compile().value();

    Pool pool;
    PoolKey input = hostEntry(pool, rgbaDesc(4, 4), 3);
    PoolKey target = pool.declare(rgbaDesc(4, 4)).key();
    Launcher launcher(program, pool);
    assert(launcher.bind(in, input).ok());
    assert(launcher.bind(first, target).ok());
    assert(launcher.bind(second, target).ok());

    Execution execution = launcher.launch().orThrow();
    (void)execution.data(program.resource(first))->hostAllocate();
    (void)execution.data(program.resource(second))->hostAllocate();

    // Nothing is moved when two outputs would land in one entry.
    assert(!execution.retire(pool).ok());
    assert(pool.get(target)->data().isLateBound());
    assert(execution.data(program.resource(first))->isHost());

    std::printf("  outputs sharing an entry: ok\n");
}

static void testSharedDisposableInput() {
    Pool pool;
    PoolKey shared = hostEntry(pool, rgbaDesc(4, 4), 6);
    pool.entry(shared)->setNoRead(true);
    PoolKey target = pool.declare(rgbaDesc(4, 4)).key();

    CommandLog log;
    auto x = log.input(rgbaDesc(4, 4)).value();
    auto y = log.input(rgbaDesc(4, 4)).value();
    auto z = log.inscribe(x, Rectangle{0, 0, 4, 4}, y).value();
    (void)log.output(z).value();
    Program program = log.compile().value();

    Launcher launcher(program, pool);
    assert(launcher.bind(x, shared).ok());
    assert(launcher.bind(y, shared).ok());
    assert(launcher.bind(z, target).ok());

    Execution execution = launcher.launch().orThrow();
    const ImageData* a = execution.data(program.resource(x));
    const ImageData* b = execution.data(program.resource(y));
    assert(a->isHost() && a->asBytes()[0] == 6);
    assert(b->isHost() && b->asBytes()[0] == 6);
    assert(a->asBytes() != b->asBytes());
    assert(pool.get(shared)->data().isLateBound());

    std::printf("  disposable entry bound twice: ok\n");
}

int main() {
    testBind();
    testUnboundInput();
    testLaunchAndRetire();
    testDisposableInput();
    testLateBoundInputFails();
    testOutputTwice();
    testOutputsShareEntry();
    testSharedDisposableInput();

    std::printf("all launcher tests passed\n");
    return 0;
}
