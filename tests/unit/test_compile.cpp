#include <stealth/command.hpp>
#include <stealth/program.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <map>
#include <set>
#include <variant>
#include <vector>

using namespace stealth;

static Descriptor rgbaDesc(std::uint32_t w, std::uint32_t h) {
    return *Descriptor::withTexel(Texel::withSrgb(Samples{SampleParts::Rgba, SampleBits::Int8x4}),
                                  w, h);
}

// Registers each instruction of the log reads.
static std::vector<Register> reads(const Op& op) {
    if (const auto* out = std::get_if<OutputInstr>(&op)) return {out->src};
    if (const auto* un = std::get_if<UnaryInstr>(&op)) return {un->src};
    if (const auto* bin = std::get_if<BinaryInstr>(&op)) return {bin->lhs, bin->rhs};
    return {};
}

// A chain of same-typed unary ops with a side branch, output at the end.
static CommandLog chainLog() {
    CommandLog log;
    auto a = log.input(rgbaDesc(4, 4)).value();          // 0
    auto b = log.affine(a, Affine{}).value();            // 1
    auto c = log.crop(b, Rectangle{0, 0, 2, 2}).value(); // 2
    auto d = log.affine(c, Affine{}).value();            // 3
    auto e = log.extract(d, ColorChannel::R).value();    // 4
    auto f = log.inject(d, ColorChannel::R, e).value();  // 5
    auto g = log.affine(f, Affine{}).value();            // 6
    (void)log.output(g).value();                         // 7
    return log;
}

static void testLiveness() {
    CommandLog log = chainLog();
    Program program = log.compile().value();

    for (std::uint32_t i = 0; i < log.size(); ++i) {
        for (Register r : reads(log.ops()[i])) {
            Liveness l = program.liveness(r);
            assert(l.firstUse <= i && i <= l.lastUse);
        }
    }

    // d is read by extract and inject
    Liveness d = program.liveness(Register{3});
    assert(d.firstUse == 4 && d.lastUse == 5);

    // The output instruction produces nothing and is never read.
    assert(program.liveness(Register{7}).empty());
    assert(program.liveness(Register{99}).empty());

    // A value nobody reads
    CommandLog unused;
    auto in = unused.input(rgbaDesc(2, 2)).value();
    (void)unused.affine(in, Affine{}).value();
    Program p2 = unused.compile().value();
    assert(p2.liveness(Register{1}).empty());
    assert(p2.liveness(Register{1}).firstUse > p2.liveness(Register{1}).lastUse);

    std::printf("  liveness: ok\n");
}

// Allocation points: every resource is allocated or bound before its first
// write, read only while allocated, discarded at most once.
static void testAllocateDiscard() {
    CommandLog log = chainLog();
    Program program = log.compile().value();

    std::set<std::uint32_t> allocated;
    std::set<std::uint32_t> discarded;
    std::set<std::uint32_t> inputs;

    auto readable = [&](ResourceId id) {
        assert(id.valid());
        assert(allocated.count(id.index) || inputs.count(id.index));
        assert(!discarded.count(id.index));
    };
    // A resource first owned by an input keeps the bound storage.
    auto writable = [&](ResourceId id) {
        assert(allocated.count(id.index) || inputs.count(id.index));
        assert(!discarded.count(id.index));
    };

    for (const auto& high : program.ops()) {
        if (const auto* in = std::get_if<HighInput>(&high)) {
            inputs.insert(in->dst.index);
        } else if (const auto* out = std::get_if<HighOutput>(&high)) {
            readable(out->src);
        } else if (const auto* alloc = std::get_if<HighAllocate>(&high)) {
            assert(!allocated.count(alloc->id.index));
            assert(!inputs.count(alloc->id.index));
            allocated.insert(alloc->id.index);
        } else if (const auto* disc = std::get_if<HighDiscard>(&high)) {
            assert(!discarded.count(disc->id.index));
            discarded.insert(disc->id.index);
        } else if (const auto* cons = std::get_if<HighConstruct>(&high)) {
            writable(cons->dst);
        } else if (const auto* un = std::get_if<HighUnary>(&high)) {
            readable(un->src);
            writable(un->dst);
        } else if (const auto* bin = std::get_if<HighBinary>(&high)) {
            readable(bin->lhs);
            readable(bin->rhs);
            writable(bin->dst);
        }
    }

    // The output resource survives until the end.
    ResourceId outRes = program.resource(Register{6});
    assert(!discarded.count(outRes.index));

    const auto& stats = program.stats();
    assert(stats.instructionCount == log.size());
    assert(stats.allocateCount == allocated.size());
    assert(stats.discardCount == discarded.size());
    assert(stats.resourceCount == program.resourceCount());

    std::printf("  allocate and discard: ok\n");
}

// Registers sharing a resource have equal descriptors and lifetimes that
// do not overlap.
static void testReuse() {
    CommandLog log = chainLog();
    Program program = log.compile().value();

    std::map<std::uint32_t, std::vector<std::uint32_t>> byResource;
    for (std::uint32_t r = 0; r < log.size(); ++r) {
        ResourceId id = program.resource(Register{r});
        if (!id.valid()) continue;
        byResource[id.index].push_back(r);
        assert(log.describe(Register{r}).value() == program.resourceDescriptor(id));
    }

    for (const auto& [id, regs] : byResource) {
        for (std::size_t k = 1; k < regs.size(); ++k) {
            Register prev{regs[k - 1]};
            Liveness l = program.liveness(prev);
            std::uint32_t end = l.empty() ? prev.index : l.lastUse;
            // The next owner is defined strictly after the previous one is dead.
            assert(regs[k] > end);
        }
    }

    // The chain alternates between two 4x4 RGBA resources instead of one per step.
    assert(program.stats().reusedCount > 0);
    assert(program.resourceCount() < 7);

    // Inputs never take a recycled resource.
    for (Register in : program.inputs()) {
        assert(byResource[program.resource(in).index].front() == in.index);
    }

    std::printf("  reuse: ok\n");
}

static void testInputsOutputsCapabilities() {
    CommandLog log;
    auto a = log.input(rgbaDesc(16, 8)).value();
    auto b = log.input(rgbaDesc(4, 4)).value();
    auto c = log.inscribe(a, Rectangle{0, 0, 4, 4}, b).value();
    (void)log.output(c).value();

    Program program = log.compile().value();
    assert(program.inputs().size() == 2);
    assert(program.isInput(a) && program.isInput(b));
    assert(!program.isInput(c));
    assert(program.outputs().size() == 1 && program.isOutput(c));

    // The inputs are distinct resources, c is allocated in a fresh one since
    // its operands are still live while it is written.
    assert(program.resource(a) != program.resource(b));
    assert(program.resource(c) != program.resource(a));

    Capabilities caps = program.capabilities();
    assert(caps.maxImageDimension == 16);
    assert(caps.allocatedBytes == rgbaDesc(16, 8).layout.u64Len());

    std::printf("  inputs, outputs, capabilities: ok\n");
}

static std::uint32_t discardsOf(const Program& program, ResourceId id) {
    std::uint32_t count = 0;
    for (const auto& high : program.ops()) {
        if (const auto* disc = std::get_if<HighDiscard>(&high)) count += disc->id == id;
    }
    return count;
}

// A register named by both operands of a binary op.
static void testSameOperandTwice() {
    {
        CommandLog log;
        auto a = log.input(rgbaDesc(2, 2)).value();                  // 0
        auto b = log.affine(a, Affine{}).value();                    // 1
        auto c = log.inscribe(b, Rectangle{0, 0, 2, 2}, b).value(); // 2
        (void)log.output(c).value();                                 // 3
        Program program = log.compile().value();

        Liveness l = program.liveness(b);
        assert(l.firstUse == 2 && l.lastUse == 2);
        assert(discardsOf(program, program.resource(b)) == 1);
    }

    // The resource of b is released once, so only one later value takes it.
    {
        CommandLog log;
        auto a = log.input(rgbaDesc(2, 2)).value();                  // 0
        auto b = log.affine(a, Affine{}).value();                    // 1
        auto c = log.inscribe(b, Rectangle{0, 0, 2, 2}, b).value(); // 2
        auto d = log.affine(c, Affine{}).value();                    // 3
        auto e = log.affine(c, Affine{}).value();                    // 4
        (void)log.output(d).value();
        (void)log.output(e).value();
        Program program = log.compile().value();

        assert(program.resource(d) != program.resource(e));
        for (std::uint32_t id = 0; id < program.resourceCount(); ++id) {
            assert(discardsOf(program, ResourceId{id}) <= 1);
        }
    }

    std::printf("  same operand twice: ok\n");
}

static void testOutputTwice() {
    CommandLog log;
    auto a = log.input(rgbaDesc(2, 2)).value();
    auto b = log.affine(a, Affine{}).value();
    (void)log.output(b).value();
    (void)log.output(b).value();
    Program program = log.compile().value();

    assert(program.outputs().size() == 1);
    assert(program.isOutput(b));
    assert(discardsOf(program, program.resource(b)) == 0);

    std::printf("  output twice: ok\n");
}

static void testEmpty() {
    CommandLog log;
    Program program = log.compile().value();
    assert(program.ops().empty());
    assert(program.resourceCount() == 0);
    program.dumpLog();

    std::printf("  empty log: ok\n");
}

int main() {
    testLiveness();
    testAllocateDiscard();
    testReuse();
    testInputsOutputsCapabilities();
    testSameOperandTwice();
    testOutputTwice();
    testEmpty();

    std::printf("all compile tests passed\n");
    return 0;
}
