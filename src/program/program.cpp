#include <stealth/program.hpp>

#include <cinttypes>
#include <cstdio>

namespace stealth {

static const char* unaryName(const UnaryOp& op) {
    if (std::holds_alternative<AffineOp>(op)) return "affine";
    if (std::holds_alternative<CropOp>(op)) return "crop";
    if (std::holds_alternative<ColorConvertOp>(op)) return "color_convert";
    return "extract";
}

static const char* binaryName(const BinaryOp& op) {
    if (std::holds_alternative<InscribeOp>(op)) return "inscribe";
    return "inject";
}

void Program::dumpLog() const {
    std::fprintf(stderr, "[stealth::program] Compiled %u instructions into %u resources:\n",
                 stats_.instructionCount, stats_.resourceCount);

    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(ops_.size()); ++i) {
        const High& op = ops_[i];
        if (const auto* in = std::get_if<HighInput>(&op)) {
            std::fprintf(stderr, "  [%3u] $%u := input(%%%u)\n", i, in->dst.index, in->reg.index);
        } else if (const auto* out = std::get_if<HighOutput>(&op)) {
            std::fprintf(stderr, "  [%3u] output(%%%u) := $%u\n", i, out->reg.index,
                         out->src.index);
        } else if (const auto* cons = std::get_if<HighConstruct>(&op)) {
            std::fprintf(stderr, "  [%3u] $%u := solid()\n", i, cons->dst.index);
        } else if (const auto* un = std::get_if<HighUnary>(&op)) {
            std::fprintf(stderr, "  [%3u] $%u := %s($%u)\n", i, un->dst.index, unaryName(un->op),
                         un->src.index);
        } else if (const auto* bin = std::get_if<HighBinary>(&op)) {
            std::fprintf(stderr, "  [%3u] $%u := %s($%u, $%u)\n", i, bin->dst.index,
                         binaryName(bin->op), bin->lhs.index, bin->rhs.index);
        } else if (const auto* alloc = std::get_if<HighAllocate>(&op)) {
            std::fprintf(stderr, "  [%3u] allocate $%u\n", i, alloc->id.index);
        } else if (const auto* discard = std::get_if<HighDiscard>(&op)) {
            std::fprintf(stderr, "  [%3u] discard $%u\n", i, discard->id.index);
        }
    }

    std::fprintf(stderr, "[stealth::program] Resources:\n");
    for (std::uint32_t r = 0; r < static_cast<std::uint32_t>(resourceDescs_.size()); ++r) {
        const auto& layout = resourceDescs_[r].layout;
        std::fprintf(stderr, "  $%-3u %ux%u  %u B/texel  %" PRIu64 " bytes\n", r, layout.width(),
                     layout.height(), static_cast<unsigned>(layout.bytesPerTexel()),
                     layout.u64Len());
    }

    std::fprintf(stderr,
                 "[stealth::program] %u allocations, %u discards, %u reused, "
                 "%" PRIu64 " bytes allocated, max dimension %u\n",
                 stats_.allocateCount, stats_.discardCount, stats_.reusedCount,
                 capabilities_.allocatedBytes, capabilities_.maxImageDimension);
}

} // namespace stealth
