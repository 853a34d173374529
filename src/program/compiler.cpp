#include <stealth/command.hpp>
#include <stealth/program.hpp>

#include <algorithm>

namespace stealth {

namespace {

// Registers an instruction reads. A register named by both operands of a
// binary op is reported twice, which only extends its interval once.
void forEachRead(const Op& op, auto&& fn) {
    if (const auto* out = std::get_if<OutputInstr>(&op)) {
        fn(out->src);
    } else if (const auto* un = std::get_if<UnaryInstr>(&op)) {
        fn(un->src);
    } else if (const auto* bin = std::get_if<BinaryInstr>(&op)) {
        fn(bin->lhs);
        fn(bin->rhs);
    }
}

// Descriptor of the value an instruction produces, null for outputs.
const Descriptor* producedDescriptor(const Op& op) {
    if (const auto* in = std::get_if<InputInstr>(&op)) return &in->desc;
    if (const auto* cons = std::get_if<ConstructInstr>(&op)) return &cons->desc;
    if (const auto* un = std::get_if<UnaryInstr>(&op)) return &un->desc;
    if (const auto* bin = std::get_if<BinaryInstr>(&op)) return &bin->desc;
    return nullptr;
}

std::vector<Liveness> computeLiveness(const std::vector<Op>& ops) {
    std::vector<Liveness> live(ops.size());

    for (std::uint32_t i = static_cast<std::uint32_t>(ops.size()); i-- > 0;) {
        forEachRead(ops[i], [&](Register reg) {
            auto& l = live[reg.index];
            l.firstUse = std::min(l.firstUse, i);
            l.lastUse = std::max(l.lastUse, i);
        });
    }

    return live;
}

} // namespace

Liveness Program::liveness(Register reg) const {
    if (!reg.valid() || reg.index >= liveness_.size()) return {};
    return liveness_[reg.index];
}

ResourceId Program::resource(Register reg) const {
    if (!reg.valid() || reg.index >= registerRes_.size()) return {};
    return registerRes_[reg.index];
}

bool Program::isInput(Register reg) const {
    return std::find(inputs_.begin(), inputs_.end(), reg) != inputs_.end();
}

bool Program::isOutput(Register reg) const {
    return std::find(outputs_.begin(), outputs_.end(), reg) != outputs_.end();
}

Result<Program> CommandLog::compile() const {
    const auto n = static_cast<std::uint32_t>(ops_.size());

    Program program;
    program.liveness_ = computeLiveness(ops_);
    program.registerRes_.assign(n, ResourceId{});

    // Outputs pin what they read. The executor hands pinned resources back
    // to the pool, so they must survive until the end.
    std::vector<bool> pinned(n, false);
    for (const auto& op : ops_) {
        if (const auto* out = std::get_if<OutputInstr>(&op)) pinned[out->src.index] = true;
    }

    // Release point of each register: after its last read, or right after
    // its definition when it is never read.
    std::vector<std::vector<Register>> releasedAfter(n);
    for (std::uint32_t r = 0; r < n; ++r) {
        if (!producedDescriptor(ops_[r]) || pinned[r]) continue;
        const auto& l = program.liveness_[r];
        std::uint32_t at = l.empty() ? r : l.lastUse;
        releasedAfter[at].push_back(Register{r});
    }

    // First pass: place registers into resources. A released resource goes
    // to the free list only after the releasing instruction, so it is never
    // overwritten by the instruction that reads it last.
    std::vector<ResourceId> freeList;
    std::vector<std::vector<Register>> owners; // per resource, in log order

    for (std::uint32_t i = 0; i < n; ++i) {
        const Descriptor* desc = producedDescriptor(ops_[i]);
        if (desc) {
            ResourceId id;
            auto it = std::find_if(freeList.begin(), freeList.end(), [&](ResourceId f) {
                return program.resourceDescs_[f.index] == *desc;
            });

            // Inputs are bound from the pool and never share storage.
            if (it != freeList.end() && !std::holds_alternative<InputInstr>(ops_[i])) {
                id = *it;
                freeList.erase(it);
                ++program.stats_.reusedCount;
            } else {
                id = ResourceId{static_cast<std::uint32_t>(program.resourceDescs_.size())};
                program.resourceDescs_.push_back(*desc);
                owners.emplace_back();
            }

            program.registerRes_[i] = id;
            owners[id.index].push_back(Register{i});
        }

        for (Register reg : releasedAfter[i]) freeList.push_back(program.registerRes_[reg.index]);
    }

    // Second pass: emit lowered instructions with allocation points.
    auto res = [&](Register reg) { return program.registerRes_[reg.index]; };

    for (std::uint32_t i = 0; i < n; ++i) {
        const Op& op = ops_[i];
        ResourceId dst = program.registerRes_[i];

        if (std::holds_alternative<InputInstr>(op)) {
            program.inputs_.push_back(Register{i});
            program.ops_.push_back(HighInput{dst, Register{i}});
        } else if (const auto* out = std::get_if<OutputInstr>(&op)) {
            // A register output twice is still handed back once.
            if (!program.isOutput(out->src)) program.outputs_.push_back(out->src);
            program.ops_.push_back(HighOutput{res(out->src), out->src});
        } else {
            if (owners[dst.index].front().index == i) {
                program.ops_.push_back(HighAllocate{dst});
                ++program.stats_.allocateCount;
                program.capabilities_.allocatedBytes += program.resourceDescs_[dst.index].layout.u64Len();
            }

            if (const auto* cons = std::get_if<ConstructInstr>(&op)) {
                program.ops_.push_back(HighConstruct{dst, cons->op});
            } else if (const auto* un = std::get_if<UnaryInstr>(&op)) {
                program.ops_.push_back(HighUnary{res(un->src), dst, un->op});
            } else if (const auto* bin = std::get_if<BinaryInstr>(&op)) {
                program.ops_.push_back(HighBinary{res(bin->lhs), res(bin->rhs), dst, bin->op});
            }
        }

        // A resource is discarded when its last owner is released. Earlier
        // owners hand the storage on to the next register instead.
        for (Register reg : releasedAfter[i]) {
            ResourceId id = res(reg);
            if (owners[id.index].back() == reg) {
                program.ops_.push_back(HighDiscard{id});
                ++program.stats_.discardCount;
            }
        }
    }

    for (const auto& desc : program.resourceDescs_) {
        program.capabilities_.maxImageDimension =
            std::max({program.capabilities_.maxImageDimension, desc.layout.width(),
                      desc.layout.height()});
    }

    program.stats_.instructionCount = n;
    program.stats_.resourceCount = static_cast<std::uint32_t>(program.resourceDescs_.size());

    return program;
}

} // namespace stealth
