#pragma once

#include <stealth/command.hpp>
#include <stealth/descriptor.hpp>

#include <cstdint>
#include <variant>
#include <vector>

namespace stealth {

// Opaque handle to a program resource. Index into the program's resource table.
struct ResourceId {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const ResourceId&) const = default;
};

// Closed interval of log indices reading a register.
// A register that is never read has firstUse > lastUse.
struct Liveness {
    std::uint32_t firstUse = UINT32_MAX;
    std::uint32_t lastUse = 0;

    [[nodiscard]] bool empty() const { return firstUse > lastUse; }
    [[nodiscard]] bool contains(std::uint32_t index) const {
        return firstUse <= index && index <= lastUse;
    }
};

// Lowered instructions. Mirror Op over resource ids.
struct HighInput {
    ResourceId dst;
    Register reg; // the register the launcher binds
};

struct HighOutput {
    ResourceId src;
    Register reg;
};

struct HighConstruct {
    ResourceId dst;
    ConstructOp op;
};

struct HighUnary {
    ResourceId src;
    ResourceId dst;
    UnaryOp op;
};

struct HighBinary {
    ResourceId lhs;
    ResourceId rhs;
    ResourceId dst;
    BinaryOp op;
};

// Backing storage for the resource must exist from here on.
struct HighAllocate {
    ResourceId id;
};

// Contents of the resource are no longer needed.
struct HighDiscard {
    ResourceId id;
};

using High = std::variant<HighInput, HighOutput, HighConstruct, HighUnary, HighBinary,
                          HighAllocate, HighDiscard>;

// What an executor must provide to run a program.
struct Capabilities {
    std::uint32_t maxImageDimension = 0;
    std::uint64_t allocatedBytes = 0; // sum over allocated resources, inputs excluded
};

struct ProgramStats {
    std::uint32_t instructionCount = 0;
    std::uint32_t resourceCount = 0;
    std::uint32_t allocateCount = 0;
    std::uint32_t discardCount = 0;
    std::uint32_t reusedCount = 0; // registers placed in a recycled resource
};

// A compiled command log.
//
// Every register is placed in one resource. Two registers share a resource
// only when their descriptors are equal and their lifetimes are disjoint.
// Registers that are outputs keep their resource until the end.
//
// Thread safety: immutable after construction.
class Program {
public:
    [[nodiscard]] const std::vector<High>& ops() const { return ops_; }

    // Default (empty) interval for registers outside the log or for outputs.
    [[nodiscard]] Liveness liveness(Register reg) const;

    // Resource holding the register, invalid for registers without a value.
    [[nodiscard]] ResourceId resource(Register reg) const;

    [[nodiscard]] const Descriptor& resourceDescriptor(ResourceId id) const {
        return resourceDescs_[id.index];
    }
    [[nodiscard]] std::uint32_t resourceCount() const {
        return static_cast<std::uint32_t>(resourceDescs_.size());
    }

    // Registers to bind at launch, in log order.
    [[nodiscard]] const std::vector<Register>& inputs() const { return inputs_; }
    [[nodiscard]] const std::vector<Register>& outputs() const { return outputs_; }

    [[nodiscard]] bool isInput(Register reg) const;
    [[nodiscard]] bool isOutput(Register reg) const;

    [[nodiscard]] Capabilities capabilities() const { return capabilities_; }
    [[nodiscard]] const ProgramStats& stats() const { return stats_; }

    // Print the lowered program to stderr.
    void dumpLog() const;

private:
    friend class CommandLog;
    Program() = default;

    std::vector<High> ops_;
    std::vector<Liveness> liveness_;      // per register
    std::vector<ResourceId> registerRes_; // per register
    std::vector<Descriptor> resourceDescs_;
    std::vector<Register> inputs_;
    std::vector<Register> outputs_;
    Capabilities capabilities_;
    ProgramStats stats_;
};

} // namespace stealth
