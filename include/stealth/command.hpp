#pragma once

#include <stealth/descriptor.hpp>
#include <stealth/rectangle.hpp>
#include <stealth/result.hpp>

#include <array>
#include <cstdint>
#include <variant>
#include <vector>

namespace stealth {

class PoolImage;
class Program;

// A reference to one value produced by the command log, by its log index.
struct Register {
    std::uint32_t index = UINT32_MAX;

    [[nodiscard]] bool valid() const { return index != UINT32_MAX; }
    [[nodiscard]] bool operator==(const Register&) const = default;
};

// A projective 3x3 transform, row major.
struct Affine {
    std::array<float, 9> transformation = {1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f};

    [[nodiscard]] bool operator==(const Affine&) const = default;
};

// Reserved blend modes. No mode is implemented yet.
enum class Blend : std::uint8_t {
    Alpha,
};

// Constructors: produce an image from no input.
struct SolidOp {
    std::vector<std::uint8_t> texel; // exactly one texel, encoded

    [[nodiscard]] bool operator==(const SolidOp&) const = default;
};

using ConstructOp = std::variant<SolidOp>;

// Unary kinds.
// Affine and Crop keep the type, ColorConvert replaces the color, Extract
// selects one channel of the color.
struct AffineOp {
    Affine affine;
    [[nodiscard]] bool operator==(const AffineOp&) const = default;
};
struct CropOp {
    Rectangle rect;
    [[nodiscard]] bool operator==(const CropOp&) const = default;
};
struct ColorConvertOp {
    Color color;
    [[nodiscard]] bool operator==(const ColorConvertOp&) const = default;
};
struct ExtractOp {
    ColorChannel channel;
    [[nodiscard]] bool operator==(const ExtractOp&) const = default;
};

using UnaryOp = std::variant<AffineOp, CropOp, ColorConvertOp, ExtractOp>;

// Binary kinds, both typed as their lower operand.
// Inscribe pastes `above` at `placement`; Inject replaces one channel of the
// lower operand with the single-channel upper operand.
struct InscribeOp {
    Rectangle placement;
    [[nodiscard]] bool operator==(const InscribeOp&) const = default;
};
struct InjectOp {
    ColorChannel channel;
    [[nodiscard]] bool operator==(const InjectOp&) const = default;
};

using BinaryOp = std::variant<InscribeOp, InjectOp>;

// i := in()
struct InputInstr {
    Descriptor desc;
};

// out(src). Produces no register.
struct OutputInstr {
    Register src;
};

// i := op()
struct ConstructInstr {
    Descriptor desc;
    ConstructOp op;
};

// i := unary(src)
struct UnaryInstr {
    Register src;
    UnaryOp op;
    Descriptor desc;
};

// i := binary(lhs, rhs)
struct BinaryInstr {
    Register lhs;
    Register rhs;
    BinaryOp op;
    Descriptor desc;
};

using Op = std::variant<InputInstr, OutputInstr, ConstructInstr, UnaryInstr, BinaryInstr>;

// One linear sequence of instructions: a single basic block in SSA form where
// every register is typed with its buffer descriptor.
//
// Each builder method validates its operands before appending. A failed call
// leaves the log untouched, so size() is always an upper bound on the valid
// register indices.
//
// Thread safety: thread-confined.
class CommandLog {
public:
    // Declare an input. Inputs must be bound from the pool at launch.
    [[nodiscard]] Result<Register> input(const Descriptor& desc);

    // Declare an input typed like an image in the pool.
    [[nodiscard]] Result<Register> inputFrom(const PoolImage& image);

    // Select a rectangular part of an image.
    [[nodiscard]] Result<Register> crop(Register src, const Rectangle& rect);

    // Re-encode into another color of the same reference white.
    [[nodiscard]] Result<Register> colorConvert(Register src, const Texel& texel);

    // Embed `above` into `below` at `rect`.
    [[nodiscard]] Result<Register> inscribe(Register below, const Rectangle& rect, Register above);

    // Extract one channel into a single-channel image.
    [[nodiscard]] Result<Register> extract(Register src, ColorChannel channel);

    // Overwrite one channel of `below` with the single-channel `above`.
    [[nodiscard]] Result<Register> inject(Register below, ColorChannel channel, Register above);

    // Overlay with blending. Always fails: no blend mode is supported yet.
    [[nodiscard]] Result<Register> blend(Register below, const Rectangle& rect, Register above,
                                         Blend mode);

    // A solid color image from a descriptor and one encoded texel.
    [[nodiscard]] Result<Register> solid(const Descriptor& desc, const std::vector<std::uint8_t>& texel);

    [[nodiscard]] Result<Register> affine(Register src, const Affine& transform);

    // Declare an output. Outputs must be bound from the pool at launch.
    [[nodiscard]] Result<Descriptor> output(Register src);

    // Liveness analysis and lowering to resource operations.
    [[nodiscard]] Result<Program> compile() const;

    // Type of a register, if it names a value.
    [[nodiscard]] Result<Descriptor> describe(Register reg) const;

    [[nodiscard]] const std::vector<Op>& ops() const { return ops_; }
    [[nodiscard]] std::uint32_t size() const { return static_cast<std::uint32_t>(ops_.size()); }

private:
    [[nodiscard]] Result<Descriptor> lookup(Register reg, const char* operation) const;
    Register push(Op op);

    std::vector<Op> ops_;
};

} // namespace stealth
