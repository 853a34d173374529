#include <stealth/command.hpp>
#include <stealth/pool.hpp>
#include <stealth/program.hpp>

#include <string>

namespace stealth {

static Error typeError(const char* operation, std::string message) {
    return Error{operation, 0, std::move(message), ErrorKind::Type};
}

static Error otherError(const char* operation, std::string message) {
    return Error{operation, 0, std::move(message), ErrorKind::Other};
}

Result<Descriptor> CommandLog::lookup(Register reg, const char* operation) const {
    if (!reg.valid() || reg.index >= ops_.size()) {
        return Error{operation, 0, "register " + std::to_string(reg.index) + " out of range",
                     ErrorKind::BadRegister};
    }

    const Op& op = ops_[reg.index];
    if (const auto* in = std::get_if<InputInstr>(&op)) return in->desc;
    if (const auto* cons = std::get_if<ConstructInstr>(&op)) return cons->desc;
    if (const auto* un = std::get_if<UnaryInstr>(&op)) return un->desc;
    if (const auto* bin = std::get_if<BinaryInstr>(&op)) return bin->desc;

    return Error{operation, 0,
                 "register " + std::to_string(reg.index) + " is an output and has no value",
                 ErrorKind::BadRegister};
}

Result<Descriptor> CommandLog::describe(Register reg) const {
    return lookup(reg, "describe");
}

Register CommandLog::push(Op op) {
    Register reg{static_cast<std::uint32_t>(ops_.size())};
    ops_.push_back(std::move(op));
    return reg;
}

Result<Register> CommandLog::input(const Descriptor& desc) {
    if (!desc.isConsistent()) {
        return typeError("input", "texel size does not match the layout");
    }
    return push(InputInstr{desc});
}

Result<Register> CommandLog::inputFrom(const PoolImage& image) {
    auto desc = image.descriptor();
    if (!desc) {
        return otherError("input from pool", "pool image has no consistent descriptor");
    }
    return input(*desc);
}

Result<Register> CommandLog::crop(Register src, const Rectangle& rect) {
    auto desc = lookup(src, "crop");
    if (!desc.ok()) return desc.error();

    return push(UnaryInstr{src, CropOp{rect}, desc.value()});
}

Result<Register> CommandLog::colorConvert(Register src, const Texel& texel) {
    auto srcDesc = lookup(src, "color convert");
    if (!srcDesc.ok()) return srcDesc.error();

    const Descriptor& from = srcDesc.value();

    // Conversion goes through XYZ and is only defined between XYZ-class
    // colors of the same reference white. Chromatic adaptation is not done.
    if (!from.texel.color.isXyz() || !texel.color.isXyz()) {
        return typeError("color convert", "both colors must be XYZ based");
    }
    if (from.texel.color.whitepoint() != texel.color.whitepoint()) {
        return typeError("color convert", "whitepoints differ");
    }

    auto layout = BufferLayout::withTexel(texel, from.layout.width(), from.layout.height());
    if (!layout) {
        return otherError("color convert", "target layout does not fit");
    }

    Descriptor target{*layout, texel};
    if (!target.isConsistent()) {
        return typeError("color convert", "target texel is inconsistent");
    }

    return push(UnaryInstr{src, ColorConvertOp{texel.color}, target});
}

Result<Register> CommandLog::inscribe(Register below, const Rectangle& rect, Register above) {
    auto belowDesc = lookup(below, "inscribe");
    if (!belowDesc.ok()) return belowDesc.error();
    auto aboveDesc = lookup(above, "inscribe");
    if (!aboveDesc.ok()) return aboveDesc.error();

    if (belowDesc.value().texel != aboveDesc.value().texel) {
        return typeError("inscribe", "texels of both operands differ");
    }

    Rectangle placement = rect.normalize();
    if (placement != Rectangle::withLayout(aboveDesc.value().layout)) {
        return otherError("inscribe", "rectangle is not the full extent of the inscribed image");
    }

    if (!Rectangle::withLayout(belowDesc.value().layout).contains(placement)) {
        return otherError("inscribe", "rectangle is not contained in the target image");
    }

    return push(BinaryInstr{below, above, InscribeOp{placement}, belowDesc.value()});
}

Result<Register> CommandLog::extract(Register src, ColorChannel channel) {
    auto desc = lookup(src, "extract");
    if (!desc.ok()) return desc.error();

    auto texel = desc.value().channelTexel(channel);
    if (!texel) {
        return otherError("extract", "channel can not be extracted from this texel");
    }

    auto layout = BufferLayout::withTexel(*texel, desc.value().layout.width(),
                                          desc.value().layout.height());
    if (!layout) {
        return otherError("extract", "channel layout does not fit");
    }

    return push(UnaryInstr{src, ExtractOp{channel}, Descriptor{*layout, *texel}});
}

Result<Register> CommandLog::inject(Register below, ColorChannel channel, Register above) {
    auto belowDesc = lookup(below, "inject");
    if (!belowDesc.ok()) return belowDesc.error();

    auto expected = belowDesc.value().channelTexel(channel);
    if (!expected) {
        return otherError("inject", "channel can not be injected into this texel");
    }

    auto aboveDesc = lookup(above, "inject");
    if (!aboveDesc.ok()) return aboveDesc.error();

    if (aboveDesc.value().texel != *expected) {
        return typeError("inject", "injected texel does not match the channel");
    }

    return push(BinaryInstr{below, above, InjectOp{channel}, belowDesc.value()});
}

Result<Register> CommandLog::blend(Register, const Rectangle&, Register, Blend) {
    return otherError("blend", "no blend mode is supported");
}

Result<Register> CommandLog::solid(const Descriptor& desc, const std::vector<std::uint8_t>& texel) {
    if (!desc.isConsistent()) {
        return typeError("solid", "texel size does not match the layout");
    }
    if (texel.size() != sampleBytes(desc.texel.samples.bits)) {
        return typeError("solid", "expected " + std::to_string(sampleBytes(desc.texel.samples.bits)) +
                                      " texel bytes, got " + std::to_string(texel.size()));
    }

    return push(ConstructInstr{desc, SolidOp{texel}});
}

Result<Register> CommandLog::affine(Register src, const Affine& transform) {
    auto desc = lookup(src, "affine");
    if (!desc.ok()) return desc.error();

    return push(UnaryInstr{src, AffineOp{transform}, desc.value()});
}

Result<Descriptor> CommandLog::output(Register src) {
    auto desc = lookup(src, "output");
    if (!desc.ok()) return desc.error();

    push(OutputInstr{src});
    return desc;
}

} // namespace stealth
