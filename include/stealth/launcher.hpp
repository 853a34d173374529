#pragma once

#include <stealth/command.hpp>
#include <stealth/pool.hpp>
#include <stealth/program.hpp>
#include <stealth/result.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace stealth {

// Data of one launched program, one slot per resource.
// Move-only since slots may hold device storage.
class Execution {
public:
    Execution(Execution&&) noexcept = default;
    Execution& operator=(Execution&&) noexcept = default;
    Execution(const Execution&) = delete;
    Execution& operator=(const Execution&) = delete;

    // Null for ids outside the program.
    [[nodiscard]] ImageData*       data(ResourceId id);
    [[nodiscard]] const ImageData* data(ResourceId id) const;

    [[nodiscard]] std::uint32_t size() const { return static_cast<std::uint32_t>(slots_.size()); }

    // Swap output resources into the entries they are bound to. The previous
    // entry data is left in the slot. Nothing is moved unless every output
    // is bound to a live entry.
    [[nodiscard]] Result<void> retire(Pool& pool);

private:
    friend class Launcher;
    Execution() = default;

    std::vector<ImageData> slots_;
    std::vector<std::pair<ResourceId, PoolKey>> outputs_;
};

// Wires the registers of a compiled program to pool entries.
//
// Inputs are traded into the execution: disposable entries are swapped out,
// host entries copied. An input that holds device data which must be
// preserved can not be launched.
class Launcher {
public:
    Launcher(const Program& program, Pool& pool);

    // The register must be an input or an output of the program, and the
    // entry must carry exactly the register's descriptor.
    [[nodiscard]] Result<void> bind(Register reg, PoolKey key);

    [[nodiscard]] Result<Execution> launch();

private:
    [[nodiscard]] PoolKey binding(Register reg) const;

    const Program& program_;
    Pool& pool_;
    std::vector<PoolKey> bindings_; // per register
};

} // namespace stealth
