#include <stealth/launcher.hpp>

#include <algorithm>
#include <string>

namespace stealth {

ImageData* Execution::data(ResourceId id) {
    if (!id.valid() || id.index >= slots_.size()) return nullptr;
    return &slots_[id.index];
}

const ImageData* Execution::data(ResourceId id) const {
    if (!id.valid() || id.index >= slots_.size()) return nullptr;
    return &slots_[id.index];
}

Result<void> Execution::retire(Pool& pool) {
    std::vector<PoolImageMut> entries;
    entries.reserve(outputs_.size());

    for (std::size_t i = 0; i < outputs_.size(); ++i) {
        const auto& [id, key] = outputs_[i];
        if (key.isNull()) {
            return Error{"retire", 0, "output resource " + std::to_string(id.index) + " is not bound"};
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (outputs_[j].second == key) {
                return Error{"retire", 0,
                             "output resources " + std::to_string(outputs_[j].first.index) + " and " +
                                 std::to_string(id.index) + " are bound to the same entry"};
            }
        }
        auto entry = pool.entry(key);
        if (!entry) {
            return Error{"retire", 0,
                         "pool entry for output resource " + std::to_string(id.index) + " is gone"};
        }
        entries.push_back(std::move(*entry));
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        entries[i].swap(slots_[outputs_[i].first.index]);
    }
    return {};
}

Launcher::Launcher(const Program& program, Pool& pool)
    : program_(program), pool_(pool) {}

PoolKey Launcher::binding(Register reg) const {
    if (reg.index >= bindings_.size()) return PoolKey::null();
    return bindings_[reg.index];
}

Result<void> Launcher::bind(Register reg, PoolKey key) {
    if (!program_.isInput(reg) && !program_.isOutput(reg)) {
        return Error{"bind", 0,
                     "register " + std::to_string(reg.index) + " is neither input nor output",
                     ErrorKind::BadRegister};
    }

    auto image = pool_.get(key);
    if (!image) {
        return Error{"bind", 0, "pool key does not name an entry"};
    }

    const Descriptor& expected = program_.resourceDescriptor(program_.resource(reg));
    auto actual = image->descriptor();
    if (!actual || *actual != expected) {
        return Error{"bind", 0,
                     "entry does not match the descriptor of register " + std::to_string(reg.index),
                     ErrorKind::Type};
    }

    if (reg.index >= bindings_.size()) bindings_.resize(reg.index + 1);
    bindings_[reg.index] = key;
    return {};
}

Result<Execution> Launcher::launch() {
    for (Register reg : program_.inputs()) {
        if (binding(reg).isNull()) {
            return Error{"launch", 0, "input register " + std::to_string(reg.index) + " is not bound"};
        }
        if (!pool_.get(binding(reg))) {
            return Error{"launch", 0,
                         "pool entry for input register " + std::to_string(reg.index) + " is gone"};
        }
    }

    Execution execution;
    execution.slots_.reserve(program_.resourceCount());
    for (std::uint32_t i = 0; i < program_.resourceCount(); ++i) {
        execution.slots_.emplace_back(LateBoundData{program_.resourceDescriptor(ResourceId{i}).layout});
    }

    // Entries swapped so far, to hand their data back on failure.
    std::vector<std::pair<PoolKey, ResourceId>> swapped;

    auto rollBack = [&] {
        for (const auto& [key, undo] : swapped) {
            pool_.entry(key)->swap(execution.slots_[undo.index]);
        }
    };

    for (Register reg : program_.inputs()) {
        ResourceId id = program_.resource(reg);
        PoolKey key = binding(reg);

        // An entry bound to several inputs is only swapped out once. Later
        // inputs read the slot it went to.
        auto earlier = std::find_if(swapped.begin(), swapped.end(),
                                    [&](const auto& s) { return s.first == key; });
        if (earlier != swapped.end()) {
            const ImageData& taken = execution.slots_[earlier->second.index];
            if (!taken.asBytes()) {
                rollBack();
                return Error{"launch", 0,
                             "input register " + std::to_string(reg.index) +
                                 " shares a disposable entry that is not host accessible"};
            }
            execution.slots_[id.index] = ImageData(
                ImageBuffer::withBytes(taken.layout(), taken.asBytes(), taken.layout().byteLen()));
            continue;
        }

        auto entry = pool_.entry(key);
        bool disposable = entry->meta().noRead;

        if (!entry->trade(execution.slots_[id.index])) {
            rollBack();
            return Error{"launch", 0,
                         "input register " + std::to_string(reg.index) +
                             " is neither disposable nor host accessible"};
        }
        if (disposable) swapped.emplace_back(key, id);
    }

    for (Register reg : program_.outputs()) {
        execution.outputs_.emplace_back(program_.resource(reg), binding(reg));
    }

    return execution;
}

} // namespace stealth
