#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace stealth {

// Stable key into a SlotMap: slot index plus the generation the slot had when
// the value was inserted. The default key never names a live value.
template <typename Tag>
struct SlotKey {
    std::uint32_t index = UINT32_MAX;
    std::uint32_t generation = 0;

    [[nodiscard]] static SlotKey null() { return SlotKey{}; }
    [[nodiscard]] bool isNull() const { return index == UINT32_MAX; }
    [[nodiscard]] bool operator==(const SlotKey&) const = default;
};

// Arena of values addressed by generational keys.
//
// Removing a value bumps the generation of its slot, so keys to removed
// values resolve to nothing even after the slot is reused. Live generations
// are always odd, vacant ones even.
//
// Thread safety: thread-confined.
template <typename Key, typename T>
class SlotMap {
public:
    Key insert(T value) {
        std::uint32_t index;
        if (!free_.empty()) {
            index = free_.back();
            free_.pop_back();
        } else {
            index = static_cast<std::uint32_t>(slots_.size());
            slots_.emplace_back();
        }

        Slot& slot = slots_[index];
        slot.value.emplace(std::move(value));
        ++slot.generation;
        ++size_;
        return Key{index, slot.generation};
    }

    [[nodiscard]] bool contains(Key key) const { return find(key) != nullptr; }

    [[nodiscard]] T* get(Key key) { return const_cast<T*>(find(key)); }
    [[nodiscard]] const T* get(Key key) const { return find(key); }

    // The removed value, nullopt for stale or null keys.
    std::optional<T> remove(Key key) {
        if (!find(key)) return std::nullopt;

        Slot& slot = slots_[key.index];
        std::optional<T> value(std::move(slot.value));
        slot.value.reset();
        ++slot.generation;
        free_.push_back(key.index);
        --size_;
        return value;
    }

    [[nodiscard]] std::size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }

    // Keys of all live values, in slot order.
    [[nodiscard]] std::vector<Key> keys() const {
        std::vector<Key> result;
        result.reserve(size_);
        for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(slots_.size()); ++i) {
            if (slots_[i].value) result.push_back(Key{i, slots_[i].generation});
        }
        return result;
    }

    template <typename Fn>
    void forEach(Fn&& fn) {
        for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(slots_.size()); ++i) {
            if (slots_[i].value) fn(Key{i, slots_[i].generation}, *slots_[i].value);
        }
    }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(slots_.size()); ++i) {
            if (slots_[i].value) fn(Key{i, slots_[i].generation}, *slots_[i].value);
        }
    }

private:
    struct Slot {
        std::optional<T> value;
        std::uint32_t generation = 0;
    };

    [[nodiscard]] const T* find(Key key) const {
        if (key.index >= slots_.size()) return nullptr;
        const Slot& slot = slots_[key.index];
        if (slot.generation != key.generation || !slot.value) return nullptr;
        return &*slot.value;
    }

    std::vector<Slot> slots_;
    std::vector<std::uint32_t> free_;
    std::size_t size_ = 0;
};

} // namespace stealth
