#include <stealth/slot_map.hpp>

#include <cassert>
#include <cstdio>
#include <memory>
#include <string>

struct NameTag {};
using NameKey = stealth::SlotKey<NameTag>;

static void testInsertGet() {
    stealth::SlotMap<NameKey, std::string> map;
    assert(map.empty());

    auto a = map.insert("a");
    auto b = map.insert("b");
    assert(map.size() == 2);
    assert(a != b);
    assert(*map.get(a) == "a");
    assert(*map.get(b) == "b");
    assert(a.generation % 2 == 1);

    *map.get(a) = "changed";
    const auto& constMap = map;
    assert(*constMap.get(a) == "changed");

    std::printf("  insert and get: ok\n");
}

static void testStaleKeys() {
    stealth::SlotMap<NameKey, std::string> map;
    auto a = map.insert("a");

    auto removed = map.remove(a);
    assert(removed && *removed == "a");
    assert(!map.contains(a));
    assert(map.get(a) == nullptr);
    assert(!map.remove(a));

    // The slot is reused under a new generation.
    auto c = map.insert("c");
    assert(c.index == a.index);
    assert(c.generation != a.generation);
    assert(map.get(a) == nullptr);
    assert(*map.get(c) == "c");

    assert(NameKey::null().isNull());
    assert(map.get(NameKey::null()) == nullptr);
    assert(map.get(NameKey{42, 1}) == nullptr);

    std::printf("  stale keys: ok\n");
}

static void testMoveOnlyValues() {
    stealth::SlotMap<NameKey, std::unique_ptr<int>> map;
    auto k = map.insert(std::make_unique<int>(5));
    auto v = map.remove(k);
    assert(v && **v == 5);

    std::printf("  move-only values: ok\n");
}

static void testIteration() {
    stealth::SlotMap<NameKey, int> map;
    auto a = map.insert(1);
    auto b = map.insert(2);
    auto c = map.insert(3);
    (void)map.remove(b);

    auto keys = map.keys();
    assert(keys.size() == 2);
    assert(keys[0] == a && keys[1] == c);

    int sum = 0;
    map.forEach([&](NameKey, int& v) { v *= 10; });
    static_cast<const decltype(map)&>(map).forEach([&](NameKey, const int& v) { sum += v; });
    assert(sum == 40);

    std::printf("  iteration: ok\n");
}

int main() {
    testInsertGet();
    testStaleKeys();
    testMoveOnlyValues();
    testIteration();

    std::printf("all slot map tests passed\n");
    return 0;
}
