#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace trellis::layout {

// Handle to one layout node. Allocated and recycled by the caller's node
// tree; the cache only keys rows by it. When the tree recycles a slot it
// bumps the generation, so handles to the old node stop matching.
struct Entity {
    static constexpr uint32_t kNullIndex = std::numeric_limits<uint32_t>::max();

    uint32_t index = kNullIndex;
    uint32_t generation = 0;

    constexpr Entity() = default;
    constexpr explicit Entity(uint32_t index_, uint32_t generation_ = 0)
        : index(index_), generation(generation_) {}

    static constexpr Entity null() { return Entity{}; }
    constexpr bool is_null() const { return index == kNullIndex; }

    constexpr bool operator==(const Entity&) const = default;
    constexpr auto operator<=>(const Entity&) const = default;
};

// "12v3" for index 12, generation 3; "null" for the null entity.
inline std::string to_string(Entity entity) {
    if (entity.is_null()) return "null";
    return std::to_string(entity.index) + "v" + std::to_string(entity.generation);
}

} // namespace trellis::layout

template <>
struct std::hash<trellis::layout::Entity> {
    size_t operator()(const trellis::layout::Entity& e) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(e.generation) << 32) | e.index;
        return std::hash<uint64_t>{}(packed);
    }
};
