#pragma once
#include <cstdint>
#include <string>

namespace trellis::layout {

enum class GeometryFlag : uint8_t {
    None = 0,
    PosX = 1 << 0,
    PosY = 1 << 1,
    Width = 1 << 2,
    Height = 1 << 3,
    All = PosX | PosY | Width | Height
};

inline GeometryFlag operator|(GeometryFlag a, GeometryFlag b) {
    return static_cast<GeometryFlag>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline GeometryFlag operator&(GeometryFlag a, GeometryFlag b) {
    return static_cast<GeometryFlag>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

// Which output geometry fields of a node changed since the bits were last
// cleared. Bits are independent; setting or clearing one never touches
// another.
class GeometryChanged {
public:
    GeometryChanged() = default;
    explicit GeometryChanged(GeometryFlag flags) : bits_(static_cast<uint8_t>(flags)) {}

    // Sets (value == true) or clears every bit present in `flags`.
    void set(GeometryFlag flags, bool value) {
        auto mask = static_cast<uint8_t>(flags);
        if (value) {
            bits_ |= mask;
        } else {
            bits_ &= static_cast<uint8_t>(~mask);
        }
    }

    // True if any bit of `flags` is set.
    bool test(GeometryFlag flags) const { return (bits_ & static_cast<uint8_t>(flags)) != 0; }
    // True if every bit of `flags` is set.
    bool contains(GeometryFlag flags) const {
        auto mask = static_cast<uint8_t>(flags);
        return (bits_ & mask) == mask;
    }

    void clear() { bits_ = 0; }
    bool any() const { return bits_ != 0; }
    bool none() const { return bits_ == 0; }
    GeometryFlag bits() const { return static_cast<GeometryFlag>(bits_); }

    bool operator==(const GeometryChanged&) const = default;

    // "posx|width", or "none" when nothing changed.
    std::string to_string() const;

private:
    uint8_t bits_ = 0;
};

} // namespace trellis::layout
