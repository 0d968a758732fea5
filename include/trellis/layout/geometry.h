#pragma once

namespace trellis::layout {

// Final position and size of a node after layout.
struct Rect {
    float posx = 0, posy = 0;
    float width = 0, height = 0;

    bool operator==(const Rect&) const = default;
};

// Resolved space on each side of a node.
struct Space {
    float left = 0, right = 0, top = 0, bottom = 0;

    bool operator==(const Space&) const = default;
};

// Requested size, before the solver resolves it into Rect.
struct Size {
    float width = 0, height = 0;

    bool operator==(const Size&) const = default;
};

} // namespace trellis::layout
