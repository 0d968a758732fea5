#include <trellis/layout/geometry_changed.h>

namespace trellis::layout {

std::string GeometryChanged::to_string() const {
    struct Named {
        GeometryFlag flag;
        const char* name;
    };
    static constexpr Named kNames[] = {
        {GeometryFlag::PosX, "posx"},
        {GeometryFlag::PosY, "posy"},
        {GeometryFlag::Width, "width"},
        {GeometryFlag::Height, "height"},
    };

    std::string out;
    for (const auto& n : kNames) {
        if (!test(n.flag)) continue;
        if (!out.empty()) out += '|';
        out += n.name;
    }
    return out.empty() ? "none" : out;
}

} // namespace trellis::layout
