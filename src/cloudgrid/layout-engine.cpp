#include <cloudgrid/layout-engine.h>

#include <algorithm>

namespace cloudgrid {

uint32_t LayoutEngine::computeCellWidth(const std::vector<Target>& targets) {
    size_t width = 0;
    for (const auto& t : targets) {
        size_t labelLen = t.name.size() + t.version.size() + 1;
        width = std::max({width, labelLen, t.platform.size()});
    }
    return static_cast<uint32_t>(width);
}

std::vector<CellPlacement> LayoutEngine::layout(size_t targetCount, uint32_t canvasWidth) const {
    std::vector<CellPlacement> cells;
    cells.reserve(targetCount);

    // 64-bit so very wide cells cannot wrap around
    uint64_t x = MARGIN_LEFT;
    uint64_t y = MARGIN_TOP;
    const uint64_t limit = uint64_t(canvasWidth);

    for (size_t i = 0; i < targetCount; ++i) {
        // same as x + cellWidth > canvasWidth - 5, without going negative
        if (x + _cellWidth + MARGIN_RIGHT > limit) {
            y += ROW_STRIDE;
            x = MARGIN_LEFT;
        }
        cells.push_back({i, static_cast<uint32_t>(x), static_cast<uint32_t>(y)});
        x += _cellWidth + GUTTER;
    }
    return cells;
}

static std::string padTo(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return text + std::string(width - text.size(), ' ');
}

std::string LayoutEngine::padLabel(const std::string& label) const {
    return padTo(label, _cellWidth);
}

std::string LayoutEngine::padPlatform(const std::string& platform) const {
    return padTo(platform, size_t(_cellWidth) + 2);
}

} // namespace cloudgrid
