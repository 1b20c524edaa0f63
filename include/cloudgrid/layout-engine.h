#pragma once

#include <cloudgrid/target.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cloudgrid {

// Position of one target's cell; index is the target's position in the set
struct CellPlacement {
    size_t index;
    uint32_t x;
    uint32_t y;

    bool operator==(const CellPlacement& other) const = default;
};

//-----------------------------------------------------------------------------
// LayoutEngine - row-major wrapped placement of equally sized cells
//
// Cells are cellWidth columns of label plus " <symbol>", separated by a
// fixed gutter. A cell takes two rows (label, platform) and rows of cells
// are one blank row apart. Order is preserved; no packing.
//-----------------------------------------------------------------------------
class LayoutEngine {
public:
    static constexpr uint32_t MARGIN_LEFT = 4;
    static constexpr uint32_t MARGIN_TOP = 3;
    static constexpr uint32_t MARGIN_RIGHT = 5;
    static constexpr uint32_t GUTTER = 6;
    static constexpr uint32_t ROW_STRIDE = 3;

    explicit LayoutEngine(uint32_t cellWidth) : _cellWidth(cellWidth) {}

    // Widest of "name version" and platform over all targets; 0 when empty
    static uint32_t computeCellWidth(const std::vector<Target>& targets);

    uint32_t cellWidth() const { return _cellWidth; }

    std::vector<CellPlacement> layout(size_t targetCount, uint32_t canvasWidth) const;

    // Right-pad to cellWidth / cellWidth + 2 so a redraw clears old text
    std::string padLabel(const std::string& label) const;
    std::string padPlatform(const std::string& platform) const;

private:
    uint32_t _cellWidth;
};

} // namespace cloudgrid
