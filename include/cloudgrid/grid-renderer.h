#pragma once

#include <cloudgrid/browser-state.h>
#include <cloudgrid/canvas.h>
#include <cloudgrid/layout-engine.h>
#include <cloudgrid/theme.h>
#include <vector>

namespace cloudgrid {

class GridRenderer {
public:
    GridRenderer(LayoutEngine layout, Theme theme)
        : _layout(layout), _theme(std::move(theme)) {}

    // Draws every cell, then a blank separator. Safe to repeat: each cell
    // is fully overwritten as long as the cell width stays the same.
    void render(const std::vector<BrowserState>& browsers, Canvas& canvas,
                uint32_t canvasWidth) const;

    // Failed or any failing test -> Error, not ended yet -> None, else Ok
    static VisualState visualStateFor(const BrowserState& browser);

    const std::string& symbolFor(const BrowserState& browser) const {
        return _theme.symbol(visualStateFor(browser));
    }
    int colorFor(const BrowserState& browser) const {
        return _theme.color(visualStateFor(browser));
    }

    const LayoutEngine& layout() const { return _layout; }
    const Theme& theme() const { return _theme; }

private:
    LayoutEngine _layout;
    Theme _theme;
};

} // namespace cloudgrid
