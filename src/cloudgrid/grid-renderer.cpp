#include <cloudgrid/grid-renderer.h>

namespace cloudgrid {

VisualState GridRenderer::visualStateFor(const BrowserState& browser) {
    if (browser.state() == TargetState::Failed || browser.hasFailures()) {
        return VisualState::Error;
    }
    if (browser.state() != TargetState::Ended) {
        return VisualState::None;
    }
    return VisualState::Ok;
}

void GridRenderer::render(const std::vector<BrowserState>& browsers, Canvas& canvas,
                          uint32_t canvasWidth) const {
    for (const auto& cell : _layout.layout(browsers.size(), canvasWidth)) {
        const BrowserState& browser = browsers[cell.index];
        const Target& target = browser.target();
        VisualState visual = visualStateFor(browser);

        canvas.moveTo(cell.x, cell.y);
        canvas.write(_layout.padLabel(target.label()));
        canvas.write(" ");
        canvas.writeColored(_theme.symbol(visual), _theme.color(visual));

        canvas.moveTo(cell.x, cell.y + 1);
        canvas.writeColored(_layout.padPlatform(target.platform), Theme::PLATFORM_COLOR);
    }
    canvas.write("\n\n");
    canvas.flush();
}

} // namespace cloudgrid
