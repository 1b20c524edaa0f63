#include <cloudgrid/grid-view.h>

#include <ytrace/ytrace.hpp>

namespace cloudgrid {

//=============================================================================
// Factory
//=============================================================================

Result<GridView::Ptr> GridView::create(std::vector<Target> targets, Canvas::Ptr canvas,
                                       GridViewOptions options) noexcept {
    if (!canvas) {
        return Err<Ptr>("GridView::create: null Canvas");
    }
    if (targets.empty()) {
        ywarn("GridView: no targets, the grid will stay empty");
    }

    LayoutEngine layout(LayoutEngine::computeCellWidth(targets));

    std::vector<BrowserState> browsers;
    browsers.reserve(targets.size());
    for (auto& t : targets) {
        browsers.emplace_back(std::move(t));
    }

    yinfo("GridView: {} targets, cell width {}", browsers.size(), layout.cellWidth());
    return Ok(Ptr(new GridView(std::move(browsers), std::move(canvas),
                               GridRenderer(layout, std::move(options.theme)),
                               NameResolver(std::move(options.tables)))));
}

GridView::GridView(std::vector<BrowserState> browsers, Canvas::Ptr canvas,
                   GridRenderer renderer, NameResolver resolver) noexcept
    : _browsers(std::move(browsers))
    , _canvas(std::move(canvas))
    , _renderer(std::move(renderer))
    , _resolver(std::move(resolver))
{
}

GridView& GridView::size(uint32_t width, uint32_t height) {
    std::lock_guard<std::mutex> lock(_mutex);
    _width = width;
    _height = height;
    _sized = true;
    ydebug("GridView: sized {}x{}", width, height);
    return *this;
}

//=============================================================================
// Events
//=============================================================================

Result<BrowserState*> GridView::browserAt(size_t id, const char* event) {
    if (id >= _browsers.size()) {
        return Err<BrowserState*>(std::string("GridView::") + event + ": no target #" +
                                  std::to_string(id) + " (have " +
                                  std::to_string(_browsers.size()) + ")",
                                  ErrorKind::UnknownTarget);
    }
    return &_browsers[id];
}

Result<void> GridView::onInit(size_t id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto browser = browserAt(id, "onInit");
    if (!browser) return Err<void>("init event rejected", browser);

    if ((*browser)->markRunning()) {
        ydebug("GridView: {} initialized", describe((*browser)->target()));
    }
    renderLocked();
    return Ok();
}

Result<void> GridView::onStart(size_t id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto browser = browserAt(id, "onStart");
    if (!browser) return Err<void>("start event rejected", browser);

    if ((*browser)->markRunning()) {
        ydebug("GridView: {} started", describe((*browser)->target()));
    }
    renderLocked();
    return Ok();
}

Result<void> GridView::onEnd(size_t id, TestResults results) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto browser = browserAt(id, "onEnd");
    if (!browser) return Err<void>("end event rejected", browser);

    uint32_t failures = results.failureCount;
    (*browser)->markEnded(std::move(results));
    ydebug("GridView: {} ended with {} failure(s), state {}", describe((*browser)->target()),
           failures, targetStateName((*browser)->state()));
    renderLocked();
    return Ok();
}

size_t GridView::markAsFailed(const std::string& rawName, const std::string& rawVersion,
                              const std::string& rawPlatform) {
    std::lock_guard<std::mutex> lock(_mutex);

    size_t matched = 0;
    auto identity = _resolver.resolve(rawName, rawPlatform);
    if (!identity.complete()) {
        ydebug("GridView: cannot resolve {} {} on {}, ignoring", rawName, rawVersion,
               rawPlatform);
    } else {
        for (auto& browser : _browsers) {
            const Target& t = browser.target();
            if (NameResolver::matches(t.name, *identity.name) &&
                NameResolver::matches(t.platform, *identity.platform)) {
                ++matched;
                if (browser.markFailed()) {
                    yinfo("GridView: {} marked as failed", describe(t));
                }
            }
        }
        if (matched == 0) {
            ydebug("GridView: no target for {} {} on {}", rawName, rawVersion, rawPlatform);
        }
    }

    renderLocked();
    return matched;
}

//=============================================================================
// Rendering / queries
//=============================================================================

void GridView::render() {
    std::lock_guard<std::mutex> lock(_mutex);
    renderLocked();
}

void GridView::renderLocked() {
    if (!_sized) {
        ywarn("GridView: render before size(), skipped");
        return;
    }
    _renderer.render(_browsers, *_canvas, _width);
}

std::optional<size_t> GridView::indexOf(const std::string& name, const std::string& version,
                                        const std::string& platform) const {
    std::lock_guard<std::mutex> lock(_mutex);
    for (size_t i = 0; i < _browsers.size(); ++i) {
        const Target& t = _browsers[i].target();
        if (t.name == name && t.version == version && t.platform == platform) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<BrowserState> GridView::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _browsers;
}

Result<std::vector<FailureReport>> GridView::collectFailures() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return FailureReporter::collect(_browsers);
}

uint32_t GridView::totalFailures() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return FailureReporter::totalFailures(_browsers);
}

} // namespace cloudgrid
