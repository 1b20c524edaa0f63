#pragma once

#include <cloudgrid/browser-state.h>
#include <cloudgrid/canvas.h>
#include <cloudgrid/failure-reporter.h>
#include <cloudgrid/grid-renderer.h>
#include <cloudgrid/name-resolver.h>
#include <cloudgrid/result.hpp>
#include <cloudgrid/theme.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloudgrid {

struct GridViewOptions {
    Theme theme;
    NormalizationTables tables = NormalizationTables::defaults();
};

/**
 * GridView - live status grid for a fixed set of browser targets.
 *
 * Owns the target set. Every entry point updates one target (or, for
 * markAsFailed, every matching one) and then redraws the whole grid before
 * returning. Entry points are serialized, so events coming from several
 * threads are still processed one at a time.
 *
 * Targets are addressed by their position in the list given to create().
 */
class GridView {
public:
    using Ptr = std::shared_ptr<GridView>;

    static Result<Ptr> create(std::vector<Target> targets, Canvas::Ptr canvas,
                              GridViewOptions options = {}) noexcept;

    ~GridView() = default;

    GridView(const GridView&) = delete;
    GridView& operator=(const GridView&) = delete;

    // Canvas size; nothing is drawn until this has been called
    GridView& size(uint32_t width, uint32_t height);
    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    uint32_t cellWidth() const { return _renderer.layout().cellWidth(); }

    // Lifecycle events from the test orchestrator
    Result<void> onInit(size_t id);
    Result<void> onStart(size_t id);
    Result<void> onEnd(size_t id, TestResults results);

    // Errored signal from the remote fleet, raw remote names. Unknown names
    // or no matching target are ignored. Returns how many targets matched.
    size_t markAsFailed(const std::string& rawName, const std::string& rawVersion,
                        const std::string& rawPlatform);

    void render();

    std::optional<size_t> indexOf(const std::string& name, const std::string& version,
                                  const std::string& platform) const;

    // Live view of the targets, not locked. Only safe once no other thread
    // delivers events; use snapshot() while a run is in progress.
    const std::vector<BrowserState>& browsers() const { return _browsers; }

    // Copy of every target's state, taken under the lock
    std::vector<BrowserState> snapshot() const;

    Result<std::vector<FailureReport>> collectFailures() const;
    uint32_t totalFailures() const;

    const GridRenderer& renderer() const { return _renderer; }

private:
    GridView(std::vector<BrowserState> browsers, Canvas::Ptr canvas,
             GridRenderer renderer, NameResolver resolver) noexcept;

    Result<BrowserState*> browserAt(size_t id, const char* event);
    void renderLocked();

    mutable std::mutex _mutex;
    std::vector<BrowserState> _browsers;
    Canvas::Ptr _canvas;
    GridRenderer _renderer;
    NameResolver _resolver;
    uint32_t _width = 0;
    uint32_t _height = 0;
    bool _sized = false;
};

} // namespace cloudgrid
