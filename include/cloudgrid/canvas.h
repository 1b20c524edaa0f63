#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace cloudgrid {

/**
 * Canvas - write-only text surface the grid draws on.
 *
 * Colors are plain SGR foreground codes (32 green, 31 red, 90 gray, 0
 * default). How a color reaches the screen is up to the implementation;
 * the grid never emits escape sequences itself.
 *
 * Implementations:
 * - TerminalCanvas: ANSI terminal on an ostream
 * - test::RecordingCanvas: in-memory screen for the unit tests
 */
class Canvas {
public:
    using Ptr = std::shared_ptr<Canvas>;

    virtual ~Canvas() = default;

    virtual void moveTo(uint32_t x, uint32_t y) = 0;

    // Text at the cursor, in the surface's default color
    virtual void write(std::string_view text) = 0;

    // Text at the cursor, in the given color, restoring the default after
    virtual void writeColored(std::string_view text, int color) = 0;

    virtual void flush() {}
};

} // namespace cloudgrid
