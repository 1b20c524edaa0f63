#pragma once

#include <cloudgrid/canvas.h>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace cloudgrid {

struct TerminalSize {
    uint32_t cols = 80;
    uint32_t rows = 24;
};

// Size of the controlling terminal, 80x24 when stdout is not a tty
TerminalSize queryTerminalSize();

//-----------------------------------------------------------------------------
// TerminalCanvas - Canvas on an ANSI terminal
//
// moveTo(x, y) -> CSI y;x H
// writeColored -> CSI color m text CSI 0 m
// With color disabled, writeColored writes plain text.
//-----------------------------------------------------------------------------
class TerminalCanvas : public Canvas {
public:
    explicit TerminalCanvas(std::ostream& out, bool color = true);
    ~TerminalCanvas() override = default;

    void moveTo(uint32_t x, uint32_t y) override;
    void write(std::string_view text) override;
    void writeColored(std::string_view text, int color) override;
    void flush() override;

    // Screen control used around a replay
    void clear();
    void hideCursor();
    void showCursor();

    static std::string cursorSequence(uint32_t x, uint32_t y);
    static std::string colorSequence(int color);

private:
    std::ostream& _out;
    bool _color;
};

} // namespace cloudgrid
