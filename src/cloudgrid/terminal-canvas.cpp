#include <cloudgrid/terminal-canvas.h>

#include <ostream>

#ifdef __unix__
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace cloudgrid {

TerminalSize queryTerminalSize() {
    TerminalSize size;
#ifdef __unix__
    struct winsize ws = {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        size.cols = ws.ws_col;
        size.rows = ws.ws_row;
    }
#endif
    return size;
}

TerminalCanvas::TerminalCanvas(std::ostream& out, bool color)
    : _out(out), _color(color) {}

std::string TerminalCanvas::cursorSequence(uint32_t x, uint32_t y) {
    return "\033[" + std::to_string(y) + ";" + std::to_string(x) + "H";
}

std::string TerminalCanvas::colorSequence(int color) {
    return "\033[" + std::to_string(color) + "m";
}

void TerminalCanvas::moveTo(uint32_t x, uint32_t y) {
    _out << cursorSequence(x, y);
}

void TerminalCanvas::write(std::string_view text) {
    _out << text;
}

void TerminalCanvas::writeColored(std::string_view text, int color) {
    if (!_color) {
        _out << text;
        return;
    }
    _out << colorSequence(color) << text << "\033[0m";
}

void TerminalCanvas::flush() {
    _out.flush();
}

void TerminalCanvas::clear() {
    _out << "\033[2J" << cursorSequence(1, 1);
}

void TerminalCanvas::hideCursor() {
    _out << "\033[?25l";
}

void TerminalCanvas::showCursor() {
    _out << "\033[?25h";
}

} // namespace cloudgrid
