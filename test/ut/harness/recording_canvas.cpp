#include "recording_canvas.h"

namespace cloudgrid::test {

static size_t utf8Length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

void RecordingCanvas::moveTo(uint32_t x, uint32_t y) {
    _ops.push_back({CanvasOp::Kind::Move, x, y, {}, -1});
    _x = x;
    _y = y;
}

void RecordingCanvas::write(std::string_view text) {
    _ops.push_back({CanvasOp::Kind::Write, _x, _y, std::string(text), -1});
    put(text, -1);
}

void RecordingCanvas::writeColored(std::string_view text, int color) {
    _ops.push_back({CanvasOp::Kind::Write, _x, _y, std::string(text), color});
    put(text, color);
}

void RecordingCanvas::put(std::string_view text, int color) {
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\n') {
            _x = 1;
            _y += 1;
            i += 1;
            continue;
        }
        size_t len = utf8Length(static_cast<unsigned char>(text[i]));
        _screen[{_y, _x}] = ScreenCell{std::string(text.substr(i, len)), color};
        _x += 1;
        i += len;
    }
}

std::string RecordingCanvas::textAt(uint32_t x, uint32_t y, size_t count) const {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        auto it = _screen.find({y, x + static_cast<uint32_t>(i)});
        if (it != _screen.end()) out += it->second.glyph;
    }
    return out;
}

const ScreenCell* RecordingCanvas::cellAt(uint32_t x, uint32_t y) const {
    auto it = _screen.find({y, x});
    return it == _screen.end() ? nullptr : &it->second;
}

std::vector<std::string> RecordingCanvas::writesWithColor(int color) const {
    std::vector<std::string> out;
    for (const auto& op : _ops) {
        if (op.kind == CanvasOp::Kind::Write && op.color == color) out.push_back(op.text);
    }
    return out;
}

} // namespace cloudgrid::test
