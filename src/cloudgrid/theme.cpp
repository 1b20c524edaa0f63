#include <cloudgrid/theme.h>

namespace cloudgrid {

const std::string& Theme::symbol(VisualState state) const {
    switch (state) {
        case VisualState::Ok:    return okSymbol;
        case VisualState::Error: return errorSymbol;
        case VisualState::None:  break;
    }
    return noneSymbol;
}

int Theme::color(VisualState state) const {
    switch (state) {
        case VisualState::Ok:    return okColor;
        case VisualState::Error: return errorColor;
        case VisualState::None:  break;
    }
    return noneColor;
}

Result<VisualState> Theme::parseKey(std::string_view key) {
    if (key == "ok") return VisualState::Ok;
    if (key == "error") return VisualState::Error;
    if (key == "none") return VisualState::None;
    return Err<VisualState>("unknown theme key '" + std::string(key) +
                            "' (expected ok, error or none)",
                            ErrorKind::InvalidConfig);
}

Result<void> Theme::setSymbol(std::string_view key, std::string symbol) {
    auto state = parseKey(key);
    if (!state) {
        return Err<void>("Theme::setSymbol", state);
    }
    switch (*state) {
        case VisualState::Ok:    okSymbol = std::move(symbol); break;
        case VisualState::Error: errorSymbol = std::move(symbol); break;
        case VisualState::None:  noneSymbol = std::move(symbol); break;
    }
    return Ok();
}

Result<void> Theme::setColor(std::string_view key, int color) {
    auto state = parseKey(key);
    if (!state) {
        return Err<void>("Theme::setColor", state);
    }
    switch (*state) {
        case VisualState::Ok:    okColor = color; break;
        case VisualState::Error: errorColor = color; break;
        case VisualState::None:  noneColor = color; break;
    }
    return Ok();
}

} // namespace cloudgrid
