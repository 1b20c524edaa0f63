#pragma once

#include <cloudgrid/result.hpp>
#include <string>
#include <string_view>

namespace cloudgrid {

// What a cell shows, independent of how it is drawn
enum class VisualState {
    Ok,
    Error,
    None,
};

struct Theme {
    static constexpr int PLATFORM_COLOR = 90;

    std::string okSymbol = "✓";
    std::string errorSymbol = "✖";
    std::string noneSymbol = " ";

    int okColor = 32;
    int errorColor = 31;
    int noneColor = 0;

    const std::string& symbol(VisualState state) const;
    int color(VisualState state) const;

    // Keys are exactly "ok", "error" and "none"; anything else is rejected
    Result<void> setSymbol(std::string_view key, std::string symbol);
    Result<void> setColor(std::string_view key, int color);

    static Result<VisualState> parseKey(std::string_view key);
};

} // namespace cloudgrid
