#pragma once

#include <cloudgrid/name-resolver.h>
#include <cloudgrid/result.hpp>
#include <cloudgrid/theme.h>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudgrid {

/**
 * Config - layered YAML settings.
 *
 * Layers, lowest first: built-in defaults, config file, CLOUDGRID_* env
 * vars (scalar keys only), command line overrides.
 *
 *   display:
 *     symbols: { ok: "✓", error: "✖", none: " " }
 *     colors:  { ok: 32, error: 31, none: 0 }
 *     color: true
 *     delay-ms: 0
 *   names:
 *     browsers:  { "Mobile Safari": iphone }
 *     platforms: { "Windows 8": "Windows 2012" }
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Empty configPath means the XDG location, skipped when absent.
    // An explicit path that cannot be read is an error.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Dotted path lookup ("display.colors.ok"); nullopt when missing or of
    // the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Theme with the configured symbols/colors; unknown keys are rejected
    Result<Theme> theme() const;

    // Built-in tables with names.browsers / names.platforms merged on top
    Result<NormalizationTables> normalizationTables() const;

    bool useColor() const;
    uint32_t delayMs() const;

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "CLOUDGRID_";

    static constexpr const char* KEY_SYMBOLS = "display.symbols";
    static constexpr const char* KEY_COLORS = "display.colors";
    static constexpr const char* KEY_COLOR = "display.color";
    static constexpr const char* KEY_DELAY_MS = "display.delay-ms";
    static constexpr const char* KEY_BROWSER_NAMES = "names.browsers";
    static constexpr const char* KEY_PLATFORM_NAMES = "names.platforms";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;

    // "display.colors.ok" -> "CLOUDGRID_DISPLAY_COLORS_OK"
    static std::string pathToEnvVar(const std::string& path);

    static void mergeNodes(YAML::Node& target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace cloudgrid
