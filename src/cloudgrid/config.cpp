#include <cloudgrid/config.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <ytrace/ytrace.hpp>

namespace cloudgrid {

static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Dotted paths of every scalar below node, "names" excluded: its keys are
// remote names, not settings
static void collectScalarPaths(const YAML::Node& node, const std::string& prefix,
                               std::vector<std::string>& out) {
    if (!node.IsMap()) return;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string path = prefix.empty() ? key : prefix + "." + key;
        if (path == "names") continue;
        if (it->second.IsMap()) {
            collectScalarPaths(it->second, path, out);
        } else if (it->second.IsScalar()) {
            out.push_back(path);
        }
    }
}

static void setScalar(YAML::Node node, const std::vector<std::string>& parts, size_t i,
                      const std::string& value) {
    if (i + 1 == parts.size()) {
        node[parts[i]] = value;
        return;
    }
    setScalar(node[parts[i]], parts, i + 1, value);
}

//=============================================================================
// Factory
//=============================================================================

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return Err<void>("Cannot use config " + _configPath, res);
        }
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        if (std::filesystem::exists(xdgPath)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                yinfo("Loaded config from: {}", xdgPath.string());
            }
        }
    }

    applyEnvOverrides();

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    Theme theme;
    _config = YAML::Node(YAML::NodeType::Map);
    _config["display"]["symbols"]["ok"] = theme.okSymbol;
    _config["display"]["symbols"]["error"] = theme.errorSymbol;
    _config["display"]["symbols"]["none"] = theme.noneSymbol;
    _config["display"]["colors"]["ok"] = theme.okColor;
    _config["display"]["colors"]["error"] = theme.errorColor;
    _config["display"]["colors"]["none"] = theme.noneColor;
    _config["display"]["color"] = true;
    _config["display"]["delay-ms"] = 0;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path, ErrorKind::InvalidConfig);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err<void>("Config file is not a mapping: " + path, ErrorKind::InvalidConfig);
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()), ErrorKind::InvalidConfig);
    }
}

void Config::applyEnvOverrides() {
    std::vector<std::string> paths;
    collectScalarPaths(_config, "", paths);

    for (const auto& path : paths) {
        std::string envVar = pathToEnvVar(path);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;
        setScalar(_config, splitPath(path), 0, val);
        ydebug("Config override from env: {}={}", envVar, val);
    }
}

//=============================================================================
// Lookup
//=============================================================================

YAML::Node Config::getNode(const std::string& path) const {
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node& target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        const YAML::Node& constTarget = target;
        YAML::Node existing = constTarget[key];
        if (value.IsMap() && existing && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

//=============================================================================
// Typed accessors
//=============================================================================

Result<Theme> Config::theme() const {
    Theme theme;

    YAML::Node symbols = getNode(KEY_SYMBOLS);
    if (symbols && symbols.IsMap()) {
        for (auto it = symbols.begin(); it != symbols.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (!it->second.IsScalar()) {
                return Err<Theme>("display.symbols." + key + " must be a string",
                                  ErrorKind::InvalidConfig);
            }
            if (auto res = theme.setSymbol(key, it->second.as<std::string>()); !res) {
                return Err<Theme>("Bad display.symbols", res);
            }
        }
    }

    YAML::Node colors = getNode(KEY_COLORS);
    if (colors && colors.IsMap()) {
        for (auto it = colors.begin(); it != colors.end(); ++it) {
            std::string key = it->first.as<std::string>();
            int color = 0;
            try {
                color = it->second.as<int>();
            } catch (const YAML::Exception&) {
                return Err<Theme>("display.colors." + key + " must be an integer",
                                  ErrorKind::InvalidConfig);
            }
            if (auto res = theme.setColor(key, color); !res) {
                return Err<Theme>("Bad display.colors", res);
            }
        }
    }
    return Ok(std::move(theme));
}

static Result<void> mergeTable(const YAML::Node& node, const char* key,
                               std::map<std::string, std::string>& table) {
    if (!node) return Ok();
    if (!node.IsMap()) {
        return Err<void>(std::string(key) + " must be a mapping", ErrorKind::InvalidConfig);
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it->second.IsScalar()) {
            return Err<void>(std::string(key) + "." + it->first.as<std::string>() +
                             " must be a string", ErrorKind::InvalidConfig);
        }
        table[it->first.as<std::string>()] = it->second.as<std::string>();
    }
    return Ok();
}

Result<NormalizationTables> Config::normalizationTables() const {
    auto tables = NormalizationTables::defaults();
    if (auto res = mergeTable(getNode(KEY_BROWSER_NAMES), KEY_BROWSER_NAMES,
                              tables.browserNames); !res) {
        return Err<NormalizationTables>("Bad browser name table", res);
    }
    if (auto res = mergeTable(getNode(KEY_PLATFORM_NAMES), KEY_PLATFORM_NAMES,
                              tables.platformNames); !res) {
        return Err<NormalizationTables>("Bad platform name table", res);
    }
    return Ok(std::move(tables));
}

bool Config::useColor() const {
    return get<bool>(KEY_COLOR, true);
}

uint32_t Config::delayMs() const {
    return get<uint32_t>(KEY_DELAY_MS, 0);
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "cloudgrid" / "config.yaml";
}

} // namespace cloudgrid
