#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cloudgrid {

/**
 * NormalizationTables - raw remote names to the canonical names used by
 * the local target list.
 *
 * Built once before the view exists and never mutated afterwards.
 */
struct NormalizationTables {
    std::map<std::string, std::string> browserNames;   // "Mobile Safari" -> "iphone"
    std::map<std::string, std::string> platformNames;  // "Windows 8" -> "Windows 2012"

    // Tables used by the remote grid this tool was written against
    static NormalizationTables defaults();
};

struct ResolvedIdentity {
    std::optional<std::string> name;
    std::optional<std::string> platform;

    bool complete() const { return name.has_value() && platform.has_value(); }
};

class NameResolver {
public:
    explicit NameResolver(NormalizationTables tables);

    // Pure lookup. Unknown names come back empty, which means "matches
    // nothing", never "matches anything".
    ResolvedIdentity resolve(std::string_view rawName, std::string_view rawPlatform) const;

    const NormalizationTables& tables() const { return _tables; }

    // ASCII case-insensitive equality used when matching canonical names
    static bool matches(std::string_view a, std::string_view b);

private:
    NormalizationTables _tables;
};

} // namespace cloudgrid
