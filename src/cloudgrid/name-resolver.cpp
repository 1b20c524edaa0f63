#include <cloudgrid/name-resolver.h>

#include <algorithm>
#include <cctype>

namespace cloudgrid {

NormalizationTables NormalizationTables::defaults() {
    NormalizationTables tables;
    tables.browserNames = {
        {"Chrome", "chrome"},
        {"Safari", "safari"},
        {"Mobile Safari", "iphone"},
        {"Opera", "opera"},
        {"Internet Explorer", "internet explorer"},
        {"Firefox", "firefox"},
        {"Android", "android"},
    };
    tables.platformNames = {
        {"Windows XP", "Windows 2003"},
        {"Windows 7", "Windows 2008"},
        {"Windows 8", "Windows 2012"},
        {"iOS 5.08", "Mac 10.6"},
        {"Mac OS X 10.6.8", "Mac 10.6"},
        {"Linux", "Linux"},
        {"Linuxux", "Linux"},
        {"Linuxx", "Linux"},
    };
    return tables;
}

NameResolver::NameResolver(NormalizationTables tables)
    : _tables(std::move(tables)) {}

static std::optional<std::string> lookup(const std::map<std::string, std::string>& table,
                                         std::string_view key) {
    auto it = table.find(std::string(key));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

ResolvedIdentity NameResolver::resolve(std::string_view rawName,
                                       std::string_view rawPlatform) const {
    ResolvedIdentity out;
    out.name = lookup(_tables.browserNames, rawName);
    out.platform = lookup(_tables.platformNames, rawPlatform);
    return out;
}

bool NameResolver::matches(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace cloudgrid
