#include <cloudgrid/result.hpp>

namespace cloudgrid {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:              return "generic";
        case ErrorKind::UnresolvableIdentity: return "unresolvable-identity";
        case ErrorKind::MissingResults:       return "missing-results";
        case ErrorKind::UnknownTarget:        return "unknown-target";
        case ErrorKind::InvalidConfig:        return "invalid-config";
    }
    return "unknown";
}

} // namespace cloudgrid
