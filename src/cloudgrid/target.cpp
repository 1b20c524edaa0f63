#include <cloudgrid/target.h>

namespace cloudgrid {

std::string describe(const Target& target) {
    return target.name + " " + target.version + " on " + target.platform;
}

} // namespace cloudgrid
