#ifndef SCOUR_RANDOM_UTILS_HPP
#define SCOUR_RANDOM_UTILS_HPP

#include <string>

namespace scour::RandomUtils {

    /**
     * @brief Name component for workspaces and temp files.
     * @return Sixteen lowercase hex digits from a per-thread generator.
     */
    std::string random_suffix();

} // namespace scour::RandomUtils

#endif // SCOUR_RANDOM_UTILS_HPP
