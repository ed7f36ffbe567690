#include "../../include/random_utils.hpp"
#include <array>
#include <cstdint>
#include <random>

namespace scour::RandomUtils {

std::string random_suffix() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                           '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::uint64_t bits = engine();
    std::string out(16, '0');
    for (auto it = out.rbegin(); it != out.rend(); ++it, bits >>= 4) {
        *it = kHex[bits & 0xF];
    }
    return out;
}

} // namespace scour::RandomUtils
