/**
 * @file sanitize_config.hpp
 * @brief Named tunables of a sanitization run.
 */

#ifndef SCOUR_SANITIZE_CONFIG_HPP
#define SCOUR_SANITIZE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <thread>

namespace scour {

/**
 * @brief Bounds enforced before any pixel buffer is allocated.
 */
struct DecodeLimits {
    std::int64_t max_image_dimension = 50000;          ///< per side, pixels
    std::int64_t max_pixel_count = 500'000'000;        ///< width * height
    std::uint64_t max_decompressed_size = 500ull << 20; ///< bytes read from an input
};

/**
 * @brief Configuration shared by every file of a job.
 */
struct SanitizeConfig {
    std::uint32_t target_dpi = 96;
    int jpeg_quality = 95;
    std::uint32_t max_long_side = 2500;     ///< 0 disables downsampling
    unsigned max_workers = 8;
    unsigned cpu_count = std::thread::hardware_concurrency(); ///< 0 is treated as 1
    std::size_t progress_interval = 50;     ///< completions between progress events
    DecodeLimits limits{};
    std::size_t stream_buffer_size = 64 * 1024;
    bool enable_fast_path = true;
};

} // namespace scour

#endif // SCOUR_SANITIZE_CONFIG_HPP
