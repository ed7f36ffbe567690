/**
 * @file sanitization_orchestrator.hpp
 * @brief Discovers the images of an unpacked tree and sanitizes them in parallel.
 */

#ifndef SCOUR_SANITIZATION_ORCHESTRATOR_HPP
#define SCOUR_SANITIZATION_ORCHESTRATOR_HPP

#include "event_bus.hpp"
#include "image_sanitizer.hpp"
#include "sanitization_report.hpp"
#include "sanitize_config.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace scour {

/**
 * @brief Fans the files of one directory tree over a bounded ThreadPool.
 *
 * @details Two phases:
 * - Discovery: recursive walk collecting files whose extension is a known
 *   raster format (case-insensitive). Unreadable directories are logged and
 *   skipped, symlinks are not followed. The result is sorted by generic path.
 * - Fan-out: each worker runs ImageSanitizer::sanitize and stores the report
 *   at the file's discovery index, so the returned list does not depend on
 *   scheduling.
 *
 * Progress is published on the EventBus every `progress_interval`
 * completions and once at the end.
 */
class SanitizationOrchestrator {
public:
    SanitizationOrchestrator(const ImageSanitizer& sanitizer, EventBus& bus);

    /**
     * @brief Collects candidate image files under root.
     * @return Paths sorted by their generic string form.
     */
    [[nodiscard]] static std::vector<std::filesystem::path> discover(const std::filesystem::path& root);

    /**
     * @brief Pool size for a run: min(cpu_count, file_count, max_workers), at least 1.
     */
    [[nodiscard]] static unsigned worker_count(const SanitizeConfig& config, std::size_t file_count);

    /**
     * @brief Discovers and sanitizes every image under root. Blocks until done.
     * @return One report per discovered file, in discovery order.
     */
    std::vector<SanitizationReport> run(const std::filesystem::path& root);

private:
    void sanitize_one(std::size_t index,
                      const std::filesystem::path& file,
                      SanitizationReport& slot,
                      std::atomic<std::size_t>& done,
                      std::size_t total) const;

    const ImageSanitizer& sanitizer_;
    EventBus& bus_;
};

} // namespace scour

#endif // SCOUR_SANITIZATION_ORCHESTRATOR_HPP
