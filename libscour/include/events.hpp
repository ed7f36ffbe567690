#ifndef SCOUR_EVENTS_HPP
#define SCOUR_EVENTS_HPP

#include "sanitization_report.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace scour {

/**
 * @brief Events published while a job runs.
 *
 * Plain data carriers for EventBus subscribers (CLI progress bar, report
 * generator, GUI). Per-file events are published from worker threads.
 */

// --- Sanitization ---

/**
 * @brief Emitted once discovery has finished, before any file is touched.
 */
struct SanitizeStartEvent {
    std::filesystem::path root; ///< Directory being sanitized
    std::size_t file_count = 0; ///< Images found
    unsigned workers = 0;       ///< Pool size chosen for this run
};

/**
 * @brief Emitted when one file has its final report.
 */
struct FileSanitizedEvent {
    std::size_t index = 0;      ///< Position in discovery order
    SanitizationReport report;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted every progress_interval completions and once at the end.
 */
struct SanitizeProgressEvent {
    std::size_t done = 0;
    std::size_t total = 0;
};

struct SanitizeCompleteEvent {
    std::filesystem::path root;
    AggregateStats stats;
    std::chrono::milliseconds duration{0};
};

// --- Container ---

/**
 * @brief Emitted for each archive entry refused during extraction.
 */
struct EntrySkippedEvent {
    std::filesystem::path archive; ///< Source archive
    std::string entry_name;        ///< Name as stored in the archive
    std::string reason;
};

struct ArchiveWrittenEvent {
    std::filesystem::path path; ///< Written archive
    std::uintmax_t size = 0;    ///< bytes
    std::size_t entries = 0;
};

} // namespace scour

#endif // SCOUR_EVENTS_HPP
