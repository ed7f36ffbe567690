/**
 * @file scour.hpp
 * @brief Public API for the scour library.
 */

#ifndef SCOUR_HPP
#define SCOUR_HPP

#include "container_codec.hpp"
#include "event_bus.hpp"
#include "job_state.hpp"
#include "sanitization_report.hpp"
#include "sanitize_config.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scour {

/**
 * @brief Interface for receiving progress during a job.
 * Callbacks for per-file events arrive on worker threads.
 */
struct ScourObserver {
    virtual ~ScourObserver() = default;

    virtual void onStart(std::size_t file_count) {}

    virtual void onFileSanitized(const SanitizationReport& report) {}

    virtual void onProgress(std::size_t done, std::size_t total) {}

    virtual void onEntrySkipped(const std::string& entry_name, const std::string& reason) {}
};

/**
 * @brief Outcome of one job.
 */
struct JobResult {
    std::filesystem::path output;              ///< Written archive, or the sanitized directory
    std::vector<SanitizationReport> reports;   ///< Discovery order; paths relative to the content root
    AggregateStats stats;
    std::vector<SkippedEntry> skipped_entries; ///< Archive entries refused at extraction
};

/**
 * @brief Main interface for the scour library.
 *
 * @details Wraps unzip, sanitize and repack into a blocking call. Only one
 * job may run at a time per JobState; a second caller gets a "busy" error
 * instead of waiting. Uses PIMPL to keep the codec stack out of this header.
 */
class Scour {
public:
    explicit Scour(JobState& state);
    ~Scour();

    Scour(const Scour&) = delete;
    Scour& operator=(const Scour&) = delete;
    Scour(Scour&&) noexcept;
    Scour& operator=(Scour&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Replace the whole configuration.
     */
    Scour& configure(const SanitizeConfig& config);

    /**
     * @brief Density written into every output image. Default: 96.
     */
    Scour& targetDpi(std::uint32_t dpi);

    /**
     * @brief Longest allowed side in pixels, 0 to disable downsampling. Default: 2500.
     */
    Scour& maxLongSide(std::uint32_t pixels);

    /**
     * @brief libjpeg quality for re-encoded JPEGs. Default: 95.
     */
    Scour& jpegQuality(int quality);

    /**
     * @brief Upper bound on worker threads. Default: 8.
     */
    Scour& threads(unsigned val);

    /**
     * @brief Allow clean JPEGs to skip decoding. Default: true.
     */
    Scour& fastPath(bool val);

    [[nodiscard]] const SanitizeConfig& config() const noexcept;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(ScourObserver* observer);

    /**
     * @brief Bus carrying the raw pipeline events.
     */
    [[nodiscard]] EventBus& events() noexcept;

    // --- Execution ---

    /**
     * @brief Sanitizes an EPUB into a new archive. Blocks until completion.
     * @param input Existing `.epub` file.
     * @param output Destination; defaults to defaultOutputPath(input).
     * @throws ScourError if another job holds the JobState ("busy") or the input is invalid.
     * @throws ArchiveError on container failures.
     */
    JobResult sanitizeEpub(const std::filesystem::path& input, const std::filesystem::path& output = {});

    /**
     * @brief Sanitizes an unpacked tree in place, without repacking.
     * @throws ScourError if another job holds the JobState or dir is not a directory.
     */
    JobResult sanitizeDirectory(const std::filesystem::path& dir);

    /**
     * @brief `<dir>/<stem>_sanitized.epub` next to the input.
     */
    [[nodiscard]] static std::filesystem::path defaultOutputPath(const std::filesystem::path& input);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace scour

#endif // SCOUR_HPP
