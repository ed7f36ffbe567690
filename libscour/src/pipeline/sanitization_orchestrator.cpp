#include "../../include/sanitization_orchestrator.hpp"
#include "../../include/events.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace scour {

namespace {

const char* tag() {
    return "orchestrator";
}

// per-directory recursion so an unreadable directory costs only its own subtree
void walk(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code st_ec;
        const auto status = entry.symlink_status(st_ec);
        if (st_ec) {
            Logger::log(LogLevel::Warning, "Cannot stat " + entry.path().string() + ": " + st_ec.message(), tag());
            continue;
        }
        if (fs::is_symlink(status)) {
            Logger::log(LogLevel::Debug, "Not following symlink " + entry.path().string(), tag());
            continue;
        }
        if (fs::is_directory(status)) {
            walk(entry.path(), out);
        } else if (fs::is_regular_file(status) && has_image_extension(entry.path())) {
            out.push_back(entry.path());
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Skipping " + dir.string() + ": " + ec.message(), tag());
    }
}

} // namespace

SanitizationOrchestrator::SanitizationOrchestrator(const ImageSanitizer& sanitizer, EventBus& bus)
    : sanitizer_(sanitizer), bus_(bus) {}

std::vector<fs::path> SanitizationOrchestrator::discover(const fs::path& root) {
    std::vector<fs::path> files;
    walk(root, files);
    std::ranges::sort(files, [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return files;
}

unsigned SanitizationOrchestrator::worker_count(const SanitizeConfig& config, const std::size_t file_count) {
    const std::size_t cpus = config.cpu_count > 0 ? config.cpu_count : 1;
    const std::size_t n = std::min({cpus, file_count, static_cast<std::size_t>(config.max_workers)});
    return static_cast<unsigned>(std::max<std::size_t>(n, 1));
}

std::vector<SanitizationReport> SanitizationOrchestrator::run(const fs::path& root) {
    const auto start = std::chrono::steady_clock::now();
    const auto files = discover(root);
    const std::size_t total = files.size();
    const unsigned workers = worker_count(sanitizer_.config(), total);

    Logger::log(LogLevel::Info, "Sanitizing " + std::to_string(total) + " image(s) under " + root.string() +
                " with " + std::to_string(workers) + " worker(s)", tag());
    bus_.publish(SanitizeStartEvent{root, total, workers});

    std::vector<SanitizationReport> reports(total);
    if (total > 0) {
        std::atomic<std::size_t> done{0};
        ThreadPool pool(workers);
        std::vector<std::future<void>> pending;
        pending.reserve(total);
        for (std::size_t i = 0; i < total; ++i) {
            pending.push_back(pool.enqueue([this, i, &files, &reports, &done, total](const std::stop_token&) {
                sanitize_one(i, files[i], reports[i], done, total);
            }));
        }
        for (auto& f : pending) {
            f.get();
        }
    }
    bus_.publish(SanitizeProgressEvent{total, total});

    const auto stats = AggregateStats::from(reports);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::log(LogLevel::Info, "Done: " + std::to_string(stats.ok) + " ok, " + std::to_string(stats.repaired) +
                " repaired, " + std::to_string(stats.replaced) + " replaced, " + std::to_string(stats.failed) +
                " failed in " + std::to_string(elapsed.count()) + " ms", tag());
    bus_.publish(SanitizeCompleteEvent{root, stats, elapsed});
    return reports;
}

void SanitizationOrchestrator::sanitize_one(const std::size_t index,
                                            const fs::path& file,
                                            SanitizationReport& slot,
                                            std::atomic<std::size_t>& done,
                                            const std::size_t total) const {
    const auto start = std::chrono::steady_clock::now();
    try {
        slot = sanitizer_.sanitize(file);
    } catch (const std::exception& e) {
        // resource exhaustion and the like; the file is left untouched
        Logger::log(LogLevel::Error, "Unexpected failure on " + file.string() + ": " + e.what(), tag());
        slot = SanitizationReport{};
        slot.path = file;
        slot.status = SanitizeStatus::Failed;
        slot.error = e.what();
    }
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    bus_.publish(FileSanitizedEvent{index, slot, duration});

    const std::size_t finished = done.fetch_add(1, std::memory_order_acq_rel) + 1;
    const std::size_t interval = sanitizer_.config().progress_interval;
    if (interval > 0 && finished % interval == 0 && finished < total) {
        bus_.publish(SanitizeProgressEvent{finished, total});
    }
}

} // namespace scour
