/**
 * @file scour.cpp
 * @brief Implementation of the public Scour API.
 */

#include "../../include/scour.hpp"

#include "../../include/codec_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_format.hpp"
#include "../../include/image_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/sanitization_orchestrator.hpp"

#include <system_error>
#include <utility>

namespace scour {

namespace fs = std::filesystem;

namespace {

const char* tag() {
    return "scour";
}

// removes the job workspace on every exit path
class WorkspaceGuard {
public:
    explicit WorkspaceGuard(fs::path dir) : dir_(std::move(dir)) {}
    ~WorkspaceGuard() { cleanup_temp_dir(dir_, tag()); }

    WorkspaceGuard(const WorkspaceGuard&) = delete;
    WorkspaceGuard& operator=(const WorkspaceGuard&) = delete;

private:
    fs::path dir_;
};

void relativize(std::vector<SanitizationReport>& reports, const fs::path& root) {
    for (auto& r : reports) {
        r.path = r.path.lexically_relative(root);
    }
}

} // namespace

struct Scour::Impl {
    JobState& state;
    CodecRegistry registry;
    EventBus eventBus;
    SanitizeConfig config;
    ScourObserver* observer = nullptr;

    explicit Impl(JobState& s) : state(s) {
        eventBus.subscribe<SanitizeStartEvent>([this](const SanitizeStartEvent& e) {
            if (observer) observer->onStart(e.file_count);
        });
        eventBus.subscribe<FileSanitizedEvent>([this](const FileSanitizedEvent& e) {
            if (observer) observer->onFileSanitized(e.report);
        });
        eventBus.subscribe<SanitizeProgressEvent>([this](const SanitizeProgressEvent& e) {
            if (observer) observer->onProgress(e.done, e.total);
        });
        eventBus.subscribe<EntrySkippedEvent>([this](const EntrySkippedEvent& e) {
            if (observer) observer->onEntrySkipped(e.entry_name, e.reason);
        });
    }

    std::vector<SanitizationReport> sanitize_tree(const fs::path& root) {
        const ImageSanitizer sanitizer(registry, config);
        SanitizationOrchestrator orchestrator(sanitizer, eventBus);
        return orchestrator.run(root);
    }
};

Scour::Scour(JobState& state) : impl_(std::make_unique<Impl>(state)) {}

Scour::~Scour() = default;

Scour::Scour(Scour&&) noexcept = default;
Scour& Scour::operator=(Scour&&) noexcept = default;

Scour& Scour::configure(const SanitizeConfig& config) {
    impl_->config = config;
    return *this;
}

Scour& Scour::targetDpi(const std::uint32_t dpi) {
    impl_->config.target_dpi = dpi;
    return *this;
}

Scour& Scour::maxLongSide(const std::uint32_t pixels) {
    impl_->config.max_long_side = pixels;
    return *this;
}

Scour& Scour::jpegQuality(const int quality) {
    impl_->config.jpeg_quality = quality;
    return *this;
}

Scour& Scour::threads(const unsigned val) {
    impl_->config.max_workers = val > 0 ? val : 1;
    return *this;
}

Scour& Scour::fastPath(const bool val) {
    impl_->config.enable_fast_path = val;
    return *this;
}

const SanitizeConfig& Scour::config() const noexcept {
    return impl_->config;
}

void Scour::setObserver(ScourObserver* observer) {
    impl_->observer = observer;
}

EventBus& Scour::events() noexcept {
    return impl_->eventBus;
}

fs::path Scour::defaultOutputPath(const fs::path& input) {
    return input.parent_path() / (input.stem().string() + "_sanitized.epub");
}

JobResult Scour::sanitizeEpub(const fs::path& input, const fs::path& output) {
    const JobLease lease(impl_->state);
    if (!lease.acquired()) {
        throw ScourError("busy: a sanitization job is already running");
    }

    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        throw ScourError("input not found: " + input.string());
    }
    if (lower_extension(input) != ".epub") {
        throw ScourError("not an .epub file: " + input.string());
    }

    JobResult result;
    result.output = output.empty() ? defaultOutputPath(input) : output;
    if (fs::absolute(result.output, ec).lexically_normal() == fs::absolute(input, ec).lexically_normal()) {
        throw ScourError("output would overwrite the input: " + input.string());
    }

    const fs::path workspace = make_temp_dir_for(input, "epub");
    const WorkspaceGuard guard(workspace);
    Logger::log(LogLevel::Info, "Sanitizing " + input.string() + " in " + workspace.string(), tag());

    const ContainerCodec codec(impl_->config.stream_buffer_size);
    auto unzipped = codec.unzip(input, workspace);
    for (const auto& skipped : unzipped.skipped) {
        impl_->eventBus.publish(EntrySkippedEvent{input, skipped.name, skipped.reason});
    }
    result.skipped_entries = std::move(unzipped.skipped);

    result.reports = impl_->sanitize_tree(workspace);
    relativize(result.reports, workspace);
    result.stats = AggregateStats::from(result.reports);

    const std::size_t entries = codec.zip_strict(workspace, result.output);
    const auto size = fs::file_size(result.output, ec);
    impl_->eventBus.publish(ArchiveWrittenEvent{result.output, ec ? 0 : size, entries});
    Logger::log(LogLevel::Info, "Wrote " + result.output.string() + " (" + std::to_string(entries) + " entries)", tag());
    return result;
}

JobResult Scour::sanitizeDirectory(const fs::path& dir) {
    const JobLease lease(impl_->state);
    if (!lease.acquired()) {
        throw ScourError("busy: a sanitization job is already running");
    }

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw ScourError("not a directory: " + dir.string());
    }

    JobResult result;
    result.output = dir;
    result.reports = impl_->sanitize_tree(dir);
    relativize(result.reports, dir);
    result.stats = AggregateStats::from(result.reports);
    return result;
}

} // namespace scour
