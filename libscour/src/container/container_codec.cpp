#include "../../include/container_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>

namespace scour {

namespace fs = std::filesystem;

namespace {

const char* tag() {
    return "container_codec";
}

struct ReadDeleter {
    void operator()(archive* a) const noexcept { archive_read_free(a); }
};

struct WriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};

struct EntryDeleter {
    void operator()(archive_entry* e) const noexcept { archive_entry_free(e); }
};

using ReadHandle = std::unique_ptr<archive, ReadDeleter>;
using WriteHandle = std::unique_ptr<archive, WriteDeleter>;
using EntryHandle = std::unique_ptr<archive_entry, EntryDeleter>;

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

void log_warn(archive* a, const int r) {
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, error_of(a), "libarchive");
    }
}

void set_zip_option(archive* a, const char* key, const char* value) {
    const int r = archive_write_set_format_option(a, "zip", key, value);
    log_warn(a, r);
    if (r < ARCHIVE_WARN) {
        throw ArchiveError(std::string("zip option ") + key + "=" + value + ": " + error_of(a));
    }
}

void write_header(archive* a, const std::string& name, const std::int64_t size) {
    EntryHandle entry(archive_entry_new());
    if (!entry) throw ArchiveError("archive_entry_new failed");
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), size);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), 0, 0);

    const int r = archive_write_header(a, entry.get());
    log_warn(a, r);
    if (r < ARCHIVE_WARN) {
        throw ArchiveError("archive_write_header (" + name + "): " + error_of(a));
    }
}

void write_data(archive* a, const char* data, const std::size_t size, const std::string& name) {
    if (size == 0) return;
    if (archive_write_data(a, data, size) < 0) {
        throw ArchiveError("archive_write_data (" + name + "): " + error_of(a));
    }
}

// regular files under root except the top-level mimetype, as sorted generic relative paths
std::vector<std::string> collect_entries(const fs::path& root) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code st_ec;
        const auto status = it->symlink_status(st_ec);
        if (st_ec || !fs::is_regular_file(status)) continue;

        const std::string rel = it->path().lexically_relative(root).generic_string();
        if (rel.empty() || rel == "mimetype") continue;
        names.push_back(rel);
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Walk of " + root.string() + " stopped early: " + ec.message(), tag());
    }
    std::ranges::sort(names);
    return names;
}

std::size_t write_archive(const fs::path& src_root, const fs::path& dest_file, const std::size_t block_size) {
    WriteHandle a(archive_write_new());
    if (!a) throw ArchiveError("archive_write_new failed");

    int r = archive_write_set_format_zip(a.get());
    if (r != ARCHIVE_OK) {
        throw ArchiveError("archive_write_set_format_zip: " + error_of(a.get()));
    }
    set_zip_option(a.get(), "compression", "store");

    r = archive_write_open_filename(a.get(), dest_file.string().c_str());
    log_warn(a.get(), r);
    if (r < ARCHIVE_WARN) {
        throw ArchiveError("cannot create " + dest_file.string() + ": " + error_of(a.get()));
    }

    std::string mimetype(ContainerCodec::kDefaultMimetype);
    const fs::path mimetype_path = src_root / "mimetype";
    std::error_code ec;
    if (fs::is_regular_file(mimetype_path, ec)) {
        std::ifstream in(mimetype_path, std::ios::binary);
        if (!in) throw ArchiveError("cannot read " + mimetype_path.string());
        mimetype = ContainerCodec::trim_mimetype(
            std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
    } else {
        Logger::log(LogLevel::Warning, "No mimetype in " + src_root.string() + ", writing " + mimetype, tag());
    }
    write_header(a.get(), "mimetype", static_cast<std::int64_t>(mimetype.size()));
    write_data(a.get(), mimetype.data(), mimetype.size(), "mimetype");

    set_zip_option(a.get(), "compression", "deflate");
    set_zip_option(a.get(), "compression-level", "9");

    std::size_t written = 1;
    std::vector<char> buffer(block_size);
    for (const auto& name : collect_entries(src_root)) {
        const fs::path file = src_root / fs::path(name);
        const auto size = fs::file_size(file, ec);
        if (ec) throw ArchiveError("cannot stat " + file.string() + ": " + ec.message());

        std::ifstream in(file, std::ios::binary);
        if (!in) throw ArchiveError("cannot read " + file.string());

        write_header(a.get(), name, static_cast<std::int64_t>(size));
        std::uintmax_t copied = 0;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = static_cast<std::size_t>(in.gcount());
            write_data(a.get(), buffer.data(), got, name);
            copied += got;
        }
        if (in.bad() || copied != size) {
            throw ArchiveError("short read on " + file.string());
        }
        ++written;
    }

    r = archive_write_close(a.get());
    log_warn(a.get(), r);
    if (r < ARCHIVE_WARN) {
        throw ArchiveError("archive_write_close: " + error_of(a.get()));
    }
    return written;
}

} // namespace

ContainerCodec::ContainerCodec(const std::size_t block_size)
    : block_size_(std::max<std::size_t>(block_size, 4096)) {}

std::optional<fs::path> ContainerCodec::resolve_entry_path(const std::string_view entry_name,
                                                           const fs::path& dest_root) {
    if (entry_name.empty()) return std::nullopt;
    if (entry_name.find('\0') != std::string_view::npos) return std::nullopt;

    std::string s(entry_name);
    std::ranges::replace(s, '\\', '/');
    const fs::path entry(s);
    if (entry.has_root_path()) return std::nullopt;

    const fs::path base = dest_root.lexically_normal();
    const fs::path candidate = (base / entry).lexically_normal();

    std::string prefix = base.string();
    if (prefix.empty() || prefix.back() != fs::path::preferred_separator) {
        prefix += static_cast<char>(fs::path::preferred_separator);
    }
    const std::string resolved = candidate.string();
    if (resolved.size() <= prefix.size()) return std::nullopt;
    if (resolved.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return candidate;
}

std::string ContainerCodec::trim_mimetype(std::string content) {
    const auto end = content.find_last_not_of(" \t\r\n\f\v");
    content.erase(end == std::string::npos ? 0 : end + 1);
    return content;
}

UnzipResult ContainerCodec::unzip(const fs::path& archive_path, const fs::path& dest_root) const {
    std::error_code ec;
    fs::create_directories(dest_root, ec);
    if (ec) {
        throw ArchiveError("cannot create " + dest_root.string() + ": " + ec.message());
    }

    ReadHandle a(archive_read_new());
    if (!a) throw ArchiveError("archive_read_new failed");
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    int r = archive_read_open_filename(a.get(), archive_path.string().c_str(), block_size_);
    log_warn(a.get(), r);
    if (r < ARCHIVE_WARN) {
        throw ArchiveError("cannot open " + archive_path.string() + ": " + error_of(a.get()));
    }

    UnzipResult result;
    std::vector<char> buffer(block_size_);
    archive_entry* entry = nullptr;

    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        log_warn(a.get(), r);
        const char* raw_name = archive_entry_pathname(entry);
        const std::string name = raw_name ? raw_name : "";

        auto skip = [&](std::string reason) {
            Logger::log(LogLevel::Warning, "Skipping entry '" + name + "': " + reason, tag());
            result.skipped.push_back({name, std::move(reason)});
            if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
                throw ArchiveError("archive_read_data_skip: " + error_of(a.get()));
            }
        };

        const auto out_path = resolve_entry_path(name, dest_root);
        if (!out_path) {
            skip("path escapes destination");
            continue;
        }

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            fs::create_directories(*out_path, ec);
            if (ec) throw ArchiveError("cannot create " + out_path->string() + ": " + ec.message());
            continue;
        }
        if (type != AE_IFREG) {
            skip("not a regular file");
            continue;
        }

        fs::create_directories(out_path->parent_path(), ec);
        if (ec) throw ArchiveError("cannot create " + out_path->parent_path().string() + ": " + ec.message());

        std::ofstream out(*out_path, std::ios::binary | std::ios::trunc);
        if (!out) throw ArchiveError("cannot create " + out_path->string());

        la_ssize_t got = 0;
        while ((got = archive_read_data(a.get(), buffer.data(), buffer.size())) > 0) {
            out.write(buffer.data(), static_cast<std::streamsize>(got));
        }
        if (got < 0) {
            throw ArchiveError("reading '" + name + "': " + error_of(a.get()));
        }
        out.close();
        if (!out) throw ArchiveError("writing " + out_path->string() + " failed");
        ++result.extracted;
    }

    if (r != ARCHIVE_EOF) {
        throw ArchiveError("reading " + archive_path.string() + ": " + error_of(a.get()));
    }

    Logger::log(LogLevel::Debug, "Extracted " + std::to_string(result.extracted) + " file(s), skipped " +
                std::to_string(result.skipped.size()) + " from " + archive_path.string(), tag());
    return result;
}

std::size_t ContainerCodec::zip_strict(const fs::path& src_root, const fs::path& dest_file) const {
    std::error_code ec;
    if (!fs::is_directory(src_root, ec)) {
        throw ArchiveError("not a directory: " + src_root.string());
    }
    if (dest_file.has_parent_path()) {
        fs::create_directories(dest_file.parent_path(), ec);
        if (ec) throw ArchiveError("cannot create " + dest_file.parent_path().string() + ": " + ec.message());
    }

    try {
        const std::size_t entries = write_archive(src_root, dest_file, block_size_);
        Logger::log(LogLevel::Debug, "Wrote " + std::to_string(entries) + " entries to " + dest_file.string(), tag());
        return entries;
    } catch (const ArchiveError&) {
        fs::remove(dest_file, ec);
        throw;
    }
}

} // namespace scour
