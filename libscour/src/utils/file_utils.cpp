#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <memory>
#include <system_error>

namespace scour {

namespace {

struct FileCloser {
    void operator()(FILE *f) const { if (f) std::fclose(f); }
};
using unique_FILE = std::unique_ptr<FILE, FileCloser>;

} // namespace

FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
    std::wstring wmode;
    for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);
    return _wfopen(path.wstring().c_str(), wmode.c_str());
#else
    return std::fopen(path.string().c_str(), mode);
#endif
}

std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
    const auto base_tmp = std::filesystem::temp_directory_path() / ("scour-" + prefix);

    std::error_code ec;
    std::filesystem::create_directories(base_tmp, ec);

    const std::string dir_name = prefix + "_" + input_path.stem().string() + "_" + RandomUtils::random_suffix();
    auto dir = base_tmp / dir_name;

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        Logger::log(LogLevel::Error,
            "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
            "file_utils");
        throw ArchiveError("cannot create workspace " + dir.string() + ": " + ec.message());
    }
    return dir;
}

void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
    } else {
        Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
    }
}

std::vector<std::uint8_t> read_file_capped(const std::filesystem::path& path,
                                           const std::uintmax_t max_bytes,
                                           const std::size_t chunk_size) {
    const unique_FILE fp(open_file(path, "rb"));
    if (!fp) {
        throw DecodeError("cannot open " + path.string());
    }

    std::vector<std::uint8_t> data;
    std::vector<std::uint8_t> chunk(chunk_size == 0 ? 64 * 1024 : chunk_size);
    for (;;) {
        const std::size_t n = std::fread(chunk.data(), 1, chunk.size(), fp.get());
        if (n > 0) {
            if (data.size() + n > max_bytes) {
                throw DecompressedSizeError("input exceeds " + std::to_string(max_bytes) + " bytes");
            }
            data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        }
        if (n < chunk.size()) {
            if (std::ferror(fp.get())) {
                throw DecodeError("read error on " + path.string());
            }
            break;
        }
    }
    return data;
}

void write_file_atomic(const std::filesystem::path& target, std::span<const std::uint8_t> data) {
    auto tmp = target;
    tmp += ".scour_tmp_" + RandomUtils::random_suffix();

    {
        const unique_FILE fp(open_file(tmp, "wb"));
        if (!fp) {
            Logger::log(LogLevel::Error, "Cannot open temp file: " + tmp.string(), "file_utils");
            throw ReencodeError("cannot create temp file " + tmp.string());
        }
        const bool ok = std::fwrite(data.data(), 1, data.size(), fp.get()) == data.size() &&
                        std::fflush(fp.get()) == 0;
        if (!ok) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw ReencodeError("cannot write temp file " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        Logger::log(LogLevel::Error,
                    "Rename failed: " + tmp.string() + " -> " + target.string() + " (" + ec.message() + ")",
                    "file_utils");
        throw ReencodeError("cannot replace " + target.string() + ": " + ec.message());
    }
}

} // namespace scour
