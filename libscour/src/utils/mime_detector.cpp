#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>

namespace {

std::string query_magic(const std::filesystem::path& path, const int flags) {
    const magic_t magic = magic_open(flags | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0) {
        scour::Logger::log(scour::LogLevel::Warning,
                           std::string("magic_load failed: ") + (magic_error(magic) ? magic_error(magic) : "?"),
                           "libmagic");
        magic_close(magic);
        return {};
    }
    const char* res = magic_file(magic, path.string().c_str());
    std::string result = res ? res : "";
    magic_close(magic);
    return result;
}

} // namespace

std::string scour::MimeDetector::detect(const std::filesystem::path& path) {
    return query_magic(path, MAGIC_MIME_TYPE);
}

std::string scour::MimeDetector::describe(const std::filesystem::path& path) {
    return query_magic(path, MAGIC_NONE);
}
