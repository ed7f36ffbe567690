#ifndef SCOUR_MIME_DETECTOR_HPP
#define SCOUR_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace scour {

    /**
     * @brief libmagic-backed identification of files that are not images.
     *
     * Used only when sniffing fails, to say what was stored under an
     * image name.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         * @return A MIME type (e.g., "text/html"), or empty if libmagic is unavailable.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Human readable description of a file's content.
         * @return A description (e.g., "HTML document, ASCII text"), or empty.
         */
        static std::string describe(const std::filesystem::path& path);
    };

} // namespace scour

#endif // SCOUR_MIME_DETECTOR_HPP
