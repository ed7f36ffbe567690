/**
 * @file errors.hpp
 * @brief Exception hierarchy used across libscour.
 */

#ifndef SCOUR_ERRORS_HPP
#define SCOUR_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace scour {

/**
 * @brief Root of every error thrown by libscour.
 */
class ScourError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The leading bytes of a file match no supported image signature.
 */
class FormatUnknownError : public ScourError {
public:
    FormatUnknownError(const std::string& what, std::vector<std::uint8_t> magic)
        : ScourError(what), magic_(std::move(magic)) {}

    /// @return Up to the first four bytes that were read from the file.
    [[nodiscard]] const std::vector<std::uint8_t>& magic() const noexcept { return magic_; }

private:
    std::vector<std::uint8_t> magic_;
};

/**
 * @brief Pixel decoding failed. The subclasses are the bound checks that
 * reject an image before its pixels are allocated.
 */
class DecodeError : public ScourError {
public:
    using ScourError::ScourError;
};

/// Width or height above the configured maximum dimension.
class DimensionError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/// width * height above the configured pixel limit.
class PixelBombError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/// Input or decoded buffer larger than the configured byte cap.
class DecompressedSizeError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/**
 * @brief Encoding, writing the temp file, or renaming it over the original failed.
 */
class ReencodeError : public ScourError {
public:
    using ScourError::ScourError;
};

/**
 * @brief Archive-level failure: the source ZIP cannot be opened or read, or
 * a destination file or directory cannot be created.
 */
class ArchiveError : public ScourError {
public:
    using ScourError::ScourError;
};

} // namespace scour

#endif // SCOUR_ERRORS_HPP
