//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file errors.hpp
 * @brief Exception types raised by the library.
 *
 * Three families, matching how far a failure is allowed to propagate:
 * - ScanError: the input root cannot be walked; fatal for the run.
 * - FileError: one image failed; the executor turns it into a Failed outcome.
 * - UpdateError: the self-update aborts; optimization runs are unaffected.
 */

#ifndef PIXTRIM_ERRORS_HPP
#define PIXTRIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pixtrim {

class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class FileErrorKind {
    FormatMismatch, ///< Content type disagrees with the file extension
    DecodeError,    ///< Input is not a valid image of its format
    OptimizeError,  ///< Encoder failed on valid input
    IoError,        ///< Read, write, rename or path routing failed
    BackupFailed    ///< The .bak copy could not be written
};

[[nodiscard]] inline const char* to_string(const FileErrorKind kind) noexcept {
    switch (kind) {
        case FileErrorKind::FormatMismatch: return "FormatMismatch";
        case FileErrorKind::DecodeError:    return "DecodeError";
        case FileErrorKind::OptimizeError:  return "OptimizeError";
        case FileErrorKind::IoError:        return "IoError";
        case FileErrorKind::BackupFailed:   return "BackupFailed";
    }
    return "Unknown";
}

class FileError : public std::runtime_error {
public:
    FileError(const FileErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] FileErrorKind kind() const noexcept { return kind_; }

private:
    FileErrorKind kind_;
};

enum class UpdateErrorKind {
    NetworkError,    ///< Transport failure talking to the release endpoint
    ParseError,      ///< Malformed release JSON or version string
    NoMatchingAsset, ///< No asset name contains this platform's target
    CorruptArtifact, ///< Downloaded file is empty or not executable
    SwapError        ///< Replacing the running executable failed
};

[[nodiscard]] inline const char* to_string(const UpdateErrorKind kind) noexcept {
    switch (kind) {
        case UpdateErrorKind::NetworkError:    return "NetworkError";
        case UpdateErrorKind::ParseError:      return "ParseError";
        case UpdateErrorKind::NoMatchingAsset: return "NoMatchingAsset";
        case UpdateErrorKind::CorruptArtifact: return "CorruptArtifact";
        case UpdateErrorKind::SwapError:       return "SwapError";
    }
    return "Unknown";
}

class UpdateError : public std::runtime_error {
public:
    UpdateError(const UpdateErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] UpdateErrorKind kind() const noexcept { return kind_; }

private:
    UpdateErrorKind kind_;
};

} // namespace pixtrim

#endif // PIXTRIM_ERRORS_HPP
