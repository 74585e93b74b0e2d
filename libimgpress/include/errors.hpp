/**
 * @file errors.hpp
 * @brief Error classification shared by the codecs, the pipeline and the CLI.
 */

#ifndef IMGPRESS_ERRORS_HPP
#define IMGPRESS_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace imgpress {

/**
 * @brief Why a file (or the whole run) failed.
 *
 * NotFound, DecodeError, EncodeError, FilesystemError and Unknown are
 * per-file and never abort a run. UnsupportedFormat and InvalidConfig are
 * raised once, at startup, and are fatal. Cancelled marks a task that was
 * stopped before anything was written; it is not counted as an error.
 */
enum class ErrorKind {
    None,
    NotFound,
    DecodeError,
    UnsupportedFormat,
    EncodeError,
    FilesystemError,
    InvalidConfig,
    Cancelled,
    Unknown
};

[[nodiscard]] constexpr std::string_view error_kind_to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::DecodeError:       return "DecodeError";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::EncodeError:       return "EncodeError";
        case ErrorKind::FilesystemError:   return "FilesystemError";
        case ErrorKind::InvalidConfig:     return "InvalidConfig";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::Unknown:           return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Raised by codecs when libjpeg, libpng, libwebp, libtiff or bmplib
 * reject a file.
 *
 * kind() is ErrorKind::DecodeError or ErrorKind::EncodeError.
 */
class CodecError : public std::runtime_error {
public:
    CodecError(const ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Raised while validating a configuration. Always fatal to the run.
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(const ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace imgpress

#endif // IMGPRESS_ERRORS_HPP
