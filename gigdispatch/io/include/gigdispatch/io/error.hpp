#pragma once

/// @file error.hpp
/// @brief Exception type of the gigdispatch I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace gigdispatch::io {

/// @brief Exception for I/O errors (reading, parsing, validation).
///
/// Thrown by the loaders when JSON input is malformed, a required field is
/// missing or has the wrong type, or a value fails validation.
///
/// @ingroup io
/// @see load_config, load_scenario
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Where it happened, e.g. a file path or `workers[2]`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace gigdispatch::io
