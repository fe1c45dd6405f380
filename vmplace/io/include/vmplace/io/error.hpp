#pragma once

/// @file error.hpp
/// @brief Exception type of the vmplace I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace vmplace::io {

/// @brief Exception for I/O errors (reading, parsing, validation of files).
///
/// Thrown by loader functions when JSON input is malformed, a required
/// field is missing or has the wrong type, or a value fails semantic
/// validation (e.g. a negative host capacity).
///
/// @ingroup io
/// @see load_scenario, load_model_bundle, load_telemetry_request
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace vmplace::io
