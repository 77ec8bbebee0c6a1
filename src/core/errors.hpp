#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Error kinds raised by the recording pipeline
 *
 * Every failure of the core is reported as an IpsError subclass carrying
 * one of these kinds and the identifier of the offending input, so callers
 * (CLI, tests, batch jobs) can tell failures apart without parsing messages.
 */
enum class ErrorKind {
    MALFORMED_RECORDING = 0,   ///< Missing column or unparsable field
    EMPTY_RECORDING,           ///< Source has no data rows
    RECORDING_IO,              ///< Source or output could not be opened
    ALIGNMENT,                 ///< No reference sample within tolerance
    EMPTY_INPUT,               ///< Grid requested over zero estimates
    INVALID_CELL_SIZE,         ///< Cell width/height not strictly positive or grid too large
    CONFIG                     ///< Invalid run configuration
};

/**
 * @brief Convert error kind to its stable name
 */
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_RECORDING: return "MalformedRecordingError";
        case ErrorKind::EMPTY_RECORDING: return "EmptyRecordingError";
        case ErrorKind::RECORDING_IO: return "RecordingIoError";
        case ErrorKind::ALIGNMENT: return "AlignmentError";
        case ErrorKind::EMPTY_INPUT: return "EmptyInputError";
        case ErrorKind::INVALID_CELL_SIZE: return "InvalidCellSizeError";
        case ErrorKind::CONFIG: return "ConfigError";
        default: return "UnknownError";
    }
}

/**
 * @brief Base of all pipeline errors
 */
class IpsError : public std::runtime_error {
private:
    ErrorKind kind_;
    std::string subject_;

public:
    IpsError(ErrorKind kind, std::string subject, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
        , subject_(std::move(subject)) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief Identifier of the offending input (source name, sample index, parameter)
     */
    const std::string& subject() const { return subject_; }

    /**
     * @brief One-line report: "[Kind] subject: message"
     */
    std::string describe() const {
        return "[" + error_kind_to_string(kind_) + "] " + subject_ + ": " + what();
    }
};

class MalformedRecordingError : public IpsError {
public:
    MalformedRecordingError(const std::string& source, const std::string& message)
        : IpsError(ErrorKind::MALFORMED_RECORDING, source, message) {}
};

class EmptyRecordingError : public IpsError {
public:
    explicit EmptyRecordingError(const std::string& source)
        : IpsError(ErrorKind::EMPTY_RECORDING, source, "recording has no data rows") {}
};

class RecordingIoError : public IpsError {
public:
    RecordingIoError(const std::string& path, const std::string& message)
        : IpsError(ErrorKind::RECORDING_IO, path, message) {}
};

class AlignmentError : public IpsError {
private:
    std::size_t sample_index_;

public:
    AlignmentError(const std::string& subject, std::size_t sample_index, const std::string& message)
        : IpsError(ErrorKind::ALIGNMENT, subject, message)
        , sample_index_(sample_index) {}

    /**
     * @brief Index of the magnetic sample that could not be aligned
     */
    std::size_t sample_index() const { return sample_index_; }
};

class EmptyInputError : public IpsError {
public:
    explicit EmptyInputError(const std::string& subject)
        : IpsError(ErrorKind::EMPTY_INPUT, subject, "no position estimates to grid") {}
};

class InvalidCellSizeError : public IpsError {
public:
    InvalidCellSizeError(double width, double height)
        : IpsError(ErrorKind::INVALID_CELL_SIZE, "cell_size",
                   "cell size must be strictly positive, got " +
                   std::to_string(width) + " x " + std::to_string(height)) {}

    InvalidCellSizeError(double width, double height, const std::string& message)
        : IpsError(ErrorKind::INVALID_CELL_SIZE, "cell_size",
                   message + " (cell " + std::to_string(width) + " x " +
                   std::to_string(height) + ")") {}
};

class ConfigError : public IpsError {
public:
    ConfigError(const std::string& key, const std::string& message)
        : IpsError(ErrorKind::CONFIG, key, message) {}
};
