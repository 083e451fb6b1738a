/**
 * @file error.hpp
 * @brief emmemtx error handling.
 *
 * Every failure is raised as an exception derived from EmmeException, which
 * carries an Error code for callers that want to branch on the category.
 */

#ifndef EMMEMTX_ERROR_HPP
#define EMMEMTX_ERROR_HPP

#include <stdexcept>
#include <string>

namespace emmemtx {

/**
 * @brief Error categories.
 */
enum class Error {
    Ok = 0,                 ///< Success
    InvalidArg = -1,        ///< Invalid argument
    InvalidHeader = -2,     ///< Wrong magic number
    InvalidDimensions = -3, ///< Dimension count other than 2
    UnexpectedEof = -4,     ///< Input ended early (truncated file)
    InvalidData = -5,       ///< Invalid/corrupted data
    UnsupportedSeek = -6,   ///< Seek not possible on this source
    Io = -7,                ///< Underlying I/O failure
    Consistency = -8        ///< Internal bookkeeping mismatch
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::InvalidHeader:
        return "Invalid header";
    case Error::InvalidDimensions:
        return "Invalid dimensions";
    case Error::UnexpectedEof:
        return "Unexpected end of data";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    case Error::UnsupportedSeek:
        return "Unsupported seek";
    case Error::Io:
        return "I/O error";
    case Error::Consistency:
        return "Internal consistency failure";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for emmemtx errors.
 */
class EmmeException : public std::runtime_error {
public:
    explicit EmmeException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public EmmeException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : EmmeException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for a file that does not start with the EMME magic.
 */
class InvalidHeaderException : public EmmeException {
public:
    explicit InvalidHeaderException(const std::string& message)
        : EmmeException(message, Error::InvalidHeader) {}
};

/**
 * @brief Exception for a dimension count other than 2.
 */
class InvalidDimensionsException : public EmmeException {
public:
    explicit InvalidDimensionsException(const std::string& message)
        : EmmeException(message, Error::InvalidDimensions) {}
};

/**
 * @brief Exception for a short read.
 */
class UnexpectedEofException : public EmmeException {
public:
    explicit UnexpectedEofException(const std::string& message)
        : EmmeException(message, Error::UnexpectedEof) {}
};

/**
 * @brief Exception for invalid/corrupted data.
 */
class InvalidDataException : public EmmeException {
public:
    explicit InvalidDataException(const std::string& message)
        : EmmeException(message, Error::InvalidData) {}
};

/**
 * @brief Exception for seeks a compressed source cannot honour.
 */
class UnsupportedSeekException : public EmmeException {
public:
    explicit UnsupportedSeekException(const std::string& message)
        : EmmeException(message, Error::UnsupportedSeek) {}
};

/**
 * @brief Exception for failures of the underlying file or stream.
 */
class IoException : public EmmeException {
public:
    explicit IoException(const std::string& message)
        : EmmeException(message, Error::Io) {}
};

/**
 * @brief Exception for a matrix whose shape disagrees with its payload.
 */
class ConsistencyException : public EmmeException {
public:
    explicit ConsistencyException(const std::string& message)
        : EmmeException(message, Error::Consistency) {}
};

} // namespace emmemtx

#endif // EMMEMTX_ERROR_HPP
