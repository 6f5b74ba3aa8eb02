#pragma once

#include <string>

#include <cstddef>
#include <cstring>

#include "types.hpp"

namespace fwio {

/**
 * @brief Positioned error returned by every record operation
 *
 * A default-constructed ParseError means success. On failure, line holds the
 * 1-based raw line number at which the failure happened (header and comment
 * lines included) and column the 1-based column index or byte offset the
 * failure refers to, or 0 when no single column is at fault.
 */
struct ParseError {
    ErrorCode code{ErrorCode::none}; ///< Error code (none = success)
    size_t line{0};                  ///< 1-based raw line number
    size_t column{0};                ///< 1-based column/byte position, 0 if not applicable
    int errno_value{0};              ///< errno from the stream for io_error

    /// Check if the operation succeeded
    bool ok() const noexcept { return code == ErrorCode::none; }

    /// Check if this is end-of-stream (not a framing error)
    bool is_eof() const noexcept { return code == ErrorCode::end_of_stream; }

    /// Check if this is a framing error (as opposed to a stream condition)
    bool is_parse_error() const noexcept {
        return code != ErrorCode::none && code != ErrorCode::end_of_stream &&
               code != ErrorCode::io_error;
    }

    /**
     * @brief Format as "line N, column C: text"
     */
    std::string message() const {
        std::string msg = "line " + std::to_string(line) + ", column " + std::to_string(column) +
                          ": " + error_code_string(code);
        if (code == ErrorCode::io_error && errno_value != 0) {
            msg += " (";
            msg += std::strerror(errno_value);
            msg += ")";
        }
        return msg;
    }
};

inline bool operator==(const ParseError& a, const ParseError& b) noexcept {
    return a.code == b.code && a.line == b.line && a.column == b.column &&
           a.errno_value == b.errno_value;
}

} // namespace fwio
