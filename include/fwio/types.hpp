#pragma once

#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace fwio {

// One decoded (or to-be-encoded) fixed-width line, fields in column order
using Record = std::vector<std::string>;

// Line delimiter handling
enum class LineEnding : uint8_t {
    none = 0, // Lines are exactly line_width bytes, no delimiter
    cr = 1,   // Carriage return (0x0D)
    lf = 2,   // Line feed (0x0A)
    crlf = 3  // Carriage return followed by line feed
};

// Padding side of a column on write
enum class Alignment : uint8_t {
    left = 0, // Field first, padding after
    right = 1 // Padding first, field after
};

// Byte values used for framing
inline constexpr char cr_byte = '\r';
inline constexpr char lf_byte = '\n';
inline constexpr char pad_byte = ' ';

// Outcome of a byte-source primitive
enum class SourceStatus : uint8_t {
    ok = 0,        // Request satisfied
    end_of_stream, // Source exhausted before the request was satisfied
    io_error       // Underlying stream failed
};

// Error codes for record framing
enum class ErrorCode : uint8_t {
    none = 0,                 // No error
    no_fields_configured,     // Layout has no columns
    invalid_field_width,      // Non-positive column width, or field overflow on write
    incorrect_line_width,     // Raw line length differs from layout width, or stray CR/LF
    malformed_line_ending,    // CR not followed by LF in crlf mode
    field_count_mismatch,     // Record arity differs from column count
    alignment_count_mismatch, // field_align size differs from column count
    end_of_stream,            // Source exhausted
    io_error                  // Underlying stream failed
};

// Convert error code to human-readable string
constexpr const char* error_code_string(ErrorCode err) noexcept {
    switch (err) {
        case ErrorCode::none:
            return "No error";
        case ErrorCode::no_fields_configured:
            return "No fields defined in layout";
        case ErrorCode::invalid_field_width:
            return "Field width incorrect";
        case ErrorCode::incorrect_line_width:
            return "Incorrect line width";
        case ErrorCode::malformed_line_ending:
            return "CRLF not found at end of line";
        case ErrorCode::field_count_mismatch:
            return "Wrong number of fields in record";
        case ErrorCode::alignment_count_mismatch:
            return "Alignment count doesn't match field count";
        case ErrorCode::end_of_stream:
            return "End of stream";
        case ErrorCode::io_error:
            return "I/O error";
    }
    return "Unknown error";
}

constexpr const char* line_ending_string(LineEnding mode) noexcept {
    switch (mode) {
        case LineEnding::none:
            return "none";
        case LineEnding::cr:
            return "cr";
        case LineEnding::lf:
            return "lf";
        case LineEnding::crlf:
            return "crlf";
    }
    return "unknown";
}

// Number of bytes the line ending occupies on write
constexpr size_t line_ending_size(LineEnding mode) noexcept {
    switch (mode) {
        case LineEnding::none:
            return 0;
        case LineEnding::cr:
        case LineEnding::lf:
            return 1;
        case LineEnding::crlf:
            return 2;
    }
    return 0;
}

} // namespace fwio
