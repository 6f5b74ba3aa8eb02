// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <iterator>
#include <string>
#include <string_view>

#include <cstddef>

#include "fwio/layout.hpp"
#include "fwio/types.hpp"

namespace fwio::detail {

// Strip leading and trailing spaces and tabs
inline std::string_view trim_field(std::string_view field) noexcept {
    constexpr std::string_view blanks = " \t";
    auto first = field.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = field.find_last_not_of(blanks);
    return field.substr(first, last - first + 1);
}

/**
 * @brief Find the first CR or LF byte in a raw line
 *
 * @return 1-based byte offset, or 0 if the line holds no delimiter bytes
 */
inline size_t find_stray_delimiter(std::string_view line) noexcept {
    auto pos = line.find_first_of("\r\n");
    return pos == std::string_view::npos ? 0 : pos + 1;
}

/**
 * @brief Slice a validated raw line into fields
 *
 * The line must be exactly check_layout(layout).width bytes long.
 */
inline Record slice_fields(std::string_view line, const Layout& layout) {
    Record fields;
    fields.reserve(layout.field_count());

    size_t pos = layout.leading_skip();
    for (int len : layout.field_lengths) {
        auto field = line.substr(pos, static_cast<size_t>(len));
        if (layout.trim_fields) {
            field = trim_field(field);
        }
        fields.emplace_back(field);
        pos += static_cast<size_t>(len);
    }
    return fields;
}

// Append the configured line ending to out
inline void append_line_ending(std::string& out, LineEnding mode) {
    switch (mode) {
        case LineEnding::none:
            break;
        case LineEnding::cr:
            out.push_back(cr_byte);
            break;
        case LineEnding::lf:
            out.push_back(lf_byte);
            break;
        case LineEnding::crlf:
            out.push_back(cr_byte);
            out.push_back(lf_byte);
            break;
    }
}

/**
 * @brief Result of encoding one record
 */
struct EncodeResult {
    ErrorCode error{ErrorCode::none}; ///< Error code (none = success)
    size_t column{0};                 ///< 1-based column for invalid_field_width

    bool is_valid() const noexcept { return error == ErrorCode::none; }
};

/**
 * @brief Encode one record as a fixed-width line
 *
 * Appends skip_start padding, each column padded to its width on the side
 * given by its alignment (or truncated when trim_fields is set), skip_end
 * padding and the line ending. On failure out is left as it was.
 *
 * @param fields Field values in column order
 * @param layout Layout already accepted by check_write_layout()
 * @param out Line buffer to append to
 */
template <typename Fields>
EncodeResult encode_record(const Fields& fields, const Layout& layout, std::string& out) {
    EncodeResult result{};
    const size_t mark = out.size();

    out.append(layout.leading_skip(), pad_byte);

    if (std::size(fields) != layout.field_count()) {
        out.resize(mark);
        result.error = ErrorCode::field_count_mismatch;
        return result;
    }

    size_t i = 0;
    for (const auto& value : fields) {
        std::string_view buf{value};
        const auto width = static_cast<size_t>(layout.field_lengths[i]);

        if (buf.size() > width) {
            if (!layout.trim_fields) {
                out.resize(mark);
                result.error = ErrorCode::invalid_field_width;
                result.column = i + 1;
                return result;
            }
            out.append(buf.substr(0, width));
        } else {
            switch (layout.alignment(i)) {
                case Alignment::right:
                    out.append(width - buf.size(), pad_byte);
                    out.append(buf);
                    break;
                case Alignment::left:
                    out.append(buf);
                    out.append(width - buf.size(), pad_byte);
                    break;
            }
        }
        ++i;
    }

    out.append(layout.trailing_skip(), pad_byte);
    append_line_ending(out, layout.line_ending);
    return result;
}

/**
 * @brief Encode a comment line
 *
 * Marker byte, then text truncated or space-padded to width - 1 bytes, then
 * the line ending.
 */
inline void encode_comment(std::string_view text, char marker, size_t width, LineEnding mode,
                           std::string& out) {
    const size_t body = width > 0 ? width - 1 : 0;
    out.push_back(marker);
    if (text.size() > body) {
        out.append(text.substr(0, body));
    } else {
        out.append(text);
        out.append(body - text.size(), pad_byte);
    }
    append_line_ending(out, mode);
}

} // namespace fwio::detail
