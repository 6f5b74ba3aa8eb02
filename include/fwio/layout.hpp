#pragma once

#include <algorithm>
#include <optional>
#include <vector>

#include <cstddef>

#include "types.hpp"

namespace fwio {

/**
 * @brief Column layout and framing options shared by readers and writers
 *
 * Plain aggregate: mutate freely between record operations. The derived
 * line width is never cached; check_layout() recomputes it on every call.
 */
struct Layout {
    std::vector<int> field_lengths;           ///< Byte width of each column
    std::vector<Alignment> field_align;       ///< Per-column alignment (empty = all left)
    int skip_start{0};                        ///< Bytes before the first column
    int skip_end{0};                          ///< Bytes after the last column
    LineEnding line_ending{LineEnding::crlf}; ///< Line delimiter mode
    std::optional<char> comment;              ///< Comment marker byte
    int skip_lines{0};                        ///< Leading lines to discard (readers only)
    bool trim_fields{false};                  ///< Trim on read, truncate on write

    /// Number of columns
    size_t field_count() const noexcept { return field_lengths.size(); }

    /// Alignment of column i; columns without an explicit entry are left aligned
    Alignment alignment(size_t i) const noexcept {
        return i < field_align.size() ? field_align[i] : Alignment::left;
    }

    /// skip_start with negative values clamped to zero
    size_t leading_skip() const noexcept {
        return static_cast<size_t>(std::max(skip_start, 0));
    }

    /// skip_end with negative values clamped to zero
    size_t trailing_skip() const noexcept { return static_cast<size_t>(std::max(skip_end, 0)); }

    /// skip_lines with negative values clamped to zero
    size_t header_lines() const noexcept { return static_cast<size_t>(std::max(skip_lines, 0)); }

    /// Fill field_align with left alignment for every column
    void materialize_alignment() {
        field_align.resize(field_lengths.size(), Alignment::left);
    }
};

/**
 * @brief Result of layout validation
 */
struct LayoutCheck {
    ErrorCode error{ErrorCode::none}; ///< Error code (none = valid)
    size_t width{0};                  ///< Derived line width (valid only if error == none)
    size_t column{0};                 ///< 1-based offending column for invalid_field_width

    bool is_valid() const noexcept { return error == ErrorCode::none; }
};

/**
 * @brief Validate a layout and derive its line width
 *
 * width = skip_start + skip_end + sum(field_lengths), with negative skips
 * clamped to zero. Fails with no_fields_configured on an empty layout and
 * invalid_field_width on the first non-positive column.
 */
inline LayoutCheck check_layout(const Layout& layout) noexcept {
    LayoutCheck check{};

    if (layout.field_lengths.empty()) {
        check.error = ErrorCode::no_fields_configured;
        return check;
    }

    size_t width = layout.leading_skip() + layout.trailing_skip();
    for (size_t i = 0; i < layout.field_lengths.size(); ++i) {
        int len = layout.field_lengths[i];
        if (len <= 0) {
            check.error = ErrorCode::invalid_field_width;
            check.column = i + 1;
            return check;
        }
        width += static_cast<size_t>(len);
    }

    check.width = width;
    return check;
}

/**
 * @brief Validate a layout for writing
 *
 * Same as check_layout(), and additionally rejects an explicit alignment
 * list whose size differs from the column count.
 */
inline LayoutCheck check_write_layout(const Layout& layout) noexcept {
    LayoutCheck check = check_layout(layout);
    if (check.is_valid() && !layout.field_align.empty() &&
        layout.field_align.size() != layout.field_lengths.size()) {
        check.error = ErrorCode::alignment_count_mismatch;
        check.width = 0;
    }
    return check;
}

} // namespace fwio
