// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>

#include "detail/byte_stream_concepts.hpp"
#include "detail/field_codec.hpp"
#include "layout.hpp"
#include "parse_error.hpp"
#include "types.hpp"

namespace fwio {

/**
 * @brief Fixed-width record writer over a byte sink
 *
 * Encodes each record as skip_start spaces, the columns padded (or truncated
 * when trim_fields is set) to their widths on the side given by their
 * alignment, skip_end spaces and the line ending.
 *
 * A record is encoded completely before any of its bytes reach the sink, so
 * a record that fails validation leaves the output untouched.
 *
 * Error Handling:
 * - All operations return a ParseError; line is the 1-based output line the
 *   failure refers to, column the 1-based column for field errors
 * - Sink failures are reported as io_error with the sink's errno
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 *
 * @tparam Sink Type satisfying the ByteSink concept
 */
template <ByteSink Sink>
class RecordWriter {
public:
    /**
     * @brief Create a writer bound to a byte sink
     *
     * @param sink Byte sink (moved in; owned by the writer)
     * @param layout Column layout
     */
    explicit RecordWriter(Sink sink, Layout layout = {})
        : sink_(std::move(sink)),
          layout_(std::move(layout)) {}

    RecordWriter(const RecordWriter&) = delete;
    RecordWriter& operator=(const RecordWriter&) = delete;

    RecordWriter(RecordWriter&&) noexcept = default;
    RecordWriter& operator=(RecordWriter&&) noexcept = default;

    /**
     * @brief Write one record
     *
     * @tparam Fields Sized range of values convertible to std::string_view
     * @param fields Field values in column order
     * @return ParseError (code none = success)
     */
    template <typename Fields>
    ParseError write(const Fields& fields) {
        auto check = check_write_layout(layout_);
        if (!check.is_valid()) {
            return error(check.error, check.column);
        }

        scratch_.clear();
        auto encoded = detail::encode_record(fields, layout_, scratch_);
        if (!encoded.is_valid()) {
            return error(encoded.error, encoded.column);
        }

        return emit_line();
    }

    ParseError write(const Record& fields) { return write<Record>(fields); }

    /**
     * @brief Write all records, then flush
     *
     * Stops at and returns the first failure; the sink is flushed only when
     * every record was written.
     */
    ParseError write_all(const std::vector<Record>& records) {
        for (const auto& rec : records) {
            auto err = write(rec);
            if (!err.ok()) {
                return err;
            }
        }

        if (!sink_.flush()) {
            return io_failure();
        }
        return {};
    }

    /**
     * @brief Write records from an iterator range
     *
     * Stops on the first error and does not flush.
     *
     * @return Number of successfully written records
     */
    template <typename Iterator>
    size_t write_records(Iterator begin, Iterator end) {
        size_t count = 0;
        for (auto it = begin; it != end; ++it) {
            if (!write(*it).ok()) {
                break;
            }
            ++count;
        }
        return count;
    }

    /**
     * @brief Write a comment line
     *
     * No-op when the layout has no comment marker. Otherwise writes the
     * marker followed by text truncated or padded to line_width - 1 bytes.
     */
    ParseError write_comment(std::string_view text) {
        if (!layout_.comment) {
            return {};
        }

        auto check = check_write_layout(layout_);
        if (!check.is_valid()) {
            return error(check.error, check.column);
        }

        scratch_.clear();
        detail::encode_comment(text, *layout_.comment, check.width, layout_.line_ending,
                               scratch_);
        return emit_line();
    }

    /**
     * @brief Flush buffered bytes to the sink
     *
     * @return true on success, false on error (see sink().last_errno())
     */
    bool flush() { return sink_.flush(); }

    /// Current layout (mutable; applied from the next call on)
    Layout& layout() noexcept { return layout_; }
    const Layout& layout() const noexcept { return layout_; }

    /// Replace the layout
    void set_layout(Layout layout) { layout_ = std::move(layout); }

    /// Underlying byte sink
    Sink& sink() noexcept { return sink_; }
    const Sink& sink() const noexcept { return sink_; }

    /// Number of lines written (records and comments)
    size_t lines_written() const noexcept { return lines_written_; }

private:
    ParseError error(ErrorCode code, size_t column) const noexcept {
        ParseError err{};
        err.code = code;
        err.line = lines_written_ + 1;
        err.column = column;
        return err;
    }

    ParseError io_failure() const noexcept {
        ParseError err = error(ErrorCode::io_error, 0);
        err.errno_value = sink_.last_errno();
        return err;
    }

    ParseError emit_line() {
        if (!sink_.write_bytes(scratch_)) {
            return io_failure();
        }
        lines_written_++;
        return {};
    }

    Sink sink_;
    Layout layout_;
    std::string scratch_;     ///< Encoded line awaiting the sink
    size_t lines_written_{0}; ///< Lines handed to the sink
};

} // namespace fwio
