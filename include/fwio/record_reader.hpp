#pragma once

#include <string>
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
 * @brief Result of a single record read
 */
struct ReadResult {
    Record fields;    ///< Decoded fields (empty on error)
    ParseError error; ///< Error information (code none = success)

    /// Check if read was successful
    bool is_valid() const noexcept { return error.ok(); }

    /// Check if this is end-of-stream (not an error)
    bool is_eof() const noexcept { return error.is_eof(); }
};

/**
 * @brief Result of a multi-record read
 *
 * records holds everything decoded before the failure in error, if any.
 */
struct RowsResult {
    std::vector<Record> records; ///< Records read, in stream order
    ParseError error;            ///< First failure (code none = success)

    bool is_valid() const noexcept { return error.ok(); }
};

/**
 * @brief Fixed-width record reader over a byte source
 *
 * Decodes one raw line per record according to the current Layout:
 * - Header lines (skip_lines) are discarded once, before the first record
 * - Comment lines are discarded wherever they occur
 * - Each data line must be exactly skip_start + sum(field_lengths) + skip_end
 *   bytes long and free of CR/LF bytes
 * - Fields are sliced in column order and optionally trimmed
 *
 * The layout is re-validated at the start of every call, so it can be changed
 * between records to read heterogeneous files.
 *
 * Error Handling:
 * - All operations return a ParseError; nothing throws except allocation
 * - end_of_stream is reported by read() and read_rows(), and absorbed by
 *   read_all()
 * - Errors are not sticky; the caller decides whether to continue
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 *
 * @tparam Source Type satisfying the ByteSource concept
 *
 * Example:
 * @code
 * fwio::RecordReader reader(fwio::io::StringSource(text),
 *                           fwio::LayoutBuilder().fields({7, 4}).build());
 * auto result = reader.read_all();
 * for (const auto& rec : result.records) { ... }
 * @endcode
 */
template <ByteSource Source>
class RecordReader {
public:
    /**
     * @brief Create a reader bound to a byte source
     *
     * @param source Byte source (moved in; owned by the reader)
     * @param layout Column layout
     */
    explicit RecordReader(Source source, Layout layout = {})
        : source_(std::move(source)),
          layout_(std::move(layout)) {}

    RecordReader(const RecordReader&) = delete;
    RecordReader& operator=(const RecordReader&) = delete;

    RecordReader(RecordReader&&) noexcept = default;
    RecordReader& operator=(RecordReader&&) noexcept = default;

    /**
     * @brief Read the next record
     *
     * @return ReadResult with the decoded fields, or the error at the current line
     */
    ReadResult read() {
        ReadResult result{};

        auto check = check_layout(layout_);
        if (!check.is_valid()) {
            result.error.code = check.error;
            result.error.line = lines_read_ + 1;
            result.error.column = check.column;
            return result;
        }

        result.error = skip_header(check.width);
        if (!result.error.ok()) {
            return result;
        }

        result.error = next_data_line(check.width);
        if (!result.error.ok()) {
            return result;
        }

        if (line_.size() != check.width) {
            result.error = error_at_line(ErrorCode::incorrect_line_width);
            return result;
        }

        if (size_t pos = detail::find_stray_delimiter(line_); pos != 0) {
            result.error = error_at_line(ErrorCode::incorrect_line_width, pos);
            return result;
        }

        result.fields = detail::slice_fields(line_, layout_);
        records_read_++;
        return result;
    }

    /**
     * @brief Read up to num_rows records
     *
     * Stops at the first failure (end_of_stream included) and returns the
     * records read before it together with the error.
     */
    RowsResult read_rows(size_t num_rows) {
        RowsResult result{};
        result.records.reserve(num_rows);

        for (size_t i = 0; i < num_rows; ++i) {
            auto rec = read();
            if (!rec.is_valid()) {
                result.error = rec.error;
                break;
            }
            result.records.push_back(std::move(rec.fields));
        }

        return result;
    }

    /**
     * @brief Read every remaining record
     *
     * End of stream terminates the loop successfully, also when it happens
     * while skipping header lines. Any other failure is returned together
     * with the records read before it.
     */
    RowsResult read_all() {
        RowsResult result{};

        while (true) {
            auto rec = read();
            if (rec.is_eof()) {
                break;
            }
            if (!rec.is_valid()) {
                result.error = rec.error;
                break;
            }
            result.records.push_back(std::move(rec.fields));
        }

        return result;
    }

    /// Current layout (mutable; applied from the next call on)
    Layout& layout() noexcept { return layout_; }
    const Layout& layout() const noexcept { return layout_; }

    /// Replace the layout
    void set_layout(Layout layout) { layout_ = std::move(layout); }

    /// Underlying byte source
    Source& source() noexcept { return source_; }
    const Source& source() const noexcept { return source_; }

    /// Number of raw lines consumed (header, comment and data lines)
    size_t lines_read() const noexcept { return lines_read_; }

    /// Number of records decoded successfully
    size_t records_read() const noexcept { return records_read_; }

    /// Check if the header lines have been discarded
    bool header_skipped() const noexcept { return header_done_; }

    /**
     * @brief Forget progress so the header is skipped again
     *
     * Only the counters are reset; the caller repositions the source.
     */
    void reset() noexcept {
        lines_read_ = 0;
        records_read_ = 0;
        header_lines_skipped_ = 0;
        header_done_ = false;
    }

private:
    ParseError error_at_line(ErrorCode code, size_t column = 0) const noexcept {
        ParseError err{};
        err.code = code;
        err.line = lines_read_;
        err.column = column;
        return err;
    }

    ParseError error_past_line(ErrorCode code) const noexcept {
        ParseError err{};
        err.code = code;
        err.line = lines_read_ + 1;
        return err;
    }

    ParseError io_failure(bool consumed) const noexcept {
        ParseError err{};
        err.code = ErrorCode::io_error;
        err.line = consumed ? lines_read_ : lines_read_ + 1;
        err.errno_value = source_.last_errno();
        return err;
    }

    /**
     * @brief Read one raw line into line_ per the line-ending mode
     *
     * A non-empty fragment at end of stream counts as the final line for the
     * delimited modes.
     */
    ParseError read_raw_line(size_t width) {
        switch (layout_.line_ending) {
            case LineEnding::none: {
                auto status = source_.read_exact(line_, width);
                if (status == SourceStatus::io_error) {
                    return io_failure(false);
                }
                if (status == SourceStatus::end_of_stream) {
                    if (line_.empty()) {
                        return error_past_line(ErrorCode::end_of_stream);
                    }
                    lines_read_++;
                    return error_at_line(ErrorCode::incorrect_line_width);
                }
                lines_read_++;
                return {};
            }

            case LineEnding::cr:
                return read_delimited(cr_byte);

            case LineEnding::lf:
                return read_delimited(lf_byte);

            case LineEnding::crlf: {
                auto err = read_delimited(cr_byte);
                if (!err.ok() || !saw_delimiter_) {
                    return err;
                }

                char next = 0;
                auto status = source_.peek_byte(next);
                if (status == SourceStatus::io_error) {
                    return io_failure(true);
                }
                if (status == SourceStatus::end_of_stream || next != lf_byte) {
                    return error_at_line(ErrorCode::malformed_line_ending, line_.size() + 1);
                }
                status = source_.read_byte(next);
                if (status == SourceStatus::io_error) {
                    return io_failure(true);
                }
                return {};
            }
        }
        return error_past_line(ErrorCode::io_error);
    }

    ParseError read_delimited(char delim) {
        auto status = source_.read_until(line_, delim);
        if (status == SourceStatus::io_error) {
            return io_failure(false);
        }
        if (status == SourceStatus::end_of_stream) {
            if (line_.empty()) {
                return error_past_line(ErrorCode::end_of_stream);
            }
            saw_delimiter_ = false;
            lines_read_++;
            return {};
        }
        saw_delimiter_ = true;
        lines_read_++;
        return {};
    }

    // Read raw lines until one is not a comment
    ParseError next_data_line(size_t width) {
        while (true) {
            auto err = read_raw_line(width);
            if (!err.ok()) {
                return err;
            }
            if (layout_.comment && !line_.empty() && line_.front() == *layout_.comment) {
                continue;
            }
            return err;
        }
    }

    ParseError skip_header(size_t width) {
        if (header_done_) {
            return {};
        }

        const size_t wanted = layout_.header_lines();
        while (header_lines_skipped_ < wanted) {
            auto err = read_raw_line(width);
            if (err.is_parse_error()) {
                // Header bytes are never validated: a short none-mode tail or
                // a broken CRLF pair ends the header phase like end of stream
                err.code = ErrorCode::end_of_stream;
                err.line = lines_read_ + 1;
                err.column = 0;
            }
            if (!err.ok()) {
                return err;
            }
            header_lines_skipped_++;
        }

        header_done_ = true;
        return {};
    }

    Source source_;
    Layout layout_;
    std::string line_;                ///< Scratch buffer for the current raw line
    size_t lines_read_{0};            ///< Raw lines consumed
    size_t records_read_{0};          ///< Records decoded
    size_t header_lines_skipped_{0};  ///< Header lines discarded so far
    bool header_done_{false};         ///< Header skip complete
    bool saw_delimiter_{false};       ///< Last delimited read ended on its delimiter
};

} // namespace fwio
