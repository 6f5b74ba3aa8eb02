// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>

#include "fwio/layout.hpp"
#include "fwio/parse_error.hpp"
#include "fwio/record_writer.hpp"
#include "raw_file_sink.hpp"

namespace fwio::utils::fileio {

/**
 * @brief Outcome of the last FixedWidthFileWriter operation
 *
 * Layout and record rejections come from the ParseError of the call; sink
 * failures are classified by errno.
 */
enum class WriterStatus : uint8_t {
    ready,         ///< Last operation succeeded
    bad_layout,    ///< Layout rejected (no columns, bad width, alignment count)
    bad_record,    ///< Record does not fit the layout
    closed,        ///< File has been closed
    disk_full,     ///< ENOSPC or EDQUOT
    not_permitted, ///< EACCES, EPERM or EROFS
    io_error       ///< Any other sink failure
};

constexpr const char* writer_status_string(WriterStatus status) noexcept {
    switch (status) {
        case WriterStatus::ready:
            return "ready";
        case WriterStatus::bad_layout:
            return "bad_layout";
        case WriterStatus::bad_record:
            return "bad_record";
        case WriterStatus::closed:
            return "closed";
        case WriterStatus::disk_full:
            return "disk_full";
        case WriterStatus::not_permitted:
            return "not_permitted";
        case WriterStatus::io_error:
            return "io_error";
    }
    return "unknown";
}

/// Classify a sink errno; 0 means no failure
constexpr WriterStatus writer_status_from_errno(int err) noexcept {
    if (err == 0) {
        return WriterStatus::ready;
    }
    if (err == ENOSPC || err == EDQUOT) {
        return WriterStatus::disk_full;
    }
    if (err == EACCES || err == EPERM || err == EROFS) {
        return WriterStatus::not_permitted;
    }
    if (err == EBADF) {
        return WriterStatus::closed;
    }
    return WriterStatus::io_error;
}

/**
 * @brief Fixed-width file writer with a unified status
 *
 * Wraps a RecordWriter over a RawFileSink. Every operation still returns
 * its ParseError; last_error() keeps the most recent one and status()
 * classifies it as a WriterStatus.
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 * - Safe to move between threads (move-only)
 *
 * @tparam BufferBytes Size of the sink's internal buffer
 */
template <size_t BufferBytes = 8192>
class FixedWidthFileWriter {
public:
    /**
     * @brief Create writer for new file
     *
     * Creates or truncates the file at the given path.
     *
     * @param file_path Path to output file
     * @param layout Column layout
     * @throws std::runtime_error if file cannot be created
     */
    FixedWidthFileWriter(const std::string& file_path, Layout layout)
        : writer_(RawFileSink<BufferBytes>(file_path), std::move(layout)) {}

    FixedWidthFileWriter(const FixedWidthFileWriter&) = delete;
    FixedWidthFileWriter& operator=(const FixedWidthFileWriter&) = delete;

    FixedWidthFileWriter(FixedWidthFileWriter&&) noexcept = default;
    FixedWidthFileWriter& operator=(FixedWidthFileWriter&&) noexcept = default;

    ParseError write(const Record& record) { return track(writer_.write(record)); }

    template <typename Fields>
    ParseError write(const Fields& fields) {
        return track(writer_.write(fields));
    }

    ParseError write_all(const std::vector<Record>& records) {
        return track(writer_.write_all(records));
    }

    ParseError write_comment(std::string_view text) {
        return track(writer_.write_comment(text));
    }

    /**
     * @brief Flush buffered data to disk
     *
     * @return true on success, false on error
     */
    bool flush() {
        ParseError err{};
        if (!writer_.flush()) {
            err.code = ErrorCode::io_error;
            err.line = writer_.lines_written() + 1;
            err.errno_value = writer_.sink().last_errno();
        }
        return track(err).ok();
    }

    /**
     * @brief Flush and close the file
     */
    void close() noexcept { writer_.sink().close(); }

    /**
     * @brief Classify the last operation
     *
     * A closed file reports closed regardless of the last error.
     */
    [[nodiscard]] WriterStatus status() const noexcept {
        if (!writer_.sink().is_open()) {
            return WriterStatus::closed;
        }
        return status_;
    }

    /// ParseError of the last write, write_comment or flush
    [[nodiscard]] const ParseError& last_error() const noexcept { return last_error_; }

    [[nodiscard]] size_t lines_written() const noexcept { return writer_.lines_written(); }

    /**
     * @brief Get number of bytes written
     *
     * @return Total bytes written (including buffered but not flushed)
     */
    [[nodiscard]] size_t bytes_written() const noexcept { return writer_.sink().bytes_written(); }

    [[nodiscard]] bool is_open() const noexcept { return writer_.sink().is_open(); }

    Layout& layout() noexcept { return writer_.layout(); }
    const Layout& layout() const noexcept { return writer_.layout(); }

    /**
     * @brief Clear error state
     *
     * Resets the sink's sticky errno and the last error.
     */
    void clear_error() noexcept {
        writer_.sink().clear_error();
        last_error_ = ParseError{};
        status_ = WriterStatus::ready;
    }

private:
    ParseError track(ParseError err) noexcept {
        last_error_ = err;
        if (err.ok()) {
            status_ = WriterStatus::ready;
        } else if (err.code == ErrorCode::io_error) {
            status_ = writer_status_from_errno(err.errno_value);
            if (status_ == WriterStatus::ready) {
                status_ = WriterStatus::io_error;
            }
        } else if (!check_write_layout(writer_.layout()).is_valid()) {
            status_ = WriterStatus::bad_layout;
        } else {
            status_ = WriterStatus::bad_record;
        }
        return err;
    }

    RecordWriter<RawFileSink<BufferBytes>> writer_;
    ParseError last_error_{};
    WriterStatus status_{WriterStatus::ready};
};

} // namespace fwio::utils::fileio
