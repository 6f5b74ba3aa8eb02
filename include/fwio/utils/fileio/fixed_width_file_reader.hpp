#pragma once

#include <string>
#include <utility>

#include <cstddef>

#include "fwio/layout.hpp"
#include "fwio/record_reader.hpp"
#include "fwio/utils/detail/iteration_helpers.hpp"
#include "raw_file_source.hpp"

namespace fwio::utils::fileio {

/**
 * @brief Fixed-width file reader
 *
 * Opens a file and decodes it with a RecordReader over a RawFileSource.
 *
 * @warning This class is MOVE-ONLY (the underlying source owns a FILE*).
 *
 * Example usage:
 * @code
 * FixedWidthFileReader reader("people.txt",
 *                             LayoutBuilder().fields({7, 4}).skip_lines(1).build());
 *
 * reader.for_each_record([](const fwio::Record& rec) {
 *     std::cout << rec[0] << "\n";
 *     return true; // continue
 * });
 * @endcode
 */
class FixedWidthFileReader {
public:
    /**
     * @brief Open a fixed-width file for reading
     *
     * @param filepath Path to the file
     * @param layout Column layout
     * @throws std::runtime_error if file cannot be opened
     */
    FixedWidthFileReader(const char* filepath, Layout layout)
        : reader_(RawFileSource(filepath), std::move(layout)) {}

    FixedWidthFileReader(const std::string& filepath, Layout layout)
        : FixedWidthFileReader(filepath.c_str(), std::move(layout)) {}

    FixedWidthFileReader(const FixedWidthFileReader&) = delete;
    FixedWidthFileReader& operator=(const FixedWidthFileReader&) = delete;

    FixedWidthFileReader(FixedWidthFileReader&&) noexcept = default;
    FixedWidthFileReader& operator=(FixedWidthFileReader&&) noexcept = default;

    /// Read the next record
    ReadResult read() { return reader_.read(); }

    /// Read up to num_rows records
    RowsResult read_rows(size_t num_rows) { return reader_.read_rows(num_rows); }

    /// Read every remaining record; end of file is not an error
    RowsResult read_all() { return reader_.read_all(); }

    /**
     * @brief Stream records through a callback
     *
     * @param callback bool(const Record&); return false to stop
     * @return Records processed and the error that ended the loop
     */
    template <typename Callback>
    utils::detail::IterationResult for_each_record(Callback&& callback) {
        return utils::detail::for_each_record(reader_, std::forward<Callback>(callback));
    }

    /**
     * @brief Rewind to the start of the file
     *
     * Header lines are skipped again on the next read.
     */
    void rewind() noexcept {
        reader_.source().rewind();
        reader_.reset();
    }

    Layout& layout() noexcept { return reader_.layout(); }
    const Layout& layout() const noexcept { return reader_.layout(); }

    size_t lines_read() const noexcept { return reader_.lines_read(); }
    size_t records_read() const noexcept { return reader_.records_read(); }

    /// Current file position in bytes
    size_t tell() const noexcept { return reader_.source().tell(); }

    /// Total file size in bytes
    size_t size() const noexcept { return reader_.source().size(); }

    bool is_open() const noexcept { return reader_.source().is_open(); }

private:
    RecordReader<RawFileSource> reader_;
};

} // namespace fwio::utils::fileio
