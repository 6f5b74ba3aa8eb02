#pragma once

#include <concepts>
#include <string_view>

#include <cstddef>

#include "fwio/parse_error.hpp"
#include "fwio/record_reader.hpp"
#include "fwio/types.hpp"

namespace fwio::utils::detail {

/**
 * @brief Concept for record readers that provide read()
 *
 * Any reader (in-memory, stream, file) that provides read() returning a
 * ReadResult can use these iteration helpers.
 */
template <typename T>
concept RecordSource = requires(T& reader) {
    { reader.read() } -> std::same_as<fwio::ReadResult>;
};

/**
 * @brief Outcome of an iteration helper
 *
 * error is the ParseError that ended the loop: end_of_stream when the input
 * ran out, none when the callback asked to stop, anything else on failure.
 */
struct IterationResult {
    size_t count{0};        ///< Records handed to the callback
    fwio::ParseError error; ///< Why iteration stopped

    /// True unless iteration stopped on a parse or I/O error
    bool is_valid() const noexcept { return error.ok() || error.is_eof(); }
};

/**
 * @brief Iterate over all records
 *
 * Stops at end of stream, at the first error, or when the callback returns
 * false. The stopping error is returned, so no extra read() is needed to
 * find out why the loop ended.
 *
 * @tparam Reader Type satisfying RecordSource concept
 * @tparam Callback Function type with signature: bool(const Record&)
 * @param reader Reader providing read()
 * @param callback Function called for each record. Return false to stop iteration.
 * @return Records processed and the stopping error
 */
template <RecordSource Reader, typename Callback>
IterationResult for_each_record(Reader& reader, Callback&& callback) {
    IterationResult result{};

    while (true) {
        auto rec = reader.read();
        if (!rec.is_valid()) {
            result.error = rec.error;
            break;
        }

        bool continue_processing = callback(rec.fields);
        result.count++;

        if (!continue_processing) {
            break;
        }
    }

    return result;
}

/**
 * @brief Iterate over records whose column matches a value
 *
 * @param column 0-based column index
 * @param value Exact field value to match (after trimming, if enabled)
 * @return Matching records processed and the stopping error
 */
template <RecordSource Reader, typename Callback>
IterationResult for_each_record_where(Reader& reader, size_t column, std::string_view value,
                                      Callback&& callback) {
    size_t matched = 0;

    auto result = for_each_record(reader, [&](const fwio::Record& rec) -> bool {
        if (column < rec.size() && rec[column] == value) {
            matched++;
            return callback(rec);
        }
        return true;
    });

    result.count = matched;
    return result;
}

} // namespace fwio::utils::detail
