#pragma once

#include <string>
#include <string_view>

#include <cstddef>

namespace fwio::io {

/**
 * @brief Byte sink collecting output in memory
 *
 * Writes are unbuffered; flush() only counts calls.
 */
class StringSink {
public:
    bool write_bytes(std::string_view bytes) {
        data_.append(bytes);
        return true;
    }

    bool flush() noexcept {
        flushes_++;
        return true;
    }

    int last_errno() const noexcept { return 0; }

    /// Everything written so far
    const std::string& str() const noexcept { return data_; }

    /// Number of flush() calls
    size_t flush_count() const noexcept { return flushes_; }

    void clear() noexcept { data_.clear(); }

private:
    std::string data_;
    size_t flushes_{0};
};

} // namespace fwio::io
