#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include <cstddef>

#include "fwio/types.hpp"

namespace fwio::io {

/**
 * @brief Byte source over an in-memory buffer
 *
 * Owns a copy of the bytes. Never reports io_error.
 */
class StringSource {
public:
    StringSource() = default;

    explicit StringSource(std::string data) : data_(std::move(data)) {}

    explicit StringSource(std::string_view data) : data_(data) {}

    explicit StringSource(const char* data) : data_(data) {}

    SourceStatus read_exact(std::string& out, size_t n) {
        size_t count = std::min(n, remaining());
        out.assign(data_, pos_, count);
        pos_ += count;
        return count == n ? SourceStatus::ok : SourceStatus::end_of_stream;
    }

    SourceStatus read_until(std::string& out, char delim) {
        auto found = data_.find(delim, pos_);
        if (found == std::string::npos) {
            out.assign(data_, pos_, std::string::npos);
            pos_ = data_.size();
            return SourceStatus::end_of_stream;
        }
        out.assign(data_, pos_, found - pos_);
        pos_ = found + 1;
        return SourceStatus::ok;
    }

    SourceStatus peek_byte(char& byte) const noexcept {
        if (pos_ >= data_.size()) {
            return SourceStatus::end_of_stream;
        }
        byte = data_[pos_];
        return SourceStatus::ok;
    }

    SourceStatus read_byte(char& byte) noexcept {
        auto status = peek_byte(byte);
        if (status == SourceStatus::ok) {
            pos_++;
        }
        return status;
    }

    int last_errno() const noexcept { return 0; }

    /// Bytes not yet consumed
    size_t remaining() const noexcept { return data_.size() - pos_; }

    /// Current read offset
    size_t tell() const noexcept { return pos_; }

    /// Restart from the first byte
    void rewind() noexcept { pos_ = 0; }

private:
    std::string data_;
    size_t pos_{0};
};

} // namespace fwio::io
