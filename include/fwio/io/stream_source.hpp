#pragma once

#include <istream>
#include <string>

#include <cerrno>
#include <cstddef>

#include "fwio/types.hpp"

namespace fwio::io {

/**
 * @brief Byte source over a std::istream
 *
 * Does not own the stream; the stream must outlive the source. Open the
 * stream in binary mode so CR bytes reach the reader unchanged.
 */
class StreamSource {
public:
    explicit StreamSource(std::istream& stream) noexcept : stream_(&stream) {}

    SourceStatus read_exact(std::string& out, size_t n) {
        out.resize(n);
        errno = 0;
        stream_->read(out.data(), static_cast<std::streamsize>(n));
        out.resize(static_cast<size_t>(stream_->gcount()));
        if (stream_->bad()) {
            return fail();
        }
        return out.size() == n ? SourceStatus::ok : SourceStatus::end_of_stream;
    }

    SourceStatus read_until(std::string& out, char delim) {
        out.clear();
        errno = 0;
        std::getline(*stream_, out, delim);
        if (stream_->bad()) {
            return fail();
        }
        if (stream_->eof()) {
            return SourceStatus::end_of_stream;
        }
        if (stream_->fail()) {
            return fail();
        }
        return SourceStatus::ok;
    }

    SourceStatus peek_byte(char& byte) {
        errno = 0;
        auto c = stream_->peek();
        if (stream_->bad()) {
            return fail();
        }
        if (c == std::istream::traits_type::eof()) {
            return SourceStatus::end_of_stream;
        }
        byte = std::istream::traits_type::to_char_type(c);
        return SourceStatus::ok;
    }

    SourceStatus read_byte(char& byte) {
        errno = 0;
        auto c = stream_->get();
        if (stream_->bad()) {
            return fail();
        }
        if (c == std::istream::traits_type::eof()) {
            return SourceStatus::end_of_stream;
        }
        byte = std::istream::traits_type::to_char_type(c);
        return SourceStatus::ok;
    }

    int last_errno() const noexcept { return last_errno_; }

private:
    SourceStatus fail() noexcept {
        last_errno_ = errno != 0 ? errno : EIO;
        return SourceStatus::io_error;
    }

    std::istream* stream_;
    int last_errno_{0};
};

} // namespace fwio::io
