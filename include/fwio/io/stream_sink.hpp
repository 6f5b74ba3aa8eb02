#pragma once

#include <ostream>
#include <string_view>

#include <cerrno>

namespace fwio::io {

/**
 * @brief Byte sink over a std::ostream
 *
 * Does not own the stream; the stream must outlive the sink.
 */
class StreamSink {
public:
    explicit StreamSink(std::ostream& stream) noexcept : stream_(&stream) {}

    bool write_bytes(std::string_view bytes) {
        errno = 0;
        stream_->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        return check();
    }

    bool flush() {
        errno = 0;
        stream_->flush();
        return check();
    }

    int last_errno() const noexcept { return last_errno_; }

private:
    bool check() noexcept {
        if (stream_->fail()) {
            last_errno_ = errno != 0 ? errno : EIO;
            return false;
        }
        return true;
    }

    std::ostream* stream_;
    int last_errno_{0};
};

} // namespace fwio::io
