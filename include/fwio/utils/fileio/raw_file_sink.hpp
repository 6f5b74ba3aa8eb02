// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fwio::utils::fileio {

/**
 * @brief Byte sink writing to a file with internal buffering
 *
 * Satisfies the ByteSink concept. Writes are collected in an internal buffer
 * to minimize system calls. Writes larger than the buffer flush it and go
 * straight to the file.
 *
 * Error Handling:
 * - Constructor throws on file creation failure
 * - After construction, all operations are noexcept
 * - Errors stored in sticky state (remains until clear_error())
 * - Returns false on error, true on success
 * - errno preserved in last_errno()
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 * - Safe to move between threads (move-only)
 *
 * @tparam BufferBytes Size of the internal buffer in bytes
 */
template <size_t BufferBytes = 8192>
class RawFileSink {
public:
    static constexpr size_t buffer_size_bytes = BufferBytes;

    static_assert(BufferBytes > 0, "BufferBytes must be positive");
    static_assert(BufferBytes <= 1024 * 1024,
                  "Buffer size exceeds 1MB - consider reducing BufferBytes");

    /**
     * @brief Create sink for new file
     *
     * Creates or truncates the file at the given path.
     *
     * @param file_path Path to output file
     * @throws std::runtime_error if file cannot be created
     */
    explicit RawFileSink(const std::string& file_path)
        : fd_(-1),
          buffer_used_(0),
          bytes_written_(0),
          last_errno_(0) {
        fd_ = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("Failed to create file: " + file_path +
                                     " (errno=" + std::to_string(errno) + ")");
        }
    }

    /**
     * @brief Destructor flushes and closes file
     *
     * Any buffered data is written before closing. Errors during
     * flush are silently ignored.
     */
    ~RawFileSink() {
        close();
    }

    // Move-only (file handle ownership)
    RawFileSink(const RawFileSink&) = delete;
    RawFileSink& operator=(const RawFileSink&) = delete;

    RawFileSink(RawFileSink&& other) noexcept
        : fd_(other.fd_),
          buffer_(other.buffer_),
          buffer_used_(other.buffer_used_),
          bytes_written_(other.bytes_written_),
          last_errno_(other.last_errno_) {
        other.fd_ = -1;
        other.buffer_used_ = 0;
        other.bytes_written_ = 0;
        other.last_errno_ = 0;
    }

    RawFileSink& operator=(RawFileSink&& other) noexcept {
        if (this != &other) {
            close();

            fd_ = other.fd_;
            buffer_ = other.buffer_;
            buffer_used_ = other.buffer_used_;
            bytes_written_ = other.bytes_written_;
            last_errno_ = other.last_errno_;

            other.fd_ = -1;
            other.buffer_used_ = 0;
            other.bytes_written_ = 0;
            other.last_errno_ = 0;
        }
        return *this;
    }

    /**
     * @brief Write bytes
     *
     * @return true on success, false on error
     */
    bool write_bytes(std::string_view bytes) noexcept {
        if (!is_open()) {
            last_errno_ = EBADF;
            return false;
        }
        if (has_error()) {
            return false;
        }

        // Large write: flush buffer then direct write
        if (bytes.size() > buffer_size_bytes) {
            if (!flush()) {
                return false;
            }
            return write_direct(bytes.data(), bytes.size());
        }

        // Buffer is too full: flush first
        if (buffer_used_ + bytes.size() > buffer_size_bytes) {
            if (!flush()) {
                return false;
            }
        }

        std::memcpy(buffer_.data() + buffer_used_, bytes.data(), bytes.size());
        buffer_used_ += bytes.size();
        bytes_written_ += bytes.size();
        return true;
    }

    /**
     * @brief Flush buffered data to disk
     *
     * @return true on success, false on error
     */
    bool flush() noexcept {
        if (!is_open()) {
            last_errno_ = EBADF;
            return false;
        }

        if (buffer_used_ == 0) {
            return true; // Nothing to flush
        }

        size_t offset = 0;
        while (offset < buffer_used_) {
            ssize_t written = ::write(fd_, buffer_.data() + offset, buffer_used_ - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                last_errno_ = errno;
                return false;
            }
            offset += static_cast<size_t>(written);
        }

        buffer_used_ = 0;
        return true;
    }

    /**
     * @brief Flush and close the file
     *
     * Safe to call more than once.
     */
    void close() noexcept {
        if (fd_ >= 0) {
            flush(); // Best effort - ignore errors
            ::close(fd_);
            fd_ = -1;
        }
    }

    /**
     * @brief Get number of bytes written
     *
     * @return Total bytes written (including buffered but not flushed)
     */
    [[nodiscard]] size_t bytes_written() const noexcept { return bytes_written_; }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    [[nodiscard]] bool has_error() const noexcept { return last_errno_ != 0; }

    /**
     * @brief Get last error number
     *
     * @return errno value from last failed operation (0 if no error)
     */
    [[nodiscard]] int last_errno() const noexcept { return last_errno_; }

    /**
     * @brief Clear error state
     *
     * Resets error state to allow retry of operations.
     */
    void clear_error() noexcept { last_errno_ = 0; }

private:
    bool write_direct(const char* data, size_t size) noexcept {
        size_t offset = 0;
        while (offset < size) {
            ssize_t written = ::write(fd_, data + offset, size - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                last_errno_ = errno;
                return false;
            }
            offset += static_cast<size_t>(written);
        }

        bytes_written_ += size;
        return true;
    }

    int fd_;                                     ///< File descriptor
    std::array<char, buffer_size_bytes> buffer_; ///< Internal write buffer
    size_t buffer_used_;                         ///< Bytes used in buffer
    size_t bytes_written_;                       ///< Total bytes written
    int last_errno_;                             ///< Last error number
};

} // namespace fwio::utils::fileio
