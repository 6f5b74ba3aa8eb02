#pragma once

#include <stdexcept>
#include <string>

#include <cerrno>
#include <cstddef>
#include <cstdio>

#include "fwio/types.hpp"

namespace fwio::utils::fileio {

/**
 * @brief Byte source reading from a file through a FILE* handle
 *
 * Satisfies the ByteSource concept. Reads go through stdio buffering;
 * peek_byte() uses ungetc() for its single byte of pushback.
 *
 * Error Handling:
 * - Constructor throws if the file cannot be opened
 * - After construction, read operations report io_error and keep errno in
 *   last_errno()
 *
 * @warning This class is MOVE-ONLY (it owns the FILE* handle).
 */
class RawFileSource {
public:
    /**
     * @brief Open a file for reading
     *
     * @param filepath Path to the file
     * @throws std::runtime_error if file cannot be opened
     */
    explicit RawFileSource(const char* filepath)
        : file_(nullptr),
          file_size_(0),
          current_offset_(0),
          last_errno_(0) {
        file_ = std::fopen(filepath, "rb");
        if (!file_) {
            throw std::runtime_error(std::string("Failed to open file: ") + filepath);
        }

        // Determine file size
        std::fseek(file_, 0, SEEK_END);
        long end = std::ftell(file_);
        file_size_ = end > 0 ? static_cast<size_t>(end) : 0;
        std::fseek(file_, 0, SEEK_SET);
    }

    explicit RawFileSource(const std::string& filepath) : RawFileSource(filepath.c_str()) {}

    /**
     * @brief Destructor - closes file handle
     */
    ~RawFileSource() noexcept {
        if (file_) {
            std::fclose(file_);
        }
    }

    // Non-copyable due to FILE* ownership
    RawFileSource(const RawFileSource&) = delete;
    RawFileSource& operator=(const RawFileSource&) = delete;

    // Move-only semantics
    RawFileSource(RawFileSource&& other) noexcept
        : file_(other.file_),
          file_size_(other.file_size_),
          current_offset_(other.current_offset_),
          last_errno_(other.last_errno_) {
        other.file_ = nullptr;
    }

    RawFileSource& operator=(RawFileSource&& other) noexcept {
        if (this != &other) {
            if (file_) {
                std::fclose(file_);
            }
            file_ = other.file_;
            file_size_ = other.file_size_;
            current_offset_ = other.current_offset_;
            last_errno_ = other.last_errno_;
            other.file_ = nullptr;
        }
        return *this;
    }

    /**
     * @brief Read exactly n bytes
     *
     * @return ok if n bytes were read, end_of_stream if the file ended first
     *         (out holds the short read)
     */
    SourceStatus read_exact(std::string& out, size_t n) {
        if (!file_) {
            return closed();
        }

        out.resize(n);
        size_t got = n > 0 ? std::fread(out.data(), 1, n, file_) : 0;
        out.resize(got);
        current_offset_ += got;

        if (got == n) {
            return SourceStatus::ok;
        }
        if (std::ferror(file_)) {
            return fail();
        }
        return SourceStatus::end_of_stream;
    }

    /**
     * @brief Read up to and excluding delim, consuming delim
     */
    SourceStatus read_until(std::string& out, char delim) {
        out.clear();
        if (!file_) {
            return closed();
        }

        int c;
        while ((c = std::getc(file_)) != EOF) {
            current_offset_++;
            if (static_cast<char>(c) == delim) {
                return SourceStatus::ok;
            }
            out.push_back(static_cast<char>(c));
        }

        if (std::ferror(file_)) {
            return fail();
        }
        return SourceStatus::end_of_stream;
    }

    SourceStatus peek_byte(char& byte) {
        if (!file_) {
            return closed();
        }

        int c = std::getc(file_);
        if (c == EOF) {
            return std::ferror(file_) ? fail() : SourceStatus::end_of_stream;
        }
        std::ungetc(c, file_);
        byte = static_cast<char>(c);
        return SourceStatus::ok;
    }

    SourceStatus read_byte(char& byte) {
        if (!file_) {
            return closed();
        }

        int c = std::getc(file_);
        if (c == EOF) {
            return std::ferror(file_) ? fail() : SourceStatus::end_of_stream;
        }
        current_offset_++;
        byte = static_cast<char>(c);
        return SourceStatus::ok;
    }

    /**
     * @brief Rewind file to beginning for re-reading
     */
    void rewind() noexcept {
        if (file_) {
            std::rewind(file_);
            current_offset_ = 0;
            last_errno_ = 0;
        }
    }

    /**
     * @brief Get errno from the last failed read
     */
    int last_errno() const noexcept { return last_errno_; }

    /**
     * @brief Get current file position in bytes
     */
    size_t tell() const noexcept { return current_offset_; }

    /**
     * @brief Get total file size in bytes
     */
    size_t size() const noexcept { return file_size_; }

    /**
     * @brief Check if file is still open
     */
    bool is_open() const noexcept { return file_ != nullptr; }

private:
    SourceStatus fail() noexcept {
        last_errno_ = errno != 0 ? errno : EIO;
        return SourceStatus::io_error;
    }

    SourceStatus closed() noexcept {
        last_errno_ = EBADF;
        return SourceStatus::io_error;
    }

    FILE* file_;            ///< File handle
    size_t file_size_;      ///< Total file size in bytes
    size_t current_offset_; ///< Current read position
    int last_errno_;        ///< errno from the last failed read
};

} // namespace fwio::utils::fileio
