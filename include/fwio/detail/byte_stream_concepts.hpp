// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <string>
#include <string_view>

#include <cstddef>

#include "fwio/types.hpp"

namespace fwio {

/**
 * @brief Concept for byte sources a RecordReader can consume
 *
 * - read_exact(out, n): replace out with up to n bytes; ok only if all n were read
 * - read_until(out, delim): replace out with the bytes before delim and consume
 *   delim; end_of_stream if the source ended first (out holds the fragment)
 * - peek_byte(b): look at the next byte without consuming it
 * - read_byte(b): consume one byte
 * - last_errno(): errno of the last io_error
 *
 * @tparam T The type to check
 */
template <typename T>
concept ByteSource = requires(T& src, std::string& out, size_t n, char delim, char& byte) {
    { src.read_exact(out, n) } -> std::same_as<SourceStatus>;
    { src.read_until(out, delim) } -> std::same_as<SourceStatus>;
    { src.peek_byte(byte) } -> std::same_as<SourceStatus>;
    { src.read_byte(byte) } -> std::same_as<SourceStatus>;
    { src.last_errno() } -> std::convertible_to<int>;
};

/**
 * @brief Concept for byte sinks a RecordWriter can produce into
 *
 * Write operations return false on failure; last_errno() then reports why.
 *
 * @tparam T The type to check
 */
template <typename T>
concept ByteSink = requires(T& sink, std::string_view bytes) {
    { sink.write_bytes(bytes) } -> std::same_as<bool>;
    { sink.flush() } -> std::same_as<bool>;
    { sink.last_errno() } -> std::convertible_to<int>;
};

} // namespace fwio
