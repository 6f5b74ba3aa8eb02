#pragma once

// FWIO - Fixed-Width Record I/O
//
// A header-only C++20 library for reading and writing fixed-width text
// records: columns occupy predetermined byte offsets instead of being
// separated by a delimiter.
//
// Reading:
// - Line endings: none (fixed byte count), CR, LF, CRLF
// - Header line skipping and comment line skipping
// - Leading/trailing skip regions around the columns
// - Optional trimming of spaces and tabs
//
// Writing:
// - Per-column left/right alignment with space padding
// - Optional truncation of oversized fields
// - Comment lines padded to the line width
//
// Both sides work over any type satisfying the ByteSource/ByteSink concepts.

// ====================
// Public API
// ====================

// Core types and enums
#include "fwio/types.hpp"

// Positioned error value
#include "fwio/parse_error.hpp"

// Column layout and builder
#include "fwio/layout.hpp"
#include "fwio/layout_builder.hpp"

// Version information
#include "fwio/version.hpp"

// ====================
// Implementation
// ====================

#include "fwio/detail/byte_stream_concepts.hpp"
#include "fwio/record_reader.hpp"
#include "fwio/record_writer.hpp"

// In-memory and iostream adapters
#include "fwio/io/stream_sink.hpp"
#include "fwio/io/stream_source.hpp"
#include "fwio/io/string_sink.hpp"
#include "fwio/io/string_source.hpp"
