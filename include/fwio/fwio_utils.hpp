#pragma once

// FWIO Utilities
// File adapters and helpers; these may throw on open failure

// File I/O (POSIX)
#include "fwio/utils/fileio/fixed_width_file_reader.hpp"
#include "fwio/utils/fileio/fixed_width_file_writer.hpp"
#include "fwio/utils/fileio/raw_file_sink.hpp"
#include "fwio/utils/fileio/raw_file_source.hpp"

#include "fwio/utils/detail/iteration_helpers.hpp"

#include "fwio.hpp"

namespace fwio {
// Import utilities into main namespace for convenience
using FixedWidthFileReader = utils::fileio::FixedWidthFileReader;

template <size_t BufferBytes = 8192>
using FixedWidthFileWriter = utils::fileio::FixedWidthFileWriter<BufferBytes>;

using utils::fileio::WriterStatus;
using utils::fileio::writer_status_string;
using utils::fileio::writer_status_from_errno;

using utils::detail::IterationResult;
using utils::detail::for_each_record;
using utils::detail::for_each_record_where;
} // namespace fwio
