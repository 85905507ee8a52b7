// Copyright 2017-2020, Schlumberger
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "declspec.h"
#include "api.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <array>
#include <functional>
#include <ostream>

/**
 * \file partition.h
 * \brief Tiling of the trace by sample grid into rectangular chunks.
 */

namespace OpenSEGY {
#if 0
}
#endif

/**
 * \brief Half open index range [first, second).
 */
typedef std::pair<std::int64_t, std::int64_t> IndexRange;

/**
 * \brief One cell of the chunk grid.
 *
 * Carries coordinates only, no data. chunk_id is
 * (trace chunk index, depth chunk index).
 */
struct OPENSEGY_API ChunkDescriptor
{
  std::array<std::int64_t,2> chunk_id;
  std::int64_t               chunk_number;
  IndexRange                 trace_range;
  IndexRange                 sample_range;
  std::pair<double, double>  time_range_ms;

  ChunkDescriptor()
    : chunk_id{0, 0}, chunk_number(0)
    , trace_range(0, 0), sample_range(0, 0), time_range_ms(0, 0)
  {
  }

  std::int64_t num_traces() const { return trace_range.second - trace_range.first; }
  std::int64_t num_samples() const { return sample_range.second - sample_range.first; }
  std::array<std::int64_t,2> shape() const { return std::array<std::int64_t,2>{num_traces(), num_samples()}; }

  bool operator==(const ChunkDescriptor& other) const
  {
    return chunk_id == other.chunk_id &&
      chunk_number == other.chunk_number &&
      trace_range == other.trace_range &&
      sample_range == other.sample_range &&
      time_range_ms == other.time_range_ms;
  }
  bool operator!=(const ChunkDescriptor& other) const { return !(*this == other); }
};

OPENSEGY_API std::ostream& operator<<(std::ostream& os, const ChunkDescriptor& desc);

/**
 * \brief Split a traces by samples grid into reproducible chunks.
 *
 * The trace axis and the sample axis are partitioned independently.
 * Ranges are consecutive, disjoint, and cover the axis exactly. The
 * last range on each axis is truncated, never padded.
 *
 * The grid is enumerated trace-major: all depth chunks of the first
 * trace chunk, then all depth chunks of the next. chunk_number counts
 * from 0 in that order. Identical input gives identical numbering,
 * so exported chunk files can be matched up across runs.
 *
 * A partitioner constructed from geometry alone can partition but
 * not extract.
 *
 * Thread safety: All methods are const. extract() is as thread safe
 * as the reader, which is safe for concurrent reads.
 */
class OPENSEGY_API GridPartitioner
{
public:
  typedef std::function<bool(int, const std::string&)> LoggerFn;

private:
  std::shared_ptr<const ISegyReader> _reader;
  std::int64_t _tracecount;
  std::int32_t _samples;
  double       _interval_ms;
  LoggerFn     _logger;

public:
  explicit GridPartitioner(const std::shared_ptr<const ISegyReader>& reader,
                           const LoggerFn& logger = LoggerFn());
  GridPartitioner(std::int64_t tracecount, std::int32_t samples, double interval_ms,
                  const LoggerFn& logger = LoggerFn());

  std::int64_t tracecount() const { return _tracecount; }
  std::int32_t samples() const { return _samples; }
  double sampleinterval_ms() const { return _interval_ms; }

  /**
   * \brief Consecutive trace ranges of chunk_size traces.
   * \throws Errors::SegyInvalidArgument if chunk_size <= 0.
   */
  std::vector<IndexRange> partitionByTraceCount(std::int64_t chunk_size) const;

  /**
   * \brief Consecutive sample ranges spanning interval_ms each.
   *
   * An interval shorter than one sample still gives one sample
   * per chunk.
   *
   * \throws Errors::SegyInvalidArgument if interval_ms <= 0.
   */
  std::vector<IndexRange> partitionByDepthInterval(double interval_ms) const;

  /**
   * \brief Number of samples in each depth chunk, at least 1.
   */
  std::int64_t samplesPerChunk(double interval_ms) const;

  /**
   * \brief Cartesian product of the two partitions, trace-major.
   */
  std::vector<ChunkDescriptor> partitionGrid(std::int64_t chunk_size, double interval_ms) const;

  /**
   * \brief Build a descriptor for an arbitrary window.
   *
   * The result has chunk_id (0,0) and chunk_number 0 and is
   * validated the same way as extract() does.
   */
  ChunkDescriptor describe(const IndexRange& traces, const IndexRange& samples) const;

  /**
   * \brief Check that the descriptor lies inside the grid.
   * \throws Errors::SegyRangeError if it does not.
   */
  void validate(const ChunkDescriptor& desc) const;

  /**
   * \brief Read the samples covered by a descriptor.
   *
   * Only the requested traces and samples are read.
   *
   * \throws Errors::SegyRangeError for a descriptor outside the grid.
   * \throws Errors::SegyUserError if there is no reader.
   */
  ChunkData extract(const ChunkDescriptor& desc) const;

  /**
   * \brief Shortcut for extract(describe(traces, samples)).
   */
  ChunkData extract(const IndexRange& traces, const IndexRange& samples) const;
};

} // namespace
