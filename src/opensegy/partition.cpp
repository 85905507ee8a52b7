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

#include "partition.h"
#include "exception.h"
#include "impl/logger.h"

#include <cmath>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace OpenSEGY {
#if 0
}
#endif

namespace {
  GridPartitioner::LoggerFn defaultLogger(const GridPartitioner::LoggerFn& logger)
  {
    if (logger)
      return logger;
    return InternalSEGY::LoggerBase::standardCallback
      (InternalSEGY::LoggerBase::getVerboseFromEnv("OPENSEGY_VERBOSE"),
       "opensegy-grid: ", "");
  }

  std::string rangeToString(const IndexRange& range)
  {
    return "[" + std::to_string(range.first) + ", " + std::to_string(range.second) + ")";
  }
}

std::ostream&
operator<<(std::ostream& os, const ChunkDescriptor& desc)
{
  std::stringstream ss;
  ss << "chunk " << desc.chunk_number
     << " (" << desc.chunk_id[0] << "," << desc.chunk_id[1] << ")"
     << " traces " << rangeToString(desc.trace_range)
     << " samples " << rangeToString(desc.sample_range)
     << " time [" << desc.time_range_ms.first
     << ", " << desc.time_range_ms.second << ") ms";
  return os << ss.str();
}

GridPartitioner::GridPartitioner(const std::shared_ptr<const ISegyReader>& reader,
                                 const LoggerFn& logger)
  : _reader(reader)
  , _tracecount(0)
  , _samples(0)
  , _interval_ms(0)
  , _logger(defaultLogger(logger))
{
  if (!_reader)
    throw Errors::SegyInvalidArgument("GridPartitioner needs a reader.");
  _tracecount  = _reader->tracecount();
  _samples     = _reader->samples();
  _interval_ms = _reader->sampleinterval_ms();
}

GridPartitioner::GridPartitioner(std::int64_t tracecount, std::int32_t samples,
                                 double interval_ms, const LoggerFn& logger)
  : _reader()
  , _tracecount(tracecount)
  , _samples(samples)
  , _interval_ms(interval_ms)
  , _logger(defaultLogger(logger))
{
  if (tracecount < 0)
    throw Errors::SegyInvalidArgument("Trace count cannot be negative.");
  if (samples <= 0)
    throw Errors::SegyInvalidArgument("Samples per trace must be positive.");
  if (!(interval_ms > 0) || !std::isfinite(interval_ms))
    throw Errors::SegyInvalidArgument("Sample interval must be positive.");
}

std::vector<IndexRange>
GridPartitioner::partitionByTraceCount(std::int64_t chunk_size) const
{
  if (chunk_size <= 0)
    throw Errors::SegyInvalidArgument
      ("Traces per chunk must be positive, got " + std::to_string(chunk_size) + ".");
  std::vector<IndexRange> result;
  for (std::int64_t start = 0; start < _tracecount; start += chunk_size)
    result.push_back(IndexRange(start, std::min(start + chunk_size, _tracecount)));
  return result;
}

std::int64_t
GridPartitioner::samplesPerChunk(double interval_ms) const
{
  if (!(interval_ms > 0) || !std::isfinite(interval_ms))
    throw Errors::SegyInvalidArgument
      ("Depth interval must be positive, got " + std::to_string(interval_ms) + " ms.");
  const double ratio = std::floor(interval_ms / _interval_ms);
  if (ratio >= static_cast<double>(_samples))
    return _samples;
  return std::max(static_cast<std::int64_t>(ratio), static_cast<std::int64_t>(1));
}

std::vector<IndexRange>
GridPartitioner::partitionByDepthInterval(double interval_ms) const
{
  const std::int64_t chunk_size = samplesPerChunk(interval_ms);
  std::vector<IndexRange> result;
  for (std::int64_t start = 0; start < _samples; start += chunk_size)
    result.push_back(IndexRange(start, std::min(start + chunk_size, static_cast<std::int64_t>(_samples))));
  return result;
}

std::vector<ChunkDescriptor>
GridPartitioner::partitionGrid(std::int64_t chunk_size, double interval_ms) const
{
  const std::vector<IndexRange> traces = partitionByTraceCount(chunk_size);
  const std::vector<IndexRange> depths = partitionByDepthInterval(interval_ms);
  std::vector<ChunkDescriptor> result;
  result.reserve(traces.size() * depths.size());
  std::int64_t number = 0;
  for (std::size_t tt = 0; tt < traces.size(); ++tt) {
    for (std::size_t dd = 0; dd < depths.size(); ++dd) {
      ChunkDescriptor desc;
      desc.chunk_id = std::array<std::int64_t,2>{(std::int64_t)tt, (std::int64_t)dd};
      desc.chunk_number = number++;
      desc.trace_range = traces[tt];
      desc.sample_range = depths[dd];
      desc.time_range_ms = std::make_pair(depths[dd].first * _interval_ms,
                                          depths[dd].second * _interval_ms);
      result.push_back(desc);
    }
  }
  if (_logger(1, ""))
    InternalSEGY::LoggerBase::logger
      (_logger, 1, std::stringstream()
       << "Grid of " << traces.size() << " x " << depths.size()
       << " chunks, " << chunk_size << " traces by "
       << samplesPerChunk(interval_ms) << " samples each");
  return result;
}

ChunkDescriptor
GridPartitioner::describe(const IndexRange& traces, const IndexRange& samples) const
{
  ChunkDescriptor desc;
  desc.trace_range = traces;
  desc.sample_range = samples;
  desc.time_range_ms = std::make_pair(samples.first * _interval_ms,
                                      samples.second * _interval_ms);
  validate(desc);
  return desc;
}

void
GridPartitioner::validate(const ChunkDescriptor& desc) const
{
  const IndexRange& tr = desc.trace_range;
  const IndexRange& sr = desc.sample_range;
  if (tr.first < 0 || tr.first >= tr.second || tr.second > _tracecount)
    throw Errors::SegyRangeError
      ("Chunk trace range " + rangeToString(tr) +
       " is outside [0, " + std::to_string(_tracecount) + ").");
  if (sr.first < 0 || sr.first >= sr.second || sr.second > _samples)
    throw Errors::SegyRangeError
      ("Chunk sample range " + rangeToString(sr) +
       " is outside [0, " + std::to_string(_samples) + ").");
}

ChunkData
GridPartitioner::extract(const ChunkDescriptor& desc) const
{
  validate(desc);
  if (!_reader)
    throw Errors::SegyUserError("GridPartitioner was created without a reader.");
  return _reader->readwindow(desc.trace_range.first, desc.trace_range.second,
                             desc.sample_range.first, desc.sample_range.second);
}

ChunkData
GridPartitioner::extract(const IndexRange& traces, const IndexRange& samples) const
{
  return extract(describe(traces, samples));
}

} // namespace
