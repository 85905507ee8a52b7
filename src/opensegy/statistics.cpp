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

#include "statistics.h"
#include "exception.h"
#include "impl/statisticdata.h"
#include "impl/logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace OpenSEGY {
#if 0
}
#endif

namespace {
  /**
   * Append the finite values and add everything to "stats", which
   * counts the non-finite ones.
   */
  template<typename T>
  void collect(const T* data, std::int64_t count, std::vector<double>& out,
               InternalSEGY::StatisticData& stats)
  {
    stats.add(data, count);
    for (std::int64_t ii = 0; ii < count; ++ii) {
      const double value = static_cast<double>(data[ii]);
      if (std::isfinite(value))
        out.push_back(value);
    }
  }
}

std::string
SampleStatistics::toString() const
{
  std::stringstream ss;
  ss << "count " << count << " (" << infinite << " not finite)"
     << " shape (" << rows << ", " << cols << ")"
     << " min " << min << " max " << max
     << " mean " << mean << " std " << stddev
     << " median " << median << " p5 " << p5 << " p95 " << p95;
  return ss.str();
}

StatisticsEngine::StatisticsEngine(const LoggerFn& logger)
  : _logger(logger ? logger :
            InternalSEGY::LoggerBase::standardCallback
            (InternalSEGY::LoggerBase::getVerboseFromEnv("OPENSEGY_VERBOSE"),
             "opensegy-stats: ", ""))
{
}

SampleStatistics
StatisticsEngine::compute(const TraceMatrix& matrix) const
{
  return compute(matrix.data(), matrix.rows(), matrix.cols());
}

SampleStatistics
StatisticsEngine::compute(const ChunkData& matrix) const
{
  std::vector<double> values;
  values.reserve(static_cast<std::size_t>(matrix.size()));
  InternalSEGY::StatisticData stats;
  collect(matrix.data(), matrix.size(), values, stats);
  return _finish(values, stats, matrix.rows(), matrix.cols());
}

SampleStatistics
StatisticsEngine::compute(const double* data, std::int64_t rows, std::int64_t cols) const
{
  if (rows < 0 || cols < 0 || (rows * cols != 0 && !data))
    throw Errors::SegyInvalidArgument("Bad matrix passed to statistics.");
  std::vector<double> values;
  values.reserve(static_cast<std::size_t>(rows * cols));
  InternalSEGY::StatisticData stats;
  collect(data, rows * cols, values, stats);
  return _finish(values, stats, rows, cols);
}

SampleStatistics
StatisticsEngine::computeSampled(const ISegyReader& reader, std::int64_t max_sample_traces) const
{
  const std::int64_t total = reader.tracecount();
  const std::vector<std::int64_t> traces = sampledTraces(total, max_sample_traces);
  if (static_cast<std::int64_t>(traces.size()) < total)
    InternalSEGY::LoggerBase::logger
      (_logger, 0, std::stringstream()
       << "Statistics are approximate, using " << traces.size()
       << " of " << total << " traces");
  std::vector<double> values;
  values.reserve(traces.size() * static_cast<std::size_t>(reader.samples()));
  InternalSEGY::StatisticData stats;
  for (std::int64_t trace : traces) {
    const std::vector<double> samples = reader.readtrace(trace);
    collect(samples.data(), static_cast<std::int64_t>(samples.size()), values, stats);
  }
  return _finish(values, stats, static_cast<std::int64_t>(traces.size()), reader.samples());
}

SampleStatistics
StatisticsEngine::computeFull(const ISegyReader& reader) const
{
  const std::int64_t total = reader.tracecount();
  const std::int64_t batch = 1000;
  std::vector<double> values;
  values.reserve(static_cast<std::size_t>(total * reader.samples()));
  InternalSEGY::StatisticData stats;
  for (std::int64_t start = 0; start < total; start += batch) {
    const TraceMatrix part = reader.readtraces(start, std::min(start + batch, total));
    InternalSEGY::StatisticData partstats;
    collect(part.data(), part.size(), values, partstats);
    if (_logger(2, ""))
      InternalSEGY::LoggerBase::logger
        (_logger, 2, std::stringstream()
         << "Traces " << start << " to " << start + part.rows()
         << ": " << partstats.getcnt() << " finite, range ["
         << partstats.getmin() << ", " << partstats.getmax() << "]");
    stats += partstats;
  }
  return _finish(values, stats, total, reader.samples());
}

std::vector<std::int64_t>
StatisticsEngine::sampledTraces(std::int64_t total, std::int64_t max_sample_traces)
{
  if (max_sample_traces <= 0)
    throw Errors::SegyInvalidArgument
      ("Maximum number of sampled traces must be positive, got " +
       std::to_string(max_sample_traces) + ".");
  const std::int64_t step = (total > max_sample_traces) ? total / max_sample_traces : 1;
  std::vector<std::int64_t> result;
  for (std::int64_t ii = 0; ii < total; ii += step)
    result.push_back(ii);
  return result;
}

double
StatisticsEngine::percentile(const std::vector<double>& sorted, double p)
{
  if (sorted.empty())
    return 0;
  const double pos = (p / 100.0) * static_cast<double>(sorted.size() - 1);
  const double lo_pos = std::floor(pos);
  const std::size_t lo = static_cast<std::size_t>(lo_pos);
  const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
  const double frac = pos - lo_pos;
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

/**
 * Sorts the values in place. Count, range and mean come from the
 * accumulated "stats", the deviation from a second pass around the mean.
 */
SampleStatistics
StatisticsEngine::_finish(std::vector<double>& values,
                          const InternalSEGY::StatisticData& stats,
                          std::int64_t rows, std::int64_t cols) const
{
  SampleStatistics result;
  result.infinite = stats.getinf();
  result.rows = rows;
  result.cols = cols;
  if (values.empty())
    return result;

  result.count = stats.getcnt();
  result.min   = stats.getmin();
  result.max   = stats.getmax();
  result.mean  = stats.mean();

  double ssd = 0;
  for (double value : values)
    ssd += (value - result.mean) * (value - result.mean);
  result.stddev = std::sqrt(ssd / static_cast<double>(values.size()));

  std::sort(values.begin(), values.end());
  result.median = percentile(values, 50);
  result.p5     = percentile(values, 5);
  result.p95    = percentile(values, 95);

  if (_logger(2, ""))
    _logger(2, "Statistics: " + result.toString());
  return result;
}

} // namespace
