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
#include <string>
#include <vector>
#include <functional>

/**
 * \file statistics.h
 * \brief Descriptive statistics of sample values.
 */

namespace InternalSEGY {
  class StatisticData;
}

namespace OpenSEGY {
#if 0
}
#endif

/**
 * \brief Result of StatisticsEngine.
 *
 * Non-finite samples are excluded and counted in "infinite". With
 * no finite samples every value is zero. stddev is the population
 * standard deviation. The percentiles interpolate linearly between
 * the closest ranks.
 */
struct OPENSEGY_API SampleStatistics
{
  std::int64_t count;
  std::int64_t infinite;
  std::int64_t rows;
  std::int64_t cols;
  double min;
  double max;
  double mean;
  double stddev;
  double median;
  double p5;
  double p95;

  SampleStatistics()
    : count(0), infinite(0), rows(0), cols(0)
    , min(0), max(0), mean(0), stddev(0), median(0), p5(0), p95(0)
  {
  }

  std::string toString() const;
};

/**
 * \brief Compute SampleStatistics over a matrix or a file.
 *
 * computeSampled() reads at most max_sample_traces traces, chosen
 * with a fixed stride starting at trace 0. The result is an
 * approximation for large files. computeFull() reads everything.
 *
 * Thread safety: Stateless apart from the logger.
 */
class OPENSEGY_API StatisticsEngine
{
public:
  typedef std::function<bool(int, const std::string&)> LoggerFn;

private:
  LoggerFn _logger;

public:
  explicit StatisticsEngine(const LoggerFn& logger = LoggerFn());

  SampleStatistics compute(const TraceMatrix& matrix) const;
  SampleStatistics compute(const ChunkData& matrix) const;
  SampleStatistics compute(const double* data, std::int64_t rows, std::int64_t cols) const;
  SampleStatistics computeSampled(const ISegyReader& reader, std::int64_t max_sample_traces = 1000) const;
  SampleStatistics computeFull(const ISegyReader& reader) const;

  /**
   * \brief Trace numbers that computeSampled() would read.
   * \throws Errors::SegyInvalidArgument if max_sample_traces <= 0.
   */
  static std::vector<std::int64_t> sampledTraces(std::int64_t total, std::int64_t max_sample_traces);

  /**
   * \brief Percentile p (0..100) of an ascending sorted list.
   *
   * Position p/100*(n-1), interpolated between its neighbors.
   * Returns 0 for an empty list.
   */
  static double percentile(const std::vector<double>& sorted, double p);

private:
  SampleStatistics _finish(std::vector<double>& values,
                           const InternalSEGY::StatisticData& stats,
                           std::int64_t rows, std::int64_t cols) const;
};

} // namespace
