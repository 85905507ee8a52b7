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

#include <cstdint>
#include <cmath>

namespace InternalSEGY {
#if 0
}
#endif

/**
 * \file statisticdata.h
 * \brief provides class \ref InternalSEGY::StatisticData.
 */

/**
 * \brief Running count, sum, sum of squares and range of sample values.
 *
 * Non-finite values are counted separately and otherwise ignored.
 * Instances can be merged with operator+= which makes it possible
 * to accumulate per trace or per thread and combine afterwards.
 *
 * \details Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_TEST_API StatisticData
{
public:
  typedef std::int64_t count_type;
  count_type  getcnt() const { return cnt_; }  /**< \brief Number of added samples. */
  count_type  getinf() const { return inf_; }  /**< \brief Number of not added (infinite) samples. */
  double      getsum() const { return sum_; }  /**< \brief Sum of added samples. */
  double      getssq() const { return ssq_; }  /**< \brief Sum-of-squares of added samples. */
  double      getmin() const { return min_; }  /**< \brief Minimum added sample value. */
  double      getmax() const { return max_; }  /**< \brief Maximum added sample value. */

  StatisticData();

  inline void add(double value);
  template<typename T> void add(const T* values, std::int64_t count);

  StatisticData& operator+=(const StatisticData& other);

  double mean() const;

private:
  count_type  cnt_;
  count_type  inf_;
  double      sum_;
  double      ssq_;
  double      min_;
  double      max_;
};

/**
 * Add a single sample to the statistics.
 */
inline void
StatisticData::add(double value)
{
  if (std::isfinite(value)) {
    sum_ += value;
    ssq_ += value*value;
    if (cnt_ == 0)
      min_ = max_ = value;
    if (value < min_)
      min_ = value;
    if (value > max_)
      max_ = value;
    ++cnt_;
  }
  else
    ++inf_;
}

template<typename T>
void
StatisticData::add(const T* values, std::int64_t count)
{
  for (std::int64_t ii = 0; ii < count; ++ii)
    add(static_cast<double>(values[ii]));
}

} // end namespace
