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

#include "statisticdata.h"

#include <limits>
#include <algorithm>

namespace InternalSEGY {
#if 0
}
#endif

/**
 * Initialize to empty. min > max marks the range as not yet valid.
 */
StatisticData::StatisticData()
  : cnt_(0), inf_(0), sum_(0), ssq_(0)
  , min_(std::numeric_limits<double>::infinity())
  , max_(-std::numeric_limits<double>::infinity())
{
}

StatisticData& StatisticData::operator+=(const StatisticData& other)
{
  if (other.min_ <= other.max_) {
    if (min_ <= max_) {
      min_ = std::min(min_, other.min_);
      max_ = std::max(max_, other.max_);
    }
    else {
      min_ = other.min_;
      max_ = other.max_;
    }
  }
  cnt_ += other.cnt_;
  sum_ += other.sum_;
  ssq_ += other.ssq_;
  inf_ += other.inf_;
  return *this;
}

double
StatisticData::mean() const
{
  return cnt_ == 0 ? 0.0 : sum_ / static_cast<double>(cnt_);
}

} // namespace
