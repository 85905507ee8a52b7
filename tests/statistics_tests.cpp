/////////////////////////////////////////////////////////////////////////////////
//
// Copyright 2023 Equinor ASA
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http ://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
/////////////////////////////////////////////////////////////////////////////////

#include "gtest/gtest.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "opensegy/api.h"
#include "opensegy/exception.h"
#include "opensegy/statistics.h"
#include "opensegy/impl/statisticdata.h"
#include "test_utils.h"

using namespace OpenSEGY;
using namespace OpenSEGY::Errors;
using Test_Utils::LocalFileAutoDelete;
using Test_Utils::SyntheticLayout;

namespace
{
    StatisticsEngine quietEngine()
    {
        return StatisticsEngine([](int, const std::string&) { return false; });
    }

    TraceMatrix matrixOf(std::int64_t rows, std::int64_t cols, const std::vector<double>& values)
    {
        TraceMatrix result(rows, cols);
        for (std::int64_t ii = 0; ii < rows * cols; ++ii)
        {
            result.data()[ii] = values[static_cast<std::size_t>(ii)];
        }
        return result;
    }
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testKnownValues)
{
    const TraceMatrix      m = matrixOf(2, 5, { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 });
    const SampleStatistics s = quietEngine().compute(m);

    ASSERT_EQ(s.count, 10);
    ASSERT_EQ(s.infinite, 0);
    ASSERT_EQ(s.rows, 2);
    ASSERT_EQ(s.cols, 5);
    ASSERT_DOUBLE_EQ(s.min, 1.0);
    ASSERT_DOUBLE_EQ(s.max, 10.0);
    ASSERT_DOUBLE_EQ(s.mean, 5.5);
    ASSERT_DOUBLE_EQ(s.stddev, std::sqrt(8.25));
    ASSERT_DOUBLE_EQ(s.median, 5.5);
    ASSERT_DOUBLE_EQ(s.p5, 1.45);
    ASSERT_DOUBLE_EQ(s.p95, 9.55);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testOrderDoesNotMatter)
{
    const SampleStatistics a = quietEngine().compute(matrixOf(1, 6, { 6, -2, 0.5, 3, 3, 9 }));
    const SampleStatistics b = quietEngine().compute(matrixOf(3, 2, { 3, 9, 0.5, -2, 6, 3 }));
    ASSERT_DOUBLE_EQ(a.mean, b.mean);
    ASSERT_DOUBLE_EQ(a.stddev, b.stddev);
    ASSERT_DOUBLE_EQ(a.median, b.median);
    ASSERT_DOUBLE_EQ(a.median, 3.0);
    ASSERT_DOUBLE_EQ(a.p95, b.p95);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testPercentile)
{
    const std::vector<double> sorted{ 10, 20, 30, 40 };
    ASSERT_DOUBLE_EQ(StatisticsEngine::percentile(sorted, 0), 10.0);
    ASSERT_DOUBLE_EQ(StatisticsEngine::percentile(sorted, 100), 40.0);
    ASSERT_DOUBLE_EQ(StatisticsEngine::percentile(sorted, 50), 25.0);
    ASSERT_DOUBLE_EQ(StatisticsEngine::percentile(sorted, 5), 11.5);
    ASSERT_DOUBLE_EQ(StatisticsEngine::percentile(std::vector<double>{ 7 }, 95), 7.0);
    ASSERT_DOUBLE_EQ(StatisticsEngine::percentile(std::vector<double>(), 50), 0.0);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testNonFiniteAndEmpty)
{
    const double           inf = std::numeric_limits<double>::infinity();
    const double           nan = std::numeric_limits<double>::quiet_NaN();
    const SampleStatistics s   = quietEngine().compute(matrixOf(1, 5, { 2, inf, 4, nan, -inf }));
    ASSERT_EQ(s.count, 2);
    ASSERT_EQ(s.infinite, 3);
    ASSERT_DOUBLE_EQ(s.mean, 3.0);
    ASSERT_DOUBLE_EQ(s.stddev, 1.0);

    const SampleStatistics empty = quietEngine().compute(TraceMatrix());
    ASSERT_EQ(empty.count, 0);
    ASSERT_EQ(empty.min, 0.0);
    ASSERT_EQ(empty.max, 0.0);
    ASSERT_EQ(empty.mean, 0.0);
    ASSERT_EQ(empty.stddev, 0.0);
    ASSERT_EQ(empty.median, 0.0);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testFloatMatrix)
{
    ChunkData m(2, 2);
    m(0, 0) = 1.5f;
    m(0, 1) = -1.5f;
    m(1, 0) = 0.5f;
    m(1, 1) = -0.5f;
    const SampleStatistics s = quietEngine().compute(m);
    ASSERT_EQ(s.count, 4);
    ASSERT_DOUBLE_EQ(s.mean, 0.0);
    ASSERT_DOUBLE_EQ(s.min, -1.5);
    ASSERT_DOUBLE_EQ(s.median, 0.0);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testSampledTraces)
{
    ASSERT_EQ(StatisticsEngine::sampledTraces(5, 1000), std::vector<std::int64_t>({ 0, 1, 2, 3, 4 }));
    ASSERT_EQ(StatisticsEngine::sampledTraces(10, 10).size(), 10u);

    // step = floor(25 / 10) = 2
    const std::vector<std::int64_t> picked = StatisticsEngine::sampledTraces(25, 10);
    ASSERT_EQ(picked.size(), 13u);
    ASSERT_EQ(picked.front(), 0);
    ASSERT_EQ(picked[1], 2);
    ASSERT_EQ(picked.back(), 24);

    ASSERT_TRUE(StatisticsEngine::sampledTraces(0, 10).empty());
    ASSERT_THROW(StatisticsEngine::sampledTraces(10, 0), SegyInvalidArgument);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testFromFile)
{
    LocalFileAutoDelete file(".sgy");
    SyntheticLayout     layout;
    layout.traces  = 40;
    layout.samples = 16;
    Test_Utils::writeSynthetic(file.name(), layout);
    auto reader = ISegyReader::open(file.name());

    const SampleStatistics full = quietEngine().computeFull(*reader);
    const SampleStatistics same = quietEngine().compute(reader->readall());
    ASSERT_EQ(full.count, 40 * 16);
    ASSERT_EQ(full.rows, 40);
    ASSERT_DOUBLE_EQ(full.mean, same.mean);
    ASSERT_DOUBLE_EQ(full.p95, same.p95);
    ASSERT_DOUBLE_EQ(full.min, Test_Utils::syntheticValue(0, 0, layout.format));
    ASSERT_DOUBLE_EQ(full.max, Test_Utils::syntheticValue(39, 15, layout.format));

    // Everything fits, so sampling reads it all.
    const SampleStatistics all = quietEngine().computeSampled(*reader);
    ASSERT_EQ(all.count, full.count);
    ASSERT_DOUBLE_EQ(all.stddev, full.stddev);

    // Every 4th trace: 0, 4, ..., 36.
    const SampleStatistics sampled = quietEngine().computeSampled(*reader, 10);
    ASSERT_EQ(sampled.rows, 10);
    ASSERT_EQ(sampled.count, 10 * 16);
    ASSERT_DOUBLE_EQ(sampled.max, Test_Utils::syntheticValue(36, 15, layout.format));

    ASSERT_THROW(quietEngine().computeSampled(*reader, 0), SegyInvalidArgument);
}

//--------------------------------------------------------------------------------------------------
/// More traces than one read batch, so the per batch results get merged.
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testFullAcrossBatches)
{
    LocalFileAutoDelete file(".sgy");
    SyntheticLayout     layout;
    layout.traces  = 2500;
    layout.samples = 4;
    layout.format  = SampleFormat::int16;
    Test_Utils::writeSynthetic(file.name(), layout);
    auto reader = ISegyReader::open(file.name());

    const SampleStatistics full = quietEngine().computeFull(*reader);
    const SampleStatistics same = quietEngine().compute(reader->readall());
    ASSERT_EQ(full.count, 2500 * 4);
    ASSERT_EQ(full.infinite, 0);
    ASSERT_EQ(full.rows, 2500);
    ASSERT_DOUBLE_EQ(full.min, -100.0);
    ASSERT_DOUBLE_EQ(full.max, 100.0);
    ASSERT_DOUBLE_EQ(full.min, same.min);
    ASSERT_DOUBLE_EQ(full.max, same.max);
    ASSERT_DOUBLE_EQ(full.mean, same.mean);
    ASSERT_DOUBLE_EQ(full.stddev, same.stddev);
    ASSERT_DOUBLE_EQ(full.median, same.median);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(statistics_tests, testStatisticData)
{
    InternalSEGY::StatisticData a, b;
    const double                first[]  = { 1, 2, 3 };
    const float                 second[] = { -4.0f, std::numeric_limits<float>::infinity() };
    a.add(first, 3);
    b.add(second, 2);
    a += b;
    ASSERT_EQ(a.getcnt(), 4);
    ASSERT_EQ(a.getinf(), 1);
    ASSERT_DOUBLE_EQ(a.getmin(), -4.0);
    ASSERT_DOUBLE_EQ(a.getmax(), 3.0);
    ASSERT_DOUBLE_EQ(a.getsum(), 2.0);
    ASSERT_DOUBLE_EQ(a.mean(), 0.5);
    ASSERT_DOUBLE_EQ(a.getssq(), 30.0);

    // Merging into an empty accumulator takes the range as is.
    InternalSEGY::StatisticData empty;
    empty += a;
    ASSERT_DOUBLE_EQ(empty.getmin(), -4.0);
    ASSERT_DOUBLE_EQ(empty.getmax(), 3.0);
    ASSERT_EQ(empty.getcnt(), 4);
}
