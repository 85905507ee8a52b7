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

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "opensegy/exception.h"
#include "segyaccess/segyreader.h"
#include "test_utils.h"

using namespace OpenSEGY;
using namespace OpenSEGY::Errors;
using SEGYAccess::SEGYReader;
using Test_Utils::LocalDirAutoDelete;
using Test_Utils::LocalFileAutoDelete;
using Test_Utils::SyntheticLayout;

namespace
{
    SyntheticLayout smallLayout()
    {
        SyntheticLayout layout;
        layout.traces  = 25;
        layout.samples = 60;
        return layout;
    }
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testOpenAndMetaData)
{
    LocalFileAutoDelete file(".sgy");
    Test_Utils::writeSynthetic(file.name(), smallLayout());

    SEGYReader reader;
    ASSERT_FALSE(reader.isOpen());
    ASSERT_TRUE(reader.metaData().empty());

    ASSERT_TRUE(reader.open(file.name()));
    ASSERT_TRUE(reader.isOpen());
    ASSERT_EQ(reader.lastError(), "");

    const std::vector<std::pair<std::string, std::string>> meta = reader.metaData();
    ASSERT_EQ(meta.size(), 8u);
    ASSERT_EQ(meta[0], std::make_pair(std::string("File"), file.name()));
    ASSERT_EQ(meta[1], std::make_pair(std::string("Traces"), std::string("25")));
    ASSERT_EQ(meta[2], std::make_pair(std::string("Samples per trace"), std::string("60")));
    ASSERT_EQ(meta[3], std::make_pair(std::string("Sample interval"), std::string("2000 us")));

    ASSERT_EQ(reader.totalTraces(), 25);
    ASSERT_EQ(reader.samplesPerTrace(), 60);
    ASSERT_DOUBLE_EQ(reader.sampleInterval(), 2.0);
    ASSERT_EQ(reader.fileInfo().total_traces, 25);
    ASSERT_EQ(reader.textHeader().substr(0, 23), "C01 SYNTHETIC TEST DATA");
    ASSERT_EQ(reader.traceHeader(3).get(TraceField::TraceNumber), 4);

    // Only one file at a time.
    ASSERT_FALSE(reader.open(file.name()));
    ASSERT_NE(reader.lastError(), "");
    ASSERT_TRUE(reader.isOpen());

    reader.close();
    ASSERT_FALSE(reader.isOpen());
    reader.close();
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testOpenFailure)
{
    LocalFileAutoDelete missing(".sgy");
    SEGYReader          reader;
    ASSERT_FALSE(reader.open(missing.name()));
    ASSERT_FALSE(reader.isOpen());
    ASSERT_NE(reader.lastError(), "");

    LocalFileAutoDelete tiny(".sgy");
    Test_Utils::appendBytes(tiny.name(), 100);
    ASSERT_FALSE(reader.open(tiny.name()));
    ASSERT_FALSE(reader.isOpen());
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testClosedReaderThrows)
{
    SEGYReader reader;
    ASSERT_THROW(reader.totalTraces(), SegyClosedError);
    ASSERT_THROW(reader.loadTrace(0), SegyClosedError);
    ASSERT_THROW(reader.loadAllData(), SegyClosedError);
    ASSERT_THROW(reader.divideByGrid(), SegyClosedError);
    ASSERT_THROW(reader.statistics(), SegyClosedError);
    ASSERT_THROW(reader.timeAxis(), SegyClosedError);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testLoading)
{
    LocalFileAutoDelete   file(".sgy");
    const SyntheticLayout layout = smallLayout();
    Test_Utils::writeSynthetic(file.name(), layout);

    SEGYReader reader;
    ASSERT_TRUE(reader.open(file.name()));

    const std::vector<double> trace = reader.loadTrace(7);
    ASSERT_EQ(trace.size(), 60u);
    ASSERT_DOUBLE_EQ(trace[11], Test_Utils::syntheticValue(7, 11, layout.format));

    const TraceMatrix tail = reader.loadTraces(20);
    ASSERT_EQ(tail.rows(), 5);
    ASSERT_DOUBLE_EQ(tail(4, 59), Test_Utils::syntheticValue(24, 59, layout.format));

    const TraceMatrix all = reader.loadAllData();
    ASSERT_EQ(all.rows(), 25);
    ASSERT_EQ(all.cols(), 60);

    const ChunkData slice = reader.loadDepthSlice(10, 20);
    ASSERT_EQ(slice.rows(), 25);
    ASSERT_EQ(slice.cols(), 10);
    ASSERT_EQ(slice(3, 0), static_cast<float>(Test_Utils::syntheticValue(3, 10, layout.format)));

    const ChunkData window = reader.loadDepthSlice(50, -1, 5, 8);
    ASSERT_EQ(window.rows(), 3);
    ASSERT_EQ(window.cols(), 10);

    ASSERT_THROW(reader.loadDepthSlice(-1, 10), SegySampleRangeError);
    ASSERT_THROW(reader.loadDepthSlice(60, -1), SegySampleRangeError);
    ASSERT_THROW(reader.loadDepthSlice(10, 10), SegySampleRangeError);
    ASSERT_THROW(reader.loadDepthSlice(10, 61), SegySampleRangeError);
    ASSERT_THROW(reader.loadDepthSlice(0, -1, 0, 26), SegyIndexOutOfRange);

    const std::vector<double> time = reader.timeAxis(58);
    ASSERT_EQ(time, std::vector<double>({ 116.0, 118.0 }));
    ASSERT_EQ(reader.traceAxis(22), std::vector<std::int64_t>({ 22, 23, 24 }));
    ASSERT_EQ(reader.traceAxis().size(), 25u);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testNegativeEndIndex)
{
    LocalFileAutoDelete   file(".sgy");
    const SyntheticLayout layout = smallLayout();
    Test_Utils::writeSynthetic(file.name(), layout);

    SEGYReader reader;
    ASSERT_TRUE(reader.open(file.name()));

    ASSERT_EQ(reader.loadTraces(0, -1).rows(), 25);
    ASSERT_THROW(reader.loadTraces(0, -5), SegyIndexOutOfRange);
    ASSERT_THROW(reader.traceAxis(0, -3), SegyIndexOutOfRange);
    ASSERT_THROW(reader.timeAxis(0, -2), SegySampleRangeError);
    ASSERT_THROW(reader.loadDepthSlice(0, -5), SegySampleRangeError);
    ASSERT_THROW(reader.loadDepthSlice(0, 10, 0, -2), SegyIndexOutOfRange);
    ASSERT_EQ(reader.loadDepthSlice(0, -1, 0, -1).cols(), 60);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testDivideAndSave)
{
    LocalFileAutoDelete file(".sgy");
    LocalDirAutoDelete  dir;
    Test_Utils::writeSynthetic(file.name(), smallLayout());

    SEGYReader reader;
    ASSERT_TRUE(reader.open(file.name()));

    const std::vector<IndexRange> traces = reader.divideByTraces(10);
    ASSERT_EQ(traces, std::vector<IndexRange>({ IndexRange(0, 10), IndexRange(10, 20), IndexRange(20, 25) }));
    const std::vector<IndexRange> depths = reader.divideByDepth(50.0);
    ASSERT_EQ(depths, std::vector<IndexRange>({ IndexRange(0, 25), IndexRange(25, 50), IndexRange(50, 60) }));

    // Defaults cover the whole file in one chunk.
    ASSERT_EQ(reader.divideByGrid().size(), 1u);

    const std::vector<ChunkDescriptor> chunks = reader.divideByGrid(10, 50.0);
    ASSERT_EQ(chunks.size(), 9u);
    ASSERT_EQ(chunks[4].trace_range, IndexRange(10, 20));
    ASSERT_EQ(chunks[4].sample_range, IndexRange(25, 50));

    const ChunkData chunk = reader.extractChunk(chunks[4].trace_range, chunks[4].sample_range);
    ASSERT_EQ(chunk.shape(), chunks[4].shape());

    const std::string info = reader.divisionInfo(chunks);
    ASSERT_NE(info.find("Source file: " + file.name()), std::string::npos);
    ASSERT_NE(info.find("... (4 more chunks)"), std::string::npos);

    reader.saveChunks(chunks, dir.name(), "tile", 2);
    for (const ChunkDescriptor& desc : chunks)
    {
        char name[32];
        std::snprintf(name, sizeof(name), "/tile_%04lld", static_cast<long long>(desc.chunk_number));
        const std::string json = Test_Utils::readFile(dir.name() + name + "_metadata.json");
        ASSERT_NE(json.find("\"source_file\": \"" + file.name() + "\""), std::string::npos);
        ASSERT_GT(Test_Utils::fileSize(dir.name() + name + ".npy"), 128);
    }
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(segyaccess_tests, testStatistics)
{
    LocalFileAutoDelete file(".sgy");
    Test_Utils::writeSynthetic(file.name(), smallLayout());

    SEGYReader reader;
    ASSERT_TRUE(reader.open(file.name()));

    const SampleStatistics sampled = reader.statistics();
    const SampleStatistics full    = reader.statistics(reader.loadAllData());
    ASSERT_EQ(sampled.count, 25 * 60);
    ASSERT_DOUBLE_EQ(sampled.mean, full.mean);
    ASSERT_DOUBLE_EQ(sampled.median, full.median);

    const SampleStatistics few = reader.statistics(5);
    ASSERT_EQ(few.rows, 5);
}
