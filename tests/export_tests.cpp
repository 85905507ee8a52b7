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

#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "opensegy/api.h"
#include "opensegy/chunkexport.h"
#include "opensegy/exception.h"
#include "opensegy/partition.h"
#include "test_utils.h"

using namespace OpenSEGY;
using namespace OpenSEGY::Errors;
using Test_Utils::LocalDirAutoDelete;
using Test_Utils::LocalFileAutoDelete;
using Test_Utils::SyntheticLayout;

namespace
{
    bool silent(int, const std::string&)
    {
        return false;
    }

    std::shared_ptr<GridPartitioner> openGrid(const std::string& filename, const SyntheticLayout& layout)
    {
        Test_Utils::writeSynthetic(filename, layout);
        return std::make_shared<GridPartitioner>(ISegyReader::open(filename), silent);
    }

    std::int64_t headerLength(const std::string& npy)
    {
        return 10 + (static_cast<unsigned char>(npy[8]) | (static_cast<unsigned char>(npy[9]) << 8));
    }
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testNpyHeader)
{
    const std::string header = ChunkExporter::npyHeader(3, 5);
    ASSERT_EQ(header.size() % 64, 0u);
    ASSERT_EQ(std::string(header.data(), 8), std::string("\x93NUMPY\x01\x00", 8));
    ASSERT_EQ(headerLength(header), static_cast<std::int64_t>(header.size()));
    ASSERT_EQ(header.back(), '\n');
    ASSERT_NE(header.find("{'descr': '<f4', 'fortran_order': False, 'shape': (3, 5), }"), std::string::npos);

    const std::string wide = ChunkExporter::npyHeader(123456789, 98765);
    ASSERT_EQ(wide.size() % 64, 0u);
    ASSERT_NE(wide.find("'shape': (123456789, 98765)"), std::string::npos);

    ASSERT_THROW(ChunkExporter::npyHeader(-1, 5), SegyInvalidArgument);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testNpyBytes)
{
    ChunkData data(2, 3);
    for (std::int64_t ii = 0; ii < data.size(); ++ii)
    {
        data.data()[ii] = static_cast<float>(ii) - 1.5f;
    }
    const std::vector<char> bytes  = ChunkExporter::npyBytes(data);
    const std::size_t       header = ChunkExporter::npyHeader(2, 3).size();
    ASSERT_EQ(bytes.size(), header + 6 * sizeof(float));

    float second = 0;
    std::memcpy(&second, bytes.data() + header + 4, 4);
    ASSERT_EQ(second, -0.5f);

    // Little endian 1.5f is 00 00 c0 3f.
    ASSERT_EQ(data(1, 0), 1.5f);
    ASSERT_EQ(static_cast<unsigned char>(bytes[header + 3 * 4 + 2]), 0xc0u);
    ASSERT_EQ(static_cast<unsigned char>(bytes[header + 3 * 4 + 3]), 0x3fu);

    const std::vector<char> empty = ChunkExporter::npyBytes(ChunkData());
    ASSERT_EQ(empty.size() % 64, 0u);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testMetadataJson)
{
    ChunkDescriptor desc;
    desc.chunk_id      = { 1, 2 };
    desc.chunk_number  = 7;
    desc.trace_range   = IndexRange(100, 137);
    desc.sample_range  = IndexRange(250, 300);
    desc.time_range_ms = std::make_pair(500.0, 600.0);

    const std::string expect =
        "{\n"
        "  \"chunk_id\": [\n"
        "    1,\n"
        "    2\n"
        "  ],\n"
        "  \"chunk_number\": 7,\n"
        "  \"trace_range\": [\n"
        "    100,\n"
        "    137\n"
        "  ],\n"
        "  \"sample_range\": [\n"
        "    250,\n"
        "    300\n"
        "  ],\n"
        "  \"time_range_ms\": [\n"
        "    500.0,\n"
        "    600.0\n"
        "  ],\n"
        "  \"shape\": [\n"
        "    37,\n"
        "    50\n"
        "  ],\n"
        "  \"source_file\": \"data/line \\\"7\\\".sgy\"\n"
        "}";
    ASSERT_EQ(ChunkExporter::metadataJson(desc, "data/line \"7\".sgy"), expect);

    desc.time_range_ms = std::make_pair(0.1, 2.5);
    const std::string fractional = ChunkExporter::metadataJson(desc, "");
    ASSERT_NE(fractional.find("    0.1,\n    2.5\n"), std::string::npos);
    ASSERT_NE(fractional.find("\"source_file\": \"\"\n"), std::string::npos);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testFileNames)
{
    const GridPartitioner grid(10, 10, 1.0, silent);
    ChunkDescriptor       desc = grid.describe(IndexRange(0, 5), IndexRange(0, 5));
    desc.chunk_number          = 42;

    const ChunkExporter plain(grid, "out", "chunk", "", silent);
    ASSERT_EQ(plain.npyName(desc), "out/chunk_0042.npy");
    ASSERT_EQ(plain.metadataName(desc), "out/chunk_0042_metadata.json");

    const ChunkExporter slash(grid, "/tmp/x/", "part", "", silent);
    desc.chunk_number = 12345;
    ASSERT_EQ(slash.npyName(desc), "/tmp/x/part_12345.npy");

    ASSERT_THROW(ChunkExporter(grid, "out", "", "", silent), SegyInvalidArgument);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testExportChunk)
{
    LocalFileAutoDelete file(".sgy");
    LocalDirAutoDelete  dir;
    SyntheticLayout     layout;
    layout.traces  = 12;
    layout.samples = 20;
    auto grid      = openGrid(file.name(), layout);

    const std::vector<ChunkDescriptor> chunks = grid->partitionGrid(5, 20.0);
    ASSERT_EQ(chunks.size(), 3u * 2u);

    // Output directory is created including missing parents.
    const std::string   outdir = dir.name() + "/nested/deeper";
    const ChunkExporter exporter(*grid, outdir, "chunk", file.name(), silent);
    const ChunkDescriptor& last = chunks.back();
    exporter.exportChunk(last);

    const std::string npy = Test_Utils::readFile(exporter.npyName(last));
    const std::int64_t hlen = headerLength(npy);
    ASSERT_EQ(hlen % 64, 0);
    ASSERT_EQ(static_cast<std::int64_t>(npy.size()), hlen + last.num_traces() * last.num_samples() * 4);
    ASSERT_NE(npy.find("'shape': (2, 10)"), std::string::npos);

    const ChunkData expect = grid->extract(last);
    float first = 0;
    std::memcpy(&first, npy.data() + hlen, sizeof(float));
    ASSERT_EQ(first, expect(0, 0));
    ASSERT_EQ(first, static_cast<float>(Test_Utils::syntheticValue(10, 10, layout.format)));

    const std::string json = Test_Utils::readFile(exporter.metadataName(last));
    ASSERT_EQ(json, ChunkExporter::metadataJson(last, file.name()));

    // Existing files are overwritten.
    exporter.exportChunk(last);
    ASSERT_EQ(Test_Utils::readFile(exporter.npyName(last)), npy);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testExportAll)
{
    LocalFileAutoDelete file(".sgy");
    LocalDirAutoDelete  dir;
    SyntheticLayout     layout;
    layout.traces  = 30;
    layout.samples = 40;
    auto grid      = openGrid(file.name(), layout);

    const std::vector<ChunkDescriptor> chunks = grid->partitionGrid(7, 20.0);
    ASSERT_EQ(chunks.size(), 5u * 4u);

    const ChunkExporter       exporter(*grid, dir.name(), "grid", "", silent);
    std::vector<std::int64_t> seen;
    exporter.exportAll(chunks, 4, [&seen](std::int64_t done, std::int64_t total) {
        EXPECT_EQ(total, 20);
        seen.push_back(done);
        return true;
    });

    // Only one worker thread reports, so steps may be skipped, but the
    // sequence always starts at 0, increases and ends at the total.
    ASSERT_GE(seen.size(), 2u);
    ASSERT_LE(seen.size(), 21u);
    ASSERT_EQ(seen.front(), 0);
    ASSERT_EQ(seen.back(), 20);
    for (std::size_t ii = 1; ii < seen.size(); ++ii)
    {
        ASSERT_GT(seen[ii], seen[ii - 1]);
    }
    for (const ChunkDescriptor& desc : chunks)
    {
        const std::string npy = Test_Utils::readFile(exporter.npyName(desc));
        ASSERT_EQ(static_cast<std::int64_t>(npy.size()),
                  headerLength(npy) + desc.num_traces() * desc.num_samples() * 4);
        ASSERT_GT(Test_Utils::fileSize(exporter.metadataName(desc)), 0);
    }

    ASSERT_THROW(exporter.exportAll(chunks, -1), SegyInvalidArgument);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testExportAbort)
{
    LocalFileAutoDelete file(".sgy");
    LocalDirAutoDelete  dir;
    SyntheticLayout     layout;
    layout.traces  = 20;
    layout.samples = 10;
    auto grid      = openGrid(file.name(), layout);

    const std::vector<ChunkDescriptor> chunks = grid->partitionGrid(2, 1000.0);
    ASSERT_EQ(chunks.size(), 10u);

    const ChunkExporter exporter(*grid, dir.name(), "chunk", "", silent);
    std::atomic<int>    calls(0);
    ASSERT_THROW(exporter.exportAll(chunks, 2, [&calls](std::int64_t done, std::int64_t) {
        ++calls;
        return done < 3;
    }),
                 SegyAborted);
    ASSERT_LT(calls.load(), 11);

    ASSERT_THROW(exporter.exportAll(chunks, 1, [](std::int64_t, std::int64_t) { return false; }), SegyAborted);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
TEST(export_tests, testDivisionSummary)
{
    const GridPartitioner              grid(1234, 250, 2.0, silent);
    const std::vector<ChunkDescriptor> chunks = grid.partitionGrid(100, 100.0);
    ASSERT_EQ(chunks.size(), 13u * 5u);

    const std::string text = ChunkExporter::divisionSummary(grid, chunks, "survey.sgy");
    ASSERT_NE(text.find("DATA DIVISION INFORMATION"), std::string::npos);
    ASSERT_NE(text.find("Source file: survey.sgy\n"), std::string::npos);
    ASSERT_NE(text.find("Total traces: 1,234\n"), std::string::npos);
    ASSERT_NE(text.find("Samples per trace: 250\n"), std::string::npos);
    ASSERT_NE(text.find("Sample interval: 2.000 ms\n"), std::string::npos);
    ASSERT_NE(text.find("Total chunks: 65\n"), std::string::npos);
    ASSERT_NE(text.find("Chunk #0000 | Traces: [    0 -   100] ( 100 traces) | "
                        "Samples: [    0 -    50] (  50 samples) | "
                        "Time: [   0.00 -  100.00] ms\n"),
              std::string::npos);
    ASSERT_NE(text.find("Chunk #0004 |"), std::string::npos);
    ASSERT_EQ(text.find("Chunk #0005 |"), std::string::npos);
    ASSERT_NE(text.find("... (60 more chunks)\n"), std::string::npos);

    const std::string all = ChunkExporter::divisionSummary(grid, chunks, "survey.sgy", 100);
    ASSERT_NE(all.find("Chunk #0064 | Traces: [ 1200 -  1234] (  34 traces)"), std::string::npos);
    ASSERT_EQ(all.find("more chunks"), std::string::npos);
}
