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

#include "segyaccess/segyreader.h"
#include "opensegy/exception.h"
#include "opensegy/chunkexport.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace SEGYAccess
{

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
SEGYReader::SEGYReader()
{
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
SEGYReader::~SEGYReader()
{
    close();
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
bool SEGYReader::open(std::string filename)
{
    if (m_reader != nullptr)
    {
        m_lastError = "A file is already open: " + m_filename;
        return false;
    }

    try
    {
        m_reader = OpenSEGY::ISegyReader::open(filename);
        m_grid   = std::make_shared<OpenSEGY::GridPartitioner>(m_reader);
    }
    catch (const std::exception& ex)
    {
        m_lastError = ex.what();
        m_reader    = nullptr;
        m_grid      = nullptr;
        return false;
    }

    m_filename = filename;
    m_lastError.clear();
    return true;
}

//--------------------------------------------------------------------------------------------------
/// Failing to close a read only file loses nothing, the error is kept for lastError().
//--------------------------------------------------------------------------------------------------
void SEGYReader::close()
{
    if (m_reader == nullptr) return;

    m_grid = nullptr;
    try
    {
        m_reader->close();
    }
    catch (const std::exception& ex)
    {
        m_lastError = ex.what();
    }

    m_reader = nullptr;
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
bool SEGYReader::isOpen() const
{
    return m_reader != nullptr;
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::string SEGYReader::lastError() const
{
    return m_lastError;
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<std::pair<std::string, std::string>> SEGYReader::metaData()
{
    std::vector<std::pair<std::string, std::string>> retValues;

    if (m_reader == nullptr) return retValues;

    const OpenSEGY::FileInfo info = m_reader->fileinfo();

    std::stringstream size;
    size << std::fixed << std::setprecision(2) << info.total_data_size_mb << " MBytes";

    retValues.push_back(std::make_pair("File", info.filepath));
    retValues.push_back(std::make_pair("Traces", std::to_string(info.total_traces)));
    retValues.push_back(std::make_pair("Samples per trace", std::to_string(info.samples_per_trace)));
    retValues.push_back(std::make_pair("Sample interval", std::to_string(info.sample_interval_us) + " us"));
    retValues.push_back(std::make_pair("Depth range", "0 to " + std::to_string(info.total_time_depth_ms) + " ms"));
    retValues.push_back(std::make_pair("Sample format", info.data_format));
    retValues.push_back(std::make_pair("Measurement system", info.measurement_system));
    retValues.push_back(std::make_pair("Sample data size", size.str()));

    return retValues;
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
OpenSEGY::FileInfo SEGYReader::fileInfo() const
{
    return reader().fileinfo();
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::string SEGYReader::textHeader() const
{
    return reader().textheaderAscii();
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
OpenSEGY::TraceHeader SEGYReader::traceHeader(std::int64_t traceIndex) const
{
    return reader().traceheader(traceIndex);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::int64_t SEGYReader::totalTraces() const
{
    return reader().tracecount();
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
int SEGYReader::samplesPerTrace() const
{
    return reader().samples();
}

//--------------------------------------------------------------------------------------------------
/// Milliseconds
//--------------------------------------------------------------------------------------------------
double SEGYReader::sampleInterval() const
{
    return reader().sampleinterval_ms();
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<double> SEGYReader::loadTrace(std::int64_t traceIndex) const
{
    return reader().readtrace(traceIndex);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
OpenSEGY::TraceMatrix SEGYReader::loadTraces(std::int64_t startTrace, std::int64_t endTrace) const
{
    return reader().readtraces(startTrace, traceEnd(endTrace));
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
OpenSEGY::TraceMatrix SEGYReader::loadAllData() const
{
    return reader().readall();
}

//--------------------------------------------------------------------------------------------------
/// Samples [startSample, endSample) of traces [startTrace, endTrace).
//--------------------------------------------------------------------------------------------------
OpenSEGY::ChunkData
    SEGYReader::loadDepthSlice(std::int64_t startSample, std::int64_t endSample, std::int64_t startTrace, std::int64_t endTrace) const
{
    const std::int64_t samples = reader().samples();
    endSample                  = sampleEnd(endSample);

    if (startSample < 0 || startSample >= samples)
    {
        throw OpenSEGY::Errors::SegySampleRangeError("Start sample " + std::to_string(startSample) + " is outside [0, " +
                                                     std::to_string(samples) + ").");
    }
    if (endSample <= startSample || endSample > samples)
    {
        throw OpenSEGY::Errors::SegySampleRangeError("End sample " + std::to_string(endSample) + " must be in (" +
                                                     std::to_string(startSample) + ", " + std::to_string(samples) + "].");
    }

    return reader().readwindow(startTrace, traceEnd(endTrace), startSample, endSample);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<double> SEGYReader::timeAxis(std::int64_t startSample, std::int64_t endSample) const
{
    return reader().timeaxis(startSample, sampleEnd(endSample));
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<std::int64_t> SEGYReader::traceAxis(std::int64_t startTrace, std::int64_t endTrace) const
{
    return reader().traceaxis(startTrace, traceEnd(endTrace));
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<OpenSEGY::IndexRange> SEGYReader::divideByTraces(std::int64_t tracesPerChunk) const
{
    reader();
    return m_grid->partitionByTraceCount(tracesPerChunk);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<OpenSEGY::IndexRange> SEGYReader::divideByDepth(double depthIntervalMs) const
{
    reader();
    return m_grid->partitionByDepthInterval(depthIntervalMs);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::vector<OpenSEGY::ChunkDescriptor> SEGYReader::divideByGrid(std::int64_t tracesPerChunk, double depthIntervalMs) const
{
    reader();
    return m_grid->partitionGrid(tracesPerChunk, depthIntervalMs);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
OpenSEGY::ChunkData SEGYReader::extractChunk(const OpenSEGY::IndexRange& traceRange,
                                             const OpenSEGY::IndexRange& sampleRange) const
{
    reader();
    return m_grid->extract(traceRange, sampleRange);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
void SEGYReader::saveChunks(const std::vector<OpenSEGY::ChunkDescriptor>& chunks,
                            const std::string&                            outputDir,
                            const std::string&                            prefix,
                            int                                           threads) const
{
    reader();
    OpenSEGY::ChunkExporter exporter(*m_grid, outputDir, prefix, m_filename);
    exporter.exportAll(chunks, threads);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::string SEGYReader::divisionInfo(const std::vector<OpenSEGY::ChunkDescriptor>& chunks) const
{
    reader();
    return OpenSEGY::ChunkExporter::divisionSummary(*m_grid, chunks, m_filename);
}

//--------------------------------------------------------------------------------------------------
/// Sampled statistics, reading at most maxSampleTraces traces.
//--------------------------------------------------------------------------------------------------
OpenSEGY::SampleStatistics SEGYReader::statistics(std::int64_t maxSampleTraces) const
{
    return OpenSEGY::StatisticsEngine().computeSampled(reader(), maxSampleTraces);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
OpenSEGY::SampleStatistics SEGYReader::statistics(const OpenSEGY::TraceMatrix& data) const
{
    return OpenSEGY::StatisticsEngine().compute(data);
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
const OpenSEGY::ISegyReader& SEGYReader::reader() const
{
    if (m_reader == nullptr)
    {
        throw OpenSEGY::Errors::SegyClosedError("No SEG-Y file is open.");
    }
    return *m_reader;
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::int64_t SEGYReader::traceEnd(std::int64_t endTrace) const
{
    if (endTrace < -1)
    {
        throw OpenSEGY::Errors::SegyIndexOutOfRange("End trace " + std::to_string(endTrace) + " is negative.");
    }
    return endTrace == -1 ? reader().tracecount() : endTrace;
}

//--------------------------------------------------------------------------------------------------
///
//--------------------------------------------------------------------------------------------------
std::int64_t SEGYReader::sampleEnd(std::int64_t endSample) const
{
    if (endSample < -1)
    {
        throw OpenSEGY::Errors::SegySampleRangeError("End sample " + std::to_string(endSample) + " is negative.");
    }
    return endSample == -1 ? reader().samples() : endSample;
}

}
