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

#pragma once

#include <string>
#include <vector>
#include <utility>
#include <memory>
#include <cstdint>

#include "opensegy/api.h"
#include "opensegy/partition.h"
#include "opensegy/statistics.h"

namespace SEGYAccess
{

    //==================================================================================================
    /// Convenience front end for applications that only need to load and tile a SEG-Y file.
    ///
    /// open() reports failure by returning false, the reason is available from lastError().
    /// Every other method throws OpenSEGY::Errors::SegyClosedError if no file is open, and
    /// passes on the exceptions of the underlying reader.
    ///
    /// An end index of -1 means "to the end" of the trace or sample axis.
    /// Other negative end indices are rejected.
    //==================================================================================================
    class SEGYReader
    {
    public:
        SEGYReader();
        ~SEGYReader();

        bool open(std::string filename);
        void close();
        bool isOpen() const;
        std::string lastError() const;

        std::vector<std::pair<std::string, std::string>> metaData();

        OpenSEGY::FileInfo fileInfo() const;
        std::string        textHeader() const;
        OpenSEGY::TraceHeader traceHeader(std::int64_t traceIndex) const;

        std::int64_t totalTraces() const;
        int          samplesPerTrace() const;
        double       sampleInterval() const;

        std::vector<double>   loadTrace(std::int64_t traceIndex) const;
        OpenSEGY::TraceMatrix loadTraces(std::int64_t startTrace = 0, std::int64_t endTrace = -1) const;
        OpenSEGY::TraceMatrix loadAllData() const;
        OpenSEGY::ChunkData   loadDepthSlice(std::int64_t startSample = 0, std::int64_t endSample = -1,
                                             std::int64_t startTrace = 0, std::int64_t endTrace = -1) const;

        std::vector<double>       timeAxis(std::int64_t startSample = 0, std::int64_t endSample = -1) const;
        std::vector<std::int64_t> traceAxis(std::int64_t startTrace = 0, std::int64_t endTrace = -1) const;

        std::vector<OpenSEGY::IndexRange>      divideByTraces(std::int64_t tracesPerChunk) const;
        std::vector<OpenSEGY::IndexRange>      divideByDepth(double depthIntervalMs) const;
        std::vector<OpenSEGY::ChunkDescriptor> divideByGrid(std::int64_t tracesPerChunk = 100,
                                                            double       depthIntervalMs = 500.0) const;
        OpenSEGY::ChunkData extractChunk(const OpenSEGY::IndexRange& traceRange,
                                         const OpenSEGY::IndexRange& sampleRange) const;

        void        saveChunks(const std::vector<OpenSEGY::ChunkDescriptor>& chunks,
                               const std::string&                            outputDir,
                               const std::string&                            prefix  = "chunk",
                               int                                           threads = 1) const;
        std::string divisionInfo(const std::vector<OpenSEGY::ChunkDescriptor>& chunks) const;

        OpenSEGY::SampleStatistics statistics(std::int64_t maxSampleTraces = 1000) const;
        OpenSEGY::SampleStatistics statistics(const OpenSEGY::TraceMatrix& data) const;

    private:
        const OpenSEGY::ISegyReader& reader() const;
        std::int64_t                 traceEnd(std::int64_t endTrace) const;
        std::int64_t                 sampleEnd(std::int64_t endSample) const;

    private:
        std::string                             m_filename;
        std::string                             m_lastError;
        std::shared_ptr<OpenSEGY::ISegyReader>  m_reader;
        std::shared_ptr<OpenSEGY::GridPartitioner> m_grid;
    };

}
