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
#include "partition.h"

#include <cstdint>
#include <string>
#include <vector>
#include <functional>

/**
 * \file chunkexport.h
 * \brief Write chunks as NumPy arrays with a JSON metadata record.
 */

namespace OpenSEGY {
#if 0
}
#endif

/**
 * \brief Persist the chunks of a GridPartitioner.
 *
 * Chunk number N becomes two files in the output directory:
 * \li prefix_NNNN.npy, NumPy format 1.0, little endian float32,
 *     C order, shape (traces, samples).
 * \li prefix_NNNN_metadata.json with chunk_id, chunk_number,
 *     trace_range, sample_range, time_range_ms, shape, source_file.
 *
 * Existing files are overwritten. The output directory and its
 * parents are created if needed.
 *
 * Thread safety: exportAll() parallelizes internally. The other
 * methods may be called concurrently for different chunks.
 */
class OPENSEGY_API ChunkExporter
{
public:
  typedef std::function<bool(int, const std::string&)> LoggerFn;
  typedef std::function<bool(std::int64_t, std::int64_t)> ProgressFn;

private:
  GridPartitioner _grid;
  std::string     _outdir;
  std::string     _prefix;
  std::string     _source;
  LoggerFn        _logger;

public:
  ChunkExporter(const GridPartitioner& grid,
                const std::string& outdir,
                const std::string& prefix = "chunk",
                const std::string& source_file = std::string(),
                const LoggerFn& logger = LoggerFn());

  /** \brief Full path of the array file for this chunk. */
  std::string npyName(const ChunkDescriptor& desc) const;
  /** \brief Full path of the metadata file for this chunk. */
  std::string metadataName(const ChunkDescriptor& desc) const;

  /**
   * \brief Extract and write a single chunk.
   */
  void exportChunk(const ChunkDescriptor& desc) const;

  /**
   * \brief Extract and write every chunk in the list.
   *
   * \param threads  Number of OpenMP threads, 0 for the OpenMP default.
   * \param progress Called with (done, total) after each chunk.
   *                 Returning false stops the export with
   *                 Errors::SegyAborted.
   */
  void exportAll(const std::vector<ChunkDescriptor>& chunks,
                 int threads = 1,
                 const ProgressFn& progress = ProgressFn()) const;

  /**
   * \brief Bytes of a NumPy 1.0 file for a float32 matrix, excluding data.
   */
  static std::string npyHeader(std::int64_t rows, std::int64_t cols);

  /**
   * \brief Complete NumPy 1.0 file contents for the chunk data.
   */
  static std::vector<char> npyBytes(const ChunkData& data);

  /**
   * \brief Metadata record of one exported chunk.
   */
  static std::string metadataJson(const ChunkDescriptor& desc, const std::string& source_file);

  /**
   * \brief Human readable summary of a chunk list.
   *
   * Shows the grid geometry and the first few chunks.
   */
  static std::string divisionSummary(const GridPartitioner& grid,
                                     const std::vector<ChunkDescriptor>& chunks,
                                     const std::string& source_file,
                                     std::size_t shown = 5);

private:
  void _writeFile(const std::string& name, const void* data, std::int64_t size) const;
};

} // namespace
