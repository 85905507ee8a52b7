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

#include "chunkexport.h"
#include "exception.h"
#include "impl/file.h"
#include "impl/mtguard.h"
#include "impl/structaccess.h"
#include "impl/logger.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <sstream>
#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <omp.h>

using InternalSEGY::OpenMode;
using InternalSEGY::UsageHint;

namespace OpenSEGY {
#if 0
}
#endif

namespace {
  /**
   * Create path and any missing parents, like "mkdir -p".
   */
  void makeDirectories(const std::string& path)
  {
    if (path.empty())
      return;
    std::size_t pos = 0;
    do {
      pos = path.find('/', pos + 1);
      const std::string partial = path.substr(0, pos);
      if (::mkdir(partial.c_str(), 0777) != 0 && errno != EEXIST)
        throw Errors::SegyIoError(partial, errno);
    } while (pos != std::string::npos);
    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
      throw Errors::SegyIoError(path, errno);
    if (!S_ISDIR(st.st_mode))
      throw Errors::SegyIoError(path, ENOTDIR);
  }

  /**
   * Shortest representation that reads back as the same double,
   * always with a decimal point or an exponent.
   */
  std::string jsonNumber(double value)
  {
    if (!std::isfinite(value))
      return "null";
    char buf[64]{0};
    // Positional notation in the same range as Python's repr().
    const bool plain = value == 0 || (std::fabs(value) >= 1e-4 && std::fabs(value) < 1e16);
    for (int precision = 1; precision <= 17; ++precision) {
      std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
      if (plain && std::strchr(buf, 'e') != nullptr)
        continue;
      if (std::strtod(buf, nullptr) == value)
        break;
    }
    std::string result(buf);
    if (result.find_first_of(".e") == std::string::npos)
      result += ".0";
    return result;
  }

  std::string jsonString(const std::string& value)
  {
    std::stringstream ss;
    ss << '"';
    for (char ch : value) {
      switch (ch) {
      case '"':  ss << "\\\""; break;
      case '\\': ss << "\\\\"; break;
      case '\n': ss << "\\n"; break;
      case '\r': ss << "\\r"; break;
      case '\t': ss << "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
          ss << buf;
        }
        else {
          ss << ch;
        }
      }
    }
    ss << '"';
    return ss.str();
  }

  std::string withThousands(std::int64_t value)
  {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string result;
    for (std::size_t ii = 0; ii < digits.size(); ++ii) {
      if (ii != 0 && (digits.size() - ii) % 3 == 0)
        result += ',';
      result += digits[ii];
    }
    return value < 0 ? "-" + result : result;
  }

  std::string joinPath(const std::string& dir, const std::string& name)
  {
    if (dir.empty())
      return name;
    if (dir[dir.size()-1] == '/')
      return dir + name;
    return dir + "/" + name;
  }

  std::string chunkBaseName(const std::string& prefix, std::int64_t number)
  {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "_%04lld", static_cast<long long>(number));
    return prefix + buf;
  }
}

ChunkExporter::ChunkExporter(const GridPartitioner& grid,
                             const std::string& outdir,
                             const std::string& prefix,
                             const std::string& source_file,
                             const LoggerFn& logger)
  : _grid(grid)
  , _outdir(outdir)
  , _prefix(prefix)
  , _source(source_file)
  , _logger(logger ? logger :
            InternalSEGY::LoggerBase::standardCallback
            (InternalSEGY::LoggerBase::getVerboseFromEnv("OPENSEGY_VERBOSE"),
             "opensegy-export: ", ""))
{
  if (_prefix.empty())
    throw Errors::SegyInvalidArgument("Chunk file prefix cannot be empty.");
}

std::string
ChunkExporter::npyName(const ChunkDescriptor& desc) const
{
  return joinPath(_outdir, chunkBaseName(_prefix, desc.chunk_number) + ".npy");
}

std::string
ChunkExporter::metadataName(const ChunkDescriptor& desc) const
{
  return joinPath(_outdir, chunkBaseName(_prefix, desc.chunk_number) + "_metadata.json");
}

void
ChunkExporter::exportChunk(const ChunkDescriptor& desc) const
{
  const ChunkData data = _grid.extract(desc);
  makeDirectories(_outdir);
  const std::vector<char> npy = npyBytes(data);
  _writeFile(npyName(desc), npy.data(), static_cast<std::int64_t>(npy.size()));
  const std::string meta = metadataJson(desc, _source);
  _writeFile(metadataName(desc), meta.data(), static_cast<std::int64_t>(meta.size()));
  if (_logger(2, ""))
    InternalSEGY::LoggerBase::logger(_logger, 2, std::stringstream()
                                     << "Wrote " << desc << " to " << npyName(desc));
}

void
ChunkExporter::exportAll(const std::vector<ChunkDescriptor>& chunks,
                         int threads,
                         const ProgressFn& progress) const
{
  if (threads < 0)
    throw Errors::SegyInvalidArgument("Thread count cannot be negative.");
  makeDirectories(_outdir);
  const std::int64_t total = static_cast<std::int64_t>(chunks.size());
  if (progress && !progress(0, total))
    throw Errors::SegyAborted("Chunk export was aborted.");
  if (total == 0)
    return;

  const int threadcount = static_cast<int>
    (std::min(total, static_cast<std::int64_t>(threads > 0 ? threads : omp_get_max_threads())));
  InternalSEGY::LoggerBase::logger
    (_logger, 1, std::stringstream()
     << "Exporting " << total << " chunks to \"" << _outdir
     << "\" using " << threadcount << " threads");

  InternalSEGY::MTGuardWithProgress guard(progress, total, "export");
#pragma omp parallel for num_threads(threadcount) schedule(dynamic)
  for (std::int64_t ii = 0; ii < total; ++ii) {
    guard.run([&](){
      exportChunk(chunks[ii]);
      guard.progress();
    });
  }
  guard.finished();
}

std::string
ChunkExporter::npyHeader(std::int64_t rows, std::int64_t cols)
{
  if (rows < 0 || cols < 0)
    throw Errors::SegyInvalidArgument("Array shape cannot be negative.");
  std::string dict =
    "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
    std::to_string(rows) + ", " + std::to_string(cols) + "), }";
  // magic(6) + version(2) + length(2) + dict + padding + '\n'
  const std::size_t unpadded = 10 + dict.size() + 1;
  const std::size_t padding = (64 - unpadded % 64) % 64;
  dict += std::string(padding, ' ') + "\n";
  if (dict.size() > 0xffff)
    throw Errors::SegyInternalError("NumPy header too long.");

  std::string result("\x93NUMPY\x01\x00", 8);
  result += static_cast<char>(dict.size() & 0xff);
  result += static_cast<char>((dict.size() >> 8) & 0xff);
  result += dict;
  return result;
}

std::vector<char>
ChunkExporter::npyBytes(const ChunkData& data)
{
  const std::string header = npyHeader(data.rows(), data.cols());
  const std::size_t nbytes = static_cast<std::size_t>(data.size()) * sizeof(float);
  std::vector<char> result(header.size() + nbytes);
  std::memcpy(result.data(), header.data(), header.size());
  if (nbytes != 0) {
    float* out = reinterpret_cast<float*>(result.data() + header.size());
    std::memcpy(out, data.data(), nbytes);
#if BIG_ENDIAN_ARCH
    InternalSEGY::byteswapAlways(out, static_cast<std::size_t>(data.size()));
#endif
  }
  return result;
}

std::string
ChunkExporter::metadataJson(const ChunkDescriptor& desc, const std::string& source_file)
{
  std::stringstream ss;
  ss << "{\n"
     << "  \"chunk_id\": [\n"
     << "    " << desc.chunk_id[0] << ",\n"
     << "    " << desc.chunk_id[1] << "\n"
     << "  ],\n"
     << "  \"chunk_number\": " << desc.chunk_number << ",\n"
     << "  \"trace_range\": [\n"
     << "    " << desc.trace_range.first << ",\n"
     << "    " << desc.trace_range.second << "\n"
     << "  ],\n"
     << "  \"sample_range\": [\n"
     << "    " << desc.sample_range.first << ",\n"
     << "    " << desc.sample_range.second << "\n"
     << "  ],\n"
     << "  \"time_range_ms\": [\n"
     << "    " << jsonNumber(desc.time_range_ms.first) << ",\n"
     << "    " << jsonNumber(desc.time_range_ms.second) << "\n"
     << "  ],\n"
     << "  \"shape\": [\n"
     << "    " << desc.num_traces() << ",\n"
     << "    " << desc.num_samples() << "\n"
     << "  ],\n"
     << "  \"source_file\": " << jsonString(source_file) << "\n"
     << "}";
  return ss.str();
}

std::string
ChunkExporter::divisionSummary(const GridPartitioner& grid,
                               const std::vector<ChunkDescriptor>& chunks,
                               const std::string& source_file,
                               std::size_t shown)
{
  std::stringstream ss;
  char buf[256];
  const std::string rule(80, '=');
  ss << rule << "\n"
     << "DATA DIVISION INFORMATION\n"
     << rule << "\n"
     << "Source file: " << source_file << "\n"
     << "Total traces: " << withThousands(grid.tracecount()) << "\n"
     << "Samples per trace: " << withThousands(grid.samples()) << "\n";
  std::snprintf(buf, sizeof(buf), "Sample interval: %.3f ms\n", grid.sampleinterval_ms());
  ss << buf
     << "\nTotal chunks: " << chunks.size() << "\n"
     << "\nFirst " << shown << " chunks:\n"
     << std::string(80, '-') << "\n";
  for (std::size_t ii = 0; ii < chunks.size() && ii < shown; ++ii) {
    const ChunkDescriptor& c = chunks[ii];
    std::snprintf(buf, sizeof(buf),
                  "Chunk #%04lld | Traces: [%5lld - %5lld] (%4lld traces) | "
                  "Samples: [%5lld - %5lld] (%4lld samples) | "
                  "Time: [%7.2f - %7.2f] ms\n",
                  (long long)c.chunk_number,
                  (long long)c.trace_range.first, (long long)c.trace_range.second,
                  (long long)c.num_traces(),
                  (long long)c.sample_range.first, (long long)c.sample_range.second,
                  (long long)c.num_samples(),
                  c.time_range_ms.first, c.time_range_ms.second);
    ss << buf;
  }
  if (chunks.size() > shown)
    ss << "... (" << (chunks.size() - shown) << " more chunks)\n";
  ss << rule << "\n";
  return ss.str();
}

void
ChunkExporter::_writeFile(const std::string& name, const void* data, std::int64_t size) const
{
  std::shared_ptr<InternalSEGY::IFileADT> fd =
    InternalSEGY::FileFactory::instance().create(name, OpenMode::Truncate, nullptr);
  fd->xx_write(data, 0, size, UsageHint::Data);
  fd->xx_close();
}

} // namespace
