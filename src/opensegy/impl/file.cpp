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

#include "file.h"
#include "mtguard.h"
#include "logger.h"
#include "../exception.h"

#include <algorithm>
#include <vector>
#include <string>
#include <memory>
#include <sstream>
#include <mutex>
#include <omp.h>

namespace InternalSEGY {
#if 0
}
#endif

using OpenSEGY::Errors::SegyUserError;
using OpenSEGY::Errors::SegyEndOfFile;
using OpenSEGY::Errors::SegyInternalError;

IFileADT::~IFileADT()
{
}

/////////////////////////////////////////////////////////////////////////////
//    FileFactory   /////////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

FileFactory::FileFactory()
  : _registry()
  , _mutex()
{
}

/**
 * Function local so it exists before the first static registration.
 */
FileFactory&
FileFactory::instance()
{
  static FileFactory _instance;
  return _instance;
}

void
FileFactory::add_factory(const factory_t& factory)
{
  std::lock_guard<std::mutex> lk(_mutex);
  _registry.push_back(factory);
}

/**
 * Ask each backend in registration order. The lock is released
 * before any file is opened.
 */
std::shared_ptr<IFileADT>
FileFactory::create(const std::string& filename, OpenMode mode, const OpenSEGY::IOContext *iocontext)
{
  std::vector<factory_t> candidates;
  {
    std::lock_guard<std::mutex> lk(_mutex);
    candidates = _registry;
  }
  for (const factory_t& factory : candidates) {
    std::shared_ptr<IFileADT> file = factory(filename, mode, iocontext);
    if (file)
      return file;
  }
  throw SegyUserError("No backend can open \"" + filename + "\".");
}

/////////////////////////////////////////////////////////////////////////////
//    FileCommon   //////////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////

FileCommon::FileCommon(const std::string& filename, OpenMode mode, const LoggerFn& logger)
  : _mode(mode)
  , _name(filename)
  , _eof(0)
  , _eof_mutex()
  , _logger(logger ? logger : LoggerBase::emptyCallback())
{
}

std::int64_t
FileCommon::xx_eof() const
{
  std::lock_guard<std::mutex> lk(_eof_mutex);
  return _eof;
}

/**
 * Record that the file now extends at least to "end".
 */
void
FileCommon::_grow(std::int64_t end)
{
  std::lock_guard<std::mutex> lk(_eof_mutex);
  _eof = std::max(_eof, end);
}

/**
 * Sequential unless parallel_ok is set and there is more than one
 * region. Each worker thread reuses its own scratch buffer.
 */
void
FileCommon::xx_readv(const ReadList& requests, bool parallel_ok, UsageHint usagehint)
{
  for (const ReadRequest& rr : requests)
    _check_read(&rr, rr.offset, rr.size);

  const std::int64_t count = static_cast<std::int64_t>(requests.size());
  if (!parallel_ok || count < 2) {
    std::vector<char> buffer;
    for (const ReadRequest& rr : requests) {
      buffer.resize(static_cast<std::size_t>(rr.size));
      xx_read(buffer.data(), rr.offset, rr.size, usagehint);
      if (rr.delivery)
        rr.delivery(buffer.data(), rr.size);
    }
    return;
  }

  const int threads = static_cast<int>
    (std::min(count, static_cast<std::int64_t>(omp_get_max_threads())));
  MTGuard guard("readv");
#pragma omp parallel num_threads(threads)
  {
    std::vector<char> buffer;
#pragma omp for
    for (std::int64_t ii = 0; ii < count; ++ii) {
      const ReadRequest& rr = requests[ii];
      guard.run([&](){
        buffer.resize(static_cast<std::size_t>(rr.size));
        xx_read(buffer.data(), rr.offset, rr.size, usagehint);
        if (rr.delivery)
          rr.delivery(buffer.data(), rr.size);
      });
    }
  }
  guard.finished();
}

void
FileCommon::_check_read(const void *data, std::int64_t offset, std::int64_t size) const
{
  if (_mode == OpenMode::Closed)
    throw SegyUserError(_name + ": Reading from a closed file.");
  if (data == nullptr)
    throw SegyUserError(_name + ": Read into a null buffer.");
  if (offset < 0 || size < 1)
    throw SegyUserError(_name + ": Invalid read of " + std::to_string(size) +
                        " bytes at offset " + std::to_string(offset) + ".");
  const std::int64_t eof = xx_eof();
  if (offset + size > eof)
    throw SegyEndOfFile(_name + ": Reading " + _bytes(size) + " at " + _bytes(offset) +
                        " goes past the end of the file at " + _bytes(eof) + ".");
}

void
FileCommon::_check_write(const void *data, std::int64_t offset, std::int64_t size) const
{
  if (_mode != OpenMode::ReadWrite && _mode != OpenMode::Truncate)
    throw SegyUserError(_name + ": The file is not open for writing.");
  if (data == nullptr || offset < 0 || size < 1)
    throw SegyUserError(_name + ": Invalid write of " + std::to_string(size) +
                        " bytes at offset " + std::to_string(offset) + ".");
}

/**
 * A read returned fewer bytes than requested even though the request
 * was inside the known file size. Usually another process truncated
 * the file.
 */
void
FileCommon::_check_short_read(std::int64_t offset, std::int64_t size, std::int64_t got) const
{
  if (got == size)
    return;
  const std::string what = _name + ": Read of " + _bytes(size) + " at " + _bytes(offset);
  if (got > size)
    throw SegyInternalError(what + " returned " + _bytes(got) + ".");
  const std::int64_t actual = _size_on_disk();
  if (actual >= 0 && actual < xx_eof())
    throw SegyEndOfFile(what + " failed, the file shrank from " +
                        _bytes(xx_eof()) + " to " + _bytes(actual) + ".");
  throw SegyEndOfFile(what + " returned only " + _bytes(got) + ".");
}

/**
 * Debug trace of a single access. Callers check _logger(3) first.
 */
void
FileCommon::_log_access(const char *op, std::int64_t offset, std::int64_t size, UsageHint usagehint) const
{
  LoggerBase::logger(_logger, 3, std::stringstream()
                     << _name << ": " << op << " " << _bytes(size)
                     << " at " << offset << " (" << _usage_name(usagehint) << ")");
}

std::int64_t
FileCommon::_size_on_disk() const
{
  return -1;
}

std::string
FileCommon::_bytes(std::int64_t n)
{
  std::stringstream ss;
  if (n >= 1024*1024 && n % (1024*1024) == 0)
    ss << n / (1024*1024) << " MB";
  else if (n >= 1024 && n % 1024 == 0)
    ss << n / 1024 << " KB";
  else
    ss << n << " bytes";
  return ss.str();
}

const char*
FileCommon::_usage_name(UsageHint usagehint)
{
  switch (usagehint) {
  case UsageHint::Header:      return "Header";
  case UsageHint::TraceHeader: return "TraceHeader";
  case UsageHint::Data:        return "Data";
  case UsageHint::Unknown:
  default:                     return "Unknown";
  }
}

} // namespace
