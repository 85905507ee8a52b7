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

/**
 * \file: file.h
 * \brief Byte level access to a SEG-Y file.
 *
 * The reader and writer never seek. Each request carries an absolute
 * offset, so one open file can serve several threads at once.
 *
 * \code{.unparsed}
 *     IFileADT        interface used by the rest of the library
 *         |
 *     FileCommon      argument checks, size bookkeeping, scatter reads
 *         |
 *     LocalFileLinux  pread/pwrite on a regular file (file_local.cpp)
 * \endcode
 *
 * New backends are found through FileFactory and register themselves
 * when the library is loaded.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <memory>
#include <functional>
#include <mutex>

#include "declspec.h"

namespace OpenSEGY {
  class IOContext;
}

namespace InternalSEGY {
#if 0
}
#endif

enum class OpenMode
{
  Closed = 0,
  ReadOnly,
  ReadWrite,  /**< Existing file, update in place. */
  Truncate,   /**< Create or empty the file, then read/write. */
};

/**
 * What part of the SEG-Y file a request touches. Backends log it
 * with each access at priority 3.
 */
enum class UsageHint
{
  Unknown     = 0x00,
  Header      = 0x10,  /**< Textual or binary file header. */
  TraceHeader = 0x20,
  Data        = 0x40,  /**< Trace samples. */
};

/**
 * One region of a scatter read. The buffer passed to "delivery" is
 * owned by the file and only valid during the callback.
 */
class ReadRequest
{
public:
  typedef std::function<void(const void*, std::int64_t)> delivery_t;
  std::int64_t offset;
  std::int64_t size;
  delivery_t delivery;
  ReadRequest(std::int64_t offset_in, std::int64_t size_in, const delivery_t& delivery_in)
    : offset(offset_in)
    , size(size_in)
    , delivery(delivery_in)
  {
  }
};

typedef std::vector<ReadRequest> ReadList;

/**
 * \brief What the SEG-Y layers need from an open file.
 *
 * The xx_ prefix marks calls made through this interface.
 *
 * Thread safety: xx_read, xx_readv and xx_eof may run concurrently.
 * xx_write keeps xx_eof consistent but the caller must not write the
 * same region from two threads. xx_close must run alone.
 */
class OPENSEGY_TEST_API IFileADT
{
public:
  virtual ~IFileADT();

  /** Read exactly "size" bytes or throw. */
  virtual void xx_read(void *data, std::int64_t offset, std::int64_t size, UsageHint usagehint=UsageHint::Unknown) = 0;

  /**
   * Read every region in the list and hand each one to its delivery
   * functor. With parallel_ok the functors can be invoked from OpenMP
   * worker threads in any order. The first failure is rethrown after
   * all workers have stopped.
   */
  virtual void xx_readv(const ReadList& requests, bool parallel_ok=false, UsageHint usagehint=UsageHint::Unknown) = 0;

  virtual void xx_write(const void* data, std::int64_t offset, std::int64_t size, UsageHint usagehint=UsageHint::Unknown) = 0;

  /** Release the file. A second close raises SegyUserError. */
  virtual void xx_close() = 0;

  /** Size of the file as far as this instance knows. */
  virtual std::int64_t xx_eof() const = 0;
};

/**
 * \brief Locate a backend that can open "filename".
 *
 * Each registered factory is asked in turn and returns an empty
 * pointer if the name is not for it.
 *
 * Thread safety: Yes, the registry is protected by a lock.
 */
class OPENSEGY_TEST_API FileFactory
{
public:
  typedef std::function<std::shared_ptr<IFileADT>(const std::string&, OpenMode, const OpenSEGY::IOContext*)> factory_t;

public:
  std::shared_ptr<IFileADT> create(const std::string& filename, OpenMode mode, const OpenSEGY::IOContext *iocontext);
  void add_factory(const factory_t& factory);
  static FileFactory& instance();

private:
  FileFactory();
  FileFactory(const FileFactory&) = delete;
  FileFactory& operator=(const FileFactory&) = delete;

private:
  std::vector<factory_t> _registry;
  std::mutex _mutex;
};

/**
 * \brief Bookkeeping shared by the concrete backends.
 *
 * Keeps the open mode, the name used in error messages and the
 * file size. Implements xx_readv on top of xx_read so a backend
 * only needs the single region calls.
 */
class OPENSEGY_TEST_API FileCommon : public IFileADT
{
public:
  typedef std::function<bool(int, const std::string&)> LoggerFn;

protected:
  OpenMode _mode;      // Changed only by xx_close().
  std::string _name;
  std::int64_t _eof;   // Protected by _eof_mutex.
  mutable std::mutex _eof_mutex;
  LoggerFn _logger;    // Must be thread safe, reads log from worker threads.

public:
  FileCommon(const std::string& filename, OpenMode mode, const LoggerFn& logger);
  std::int64_t xx_eof() const override;
  void xx_readv(const ReadList& requests, bool parallel_ok=false, UsageHint usagehint=UsageHint::Unknown) override;

protected:
  void _grow(std::int64_t end);
  void _check_read(const void *data, std::int64_t offset, std::int64_t size) const;
  void _check_write(const void *data, std::int64_t offset, std::int64_t size) const;
  void _check_short_read(std::int64_t offset, std::int64_t size, std::int64_t got) const;
  void _log_access(const char *op, std::int64_t offset, std::int64_t size, UsageHint usagehint) const;
  /** Size according to the operating system, -1 if unknown. */
  virtual std::int64_t _size_on_disk() const;
  static std::string _bytes(std::int64_t n);
  static const char* _usage_name(UsageHint usagehint);
};

} // namespace
