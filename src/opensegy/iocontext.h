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

/**
 * \file iocontext.h
 * \brief Options passed when opening a file.
 *
 * Class IOContext and derivatives hold settings that apply to one
 * open file, such as where to log and how tolerant the reader
 * should be.
 */

#pragma once

#include "declspec.h"
#include "exception.h"

#include <cstdint>
#include <string>
#include <functional>
#include <memory>

namespace OpenSEGY {
#if 0
}
#endif

/**
 * \brief Base class for per-file context.
 *
 * \details Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_API IOContext
{
public:
  virtual ~IOContext();
  /** Display the context in a human readable format for debugging. */
  virtual std::string toString() const = 0;
  /** Create an identical deep copy */
  virtual std::shared_ptr<IOContext> clone() const = 0;
};

/**
 * \brief Configuration for SEG-Y files on the local file system.
 *
 * Defaults are taken from OPENSEGY_* environment variables, then
 * from hard coded values. Every setter returns *this so calls can
 * be chained:
 *
 * \code
 *   LocalIOContext ctx;
 *   ctx.allowUnknownFormat(true).largeReadWarningMB(200);
 *   auto reader = ISegyReader::open(name, &ctx);
 * \endcode
 *
 * Thread safety:
 * Modification may lead to a data race. This should not be an issue,
 * because instances are only meant to be modified when created or
 * copied or assigned prior to being made available to others.
 */
class OPENSEGY_API LocalIOContext : public IOContext
{
public:
  typedef std::function<bool(int, const std::string&)> logger_t;
  std::string toString() const override;
  std::shared_ptr<IOContext> clone() const override;
  LocalIOContext();

private:
  logger_t     _logger;
  bool         _allow_unknown_format;
  std::int64_t _large_read_mb;
  std::int32_t _threads;

public:
  /**
   * Where to send log messages. The default is derived from
   * $OPENSEGY_VERBOSE. An empty functor restores the default.
   */
  LocalIOContext& logger(const logger_t& value)
  {
    this->_logger = value;
    return *this;
  }

  /**
   * Continue opening a file whose sample format code is not one of
   * 1, 2, 3, 5, 8. Headers stay readable and the sample width is
   * assumed to be 4 bytes. Decoding samples still raises
   * SegyUnsupportedFormat. Defaults to $OPENSEGY_ALLOW_UNKNOWN_FORMAT
   * or false.
   */
  LocalIOContext& allowUnknownFormat(bool value)
  {
    this->_allow_unknown_format = value;
    return *this;
  }

  /**
   * Reading the entire file logs a warning when the trace data is
   * larger than this many megabytes. Defaults to
   * $OPENSEGY_LARGE_READ_MB or 1000.
   */
  LocalIOContext& largeReadWarningMB(std::int64_t value)
  {
    if (value < 0)
      throw Errors::SegyInvalidArgument("largeReadWarningMB must not be negative.");
    this->_large_read_mb = value;
    return *this;
  }

  /**
   * Number of threads used when exporting chunks. 1 means
   * sequential and 0 means let OpenMP decide. Defaults to
   * $OPENSEGY_NUMTHREADS or 1.
   */
  LocalIOContext& threads(std::int32_t value)
  {
    if (value < 0)
      throw Errors::SegyInvalidArgument("threads must not be negative.");
    this->_threads = value;
    return *this;
  }

  const logger_t& getLogger() const { return _logger; }
  bool getAllowUnknownFormat() const { return _allow_unknown_format; }
  std::int64_t getLargeReadWarningMB() const { return _large_read_mb; }
  std::int32_t getThreads() const { return _threads; }
};

} // namespace
