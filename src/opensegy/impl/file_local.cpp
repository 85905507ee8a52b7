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

#ifndef _WIN32 // Entire file is linux only

#include "file.h"
#include "logger.h"
#include "../exception.h"
#include "../iocontext.h"

#include <string>
#include <memory>
#include <iostream>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <unistd.h>

using OpenSEGY::IOContext;
using OpenSEGY::Errors::SegyIoError;
using OpenSEGY::Errors::SegyUserError;
using OpenSEGY::Errors::SegyInternalError;

namespace InternalSEGY {
#if 0
}
#endif

/**
 * \file: file_local.cpp
 * \brief SEG-Y files on a local or mounted file system.
 */

/**
 * Uses ::pread and ::pwrite so there is no shared file position.
 * Reads are safe from any number of threads. Writes are safe as long
 * as the regions do not overlap. Closing is not thread safe.
 */
class LocalFileLinux : public FileCommon
{
  LocalFileLinux(const LocalFileLinux&) = delete;
  LocalFileLinux& operator=(const LocalFileLinux&) = delete;
public:
  LocalFileLinux(const std::string& filename, OpenMode mode, const IOContext *iocontext);
  virtual ~LocalFileLinux();
  static std::shared_ptr<IFileADT> xx_make_instance(const std::string& filename, OpenMode mode, const IOContext *iocontext);
  void xx_close() override;
  void xx_read(void *data, std::int64_t offset, std::int64_t size, UsageHint usagehint=UsageHint::Unknown) override;
  void xx_write(const void* data, std::int64_t offset, std::int64_t size, UsageHint usagehint=UsageHint::Unknown) override;
protected:
  std::int64_t _size_on_disk() const override;
private:
  int _fd;
};

namespace {
  /**
   * The logger of a LocalIOContext if it has one, otherwise the
   * standard one controlled by OPENSEGY_VERBOSE.
   */
  FileCommon::LoggerFn loggerFor(const IOContext *iocontext)
  {
    const OpenSEGY::LocalIOContext *local =
      dynamic_cast<const OpenSEGY::LocalIOContext*>(iocontext);
    if (local && local->getLogger())
      return local->getLogger();
    return LoggerBase::standardCallback
      (LoggerBase::getVerboseFromEnv("OPENSEGY_VERBOSE"), "opensegy-file: ", "");
  }

  int openFlags(OpenMode mode)
  {
    switch (mode) {
    case OpenMode::ReadOnly:  return O_RDONLY;
    case OpenMode::ReadWrite: return O_RDWR;
    case OpenMode::Truncate:  return O_RDWR | O_CREAT | O_TRUNC;
    case OpenMode::Closed:
    default:
      throw SegyUserError("Cannot open a file in mode \"Closed\".");
    }
  }
}

LocalFileLinux::LocalFileLinux(const std::string& filename, OpenMode mode, const IOContext *iocontext)
  : FileCommon(filename, mode, loggerFor(iocontext))
  , _fd(-1)
{
  _fd = ::open(filename.c_str(), openFlags(mode) | O_CLOEXEC, 0666);
  if (_fd < 0)
    throw SegyIoError(filename, errno);

  struct stat st;
  int err = 0;
  if (::fstat(_fd, &st) < 0)
    err = errno;
  else if (S_ISDIR(st.st_mode))
    err = EISDIR;
  if (err != 0) {
    ::close(_fd);
    _fd = -1;
    throw SegyIoError(filename, err);
  }
  _eof = static_cast<std::int64_t>(st.st_size);
}

/**
 * Callers are expected to close explicitly so they see any error.
 * Here it can only be reported.
 */
LocalFileLinux::~LocalFileLinux()
{
  if (_mode != OpenMode::Closed) {
    try {
      xx_close();
    }
    catch (const std::exception& ex) {
      std::cerr << "EXCEPTION closing \"" << _name << "\": " << ex.what() << std::endl;
    }
  }
}

/**
 * Names containing "://" are left for some other backend.
 */
std::shared_ptr<IFileADT>
LocalFileLinux::xx_make_instance(const std::string& filename, OpenMode mode, const IOContext *iocontext)
{
  if (filename.find("://") != std::string::npos)
    return std::shared_ptr<IFileADT>();
  return std::make_shared<LocalFileLinux>(filename, mode, iocontext);
}

void
LocalFileLinux::xx_close()
{
  if (_mode == OpenMode::Closed)
    throw SegyUserError(_name + ": File closed twice.");
  _mode = OpenMode::Closed;
  const int fd = _fd;
  _fd = -1;
  if (::close(fd) < 0)
    throw SegyIoError(_name, errno);
}

void
LocalFileLinux::xx_read(void *data, std::int64_t offset, std::int64_t size, UsageHint usagehint)
{
  _check_read(data, offset, size);
  const ssize_t got = ::pread(_fd, data, static_cast<size_t>(size), static_cast<off_t>(offset));
  if (got < 0)
    throw SegyIoError(_name, errno);
  _check_short_read(offset, size, static_cast<std::int64_t>(got));
  if (_logger(3, ""))
    _log_access("read", offset, size, usagehint);
}

void
LocalFileLinux::xx_write(const void* data, std::int64_t offset, std::int64_t size, UsageHint usagehint)
{
  _check_write(data, offset, size);
  const ssize_t put = ::pwrite(_fd, data, static_cast<size_t>(size), static_cast<off_t>(offset));
  if (put < 0)
    throw SegyIoError(_name, errno);
  _grow(offset + static_cast<std::int64_t>(put));
  if (put != size)
    throw SegyInternalError(_name + ": Short write of " + std::to_string(put) +
                            " of " + std::to_string(size) + " bytes.");
  if (_logger(3, ""))
    _log_access("wrote", offset, size, usagehint);
}

std::int64_t
LocalFileLinux::_size_on_disk() const
{
  struct stat st;
  if (_fd < 0 || ::fstat(_fd, &st) < 0)
    return -1;
  return static_cast<std::int64_t>(st.st_size);
}

namespace {
  class Register
  {
  public:
    Register()
    {
      FileFactory::instance().add_factory(LocalFileLinux::xx_make_instance);
    }
  } dummy;
}

} // namespace

#endif // Entire file is linux only
