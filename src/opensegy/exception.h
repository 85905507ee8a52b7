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

#include <stdexcept>
#include <string>

/** \file exception.h
 *
 * \brief Defines exceptions that may be raised by %OpenSEGY.
 *
 * These classes are both visible to the public API and referenced
 * directly from the implementation classes. Every error is reported
 * at the point where it is first detected and is never turned into
 * a sentinel return value.
 */

namespace OpenSEGY { namespace Errors {
#if 0
}}
#endif

/**
 * \defgroup exceptions List of exceptions
 * @{
 */

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4275) // std::runtine_error not dll-exported
#endif
/**
 * \brief Base class for all exceptions thrown by %OpenSEGY.
 * \details Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyError: public std::runtime_error
{
protected:
  /** \copybrief OpenSEGY::Errors::SegyError */
  SegyError(const std::string& arg);
};
#ifdef _MSC_VER
#pragma warning(pop)
#endif

/**
 * \brief The file is not a valid SEG-Y file.
 *
 * Raised when the file is shorter than the fixed headers, when the
 * binary header declares zero samples per trace, or when some other
 * header value makes the file impossible to interpret.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyFormatError: public SegyError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyFormatError */
  SegyFormatError(const std::string& arg);
};

/**
 * \brief The trace area is not a whole number of traces.
 *
 * The size of the file minus the 3600 header bytes is not divisible
 * by the trace stride. Also raised when a previously detected
 * inconsistency has put the reader in its error state.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyCorruptFile: public SegyFormatError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyCorruptFile */
  SegyCorruptFile(const std::string& arg);
};

/**
 * \brief Sample format code not in the supported set.
 *
 * The offending code is available from code(). Only formats 1, 2, 3,
 * 5 and 8 can be decoded.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyUnsupportedFormat: public SegyFormatError
{
  int code_;
public:
  /** \copybrief OpenSEGY::Errors::SegyUnsupportedFormat */
  SegyUnsupportedFormat(int code);
  /** \brief The sample format code that could not be handled. */
  int code() const { return code_; }
};

/**
 * \brief Exception that might be caused by the calling application.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyUserError: public SegyError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyUserError */
  SegyUserError(const std::string& arg);
};

/**
 * \brief A trace index or trace range is outside the file.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyIndexOutOfRange: public SegyUserError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyIndexOutOfRange */
  SegyIndexOutOfRange(const std::string& arg);
};

/**
 * \brief A sample range is outside the trace.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegySampleRangeError: public SegyIndexOutOfRange
{
public:
  /** \copybrief OpenSEGY::Errors::SegySampleRangeError */
  SegySampleRangeError(const std::string& arg);
};

/**
 * \brief A chunk descriptor does not fit inside the file.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyRangeError: public SegyIndexOutOfRange
{
public:
  /** \copybrief OpenSEGY::Errors::SegyRangeError */
  SegyRangeError(const std::string& arg);
};

/**
 * \brief A numeric argument is not acceptable.
 *
 * E.g. a non-positive chunk size or depth interval.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyInvalidArgument: public SegyUserError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyInvalidArgument */
  SegyInvalidArgument(const std::string& arg);
};

/**
 * \brief The file has already been closed.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyClosedError: public SegyUserError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyClosedError */
  SegyClosedError(const std::string& arg);
};

/**
 * \brief Exception that might be caused by a bug in %OpenSEGY.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyInternalError: public SegyError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyInternalError */
  SegyInternalError(const std::string& arg);
};

/**
 * \brief Trying to read past EOF.
 *
 * Seen by the reader only if the file was truncated after it was
 * opened. The reader translates it to SegyCorruptFile.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyEndOfFile: public SegyError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyEndOfFile */
  SegyEndOfFile(const std::string& arg);
};

/**
 * \brief Exception from the I/O layer.
 *
 * Some error was received from a linux syscall acting on a file.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyIoError: public SegyError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyIoError */
  SegyIoError(const std::string& filename, int system_errno);
};

/**
 * \brief Operation aborted by the user.
 *
 * Raised when a progress callback returned false.
 *
 * Thread safety: Exceptions defined in this module are safe.
 */
class OPENSEGY_API SegyAborted: public SegyError
{
public:
  /** \copybrief OpenSEGY::Errors::SegyAborted */
  SegyAborted(const std::string& arg);
};

/** @} */

}} // namespace
