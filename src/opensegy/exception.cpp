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

#include "exception.h"
#include <errno.h>
#include <string.h>
#include <string>

namespace OpenSEGY { namespace Errors {
#if 0
}}
#endif

SegyError::SegyError(const std::string& arg) : std::runtime_error(arg) {}
SegyFormatError::SegyFormatError(const std::string& arg) : SegyError(arg) {}
SegyCorruptFile::SegyCorruptFile(const std::string& arg) : SegyFormatError(arg) {}
SegyUnsupportedFormat::SegyUnsupportedFormat(int code)
  : SegyFormatError("Unsupported sample format code " + std::to_string(code))
  , code_(code)
{
}
SegyUserError::SegyUserError(const std::string& arg) : SegyError(arg) {}
SegyIndexOutOfRange::SegyIndexOutOfRange(const std::string& arg) : SegyUserError(arg) {}
SegySampleRangeError::SegySampleRangeError(const std::string& arg) : SegyIndexOutOfRange(arg) {}
SegyRangeError::SegyRangeError(const std::string& arg) : SegyIndexOutOfRange(arg) {}
SegyInvalidArgument::SegyInvalidArgument(const std::string& arg) : SegyUserError(arg) {}
SegyClosedError::SegyClosedError(const std::string& arg) : SegyUserError(arg) {}
SegyInternalError::SegyInternalError(const std::string& arg) : SegyError(arg) {}
SegyEndOfFile::SegyEndOfFile(const std::string& arg) : SegyError(arg) {}
SegyAborted::SegyAborted(const std::string& arg) : SegyError(arg) {}

namespace {
  static std::string get_error(const std::string& filename, int system_errno)
  {
    std::string errstring;
    char buf[1024]{0};
#if (_POSIX_C_SOURCE >= 200112L) && ! _GNU_SOURCE
    int rc = strerror_r(system_errno, buf, sizeof(buf)-1);
    buf[sizeof(buf)-1] = '\0';
    if (rc == 0)
      errstring = std::string(buf);
#else
    char *e = strerror_r(system_errno, buf, sizeof(buf)-1);
    errstring = std::string(e ? e : "");
#endif
    if (errstring.empty()) // should never happen; strerror should do it.
      errstring = "Unknown errno " + std::to_string(system_errno);
    return filename + ": " + errstring;
  }
}

SegyIoError::SegyIoError(const std::string& filename, int system_errno)
  : SegyError(get_error(filename, system_errno))
{
}

}} // namespace
