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

#include "iocontext.h"
#include "impl/environment.h"

#include <sstream>

namespace OpenSEGY {
#if 0
}
#endif

/**
 * The class needs at least one virtual member to make dynamic_cast work.
 */
IOContext::~IOContext()
{
}

LocalIOContext::LocalIOContext()
  : _logger()
  , _allow_unknown_format(false)
  , _large_read_mb(1000)
  , _threads(1)
{
  using InternalSEGY::Environment;
  allowUnknownFormat(Environment::getNumericEnv("OPENSEGY_ALLOW_UNKNOWN_FORMAT", 0) > 0);
  largeReadWarningMB(Environment::getNumericEnv("OPENSEGY_LARGE_READ_MB", 1000));
  threads(Environment::getNumericEnv("OPENSEGY_NUMTHREADS", 1));
}

std::string
LocalIOContext::toString() const
{
  std::stringstream ss;
  ss << "Local context:\n"
     << "  logger:    " << (_logger ? "custom" : "default") << "\n"
     << "  unknown:   " << (_allow_unknown_format ? "allowed" : "rejected") << "\n"
     << "  largeread: " << _large_read_mb << " MB\n"
     << "  threads:   " << _threads << "\n";
  return ss.str();
}

std::shared_ptr<IOContext>
LocalIOContext::clone() const
{
  return std::make_shared<LocalIOContext>(*this);
}

} // namespace
