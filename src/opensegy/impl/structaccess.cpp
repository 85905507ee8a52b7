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

#include "structaccess.h"
#include "../exception.h"

#include <string>

std::int64_t
InternalSEGY::loadSignedBE(const void* ptr, int width)
{
  switch (width) {
  case 1: return loadBE<std::int8_t>(ptr);
  case 2: return loadBE<std::int16_t>(ptr);
  case 4: return loadBE<std::int32_t>(ptr);
  default:
    throw OpenSEGY::Errors::SegyInternalError
      ("Unsupported integer width " + std::to_string(width));
  }
}

void
InternalSEGY::storeSignedBE(void* ptr, int width, std::int64_t value)
{
  switch (width) {
  case 1: storeBE<std::int8_t>(ptr, static_cast<std::int8_t>(value)); break;
  case 2: storeBE<std::int16_t>(ptr, static_cast<std::int16_t>(value)); break;
  case 4: storeBE<std::int32_t>(ptr, static_cast<std::int32_t>(value)); break;
  default:
    throw OpenSEGY::Errors::SegyInternalError
      ("Unsupported integer width " + std::to_string(width));
  }
}
