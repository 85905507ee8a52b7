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

#include "environment.h"
#include <stdlib.h>

namespace InternalSEGY {

/**
 * \brief Get value as a string.
 *
 * A variable that is empty or missing yields the provided default,
 * or the empty string if there is none. Empty and missing cannot be
 * told apart.
 */
std::string Environment::getStringEnv(const char *name, const char *dflt)
{
  const std::string fallback = dflt ? std::string(dflt) : std::string();
  if (!name || !*name)
    return fallback;
  const char *value = ::getenv(name);
  if (value == nullptr || value[0] == '\0')
    return fallback;
  return std::string(value);
}

/**
 * \brief Get value as a number.
 *
 * Missing or empty gives the supplied default. Trailing garbage is
 * ignored, so a value that doesn't start with a digit gives 0 and
 * not the default.
 */
int Environment::getNumericEnv(const char *name, int dflt)
{
  std::string value = getStringEnv(name);
  return value.empty() ? dflt : atoi(value.c_str());
}

} // namespace
