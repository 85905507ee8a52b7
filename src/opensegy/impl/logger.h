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

#include <string>
#include <sstream>
#include <functional>

namespace InternalSEGY {
#if 0
}
#endif

/**
 * \file logger.h
 * \brief Logging framework.
 *
 * See InternalSEGY::LoggerBase for details.
 */

/**
 * Logging framework.
 *
 * The actual logger is a functor invoked whenever the code wants to
 * output a message. It returns whether the message was, or would have
 * been, shown. Called with an empty message it outputs nothing but
 * still answers that question, so expensive messages can be skipped:
 *
 * \code
 *   if (callback(priority, ""))
 *     callback(priority, getMyMessage());
 * \endcode
 *
 * Loggers are passed around as members, never kept in a singleton.
 * A logger must never be empty; use emptyCallback() to discard output.
 *
 * Priorities:
 * - -1 => Errors.
 * -  0 => Warnings shown during normal execution.
 * - 1+ => Debugging.
 *
 * Thread safety: Safe because it contains only static methods.
 * Any LoggerFn implementation must be thread safe.
 */
class OPENSEGY_API LoggerBase
{
public:
  typedef std::function<bool(int, const std::string&)> LoggerFn;
  static int getVerboseFromEnv(const char *envname);
  static bool logger(const LoggerFn& logger, int priority, const std::string& str = std::string());
  static bool logger(const LoggerFn& logger, int priority, const std::ios& ss);
  static LoggerFn emptyCallback();
  static LoggerFn standardCallback(int level, const std::string& prefix, const std::string& suffix);
};

} // namespace
