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

#include "logger.h"
#include "environment.h"

#include <iostream>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <memory>
#include <chrono>

namespace InternalSEGY {
#if 0
}
#endif

namespace {
  std::atomic<int> next_logger_id{1};
  std::mutex output_mutex;

  /**
   * Destination for a new standard logger. OPENSEGY_VERBOSE_LOGFILE
   * redirects from std::cerr to a file opened for append, with "{}"
   * in the name replaced by the logger id.
   */
  std::shared_ptr<std::ostream>
  openDestination(int id)
  {
    std::string name = Environment::getStringEnv("OPENSEGY_VERBOSE_LOGFILE");
    if (name.empty())
      return std::shared_ptr<std::ostream>(&std::cerr, [](std::ostream*){});
    std::size_t pos = name.find("{}");
    if (pos != std::string::npos)
      name.replace(pos, 2, std::to_string(id));
    return std::make_shared<std::ofstream>(name, std::ofstream::app);
  }

  double
  secondsSinceEpoch()
  {
    typedef std::chrono::system_clock clock;
    return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
  }
}

int
LoggerBase::getVerboseFromEnv(const char *envname)
{
  return Environment::getNumericEnv(envname, 0);
}

bool
LoggerBase::logger(const LoggerFn& callback, int priority, const std::string& str)
{
  return callback(priority, str);
}

/**
 * Invoke the logger with the contents of a stringstream.
 *
 * \code
 *    if (logger(priority))
 *      logger(priority, std::stringstream() << "Read " << n << " traces");
 * \endcode
 */
bool
LoggerBase::logger(const LoggerFn& callback, int priority, const std::ios& ss)
{
  auto sstream = dynamic_cast<const std::stringstream*>(&ss);
  return callback(priority, sstream ? sstream->str() : std::string());
}

LoggerBase::LoggerFn
LoggerBase::emptyCallback()
{
  static const LoggerFn null = [](int, const std::string&) { return false; };
  return null;
}

/**
 * Logger that writes every message with priority <= level, one line
 * at a time, to std::cerr or the file named by OPENSEGY_VERBOSE_LOGFILE.
 *
 * Level < 0 never shows anything. Level 42 runs all logging code
 * but discards the output, which is useful for coverage.
 *
 * OPENSEGY_VERBOSE_DETAILS is a bitmask: 1 adds a timestamp to each
 * line, 2 adds the logger id.
 *
 * Thread safety: Output is serialized through a global lock.
 */
LoggerBase::LoggerFn
LoggerBase::standardCallback(int level, const std::string& prefix_in, const std::string& suffix_in)
{
  static const LoggerFn test = [](int, const std::string&) { return true; };
  if (level < 0)
    return emptyCallback();
  if (level == 42)
    return test;

  const int id = next_logger_id++;
  const int details = Environment::getNumericEnv("OPENSEGY_VERBOSE_DETAILS", 0);
  std::shared_ptr<std::ostream> os = openDestination(id);
  std::string prefix(prefix_in);
  const std::string suffix(suffix_in + "\n");
  if (details & 2)
    prefix += "<" + std::to_string(id) + "> ";

  return [level, prefix, suffix, os, details](int pri, const std::string& msg) {
    if (pri > level)
      return false;
    if (msg.empty())
      return true;
    std::istringstream lines(msg);
    std::string line;
    std::lock_guard<std::mutex> lk(output_mutex);
    if (os->good()) {
      while (std::getline(lines, line, '\n')) {
        if (line.empty())
          continue;
        std::stringstream ss;
        if (details & 1)
          ss << std::setprecision(3) << std::fixed << secondsSinceEpoch() << ": ";
        ss << prefix << line << suffix;
        *os << ss.str();
      }
      *os << std::flush;
    }
    return true;
  };
}

} // namespace
