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

#include <cstdint>
#include <exception>
#include <atomic>
#include <functional>
#include <string>

namespace InternalSEGY {
#if 0
}
#endif

/**
 * Helper class to avoid exceptions escaping from inside an OpenMP loop.
 * If something goes wrong the loop still runs to completion but every
 * iteration after the failure returns immediately. The first exception
 * is rethrown by finished(), which must be called after the parallel
 * region.
 *
 * \code
 *     MTGuard guard("export");
 *   #pragma omp parallel for num_threads(threads)
 *     for (std::int64_t ii = 0; ii < count; ++ii) {
 *       guard.run([&](){
 *         // ACTUAL CODE GOES HERE
 *       });
 *     }
 *     guard.finished();
 * \endcode
 */
class OPENSEGY_TEST_API MTGuard
{
private:
  std::atomic<int>   _errors;
  std::exception_ptr _first_ex;
  std::string        _name;
public:
  explicit MTGuard(const std::string& name = "anonymous");
  ~MTGuard();
  MTGuard(const MTGuard&) = delete;
  MTGuard& operator=(const MTGuard&) = delete;
  bool failed() const;
  int  errors() const;
  void run(const std::function<void()>& fn);
  void finished();
protected:
  void fail();
};

/**
 * MTGuard that also reports progress. The callback is only invoked
 * from OpenMP thread zero, so the caller sees a monotonically increasing
 * "done" but not one call per step. Returning false from the callback
 * aborts the loop with SegyAborted. Unless the loop failed, the last
 * call seen by the callback has done == total.
 *
 * \code
 *     MTGuardWithProgress guard(progress, total, "export");
 *   #pragma omp parallel for num_threads(threads)
 *     for (std::int64_t ii = 0; ii < total; ++ii) {
 *       guard.run([&](){
 *         // ACTUAL CODE GOES HERE
 *         guard.progress();
 *       });
 *     }
 *     guard.finished();
 * \endcode
 */
class OPENSEGY_TEST_API MTGuardWithProgress : public MTGuard
{
public:
  typedef std::function<bool(std::int64_t, std::int64_t)> progress_fn;
private:
  progress_fn _progress;
  std::int64_t _total;
  std::atomic<std::int64_t> _done;
  int _last_done_by;

public:
  MTGuardWithProgress(const progress_fn& progress, std::int64_t total, const std::string& name = "anonymous");
  MTGuardWithProgress(const MTGuardWithProgress&) = delete;
  MTGuardWithProgress& operator=(const MTGuardWithProgress&) = delete;
  void progress(std::int64_t steps = 1);
  void finished();
};

} // namespace
