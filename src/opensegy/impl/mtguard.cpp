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

#include "mtguard.h"
#include "../exception.h"

#include <iostream>
#include <stdexcept>
#include <omp.h>

namespace InternalSEGY {
#if 0
}
#endif

MTGuard::MTGuard(const std::string& name)
  : _errors(0)
  , _first_ex()
  , _name(name)
{
}

/**
 * A destructor must never throw, so an exception that was never
 * collected by finished() can only be reported.
 */
MTGuard::~MTGuard()
{
  if (_first_ex) {
    try {
      std::rethrow_exception(_first_ex);
    }
    catch (const std::exception& ex) {
      std::cerr << "EXCEPTION inside OpenMP loop \"" << _name << "\": "
                << ex.what() << std::endl;
    }
    catch (...) {
      std::cerr << "EXCEPTION inside OpenMP loop \"" << _name << "\": "
                << "unknown exception type" << std::endl;
    }
  }
}

bool
MTGuard::failed() const
{
  return _errors.load() != 0;
}

/**
 * Number of iterations that threw. Only the first exception is kept.
 */
int
MTGuard::errors() const
{
  return _errors.load();
}

/**
 * Run fn unless an earlier iteration failed. Nothing propagates out
 * of run(); any exception is stored for finished().
 */
void
MTGuard::run(const std::function<void()>& fn)
{
  if (_errors.load() != 0)
    return;
  try {
    fn();
  }
  catch (...) {
    fail();
  }
}

void
MTGuard::finished()
{
  if (_errors.load() != 0 && _first_ex) {
    std::exception_ptr throwme = _first_ex;
    _first_ex = std::exception_ptr();
    std::rethrow_exception(throwme);
  }
}

/**
 * Called from inside a catch block. Keeps the first exception.
 */
void
MTGuard::fail()
{
  if (_errors.fetch_add(1) == 0) {
    _first_ex = std::current_exception();
    if (!_first_ex)
      _first_ex = std::make_exception_ptr(std::runtime_error("fail() with no current exception."));
  }
}

MTGuardWithProgress::MTGuardWithProgress(const progress_fn& progress, std::int64_t total, const std::string& name)
  : MTGuard(name)
  , _progress(progress)
  , _total(total)
  , _done(0)
  , _last_done_by(-1)
{
}

/**
 * Count steps finished by the calling thread. An exception from the
 * callback is treated the same way as a false return.
 */
void
MTGuardWithProgress::progress(std::int64_t steps)
{
  if (!failed() && _progress && _total != 0 && steps > 0) {
    const std::int64_t localdone = _done.fetch_add(steps) + steps;
    if (omp_get_thread_num() == 0) {
      try {
        if (!_progress(localdone, _total))
          throw OpenSEGY::Errors::SegyAborted("Aborted by the progress callback.");
      }
      catch (const std::exception&) {
        fail();
      }
    }
    if (localdone == _total)
      _last_done_by = omp_get_thread_num();
  }
}

/**
 * Send the final done == total if thread zero did not already see it,
 * then rethrow the first error if any.
 */
void
MTGuardWithProgress::finished()
{
  if (!failed() && _progress && _total != 0 && _last_done_by != 0)
    if (!_progress(_total, _total))
      throw OpenSEGY::Errors::SegyAborted("Aborted by the progress callback.");
  MTGuard::finished();
}

} // namespace
