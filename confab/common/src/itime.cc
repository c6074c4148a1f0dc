// IRON: iron_headers
/*
 * Distribution A
 *
 * Approved for Public Release, Distribution Unlimited
 *
 * EdgeCT (IRON) Software Contract No.: HR0011-15-C-0097
 * DCOMP (GNAT)  Software Contract No.: HR0011-17-C-0050
 * Copyright (c) 2015-20 Raytheon BBN Technologies Corp.
 *
 * This material is based upon work supported by the Defense Advanced
 * Research Projects Agency under Contracts No. HR0011-15-C-0097 and
 * HR0011-17-C-0050. Any opinions, findings and conclusions or
 * recommendations expressed in this material are those of the author(s)
 * and do not necessarily reflect the views of the Defense Advanced
 * Research Project Agency.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/* IRON: end */

/// \brief The CONFAB time source file.

#include "itime.h"

#include "log.h"
#include "unused.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <inttypes.h>
#include <limits>


using ::confab::Time;
using ::std::numeric_limits;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*    UNUSED(kClassName) = "Time";

  /// Microseconds per second.
  const int64_t  kUsecPerSec        = 1000000;

  /// The infinite time, in microseconds.
  const int64_t  kInfiniteUsec      = numeric_limits<int64_t>::max();
}

//============================================================================
Time::Time(const timeval& t_val)
    : usec_((static_cast<int64_t>(t_val.tv_sec) * kUsecPerSec) +
            static_cast<int64_t>(t_val.tv_usec))
{
}

//============================================================================
Time::Time(const timespec& t_spec)
    : usec_((static_cast<int64_t>(t_spec.tv_sec) * kUsecPerSec) +
            ((static_cast<int64_t>(t_spec.tv_nsec) + 500) / 1000))
{
}

//============================================================================
Time::Time(time_t seconds, suseconds_t microseconds)
    : usec_((static_cast<int64_t>(seconds) * kUsecPerSec) +
            static_cast<int64_t>(microseconds))
{
}

//============================================================================
Time Time::FromMsec(int64_t milliseconds)
{
  return FromUsec(milliseconds * 1000);
}

//============================================================================
Time Time::FromUsec(int64_t microseconds)
{
  Time  t;

  t.usec_ = microseconds;

  return t;
}

//============================================================================
Time Time::Now()
{
  Time  t;

  t.GetNow();

  return t;
}

//============================================================================
Time Time::Infinite()
{
  return FromUsec(kInfiniteUsec);
}

//============================================================================
Time Time::Max(const Time& t1, const Time& t2)
{
  return ((t1 < t2) ? t2 : t1);
}

//============================================================================
Time Time::Min(const Time& t1, const Time& t2)
{
  return ((t2 < t1) ? t2 : t1);
}

//============================================================================
string Time::ToString() const
{
  char      buf[40];
  uint64_t  mag  = ((usec_ < 0) ? (0 - static_cast<uint64_t>(usec_)) :
                    static_cast<uint64_t>(usec_));

  if (snprintf(buf, sizeof(buf), "%s%" PRIu64 ".%06" PRIu64 "s",
               ((usec_ < 0) ? "-" : ""), (mag / kUsecPerSec),
               (mag % kUsecPerSec)) < 0)
  {
    return "Error";
  }

  return buf;
}

//============================================================================
int64_t Time::GetNowInUsec()
{
  Time  now;

  return (now.GetNow() ? now.usec_ : 0);
}

//============================================================================
bool Time::GetNow()
{
  timespec  t_spec;

  if (clock_gettime(CLOCK_MONOTONIC, &t_spec) != 0)
  {
    LogF(kClassName, __func__, "Monotonic clock failed with error %s\n",
         strerror(errno));
    usec_ = 0;
    return false;
  }

  *this = Time(t_spec);

  return true;
}

//============================================================================
Time Time::operator+(const Time& time_to_add) const
{
  Time  sum(*this);

  sum += time_to_add;

  return sum;
}

//============================================================================
Time& Time::operator+=(const Time& time_to_add)
{
  if (IsInfinite() || time_to_add.IsInfinite())
  {
    usec_ = kInfiniteUsec;
  }
  else
  {
    usec_ += time_to_add.usec_;
  }

  return *this;
}

//============================================================================
Time Time::operator-(const Time& time_to_remove) const
{
  if (IsInfinite())
  {
    return *this;
  }

  return FromUsec(usec_ - time_to_remove.usec_);
}

//============================================================================
bool Time::IsInfinite() const
{
  return (usec_ == kInfiniteUsec);
}
