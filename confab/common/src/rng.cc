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

/// \brief The CONFAB random number generator source file.

#include "rng.h"

#include "log.h"
#include "unused.h"

#include <cerrno>
#include <cstring>
#include <inttypes.h>
#include <time.h>
#include <unistd.h>


using ::confab::RNG;

namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName) = "RNG";

  /// One more than the largest value random_r() returns.
  const double  kRandRange         = (static_cast<double>(RAND_MAX) + 1.0);
}

//============================================================================
RNG::RNG()
    : state_buf_(), state_(), seed_(0)
{
  struct timespec  now = { 0, 0 };

  if (clock_gettime(CLOCK_MONOTONIC, &now) != 0)
  {
    LogW(kClassName, __func__, "clock_gettime() failed: %s\n",
         strerror(errno));
  }

  Init(static_cast<uint32_t>(now.tv_nsec) ^
       (static_cast<uint32_t>(getpid()) << 16));
}

//============================================================================
RNG::RNG(uint32_t seed)
    : state_buf_(), state_(), seed_(0)
{
  Init(seed);
}

//============================================================================
RNG::~RNG()
{
  // Nothing to destroy.
}

//============================================================================
void RNG::Init(uint32_t seed)
{
  seed_ = seed;

  if (initstate_r(seed_, state_buf_, sizeof(state_buf_), &state_) != 0)
  {
    LogE(kClassName, __func__, "initstate_r() failed: %s\n",
         strerror(errno));
  }
}

//============================================================================
bool RNG::SetSeed(uint32_t seed)
{
  if (srandom_r(seed, &state_) != 0)
  {
    LogE(kClassName, __func__, "srandom_r() failed: %s\n", strerror(errno));
    return false;
  }

  seed_ = seed;

  return true;
}

//============================================================================
uint32_t RNG::GetUint(uint32_t limit)
{
  double  fraction = 0.0;

  if (limit == 0)
  {
    LogW(kClassName, __func__, "Zero limit.\n");
    return 0;
  }

  if (!NextFraction(fraction))
  {
    return 0;
  }

  // Scaling instead of a modulus keeps the low bits from dominating.
  return static_cast<uint32_t>(fraction * static_cast<double>(limit));
}

//============================================================================
double RNG::GetDouble(double lower, double upper)
{
  double  fraction = 0.0;

  if (!(upper > lower))
  {
    LogW(kClassName, __func__, "Empty range [%f, %f).\n", lower, upper);
    return lower;
  }

  if (!NextFraction(fraction))
  {
    return lower;
  }

  return (lower + (fraction * (upper - lower)));
}

//============================================================================
bool RNG::NextFraction(double& fraction)
{
  int32_t  raw = 0;

  if (random_r(&state_, &raw) != 0)
  {
    LogE(kClassName, __func__, "random_r() failed: %s\n", strerror(errno));
    return false;
  }

  fraction = (static_cast<double>(raw) / kRandRange);

  return true;
}
