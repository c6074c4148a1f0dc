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

#include "reconnection_controller.h"

#include "log.h"
#include "unused.h"

#include <cmath>
#include <inttypes.h>


using ::confab::CallbackNoArg;
using ::confab::ConfigInfo;
using ::confab::ReconnectionController;
using ::confab::Time;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)         = "ReconnectionController";

  /// The default number of attempts before failing.
  const uint32_t  kDefaultMaxAttempts        = 3;

  /// The default first attempt delay.
  const uint32_t  kDefaultBaseDelayMs        = 1000;

  /// The default largest delay.
  const uint32_t  kDefaultMaxDelayMs         = 10000;

  /// The default health poll interval.
  const uint32_t  kDefaultHealthIntervalMs   = 5000;

  /// The jitter fraction applied to each delay.
  const double    kJitterFraction            = 0.2;
}

//============================================================================
ReconnectionController::ReconnectionController(Timer& timer,
                                               ConnectorIf& connector,
                                               RebindHandlerIf& rebinder,
                                               MtcEventHandler& handler)
    : timer_(timer),
      connector_(connector),
      rebinder_(rebinder),
      handler_(handler),
      rng_(),
      state_(RECONN_STABLE),
      attempt_(0),
      max_attempts_(kDefaultMaxAttempts),
      base_delay_ms_(kDefaultBaseDelayMs),
      max_delay_ms_(kDefaultMaxDelayMs),
      health_interval_ms_(kDefaultHealthIntervalMs),
      last_delay_ms_(0),
      last_reason_(),
      healthy_(true),
      monitor_running_(false),
      attempt_handle_(),
      health_handle_()
{
}

//============================================================================
ReconnectionController::~ReconnectionController()
{
  timer_.CancelTimer(attempt_handle_);
  timer_.CancelTimer(health_handle_);

  CallbackNoArg<ReconnectionController>::EmptyPool();
}

//============================================================================
bool ReconnectionController::Initialize(const ConfigInfo& ci)
{
  uint32_t  max_attempts  = ci.GetUint("reconnect.max_attempts",
                                       kDefaultMaxAttempts);
  uint32_t  base_delay_ms = ci.GetUint("reconnect.base_delay_ms",
                                       kDefaultBaseDelayMs);
  uint32_t  max_delay_ms  = ci.GetUint("reconnect.max_delay_ms",
                                       kDefaultMaxDelayMs);
  uint32_t  interval_ms   = ci.GetUint("reconnect.health_interval_ms",
                                       kDefaultHealthIntervalMs);

  if (interval_ms == 0)
  {
    LogE(kClassName, __func__, "reconnect.health_interval_ms must be "
         "positive.\n");
    return false;
  }

  if (!SetLimits(max_attempts, base_delay_ms, max_delay_ms))
  {
    return false;
  }

  health_interval_ms_ = interval_ms;

  LogC(kClassName, __func__, "reconnect.max_attempts: %" PRIu32 "\n",
       max_attempts_);
  LogC(kClassName, __func__, "reconnect.base_delay_ms: %" PRIu32 "\n",
       base_delay_ms_);
  LogC(kClassName, __func__, "reconnect.max_delay_ms: %" PRIu32 "\n",
       max_delay_ms_);
  LogC(kClassName, __func__, "reconnect.health_interval_ms: %" PRIu32 "\n",
       health_interval_ms_);

  return true;
}

//============================================================================
bool ReconnectionController::SetLimits(uint32_t max_attempts,
                                       uint32_t base_delay_ms,
                                       uint32_t max_delay_ms)
{
  if ((max_attempts == 0) || (base_delay_ms > max_delay_ms))
  {
    LogE(kClassName, __func__, "Invalid limits: max attempts %" PRIu32
         ", base delay %" PRIu32 " ms, max delay %" PRIu32 " ms.\n",
         max_attempts, base_delay_ms, max_delay_ms);
    return false;
  }

  max_attempts_  = max_attempts;
  base_delay_ms_ = base_delay_ms;
  max_delay_ms_  = max_delay_ms;

  return true;
}

//============================================================================
bool ReconnectionController::StartHealthMonitor()
{
  if (monitor_running_)
  {
    return true;
  }

  healthy_ = true;

  if (!StartHealthTimer())
  {
    return false;
  }

  monitor_running_ = true;

  LogD(kClassName, __func__, "Health monitor started, interval %" PRIu32
       " ms.\n", health_interval_ms_);

  return true;
}

//============================================================================
void ReconnectionController::StopHealthMonitor()
{
  if (!monitor_running_)
  {
    return;
  }

  timer_.CancelTimer(health_handle_);
  monitor_running_ = false;

  LogD(kClassName, __func__, "Health monitor stopped.\n");
}

//============================================================================
bool ReconnectionController::RequestReconnect(const string& reason)
{
  if (state_ == RECONN_RECONNECTING)
  {
    LogD(kClassName, __func__, "Already reconnecting, ignoring: %s\n",
         reason.c_str());
    return false;
  }

  if (state_ == RECONN_FAILED)
  {
    LogW(kClassName, __func__, "Reconnection has failed, reset required. "
         "Ignoring: %s\n", reason.c_str());
    return false;
  }

  LogW(kClassName, __func__, "Connection lost: %s\n", reason.c_str());

  state_       = RECONN_RECONNECTING;
  last_reason_ = reason;

  ScheduleAttempt();

  return true;
}

//============================================================================
void ReconnectionController::Stop()
{
  timer_.CancelTimer(attempt_handle_);
  StopHealthMonitor();

  if (state_ == RECONN_RECONNECTING)
  {
    LogI(kClassName, __func__, "Abandoning reconnection at attempt %" PRIu32
         ".\n", attempt_);
    state_   = RECONN_STABLE;
    attempt_ = 0;
  }
}

//============================================================================
void ReconnectionController::Reset()
{
  Stop();

  state_         = RECONN_STABLE;
  attempt_       = 0;
  last_delay_ms_ = 0;
  last_reason_.clear();
}

//============================================================================
uint32_t ReconnectionController::BaseBackoffDelayMs(uint32_t attempt,
                                                    uint32_t base_delay_ms,
                                                    uint32_t max_delay_ms)
{
  if (attempt == 0)
  {
    attempt = 1;
  }

  uint64_t  delay = base_delay_ms;

  for (uint32_t i = 1; i < attempt; ++i)
  {
    delay *= 2;

    if (delay >= max_delay_ms)
    {
      return max_delay_ms;
    }
  }

  return ((delay > max_delay_ms) ? max_delay_ms :
          static_cast<uint32_t>(delay));
}

//============================================================================
uint32_t ReconnectionController::ComputeDelayMs(uint32_t attempt)
{
  double  delay  = BaseBackoffDelayMs(attempt, base_delay_ms_,
                                      max_delay_ms_);
  double  jitter = delay * kJitterFraction * rng_.GetUniformSigned();
  double  total  = ::floor(delay + jitter);

  if (total < 0.0)
  {
    total = 0.0;
  }

  return static_cast<uint32_t>(total);
}

//============================================================================
void ReconnectionController::ScheduleAttempt()
{
  ++attempt_;

  if (attempt_ > max_attempts_)
  {
    state_ = RECONN_FAILED;

    LogE(kClassName, __func__, "Reconnection failed after %" PRIu32
         " attempts: %s\n", max_attempts_, last_reason_.c_str());

    handler_.ProcessReconnectionFailed(last_reason_);
    return;
  }

  last_delay_ms_ = ComputeDelayMs(attempt_);

  LogI(kClassName, __func__, "Reconnecting (%" PRIu32 "/%" PRIu32 ") in %"
       PRIu32 " ms.\n", attempt_, max_attempts_, last_delay_ms_);

  handler_.ProcessReconnecting(attempt_, max_attempts_, last_delay_ms_);

  // The handler may have stopped the controller.
  if (state_ != RECONN_RECONNECTING)
  {
    return;
  }

  CallbackNoArg<ReconnectionController>  cb(
    this, &ReconnectionController::AttemptTimeout);

  if (!timer_.StartTimer(Time::FromMsec(last_delay_ms_), &cb,
                         attempt_handle_))
  {
    state_       = RECONN_FAILED;
    last_reason_ = "cannot start reconnection timer";

    LogE(kClassName, __func__, "Cannot start reconnection timer.\n");

    handler_.ProcessReconnectionFailed(last_reason_);
  }
}

//============================================================================
void ReconnectionController::AttemptTimeout()
{
  attempt_handle_.Clear();

  if (state_ != RECONN_RECONNECTING)
  {
    return;
  }

  LogD(kClassName, __func__, "Running attempt %" PRIu32 ".\n", attempt_);

  if (!connector_.Connect())
  {
    last_reason_ = "connect failed";
    LogW(kClassName, __func__, "Attempt %" PRIu32 ": connect failed.\n",
         attempt_);
    ScheduleAttempt();
    return;
  }

  if (!rebinder_.RebindChannels())
  {
    last_reason_ = "channel rebind failed";
    LogW(kClassName, __func__, "Attempt %" PRIu32 ": channel rebind "
         "failed.\n", attempt_);
    ScheduleAttempt();
    return;
  }

  LogI(kClassName, __func__, "Reconnected after %" PRIu32 " attempts.\n",
       attempt_);

  state_   = RECONN_STABLE;
  attempt_ = 0;
  last_reason_.clear();

  handler_.ProcessReconnected();

  if (!healthy_)
  {
    healthy_ = true;
    handler_.ProcessConnectionHealthChanged(true);
  }
}

//============================================================================
void ReconnectionController::HealthCheckTimeout()
{
  health_handle_.Clear();

  if (!monitor_running_)
  {
    return;
  }

  bool  healthy = connector_.IsHealthy();

  if (healthy != healthy_)
  {
    healthy_ = healthy;

    LogI(kClassName, __func__, "Connection is %s.\n",
         (healthy ? "healthy" : "unhealthy"));

    handler_.ProcessConnectionHealthChanged(healthy);

    if ((!healthy) && (state_ == RECONN_STABLE))
    {
      RequestReconnect("health check failed");
    }
  }

  if (monitor_running_ && !StartHealthTimer())
  {
    monitor_running_ = false;
  }
}

//============================================================================
bool ReconnectionController::StartHealthTimer()
{
  CallbackNoArg<ReconnectionController>  cb(
    this, &ReconnectionController::HealthCheckTimeout);

  if (!timer_.StartTimer(Time::FromMsec(health_interval_ms_), &cb,
                         health_handle_))
  {
    LogE(kClassName, __func__, "Cannot start health monitor timer.\n");
    return false;
  }

  return true;
}
