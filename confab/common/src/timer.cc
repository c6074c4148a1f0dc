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

/// \brief The CONFAB timer source file.

#include "timer.h"

#include "log.h"
#include "unused.h"

#include <new>

#include <inttypes.h>

using ::confab::CallbackInterface;
using ::confab::Time;
using ::confab::Timer;


namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName) = "Timer";

  /// The initial number of timer elements to add to the pool.
  const size_t  kInitPoolSize      = 32;
}

//============================================================================
Timer::Timer()
    : next_handle_(1), events_head_(NULL), events_tail_(NULL),
      next_event_(NULL), pool_(NULL)
{
  Time  exp_time;

  for (size_t i = 0; i < kInitPoolSize; ++i)
  {
    TimerElem*  te = new (std::nothrow) TimerElem(0, exp_time);

    if (te != NULL)
    {
      te->next = pool_;
      pool_    = te;
    }
  }
}

//============================================================================
Timer::~Timer()
{
  CancelAllTimers();

  while (pool_ != NULL)
  {
    TimerElem*  te = pool_;
    pool_          = te->next;
    delete te;
  }
}

//============================================================================
bool Timer::StartTimer(const Time& delta_time, CallbackInterface* cb,
                       Handle& handle)
{
  if (cb == NULL)
  {
    LogE(kClassName, __func__, "NULL callback.\n");
    return false;
  }

  Time  timeout;

  if (!timeout.GetNow())
  {
    return false;
  }

  timeout += delta_time;

  TimerElem*  new_te = NULL;

  if (pool_ == NULL)
  {
    new_te = new (std::nothrow) TimerElem(next_handle_, timeout);

    if (new_te == NULL)
    {
      LogE(kClassName, __func__, "Cannot allocate timer element.\n");
      return false;
    }
  }
  else
  {
    new_te = pool_;
    pool_  = new_te->next;

    new_te->handle_id  = next_handle_;
    new_te->event_time = timeout;
  }

  new_te->cb = cb->Clone();

  handle.id_   = next_handle_;
  handle.elem_ = new_te;

  // Avoid zero, which marks an unset handle.
  if (++next_handle_ == 0)
  {
    next_handle_ = 1;
  }

  // Append to the event list.
  new_te->next = NULL;
  new_te->prev = events_tail_;

  if (events_tail_ == NULL)
  {
    events_head_ = new_te;
    next_event_  = new_te;
  }
  else
  {
    events_tail_->next = new_te;

    if ((next_event_ != NULL) && (timeout < next_event_->event_time))
    {
      next_event_ = new_te;
    }
  }

  events_tail_ = new_te;

  return true;
}

//============================================================================
bool Timer::ModifyTimer(const Time& delta_time, Handle& handle)
{
  if (!IsTimerSet(handle))
  {
    return false;
  }

  Time  timeout;

  if (!timeout.GetNow())
  {
    return false;
  }

  timeout += delta_time;

  // Pushing out the cached next event invalidates the cache.
  if ((handle.elem_ == next_event_) && (timeout > handle.elem_->event_time))
  {
    next_event_ = NULL;
  }
  else if ((next_event_ != NULL) && (timeout < next_event_->event_time))
  {
    next_event_ = handle.elem_;
  }

  handle.elem_->event_time = timeout;

  return true;
}

//============================================================================
bool Timer::CancelTimer(Handle& handle)
{
  bool  rv = false;

  if (IsTimerSet(handle))
  {
    ReleaseElem(handle.elem_);
    rv = true;
  }

  handle.Clear();

  return rv;
}

//============================================================================
void Timer::CancelAllTimers()
{
  while (events_head_ != NULL)
  {
    ReleaseElem(events_head_);
  }

  next_event_ = NULL;
}

//============================================================================
bool Timer::IsTimerSet(const Handle& handle) const
{
  return ((handle.id_ != 0) && (handle.elem_ != NULL) &&
          (handle.id_ == handle.elem_->handle_id));
}

//============================================================================
Time Timer::GetNextExpirationTime(const Time& max_wait)
{
  if (events_head_ == NULL)
  {
    return max_wait;
  }

  Time  now;

  if (!now.GetNow())
  {
    return max_wait;
  }

  if ((next_event_ == NULL) && (!FindNextEvent()))
  {
    return max_wait;
  }

  Time  wait_time;

  if (next_event_->event_time > now)
  {
    wait_time = Time::Min((next_event_->event_time - now), max_wait);
  }
  else
  {
    Time  late = (now - next_event_->event_time);

    if (late > Time::FromMsec(1))
    {
      LogW(kClassName, __func__, "Timer handle %" PRIu32 " late by more "
           "than 1 ms (%s).\n", next_event_->handle_id,
           late.ToString().c_str());
    }
  }

  return wait_time;
}

//============================================================================
void Timer::DoCallbacks()
{
  while (events_head_ != NULL)
  {
    Time  now;

    if (!now.GetNow())
    {
      break;
    }

    if ((next_event_ == NULL) && (!FindNextEvent()))
    {
      break;
    }

    // If the next event hasn't expired, none of the others have either.
    if (next_event_->event_time > now)
    {
      break;
    }

    // Detach the callback before releasing the element, so that the
    // callback may start new timers.
    TimerElem*          te = next_event_;
    CallbackInterface*  cb = te->cb;

    te->cb = NULL;
    ReleaseElem(te);

    if (cb != NULL)
    {
      cb->PerformCallback();
      cb->ReleaseClone();
    }
  }
}

//============================================================================
void Timer::ReleaseElem(TimerElem* te)
{
  if (te == next_event_)
  {
    next_event_ = NULL;
  }

  if (te->next != NULL)
  {
    te->next->prev = te->prev;
  }
  if (te->prev != NULL)
  {
    te->prev->next = te->next;
  }
  if (te == events_head_)
  {
    events_head_ = te->next;
  }
  if (te == events_tail_)
  {
    events_tail_ = te->prev;
  }

  te->handle_id = 0;

  if (te->cb != NULL)
  {
    te->cb->ReleaseClone();
    te->cb = NULL;
  }

  te->next = pool_;
  te->prev = NULL;
  pool_    = te;
}

//============================================================================
bool Timer::FindNextEvent()
{
  TimerElem*  ne = events_head_;

  if (ne != NULL)
  {
    for (TimerElem* te = ne->next; te != NULL; te = te->next)
    {
      if (te->event_time < ne->event_time)
      {
        ne = te;
      }
    }
  }

  next_event_ = ne;

  return (ne != NULL);
}
