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

#include "pseudo_timer.h"

#include "log.h"
#include "unused.h"


using ::confab::PseudoTimer;
using ::confab::Time;
using ::std::list;


namespace
{
  const char* UNUSED(kClassName) = "PseudoTimer";
}

//============================================================================
PseudoTimer::PseudoTimer()
    : Timer(), start_count(0), events_(), next_id_(1), now_()
{
}

//============================================================================
PseudoTimer::~PseudoTimer()
{
  CancelAllTimers();
}

//============================================================================
bool PseudoTimer::StartTimer(const Time& delta_time, CallbackInterface* cb,
                             Handle& handle)
{
  if (cb == NULL)
  {
    LogE(kClassName, __func__, "NULL callback.\n");
    return false;
  }

  PseudoEvent  ev;

  ev.id         = next_id_;
  ev.event_time = now_ + delta_time;
  ev.delta_time = delta_time;
  ev.cb         = cb->Clone();

  events_.push_back(ev);
  AssignHandle(handle, ev.id);
  ++start_count;

  if (++next_id_ == 0)
  {
    next_id_ = 1;
  }

  return true;
}

//============================================================================
bool PseudoTimer::ModifyTimer(const Time& delta_time, Handle& handle)
{
  list<PseudoEvent>::iterator  it = Find(HandleId(handle));

  if (it == events_.end())
  {
    return false;
  }

  it->event_time = now_ + delta_time;
  it->delta_time = delta_time;

  return true;
}

//============================================================================
bool PseudoTimer::CancelTimer(Handle& handle)
{
  list<PseudoEvent>::iterator  it = Find(HandleId(handle));

  handle.Clear();

  if (it == events_.end())
  {
    return false;
  }

  it->cb->ReleaseClone();
  events_.erase(it);

  return true;
}

//============================================================================
void PseudoTimer::CancelAllTimers()
{
  for (list<PseudoEvent>::iterator it = events_.begin();
       it != events_.end(); ++it)
  {
    it->cb->ReleaseClone();
  }

  events_.clear();
}

//============================================================================
bool PseudoTimer::IsTimerSet(const Handle& handle) const
{
  uint32_t  id = HandleId(handle);

  for (list<PseudoEvent>::const_iterator it = events_.begin();
       it != events_.end(); ++it)
  {
    if ((id != 0) && (it->id == id))
    {
      return true;
    }
  }

  return false;
}

//============================================================================
Time PseudoTimer::GetNextExpirationTime(const Time& max_wait)
{
  list<PseudoEvent>::iterator  it = FindNext();

  if (it == events_.end())
  {
    return max_wait;
  }

  if (it->event_time <= now_)
  {
    return Time();
  }

  return Time::Min((it->event_time - now_), max_wait);
}

//============================================================================
void PseudoTimer::DoCallbacks()
{
  while (true)
  {
    list<PseudoEvent>::iterator  it = FindNext();

    if ((it == events_.end()) || (it->event_time > now_))
    {
      return;
    }

    CallbackInterface*  cb = it->cb;

    events_.erase(it);

    cb->PerformCallback();
    cb->ReleaseClone();
  }
}

//============================================================================
bool PseudoTimer::FireNext()
{
  list<PseudoEvent>::iterator  it = FindNext();

  if (it == events_.end())
  {
    return false;
  }

  CallbackInterface*  cb = it->cb;

  if (it->event_time > now_)
  {
    now_ = it->event_time;
  }

  events_.erase(it);

  cb->PerformCallback();
  cb->ReleaseClone();

  return true;
}

//============================================================================
void PseudoTimer::Advance(const Time& delta_time)
{
  Time  end_time = now_ + delta_time;

  while (true)
  {
    list<PseudoEvent>::iterator  it = FindNext();

    if ((it == events_.end()) || (it->event_time > end_time))
    {
      break;
    }

    FireNext();
  }

  now_ = end_time;
}

//============================================================================
bool PseudoTimer::GetNextDelta(Time& delta_time) const
{
  list<PseudoEvent>::iterator  it =
    const_cast<PseudoTimer*>(this)->FindNext();

  if (it == events_.end())
  {
    return false;
  }

  delta_time = it->delta_time;

  return true;
}

//============================================================================
list<PseudoTimer::PseudoEvent>::iterator PseudoTimer::FindNext()
{
  list<PseudoEvent>::iterator  next = events_.end();

  for (list<PseudoEvent>::iterator it = events_.begin();
       it != events_.end(); ++it)
  {
    if ((next == events_.end()) || (it->event_time < next->event_time))
    {
      next = it;
    }
  }

  return next;
}

//============================================================================
list<PseudoTimer::PseudoEvent>::iterator PseudoTimer::Find(uint32_t id)
{
  for (list<PseudoEvent>::iterator it = events_.begin();
       it != events_.end(); ++it)
  {
    if ((id != 0) && (it->id == id))
    {
      return it;
    }
  }

  return events_.end();
}
