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

#include "channel_registry.h"

#include "callback.h"
#include "itime.h"
#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>
#include <inttypes.h>
#include <new>


using ::confab::Bytes;
using ::confab::CallbackOneArg;
using ::confab::ChannelId;
using ::confab::ChannelRegistry;
using ::confab::ChannelState;
using ::confab::MtcError;
using ::confab::ScopedLock;
using ::confab::Time;
using ::confab::TransportIf;
using ::std::list;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ChannelRegistry";
}

//============================================================================
ChannelRegistry::ChannelInfo::ChannelInfo()
    : next_seq(0), config_sent(false), has_config(false), config(),
      handle(NULL), state(CHANNEL_CLOSED)
{
}

//============================================================================
ChannelRegistry::ChannelRegistry(Timer& timer, FrameSenderIf& sender,
                                 MtcEventHandler& handler)
    : timer_(timer), sender_(sender), handler_(handler), channels_(),
      waits_(), next_wait_id_(1), mutex_()
{
  if (pthread_mutex_init(&mutex_, NULL) != 0)
  {
    LogF(kClassName, __func__, "pthread_mutex_init error: %s.\n",
         strerror(errno));
  }
}

//============================================================================
ChannelRegistry::~ChannelRegistry()
{
  for (list<ReadyWait*>::iterator it = waits_.begin(); it != waits_.end();
       ++it)
  {
    timer_.CancelTimer((*it)->timer_handle);
    delete *it;
  }

  waits_.clear();

  CallbackOneArg<ChannelRegistry, uint32_t>::EmptyPool();

  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool ChannelRegistry::Open(ChannelId ch, TransportIf* handle)
{
  if (!IsValidChannel(ch))
  {
    LogE(kClassName, __func__, "Invalid channel %d.\n", static_cast<int>(ch));
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    if (info.state != CHANNEL_CLOSED)
    {
      LogW(kClassName, __func__, "Channel %s is already open.\n",
           ChannelName(ch));
      return false;
    }

    info             = ChannelInfo();
    info.handle      = handle;
    info.state       = CHANNEL_PENDING;
  }

  LogI(kClassName, __func__, "Channel %s opened.\n", ChannelName(ch));

  return true;
}

//============================================================================
bool ChannelRegistry::MarkReady(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    if (info.state == CHANNEL_CLOSED)
    {
      LogW(kClassName, __func__, "Channel %s is not open.\n",
           ChannelName(ch));
      return false;
    }

    info.state = CHANNEL_READY;

    if (ch == CH_MEETING_CONTROL)
    {
      info.config_sent = true;
    }
  }

  LogI(kClassName, __func__, "Channel %s ready.\n", ChannelName(ch));

  CompleteWaits(ch, MTC_NO_ERROR);
  handler_.ProcessChannelReady(ch);

  return true;
}

//============================================================================
bool ChannelRegistry::NextSequence(ChannelId ch, uint32_t& seq)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  ChannelInfo&  info = channels_[ch];

  if (info.state == CHANNEL_CLOSED)
  {
    return false;
  }

  // Unsigned arithmetic wraps at 2^32.
  seq = info.next_seq++;

  return true;
}

//============================================================================
bool ChannelRegistry::SendConfig(ChannelId ch, const Bytes& blob,
                                 MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch) || blob.empty())
  {
    LogE(kClassName, __func__, "Invalid channel %d or empty config.\n",
         static_cast<int>(ch));
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    if (info.state == CHANNEL_CLOSED)
    {
      LogW(kClassName, __func__, "Channel %s is not open.\n",
           ChannelName(ch));
      err = MTC_CHANNEL_NOT_READY;
      return false;
    }

    info.config      = blob;
    info.has_config  = true;
    info.config_sent = false;

    if (info.state != CHANNEL_READY)
    {
      LogI(kClassName, __func__, "Channel %s not ready, config stored.\n",
           ChannelName(ch));
      err = MTC_CHANNEL_NOT_READY;
      return false;
    }
  }

  handler_.ProcessConfigReady(ch, blob);

  return TransmitConfig(ch, err);
}

//============================================================================
bool ChannelRegistry::ResendConfig(ChannelId ch, MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch))
  {
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    if ((info.state != CHANNEL_READY) || (!info.has_config))
    {
      err = MTC_CHANNEL_NOT_READY;
      return false;
    }
  }

  return TransmitConfig(ch, err);
}

//============================================================================
bool ChannelRegistry::TransmitConfig(ChannelId ch, MtcError& err)
{
  Bytes  blob;

  if (!GetConfig(ch, blob))
  {
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  // The lock is not held across the transmit, which may block on a stream
  // write or call back into the registry for a sequence number.
  if (!sender_.SendFrame(ch, FRAME_CONFIG, &blob[0], blob.size(), err))
  {
    LogW(kClassName, __func__, "Config send on channel %s failed: %s.\n",
         ChannelName(ch), ErrorToString(err));
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    // The channel may have been closed or reopened during the transmit.
    if (info.state != CHANNEL_READY)
    {
      err = MTC_CHANNEL_NOT_READY;
      return false;
    }

    info.config_sent = true;
  }

  LogI(kClassName, __func__, "Config sent on channel %s (%zu bytes).\n",
       ChannelName(ch), blob.size());

  handler_.ProcessConfigSent(ch);

  return true;
}

//============================================================================
bool ChannelRegistry::IsConfigSent(ChannelId ch) const
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  return ((channels_[ch].state == CHANNEL_READY) &&
          channels_[ch].config_sent);
}

//============================================================================
bool ChannelRegistry::HasConfig(ChannelId ch) const
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  return channels_[ch].has_config;
}

//============================================================================
bool ChannelRegistry::GetConfig(ChannelId ch, Bytes& blob) const
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (!channels_[ch].has_config)
  {
    return false;
  }

  blob = channels_[ch].config;

  return true;
}

//============================================================================
bool ChannelRegistry::IsReady(ChannelId ch) const
{
  return (GetState(ch) == CHANNEL_READY);
}

//============================================================================
bool ChannelRegistry::IsOpen(ChannelId ch) const
{
  return (GetState(ch) != CHANNEL_CLOSED);
}

//============================================================================
bool ChannelRegistry::WaitForReady(ChannelId ch, uint32_t timeout_ms,
                                   ReadyWaiterIf* waiter)
{
  if ((!IsValidChannel(ch)) || (waiter == NULL))
  {
    LogE(kClassName, __func__, "Invalid channel %d or NULL waiter.\n",
         static_cast<int>(ch));
    return false;
  }

  ChannelState  state = GetState(ch);

  if (state == CHANNEL_CLOSED)
  {
    LogW(kClassName, __func__, "Channel %s is not open.\n", ChannelName(ch));
    return false;
  }

  if (state == CHANNEL_READY)
  {
    waiter->ProcessReadyResult(ch, MTC_NO_ERROR);
    return true;
  }

  ReadyWait*  wait = new (std::nothrow) ReadyWait(next_wait_id_, ch, waiter);

  if (wait == NULL)
  {
    LogE(kClassName, __func__, "Cannot allocate ready wait.\n");
    return false;
  }

  CallbackOneArg<ChannelRegistry, uint32_t>  cb(
    this, &ChannelRegistry::WaitTimeout, next_wait_id_);

  if (!timer_.StartTimer(Time::FromMsec(timeout_ms), &cb,
                         wait->timer_handle))
  {
    LogE(kClassName, __func__, "Cannot start ready wait timer.\n");
    delete wait;
    return false;
  }

  if (++next_wait_id_ == 0)
  {
    next_wait_id_ = 1;
  }

  waits_.push_back(wait);

  LogD(kClassName, __func__, "Waiting up to %" PRIu32 " ms for channel "
       "%s.\n", timeout_ms, ChannelName(ch));

  return true;
}

//============================================================================
void ChannelRegistry::WaitTimeout(uint32_t wait_id)
{
  for (list<ReadyWait*>::iterator it = waits_.begin(); it != waits_.end();
       ++it)
  {
    if ((*it)->id == wait_id)
    {
      ReadyWait*  wait = *it;

      waits_.erase(it);

      LogW(kClassName, __func__, "Timed out waiting for channel %s.\n",
           ChannelName(wait->ch));

      wait->waiter->ProcessReadyResult(wait->ch, MTC_TIMEOUT);
      delete wait;
      return;
    }
  }
}

//============================================================================
void ChannelRegistry::CompleteWaits(ChannelId ch, MtcError err)
{
  list<ReadyWait*>  done;

  list<ReadyWait*>::iterator  it = waits_.begin();

  while (it != waits_.end())
  {
    if ((*it)->ch == ch)
    {
      timer_.CancelTimer((*it)->timer_handle);
      done.push_back(*it);
      it = waits_.erase(it);
    }
    else
    {
      ++it;
    }
  }

  for (it = done.begin(); it != done.end(); ++it)
  {
    (*it)->waiter->ProcessReadyResult(ch, err);
    delete *it;
  }
}

//============================================================================
bool ChannelRegistry::ResetConfig(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  ChannelInfo&  info = channels_[ch];

  if (info.state == CHANNEL_CLOSED)
  {
    return false;
  }

  info.config_sent = (ch == CH_MEETING_CONTROL) &&
                     (info.state == CHANNEL_READY);

  return true;
}

//============================================================================
bool ChannelRegistry::Reopen(ChannelId ch, TransportIf* handle)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    if (info.state == CHANNEL_CLOSED)
    {
      LogW(kClassName, __func__, "Channel %s is not open.\n",
           ChannelName(ch));
      return false;
    }

    info.handle      = handle;
    info.config_sent = false;
    info.state       = CHANNEL_PENDING;
  }

  LogI(kClassName, __func__, "Channel %s reopened on a new handle.\n",
       ChannelName(ch));

  return true;
}

//============================================================================
bool ChannelRegistry::ResetSequence(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (channels_[ch].state == CHANNEL_CLOSED)
  {
    return false;
  }

  channels_[ch].next_seq = 0;

  return true;
}

//============================================================================
bool ChannelRegistry::SetSequence(ChannelId ch, uint32_t value)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (channels_[ch].state == CHANNEL_CLOSED)
  {
    return false;
  }

  channels_[ch].next_seq = value;

  return true;
}

//============================================================================
bool ChannelRegistry::Close(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    ChannelInfo&  info = channels_[ch];

    if (info.state == CHANNEL_CLOSED)
    {
      return false;
    }

    info.state       = CHANNEL_CLOSED;
    info.config_sent = false;
    info.handle      = NULL;
  }

  LogI(kClassName, __func__, "Channel %s closed.\n", ChannelName(ch));

  CompleteWaits(ch, MTC_CHANNEL_NOT_READY);

  return true;
}

//============================================================================
void ChannelRegistry::CloseAll()
{
  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    Close(static_cast<ChannelId>(i));
  }
}

//============================================================================
ChannelState ChannelRegistry::GetState(ChannelId ch) const
{
  if (!IsValidChannel(ch))
  {
    return CHANNEL_CLOSED;
  }

  ScopedLock  lock(&mutex_);

  return channels_[ch].state;
}

//============================================================================
TransportIf* ChannelRegistry::GetHandle(ChannelId ch) const
{
  if (!IsValidChannel(ch))
  {
    return NULL;
  }

  ScopedLock  lock(&mutex_);

  return channels_[ch].handle;
}

//============================================================================
void ChannelRegistry::GetOpenChannels(list<ChannelId>& channels) const
{
  ScopedLock  lock(&mutex_);

  channels.clear();

  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    if (channels_[i].state != CHANNEL_CLOSED)
    {
      channels.push_back(static_cast<ChannelId>(i));
    }
  }
}
