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

/// \brief The channel registry header file.

#ifndef CONFAB_MTC_CHANNEL_REGISTRY_H
#define CONFAB_MTC_CHANNEL_REGISTRY_H

#include "connector_if.h"
#include "mtc_event_handler.h"
#include "mtc_types.h"
#include "timer.h"
#include "transport_if.h"

#include <list>

#include <pthread.h>


namespace confab
{

  /// \brief Receives the outcome of ChannelRegistry::WaitForReady().
  class ReadyWaiterIf
  {
    public:

    /// \brief Destructor.
    virtual ~ReadyWaiterIf() { }

    /// \brief Deliver the wait outcome.
    ///
    /// \param  ch   The channel.
    /// \param  err  MTC_NO_ERROR if the channel became ready, MTC_TIMEOUT
    ///              if the wait timed out, or MTC_CHANNEL_NOT_READY if
    ///              the channel was closed while waiting.
    virtual void ProcessReadyResult(ChannelId ch, MtcError err) = 0;

  }; // end class ReadyWaiterIf

  /// \brief The per-channel state of a session.
  ///
  /// Each channel carries a sequence counter, the config handshake state,
  /// its last config blob, its transport handle and its readiness.  All
  /// per-channel state is guarded by a mutex, so that the capture threads,
  /// the reconnection path and teardown may all call in.  The mutex is
  /// never held while calling out.
  ///
  /// WaitForReady() uses the Timer, and so must be called from the thread
  /// that drives the Timer, as must MarkReady(), Close() and CloseAll().
  class ChannelRegistry
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  timer    The timer used to bound ready waits.
    /// \param  sender   Transmits CONFIG frames.
    /// \param  handler  The session observer.
    ChannelRegistry(Timer& timer, FrameSenderIf& sender,
                    MtcEventHandler& handler);

    /// \brief Destructor.
    virtual ~ChannelRegistry();

    /// \brief Open a channel, in the pending state with a fresh sequence
    /// counter and no config.
    ///
    /// \param  ch      The channel.
    /// \param  handle  The channel's transport handle.  Not owned.
    ///
    /// \return  False if the channel is already open.
    bool Open(ChannelId ch, TransportIf* handle);

    /// \brief Mark a pending channel ready, and complete its waiters.
    ///
    /// The control channel has no codec config, so it counts as config
    /// sent once ready.
    ///
    /// \param  ch  The channel.
    ///
    /// \return  False if the channel is not open.
    bool MarkReady(ChannelId ch);

    /// \brief Fetch and increment a channel's sequence counter.
    ///
    /// The counter wraps at 2^32.
    ///
    /// \param  ch   The channel.
    /// \param  seq  The sequence number to use.
    ///
    /// \return  False if the channel is not open.
    bool NextSequence(ChannelId ch, uint32_t& seq);

    /// \brief Store a channel's config and transmit it as a CONFIG frame.
    ///
    /// The config is stored even when it cannot be sent yet, so that it
    /// is sent once the channel becomes ready.
    ///
    /// \param  ch    The channel.
    /// \param  blob  The config.
    /// \param  err   MTC_CHANNEL_NOT_READY if the channel is pending, or
    ///               the transmit error.
    ///
    /// \return  True if the config was sent.
    bool SendConfig(ChannelId ch, const Bytes& blob, MtcError& err);

    /// \brief Transmit a channel's stored config again.
    ///
    /// \param  ch   The channel.
    /// \param  err  The error code on failure.
    ///
    /// \return  True if the config was sent.
    bool ResendConfig(ChannelId ch, MtcError& err);

    /// \brief Check whether a channel's config has been sent.
    bool IsConfigSent(ChannelId ch) const;

    /// \brief Check whether a channel has a stored config.
    bool HasConfig(ChannelId ch) const;

    /// \brief Get a channel's stored config.
    ///
    /// \return  False if there is no stored config.
    bool GetConfig(ChannelId ch, Bytes& blob) const;

    /// \brief Check whether a channel is ready.
    bool IsReady(ChannelId ch) const;

    /// \brief Check whether a channel is pending or ready.
    bool IsOpen(ChannelId ch) const;

    /// \brief Wait for a channel to become ready.
    ///
    /// If the channel is already ready the waiter is completed before this
    /// method returns.
    ///
    /// \param  ch          The channel.
    /// \param  timeout_ms  The longest wait.
    /// \param  waiter      Receives the outcome.  Must outlive the wait.
    ///
    /// \return  False if the wait could not be started.
    bool WaitForReady(ChannelId ch, uint32_t timeout_ms,
                      ReadyWaiterIf* waiter);

    /// \brief Clear a channel's config sent flag, keeping its handle and
    /// sequence counter.
    ///
    /// Used when the handle survived a reconnection.
    ///
    /// \return  False if the channel is not open.
    bool ResetConfig(ChannelId ch);

    /// \brief Substitute a new transport handle after a reconnection.
    ///
    /// The channel returns to pending with its config sent flag cleared.
    /// The sequence counter and the stored config are preserved.
    ///
    /// \param  ch      The channel.
    /// \param  handle  The new transport handle.  Not owned.
    ///
    /// \return  False if the channel is not open.
    bool Reopen(ChannelId ch, TransportIf* handle);

    /// \brief Restart a channel's sequence counter at zero.
    bool ResetSequence(ChannelId ch);

    /// \brief Set the next sequence number a channel hands out.
    ///
    /// \param  ch     The channel.
    /// \param  value  The next sequence number.
    ///
    /// \return  False if the channel is not open.
    bool SetSequence(ChannelId ch, uint32_t value);

    /// \brief Close a channel.  Closing a closed channel is a no-op.
    ///
    /// The channel is marked closed before its waiters are completed, so
    /// that concurrent senders observe the closed state.
    ///
    /// \return  False if the channel was not open.
    bool Close(ChannelId ch);

    /// \brief Close every channel.
    void CloseAll();

    /// \brief Get a channel's state.
    ChannelState GetState(ChannelId ch) const;

    /// \brief Get a channel's transport handle.
    ///
    /// \return  The handle, or NULL if the channel is not open.
    TransportIf* GetHandle(ChannelId ch) const;

    /// \brief Get the open channels, in channel order.
    void GetOpenChannels(std::list<ChannelId>& channels) const;

    private:

    /// \brief Copy constructor.
    ChannelRegistry(const ChannelRegistry& other);

    /// \brief Copy operator.
    ChannelRegistry& operator=(const ChannelRegistry& other);

    /// \brief The state of one channel.
    struct ChannelInfo
    {
      ChannelInfo();

      uint32_t      next_seq;
      bool          config_sent;
      bool          has_config;
      Bytes         config;
      TransportIf*  handle;
      ChannelState  state;
    };

    /// \brief An outstanding ready wait.
    struct ReadyWait
    {
      ReadyWait(uint32_t wait_id, ChannelId wait_ch, ReadyWaiterIf* w)
          : id(wait_id), ch(wait_ch), waiter(w), timer_handle()
      { }

      uint32_t        id;
      ChannelId       ch;
      ReadyWaiterIf*  waiter;
      Timer::Handle   timer_handle;
    };

    /// \brief Transmit the stored config of a ready channel.
    bool TransmitConfig(ChannelId ch, MtcError& err);

    /// \brief Complete and remove every wait on a channel.
    void CompleteWaits(ChannelId ch, MtcError err);

    /// \brief Timer callback for a ready wait timeout.
    ///
    /// \param  wait_id  The wait identifier.
    void WaitTimeout(uint32_t wait_id);

    /// The timer used to bound ready waits.
    Timer&                  timer_;

    /// Transmits CONFIG frames.
    FrameSenderIf&          sender_;

    /// The session observer.
    MtcEventHandler&        handler_;

    /// The channel table, indexed by ChannelId.
    ChannelInfo             channels_[NUM_CHANNELS];

    /// The outstanding ready waits.
    std::list<ReadyWait*>   waits_;

    /// The next ready wait identifier.
    uint32_t                next_wait_id_;

    /// Guards the channel table.
    mutable pthread_mutex_t mutex_;

  }; // end class ChannelRegistry

} // namespace confab

#endif // CONFAB_MTC_CHANNEL_REGISTRY_H
