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

/// \brief The media transport core event handler header file.

#ifndef CONFAB_MTC_MTC_EVENT_HANDLER_H
#define CONFAB_MTC_MTC_EVENT_HANDLER_H

#include "mtc_types.h"

#include <string>


namespace confab
{

  /// \brief The observer of a media session.
  ///
  /// All methods are called on the thread that drives the session, and
  /// must not call back into the session's send methods.
  class MtcEventHandler
  {
    public:

    /// \brief Destructor.
    virtual ~MtcEventHandler() { }

    /// \brief A channel's codec configuration is available.
    ///
    /// \param  ch    The channel.
    /// \param  blob  The decoder description.
    virtual void ProcessConfigReady(ChannelId ch, const Bytes& blob) = 0;

    /// \brief A data frame was handed to the transport.
    ///
    /// \param  ch   The channel.
    /// \param  seq  The frame sequence number.
    virtual void ProcessChunkSent(ChannelId ch, uint32_t seq) = 0;

    /// \brief A send failed.
    ///
    /// \param  ch   The channel.
    /// \param  err  The error.
    virtual void ProcessSendError(ChannelId ch, MtcError err) = 0;

    /// \brief A reconnection attempt has been scheduled.
    ///
    /// \param  attempt       The attempt number, starting at 1.
    /// \param  max_attempts  The attempt limit.
    /// \param  delay_ms      The wait before the attempt.
    virtual void ProcessReconnecting(uint32_t attempt, uint32_t max_attempts,
                                     uint32_t delay_ms) = 0;

    /// \brief The connection was re-established.
    virtual void ProcessReconnected() = 0;

    /// \brief The health monitor saw a connectivity change.
    ///
    /// \param  is_healthy  The new connectivity state.
    virtual void ProcessConnectionHealthChanged(bool is_healthy) = 0;

    /// \brief Reconnection attempts are exhausted.  Terminal.
    ///
    /// \param  reason  The last failure reason.
    virtual void ProcessReconnectionFailed(const std::string& reason) = 0;

    /// \brief A channel's config was sent.
    ///
    /// \param  ch  The channel.
    virtual void ProcessConfigSent(ChannelId ch)
    {
      return;
    }

    /// \brief A fresh keyframe is needed on a video channel.
    ///
    /// \param  ch  The channel.
    virtual void ProcessKeyframeRequest(ChannelId ch)
    {
      return;
    }

    /// \brief A channel became ready.
    ///
    /// \param  ch  The channel.
    virtual void ProcessChannelReady(ChannelId ch)
    {
      return;
    }

  }; // end class MtcEventHandler

} // namespace confab

#endif // CONFAB_MTC_MTC_EVENT_HANDLER_H
