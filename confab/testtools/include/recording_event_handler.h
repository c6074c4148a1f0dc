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

/// \brief Event handlers that record every callback they receive.

#ifndef CONFAB_TESTTOOLS_RECORDING_EVENT_HANDLER_H
#define CONFAB_TESTTOOLS_RECORDING_EVENT_HANDLER_H

#include "channel_registry.h"
#include "mtc_event_handler.h"
#include "mtc_types.h"

#include <string>
#include <utility>
#include <vector>


namespace confab
{
  /// \brief Records MtcEventHandler events and ready wait results.
  class RecordingEventHandler : public MtcEventHandler,
                                public ReadyWaiterIf
  {
    public:

    /// \brief A ProcessReconnecting() call.
    struct ReconnectingEvent
    {
      uint32_t  attempt;
      uint32_t  max_attempts;
      uint32_t  delay_ms;
    };

    /// \brief Constructor.
    RecordingEventHandler();

    /// \brief Destructor.
    virtual ~RecordingEventHandler();

    // MtcEventHandler interface.

    virtual void ProcessConfigReady(ChannelId ch, const Bytes& blob);

    virtual void ProcessChunkSent(ChannelId ch, uint32_t seq);

    virtual void ProcessSendError(ChannelId ch, MtcError err);

    virtual void ProcessReconnecting(uint32_t attempt, uint32_t max_attempts,
                                     uint32_t delay_ms);

    virtual void ProcessReconnected();

    virtual void ProcessConnectionHealthChanged(bool is_healthy);

    virtual void ProcessReconnectionFailed(const std::string& reason);

    virtual void ProcessConfigSent(ChannelId ch);

    virtual void ProcessKeyframeRequest(ChannelId ch);

    virtual void ProcessChannelReady(ChannelId ch);

    // ReadyWaiterIf interface.

    virtual void ProcessReadyResult(ChannelId ch, MtcError err);

    /// \brief Forget all recorded events.
    void Clear();

    std::vector<std::pair<ChannelId, Bytes> >     config_ready;
    std::vector<std::pair<ChannelId, uint32_t> >  chunks_sent;
    std::vector<std::pair<ChannelId, MtcError> >  send_errors;
    std::vector<ReconnectingEvent>                reconnecting;
    size_t                                        reconnected_count;
    std::vector<bool>                             health_changes;
    std::vector<std::string>                      reconnection_failures;
    std::vector<ChannelId>                        config_sent;
    std::vector<ChannelId>                        keyframe_requests;
    std::vector<ChannelId>                        channel_ready;
    std::vector<std::pair<ChannelId, MtcError> >  ready_results;

    private:

    /// \brief Copy constructor.
    RecordingEventHandler(const RecordingEventHandler& other);

    /// \brief Copy operator.
    RecordingEventHandler& operator=(const RecordingEventHandler& other);

  }; // end class RecordingEventHandler
} // namespace confab

#endif // CONFAB_TESTTOOLS_RECORDING_EVENT_HANDLER_H
