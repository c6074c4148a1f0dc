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

#include "recording_event_handler.h"

#include "log.h"
#include "unused.h"


using ::confab::RecordingEventHandler;
using ::std::make_pair;
using ::std::string;


namespace
{
  const char* UNUSED(kClassName) = "RecordingEventHandler";
}

//============================================================================
RecordingEventHandler::RecordingEventHandler()
    : config_ready(), chunks_sent(), send_errors(), reconnecting(),
      reconnected_count(0), health_changes(), reconnection_failures(),
      config_sent(), keyframe_requests(), channel_ready(), ready_results()
{
}

//============================================================================
RecordingEventHandler::~RecordingEventHandler()
{
}

//============================================================================
void RecordingEventHandler::ProcessConfigReady(ChannelId ch, const Bytes& blob)
{
  config_ready.push_back(make_pair(ch, blob));
}

//============================================================================
void RecordingEventHandler::ProcessChunkSent(ChannelId ch, uint32_t seq)
{
  chunks_sent.push_back(make_pair(ch, seq));
}

//============================================================================
void RecordingEventHandler::ProcessSendError(ChannelId ch, MtcError err)
{
  send_errors.push_back(make_pair(ch, err));
}

//============================================================================
void RecordingEventHandler::ProcessReconnecting(uint32_t attempt,
                                                uint32_t max_attempts,
                                                uint32_t delay_ms)
{
  ReconnectingEvent  ev;

  ev.attempt      = attempt;
  ev.max_attempts = max_attempts;
  ev.delay_ms     = delay_ms;

  reconnecting.push_back(ev);
}

//============================================================================
void RecordingEventHandler::ProcessReconnected()
{
  ++reconnected_count;
}

//============================================================================
void RecordingEventHandler::ProcessConnectionHealthChanged(bool is_healthy)
{
  health_changes.push_back(is_healthy);
}

//============================================================================
void RecordingEventHandler::ProcessReconnectionFailed(const string& reason)
{
  LogD(kClassName, __func__, "Reconnection failed: %s\n", reason.c_str());
  reconnection_failures.push_back(reason);
}

//============================================================================
void RecordingEventHandler::ProcessConfigSent(ChannelId ch)
{
  config_sent.push_back(ch);
}

//============================================================================
void RecordingEventHandler::ProcessKeyframeRequest(ChannelId ch)
{
  keyframe_requests.push_back(ch);
}

//============================================================================
void RecordingEventHandler::ProcessChannelReady(ChannelId ch)
{
  channel_ready.push_back(ch);
}

//============================================================================
void RecordingEventHandler::ProcessReadyResult(ChannelId ch, MtcError err)
{
  ready_results.push_back(make_pair(ch, err));
}

//============================================================================
void RecordingEventHandler::Clear()
{
  config_ready.clear();
  chunks_sent.clear();
  send_errors.clear();
  reconnecting.clear();
  reconnected_count = 0;
  health_changes.clear();
  reconnection_failures.clear();
  config_sent.clear();
  keyframe_requests.clear();
  channel_ready.clear();
  ready_results.clear();
}
