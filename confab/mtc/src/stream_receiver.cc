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

#include "stream_receiver.h"

#include "log.h"
#include "unused.h"

#include <inttypes.h>
#include <list>


using ::confab::Bytes;
using ::confab::ControlMessage;
using ::confab::MediaFrame;
using ::confab::StreamConfig;
using ::confab::StreamReceiver;
using ::std::list;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "StreamReceiver";
}

//============================================================================
StreamReceiver::StreamReceiver(ReceiverHandlerIf& handler)
    : handler_(handler),
      reader_(),
      codec_(),
      state_(RECV_READING),
      keyframe_received_(false),
      message_count_(0),
      gated_frames_(0),
      decode_errors_(0)
{
}

//============================================================================
StreamReceiver::~StreamReceiver()
{
  // Nothing to destroy.
}

//============================================================================
bool StreamReceiver::ProcessBytes(const uint8_t* buf, size_t len)
{
  if (state_ != RECV_READING)
  {
    LogD(kClassName, __func__, "Not reading, ignoring %zu bytes.\n", len);
    return false;
  }

  if (!reader_.Append(buf, len))
  {
    return false;
  }

  state_ = RECV_DISPATCHING;

  Bytes  msg;

  while ((state_ == RECV_DISPATCHING) && reader_.GetNextMessage(msg))
  {
    ++message_count_;

    if ((!msg.empty()) && (msg[0] == '{'))
    {
      DispatchJson(msg);
    }
    else
    {
      DispatchFrame(msg);
    }
  }

  if (reader_.HasError())
  {
    LogE(kClassName, __func__, "Stream framing lost, stopping.\n");
    state_ = RECV_STOPPED;
    return false;
  }

  if (state_ == RECV_DISPATCHING)
  {
    state_ = RECV_READING;
  }

  return (state_ == RECV_READING);
}

//============================================================================
bool StreamReceiver::ProcessEndOfStream()
{
  bool  complete = reader_.EndOfStream();

  if (!complete)
  {
    LogW(kClassName, __func__, "Incomplete message at end of stream.\n");
  }

  state_ = RECV_STOPPED;

  return complete;
}

//============================================================================
void StreamReceiver::Stop()
{
  if (state_ == RECV_STOPPED)
  {
    return;
  }

  LogD(kClassName, __func__, "Receiver stopped.\n");

  state_ = RECV_STOPPED;
}

//============================================================================
void StreamReceiver::Reset()
{
  reader_.Reset();
  codec_.ResetBaseTimestamp();

  state_             = RECV_READING;
  keyframe_received_ = false;
}

//============================================================================
void StreamReceiver::DispatchJson(const Bytes& msg)
{
  string  json(msg.begin(), msg.end());
  string  type;

  if (!ControlMessage::ParseMessageType(json, type))
  {
    ++decode_errors_;
    LogW(kClassName, __func__, "Dropping malformed JSON message (%zu "
         "bytes).\n", msg.size());
    return;
  }

  if (type == "StreamConfig")
  {
    StreamConfig  cfg;

    if (!ControlMessage::ParseStreamConfig(json, cfg))
    {
      ++decode_errors_;
      return;
    }

    handler_.ProcessStreamConfig(cfg);
    return;
  }

  if (type == "DecoderConfigs")
  {
    list<StreamConfig>  configs;

    if (!ControlMessage::ParseDecoderConfigs(json, configs))
    {
      ++decode_errors_;
      return;
    }

    for (list<StreamConfig>::const_iterator it = configs.begin();
         it != configs.end(); ++it)
    {
      handler_.ProcessStreamConfig(*it);
    }

    return;
  }

  handler_.ProcessServerEvent(type, json);
}

//============================================================================
void StreamReceiver::DispatchFrame(const Bytes& msg)
{
  MediaFrame  frame;

  if (msg.empty() || !codec_.DecodeStandard(&msg[0], msg.size(), frame))
  {
    ++decode_errors_;
    return;
  }

  if (IsVideoFrame(frame.frame_type))
  {
    if (IsKeyFrame(frame.frame_type))
    {
      if (!keyframe_received_)
      {
        LogI(kClassName, __func__, "First key frame, seq %" PRIu32 ".\n",
             frame.seq);
      }

      keyframe_received_ = true;
    }
    else if (!keyframe_received_)
    {
      ++gated_frames_;
      LogD(kClassName, __func__, "Dropping delta frame seq %" PRIu32
           " before first key frame.\n", frame.seq);
      return;
    }
  }

  handler_.ProcessMediaFrame(frame);
}
