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

#include "media_session.h"

#include "log.h"
#include "unused.h"

#include <inttypes.h>


using ::confab::Bytes;
using ::confab::ChannelId;
using ::confab::ConfigInfo;
using ::confab::ControlMessage;
using ::confab::EncodedChunk;
using ::confab::Log;
using ::confab::MediaSession;
using ::confab::PacketCodec;
using ::confab::PublisherState;
using ::confab::StreamConfig;
using ::std::list;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)       = "MediaSession";

  /// The default ready wait timeout.
  const uint32_t  kDefaultReadyTimeoutMs   = 5000;

  /// The most control commands held for the control channel.
  const size_t    kMaxPendingCommands      = 256;
}

//============================================================================
MediaSession::MediaSession(Timer& timer, ConnectorIf& connector,
                           MtcEventHandler& handler)
    : connector_(connector),
      handler_(handler),
      codec_(),
      fec_(),
      registry_(timer, *this, handler),
      mux_(registry_, fec_),
      reconn_(timer, connector, *this, handler),
      pending_commands_(),
      ready_timeout_ms_(kDefaultReadyTimeoutMs),
      last_media_ts_ms_(0),
      dropped_chunks_(0),
      torn_down_(false)
{
  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    normalizers_[i] = NULL;
    kinds_[i]       = STREAM_TRANSPORT;
  }
}

//============================================================================
MediaSession::~MediaSession()
{
  Teardown();
}

//============================================================================
bool MediaSession::Initialize(const ConfigInfo& ci)
{
  string  log_level = ci.Get("log.level", "");

  if (!log_level.empty())
  {
    Log::SetDefaultLevel(log_level);
  }

  ready_timeout_ms_ = ci.GetUint("registry.ready_timeout_ms",
                                 kDefaultReadyTimeoutMs);

  LogC(kClassName, __func__, "registry.ready_timeout_ms: %" PRIu32 "\n",
       ready_timeout_ms_);

  if (!mux_.Initialize(ci))
  {
    LogE(kClassName, __func__, "Transport multiplexer initialization "
         "failed.\n");
    return false;
  }

  if (!reconn_.Initialize(ci))
  {
    LogE(kClassName, __func__, "Reconnection controller initialization "
         "failed.\n");
    return false;
  }

  return true;
}

//============================================================================
bool MediaSession::Start()
{
  return reconn_.StartHealthMonitor();
}

//============================================================================
bool MediaSession::SetNormalizer(ChannelId ch, CodecNormalizerIf* normalizer)
{
  if (!IsValidChannel(ch))
  {
    LogE(kClassName, __func__, "Invalid channel %d.\n", static_cast<int>(ch));
    return false;
  }

  normalizers_[ch] = normalizer;

  return true;
}

//============================================================================
bool MediaSession::OpenChannel(ChannelId ch, TransportKind kind,
                               TransportIf* handle)
{
  if (!IsValidChannel(ch) || (handle == NULL))
  {
    LogE(kClassName, __func__, "Invalid channel %d or NULL transport.\n",
         static_cast<int>(ch));
    return false;
  }

  if (!registry_.Open(ch, handle))
  {
    return false;
  }

  MtcError  err = MTC_NO_ERROR;

  if (!mux_.Bind(ch, kind, handle, err))
  {
    LogW(kClassName, __func__, "Cannot bind channel %s: %s.\n",
         ChannelName(ch), ErrorToString(err));
    registry_.Close(ch);
    return false;
  }

  kinds_[ch] = kind;
  torn_down_ = false;

  if (normalizers_[ch] != NULL)
  {
    normalizers_[ch]->Reset();
  }

  if (mux_.GetState(ch) == MUX_READY)
  {
    OnChannelReady(ch);
  }

  return true;
}

//============================================================================
bool MediaSession::SendChunk(ChannelId ch, const EncodedChunk& chunk,
                             MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch) || (ChannelMediaKind(ch) == MEDIA_CONTROL))
  {
    LogE(kClassName, __func__, "Channel %d does not carry media.\n",
         static_cast<int>(ch));
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  list<EncodedChunk>  chunks;

  if (normalizers_[ch] != NULL)
  {
    normalizers_[ch]->Normalize(chunk, chunks);
  }
  else
  {
    chunks.push_back(chunk);
  }

  // Every released chunk is attempted so that each failure is counted.
  bool  ok = true;

  for (list<EncodedChunk>::const_iterator it = chunks.begin();
       it != chunks.end(); ++it)
  {
    MtcError  chunk_err = MTC_NO_ERROR;

    if ((!SendOneChunk(ch, *it, chunk_err)) && ok)
    {
      ok  = false;
      err = chunk_err;
    }
  }

  return ok;
}

//============================================================================
bool MediaSession::SendConfig(ChannelId ch, const StreamConfig& cfg,
                              MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch) || (ChannelMediaKind(ch) == MEDIA_CONTROL))
  {
    LogE(kClassName, __func__, "Channel %d does not carry media.\n",
         static_cast<int>(ch));
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  string  json;

  if (!ControlMessage::BuildMediaConfig(cfg, json))
  {
    err = MTC_DECODE_ERROR;
    return false;
  }

  Bytes  blob(json.begin(), json.end());

  if (registry_.SendConfig(ch, blob, err))
  {
    return true;
  }

  if ((err == MTC_CHANNEL_NOT_READY) && registry_.IsOpen(ch) &&
      registry_.HasConfig(ch))
  {
    LogI(kClassName, __func__, "Holding config for channel %s until it is "
         "ready.\n", ChannelName(ch));
    err = MTC_NO_ERROR;
    return true;
  }

  return false;
}

//============================================================================
bool MediaSession::SendEvent(const string& event_json, MtcError& err)
{
  string  json;

  err = MTC_NO_ERROR;

  if (!ControlMessage::BuildEvent(event_json, json))
  {
    err = MTC_DECODE_ERROR;
    return false;
  }

  return SendCommand(json, err);
}

//============================================================================
bool MediaSession::SendPublisherState(const PublisherState& state,
                                      MtcError& err)
{
  string  json;

  err = MTC_NO_ERROR;

  if (!ControlMessage::BuildPublisherState(state, json))
  {
    err = MTC_DECODE_ERROR;
    return false;
  }

  return SendCommand(json, err);
}

//============================================================================
bool MediaSession::WaitForReady(ChannelId ch, ReadyWaiterIf* waiter)
{
  return registry_.WaitForReady(ch, ready_timeout_ms_, waiter);
}

//============================================================================
bool MediaSession::CloseChannel(ChannelId ch)
{
  if (!registry_.IsOpen(ch))
  {
    return false;
  }

  TransportIf*  handle = registry_.GetHandle(ch);

  // In-flight sends see the closed state before the transport goes away.
  registry_.Close(ch);
  mux_.Close(ch);

  if (normalizers_[ch] != NULL)
  {
    normalizers_[ch]->Reset();
  }

  if (handle != NULL)
  {
    handle->Close();
  }

  mux_.Unbind(ch);

  return true;
}

//============================================================================
void MediaSession::Teardown()
{
  if (torn_down_)
  {
    return;
  }

  torn_down_ = true;

  LogI(kClassName, __func__, "Tearing down session.\n");

  reconn_.Stop();

  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    CloseChannel(static_cast<ChannelId>(i));
  }

  pending_commands_.clear();
  codec_.ResetBaseTimestamp();
  last_media_ts_ms_ = 0;
}

//============================================================================
bool MediaSession::SendFrame(ChannelId ch, uint8_t frame_type,
                             const uint8_t* payload, size_t len,
                             MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!registry_.IsOpen(ch))
  {
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  // Stream transports carry control JSON unframed.
  if (kinds_[ch] == STREAM_TRANSPORT)
  {
    Bytes  msg;

    if (len > 0)
    {
      msg.assign(payload, payload + len);
    }

    if (!mux_.SendRaw(ch, msg, err))
    {
      if (err != MTC_CHANNEL_NOT_READY)
      {
        HandleSendFailure(ch, err);
      }

      return false;
    }

    return true;
  }

  uint32_t  seq = 0;
  Bytes     packet;

  if (!registry_.NextSequence(ch, seq))
  {
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  // Control frames reuse the latest media timestamp so that they do not
  // fix the connection's base timestamp.
  if (!PacketCodec::EncodeStandardRaw(payload, len, last_media_ts_ms_,
                                      frame_type, seq, packet))
  {
    err = MTC_DECODE_ERROR;
    return false;
  }

  if (!mux_.Send(ch, seq, frame_type, packet, err))
  {
    if (err != MTC_CHANNEL_NOT_READY)
    {
      HandleSendFailure(ch, err);
    }

    return false;
  }

  return true;
}

//============================================================================
bool MediaSession::RebindChannels()
{
  list<ChannelId>  open_channels;

  registry_.GetOpenChannels(open_channels);

  LogI(kClassName, __func__, "Rebinding %zu channels.\n",
       open_channels.size());

  // A new connection gets a new timestamp base.
  codec_.ResetBaseTimestamp();
  last_media_ts_ms_ = 0;

  for (list<ChannelId>::const_iterator it = open_channels.begin();
       it != open_channels.end(); ++it)
  {
    ChannelId      ch         = *it;
    TransportKind  kind       = kinds_[ch];
    TransportIf*   old_handle = registry_.GetHandle(ch);
    TransportIf*   new_handle = connector_.CreateChannelTransport(ch, kind);

    if (new_handle == NULL)
    {
      LogW(kClassName, __func__, "No %s transport for channel %s.\n",
           TransportKindToString(kind), ChannelName(ch));
      return false;
    }

    mux_.Unbind(ch);

    if (new_handle == old_handle)
    {
      registry_.ResetConfig(ch);
    }
    else
    {
      registry_.Reopen(ch, new_handle);
    }

    MtcError  err = MTC_NO_ERROR;

    if (!mux_.Bind(ch, kind, new_handle, err))
    {
      LogW(kClassName, __func__, "Cannot rebind channel %s: %s.\n",
           ChannelName(ch), ErrorToString(err));
      return false;
    }

    if (mux_.GetState(ch) == MUX_READY)
    {
      OnChannelReady(ch);
    }

    if (ChannelMediaKind(ch) == MEDIA_VIDEO)
    {
      handler_.ProcessKeyframeRequest(ch);
    }
  }

  return true;
}

//============================================================================
void MediaSession::ProcessOpen(ChannelId ch)
{
  if (mux_.MarkOpen(ch))
  {
    OnChannelReady(ch);
  }
}

//============================================================================
void MediaSession::ProcessBufferedAmountLow(ChannelId ch)
{
  MtcError  err = MTC_NO_ERROR;

  mux_.DrainQueue(ch, err);

  if (err == MTC_TRANSPORT_FAILURE)
  {
    HandleSendFailure(ch, err);
  }
}

//============================================================================
void MediaSession::ProcessTransportError(ChannelId ch, const string& reason)
{
  if (!registry_.IsOpen(ch))
  {
    return;
  }

  LogW(kClassName, __func__, "Transport error on channel %s: %s\n",
       ChannelName(ch), reason.c_str());

  mux_.MarkFailed(ch, reason);
  handler_.ProcessSendError(ch, MTC_TRANSPORT_FAILURE);
  reconn_.RequestReconnect(reason);
}

//============================================================================
bool MediaSession::IsChannelReady(ChannelId ch) const
{
  return (registry_.IsReady(ch) && (mux_.GetState(ch) == MUX_READY));
}

//============================================================================
void MediaSession::OnChannelReady(ChannelId ch)
{
  if (!registry_.MarkReady(ch))
  {
    return;
  }

  if (registry_.HasConfig(ch))
  {
    MtcError  err = MTC_NO_ERROR;

    if (!registry_.ResendConfig(ch, err))
    {
      LogW(kClassName, __func__, "Cannot resend config on channel %s: "
           "%s.\n", ChannelName(ch), ErrorToString(err));
    }
  }

  if (ch == CH_MEETING_CONTROL)
  {
    FlushPendingCommands();
  }
}

//============================================================================
bool MediaSession::SendCommand(const string& json, MtcError& err)
{
  err = MTC_NO_ERROR;

  if ((!IsChannelReady(CH_MEETING_CONTROL)) ||
      (reconn_.state() != RECONN_STABLE) || (!pending_commands_.empty()))
  {
    if (pending_commands_.size() >= kMaxPendingCommands)
    {
      LogW(kClassName, __func__, "Too many held commands, dropping the "
           "oldest.\n");
      pending_commands_.pop_front();
    }

    pending_commands_.push_back(json);

    // Commands held behind earlier ones go out as soon as possible.
    if (IsChannelReady(CH_MEETING_CONTROL) &&
        (reconn_.state() == RECONN_STABLE))
    {
      FlushPendingCommands();
    }

    return true;
  }

  return SendFrame(CH_MEETING_CONTROL, FRAME_EVENT,
                   reinterpret_cast<const uint8_t*>(json.data()),
                   json.size(), err);
}

//============================================================================
void MediaSession::FlushPendingCommands()
{
  while ((!pending_commands_.empty()) && IsChannelReady(CH_MEETING_CONTROL))
  {
    const string&  json = pending_commands_.front();
    MtcError       err  = MTC_NO_ERROR;

    if (!SendFrame(CH_MEETING_CONTROL, FRAME_EVENT,
                   reinterpret_cast<const uint8_t*>(json.data()),
                   json.size(), err))
    {
      if ((err == MTC_CHANNEL_NOT_READY) || (err == MTC_TRANSPORT_FAILURE))
      {
        // Keep it for the next time the channel becomes ready.
        return;
      }

      LogW(kClassName, __func__, "Dropping held command: %s.\n",
           ErrorToString(err));
    }

    pending_commands_.pop_front();
  }
}

//============================================================================
bool MediaSession::SendOneChunk(ChannelId ch, const EncodedChunk& chunk,
                                MtcError& err)
{
  if (reconn_.state() != RECONN_STABLE)
  {
    ++dropped_chunks_;
    LogD(kClassName, __func__, "Reconnecting, dropping chunk on channel "
         "%s.\n", ChannelName(ch));
    err = MTC_TRANSPORT_FAILURE;
    return false;
  }

  if (!registry_.IsConfigSent(ch))
  {
    ++dropped_chunks_;
    LogD(kClassName, __func__, "Config not sent, dropping chunk on channel "
         "%s.\n", ChannelName(ch));
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  uint32_t  seq = 0;

  if (!registry_.NextSequence(ch, seq))
  {
    ++dropped_chunks_;
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  uint8_t   frame_type = FrameTypeFor(ch, chunk.keyframe);
  uint32_t  ts_ms      = codec_.NormalizeTimestamp(chunk.timestamp_us);
  Bytes     packet;

  if (!PacketCodec::EncodeStandardRaw(
        (chunk.data.empty() ? NULL : &chunk.data[0]), chunk.data.size(),
        ts_ms, frame_type, seq, packet))
  {
    ++dropped_chunks_;
    err = MTC_DECODE_ERROR;
    return false;
  }

  last_media_ts_ms_ = ts_ms;

  if (!mux_.Send(ch, seq, frame_type, packet, err))
  {
    ++dropped_chunks_;

    if (err != MTC_CHANNEL_NOT_READY)
    {
      HandleSendFailure(ch, err);
    }

    return false;
  }

  handler_.ProcessChunkSent(ch, seq);

  return true;
}

//============================================================================
void MediaSession::HandleSendFailure(ChannelId ch, MtcError err)
{
  LogW(kClassName, __func__, "Send on channel %s failed: %s.\n",
       ChannelName(ch), ErrorToString(err));

  handler_.ProcessSendError(ch, err);

  if (err == MTC_TRANSPORT_FAILURE)
  {
    reconn_.RequestReconnect(string("transport failure on channel ") +
                             ChannelName(ch));
  }
}
