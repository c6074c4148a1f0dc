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

#include "transport_mux.h"

#include "control_message.h"
#include "log.h"
#include "unused.h"

#include <inttypes.h>


using ::confab::Bytes;
using ::confab::ChannelId;
using ::confab::ConfigInfo;
using ::confab::ControlMessage;
using ::confab::DatagramTransportIf;
using ::confab::MuxChannelState;
using ::confab::StreamTransportIf;
using ::confab::TransportMux;
using ::std::list;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName)       = "TransportMux";

  /// The default per-channel queue limit, in packets.
  const size_t  kDefaultMaxQueuePackets  = 1024;
}

//============================================================================
TransportMux::MuxChannel::MuxChannel()
    : state(MUX_UNBOUND),
      kind(STREAM_TRANSPORT),
      handle(NULL),
      threshold(0),
      queue()
{
}

//============================================================================
TransportMux::TransportMux(ChannelRegistry& registry, FecPolicy& fec)
    : registry_(registry),
      fec_(fec),
      channels_(),
      max_queue_packets_(kDefaultMaxQueuePackets),
      dropped_frames_(0),
      queue_overflows_(0)
{
}

//============================================================================
TransportMux::~TransportMux()
{
  UnbindAll();
}

//============================================================================
bool TransportMux::Initialize(const ConfigInfo& ci)
{
  max_queue_packets_ = ci.GetUint("mux.max_queue_packets",
                                  kDefaultMaxQueuePackets);

  if (max_queue_packets_ == 0)
  {
    LogE(kClassName, __func__, "mux.max_queue_packets must be positive.\n");
    max_queue_packets_ = kDefaultMaxQueuePackets;
    return false;
  }

  LogC(kClassName, __func__, "mux.max_queue_packets: %zu\n",
       max_queue_packets_);

  return true;
}

//============================================================================
bool TransportMux::Bind(ChannelId ch, TransportKind kind,
                        TransportIf* handle, MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch) || (handle == NULL))
  {
    LogE(kClassName, __func__, "Invalid channel %d or NULL transport.\n",
         static_cast<int>(ch));
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  MuxChannel&  mc = channels_[ch];

  if ((mc.state == MUX_OPENING) || (mc.state == MUX_READY))
  {
    LogE(kClassName, __func__, "Channel %s is already bound.\n",
         ChannelName(ch));
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  if (handle->kind() != kind)
  {
    LogE(kClassName, __func__, "Channel %s: transport is %s, expected "
         "%s.\n", ChannelName(ch), TransportKindToString(handle->kind()),
         TransportKindToString(kind));
    err = MTC_TRANSPORT_FAILURE;
    return false;
  }

  mc.queue.clear();
  mc.kind      = kind;
  mc.handle    = handle;
  mc.threshold = BufferedAmountThreshold(ch);
  mc.state     = MUX_OPENING;

  if (kind == STREAM_TRANSPORT)
  {
    // The stream must name its channel before anything else is written.
    string  init_json;

    if (!ControlMessage::BuildInitChannelStream(ch, init_json))
    {
      mc.state = MUX_FAILED;
      err      = MTC_CHANNEL_NOT_READY;
      return false;
    }

    Bytes  init_msg(init_json.begin(), init_json.end());

    if (!WriteStream(ch, mc, init_msg, err))
    {
      return false;
    }

    mc.state = MUX_READY;
  }
  else
  {
    DatagramTransportIf*  dt = static_cast<DatagramTransportIf*>(handle);

    dt->SetBufferedAmountLowThreshold(mc.threshold);

    if (dt->IsOpen())
    {
      mc.state = MUX_READY;
    }
  }

  LogI(kClassName, __func__, "Channel %s bound to %s transport, state %s.\n",
       ChannelName(ch), TransportKindToString(kind),
       (mc.state == MUX_READY ? "ready" : "opening"));

  return true;
}

//============================================================================
bool TransportMux::MarkOpen(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  MuxChannel&  mc = channels_[ch];

  if (mc.state != MUX_OPENING)
  {
    LogD(kClassName, __func__, "Ignoring open on channel %s in state %d.\n",
         ChannelName(ch), static_cast<int>(mc.state));
    return false;
  }

  mc.state = MUX_READY;

  LogI(kClassName, __func__, "Channel %s is ready.\n", ChannelName(ch));

  return true;
}

//============================================================================
void TransportMux::MarkFailed(ChannelId ch, const string& reason)
{
  if (!IsValidChannel(ch))
  {
    return;
  }

  MuxChannel&  mc = channels_[ch];

  if ((mc.state == MUX_UNBOUND) || (mc.state == MUX_CLOSING) ||
      (mc.state == MUX_FAILED))
  {
    return;
  }

  LogW(kClassName, __func__, "Channel %s failed: %s. Discarding %zu queued "
       "packets.\n", ChannelName(ch), reason.c_str(), mc.queue.size());

  mc.state = MUX_FAILED;
  mc.queue.clear();
}

//============================================================================
bool TransportMux::Send(ChannelId ch, uint32_t seq, uint8_t frame_type,
                        const Bytes& packet, MtcError& err)
{
  if (!CheckReady(ch, err))
  {
    LogD(kClassName, __func__, "Channel %s is not ready, dropping seq "
         "%" PRIu32 ".\n", ChannelName(ch), seq);
    return false;
  }

  if (IsDataFrame(frame_type) && !registry_.IsConfigSent(ch))
  {
    ++dropped_frames_;
    LogD(kClassName, __func__, "Channel %s config not sent, dropping seq "
         "%" PRIu32 ".\n", ChannelName(ch), seq);
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  MuxChannel&  mc = channels_[ch];

  if (mc.kind == STREAM_TRANSPORT)
  {
    return WriteStream(ch, mc, packet, err);
  }

  list<Bytes>  wire_pkts;

  if (!fec_.Protect(packet, seq, frame_type, wire_pkts, err))
  {
    LogW(kClassName, __func__, "Channel %s: cannot wrap seq %" PRIu32
         ": %s.\n", ChannelName(ch), seq, ErrorToString(err));
    return false;
  }

  for (list<Bytes>::const_iterator it = wire_pkts.begin();
       it != wire_pkts.end(); ++it)
  {
    if (!SendOrQueue(ch, mc, *it, err))
    {
      return false;
    }
  }

  return true;
}

//============================================================================
bool TransportMux::SendRaw(ChannelId ch, const Bytes& msg, MtcError& err)
{
  if (!CheckReady(ch, err))
  {
    LogD(kClassName, __func__, "Channel %s is not ready.\n",
         ChannelName(ch));
    return false;
  }

  MuxChannel&  mc = channels_[ch];

  if (mc.kind == STREAM_TRANSPORT)
  {
    return WriteStream(ch, mc, msg, err);
  }

  return SendOrQueue(ch, mc, msg, err);
}

//============================================================================
size_t TransportMux::DrainQueue(ChannelId ch, MtcError& err)
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch))
  {
    return 0;
  }

  MuxChannel&  mc = channels_[ch];

  if ((mc.state != MUX_READY) || (mc.kind != DATAGRAM_TRANSPORT))
  {
    return 0;
  }

  DatagramTransportIf*  dt   = static_cast<DatagramTransportIf*>(mc.handle);
  size_t                sent = 0;

  while ((!mc.queue.empty()) && (dt->GetBufferedAmount() <= mc.threshold))
  {
    const Bytes&  pkt = mc.queue.front();

    if (!dt->Send(&pkt[0], pkt.size()))
    {
      MarkFailed(ch, "datagram send failed while draining");
      err = MTC_TRANSPORT_FAILURE;
      break;
    }

    mc.queue.pop_front();
    ++sent;
  }

  if (sent > 0)
  {
    LogD(kClassName, __func__, "Channel %s: drained %zu packets, %zu "
         "remain.\n", ChannelName(ch), sent, mc.queue.size());
  }

  return sent;
}

//============================================================================
bool TransportMux::Close(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  MuxChannel&  mc = channels_[ch];

  if ((mc.state != MUX_OPENING) && (mc.state != MUX_READY))
  {
    return false;
  }

  LogD(kClassName, __func__, "Closing channel %s, discarding %zu queued "
       "packets.\n", ChannelName(ch), mc.queue.size());

  mc.state = MUX_CLOSING;
  mc.queue.clear();

  return true;
}

//============================================================================
bool TransportMux::Unbind(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return false;
  }

  MuxChannel&  mc = channels_[ch];

  if (mc.state == MUX_UNBOUND)
  {
    return false;
  }

  mc.queue.clear();
  mc.handle    = NULL;
  mc.threshold = 0;
  mc.state     = MUX_UNBOUND;

  LogD(kClassName, __func__, "Channel %s unbound.\n", ChannelName(ch));

  return true;
}

//============================================================================
void TransportMux::UnbindAll()
{
  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    Unbind(static_cast<ChannelId>(i));
  }
}

//============================================================================
bool TransportMux::CheckReady(ChannelId ch, MtcError& err) const
{
  err = MTC_NO_ERROR;

  if (!IsValidChannel(ch))
  {
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  if (channels_[ch].state == MUX_FAILED)
  {
    err = MTC_TRANSPORT_FAILURE;
    return false;
  }

  if (channels_[ch].state != MUX_READY)
  {
    err = MTC_CHANNEL_NOT_READY;
    return false;
  }

  return true;
}

//============================================================================
MuxChannelState TransportMux::GetState(ChannelId ch) const
{
  if (!IsValidChannel(ch))
  {
    return MUX_UNBOUND;
  }

  return channels_[ch].state;
}

//============================================================================
bool TransportMux::GetKind(ChannelId ch, TransportKind& kind) const
{
  if (!IsValidChannel(ch) || (channels_[ch].state == MUX_UNBOUND))
  {
    return false;
  }

  kind = channels_[ch].kind;

  return true;
}

//============================================================================
size_t TransportMux::GetQueueDepth(ChannelId ch) const
{
  if (!IsValidChannel(ch))
  {
    return 0;
  }

  return channels_[ch].queue.size();
}

//============================================================================
bool TransportMux::WriteStream(ChannelId ch, MuxChannel& mc, const Bytes& msg,
                               MtcError& err)
{
  StreamTransportIf*  st = static_cast<StreamTransportIf*>(mc.handle);
  Bytes               framed;
  uint32_t            len = static_cast<uint32_t>(msg.size());

  framed.reserve(kLengthPrefixSize + msg.size());
  framed.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
  framed.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
  framed.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
  framed.push_back(static_cast<uint8_t>(len & 0xFF));
  framed.insert(framed.end(), msg.begin(), msg.end());

  if (!st->Write(&framed[0], framed.size()))
  {
    MarkFailed(ch, "stream write failed");
    err = MTC_TRANSPORT_FAILURE;
    return false;
  }

  return true;
}

//============================================================================
bool TransportMux::SendOrQueue(ChannelId ch, MuxChannel& mc, const Bytes& pkt,
                               MtcError& err)
{
  DatagramTransportIf*  dt = static_cast<DatagramTransportIf*>(mc.handle);

  if (pkt.empty())
  {
    return true;
  }

  if (mc.queue.empty() && (dt->GetBufferedAmount() <= mc.threshold))
  {
    if (!dt->Send(&pkt[0], pkt.size()))
    {
      MarkFailed(ch, "datagram send failed");
      err = MTC_TRANSPORT_FAILURE;
      return false;
    }

    return true;
  }

  if (mc.queue.size() >= max_queue_packets_)
  {
    ++queue_overflows_;
    LogW(kClassName, __func__, "Channel %s queue full (%zu packets), "
         "dropping packet.\n", ChannelName(ch), mc.queue.size());
    return true;
  }

  mc.queue.push_back(pkt);

  return true;
}
