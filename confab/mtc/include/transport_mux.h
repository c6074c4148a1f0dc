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

/// \brief The transport multiplexer header file.
///
/// Binds each channel to a stream or datagram transport and hides their
/// different flow control behind one Send() call.

#ifndef CONFAB_MTC_TRANSPORT_MUX_H
#define CONFAB_MTC_TRANSPORT_MUX_H

#include "channel_registry.h"
#include "config_info.h"
#include "fec_policy.h"
#include "mtc_types.h"
#include "transport_if.h"

#include <list>
#include <string>


namespace confab
{

  /// \brief The transport multiplexer.
  ///
  /// Stream transport channels carry length(4) + packet messages, and the
  /// blocking Write() is the backpressure.  Datagram transport channels
  /// carry regular or FEC wrapped packets, and are sent immediately only
  /// when the channel's buffered amount is at or below its threshold and
  /// nothing is queued.  Otherwise packets wait in a per-channel FIFO that
  /// DrainQueue() empties when the transport reports a low buffered
  /// amount.
  ///
  /// Per-channel states are MUX_UNBOUND, MUX_OPENING, MUX_READY,
  /// MUX_CLOSING and MUX_FAILED.  A channel only reaches MUX_READY once its
  /// transport is open.  A transport error moves it to MUX_FAILED, and it
  /// stays there until it is unbound and bound again.  Sends on a failed
  /// channel report MTC_TRANSPORT_FAILURE.  Close() holds a channel in
  /// MUX_CLOSING while its transport is closed, and Unbind() returns it to
  /// MUX_UNBOUND.
  ///
  /// Not thread-safe.  All methods are called from the event loop thread.
  class TransportMux
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  registry  The channel registry, consulted for config state.
    /// \param  fec       The FEC policy used on datagram transports.
    TransportMux(ChannelRegistry& registry, FecPolicy& fec);

    /// \brief Destructor.
    virtual ~TransportMux();

    /// \brief Initialize from configuration.
    ///
    /// \param  ci  The configuration.  Reads "mux.max_queue_packets".
    ///
    /// \return  False if the queue limit is zero.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Bind a channel to a transport.
    ///
    /// A stream transport is sent the init_channel_stream command and
    /// becomes ready.  A datagram transport has its low buffered amount
    /// threshold set, and is ready only if it is already open.
    ///
    /// \param  ch      The channel.
    /// \param  kind    The transport kind.  Must match the handle.
    /// \param  handle  The transport.  Not owned.
    /// \param  err     Set on failure.
    ///
    /// \return  True on success.
    bool Bind(ChannelId ch, TransportKind kind, TransportIf* handle,
              MtcError& err);

    /// \brief Note that a datagram transport has opened.
    ///
    /// \param  ch  The channel.
    ///
    /// \return  True if the channel moved to MUX_READY.
    bool MarkOpen(ChannelId ch);

    /// \brief Note a transport error.  Queued packets are discarded.
    ///
    /// \param  ch      The channel.
    /// \param  reason  The reason, for logging.
    void MarkFailed(ChannelId ch, const std::string& reason);

    /// \brief Send a standard frame packet.
    ///
    /// Data frames on a channel whose config has not been sent are dropped
    /// and counted.
    ///
    /// \param  ch          The channel.
    /// \param  seq         The packet's sequence number.
    /// \param  frame_type  The packet's frame type.
    /// \param  packet      The standard frame packet.
    /// \param  err         Set on failure.
    ///
    /// \return  True if the packet was sent or queued.
    bool Send(ChannelId ch, uint32_t seq, uint8_t frame_type,
              const Bytes& packet, MtcError& err);

    /// \brief Send a message without framing or FEC.
    ///
    /// On a stream transport the message is length prefixed.
    ///
    /// \param  ch   The channel.
    /// \param  msg  The message.
    /// \param  err  Set on failure.
    ///
    /// \return  True if the message was sent or queued.
    bool SendRaw(ChannelId ch, const Bytes& msg, MtcError& err);

    /// \brief Send queued datagram packets while the buffered amount is at
    /// or below the threshold.
    ///
    /// A failed send fails the channel and discards the rest of the
    /// queue.
    ///
    /// \param  ch   The channel.
    /// \param  err  Set to MTC_TRANSPORT_FAILURE if a send failed.
    ///
    /// \return  The number of packets sent.
    size_t DrainQueue(ChannelId ch, MtcError& err);

    /// \brief Start closing a channel.
    ///
    /// The channel moves to MUX_CLOSING and its queue is discarded.  Sends
    /// are refused until Unbind() completes the close.
    ///
    /// \param  ch  The channel.
    ///
    /// \return  False if the channel was not opening or ready.
    bool Close(ChannelId ch);

    /// \brief Unbind a channel, discarding its queue.
    ///
    /// \param  ch  The channel.
    ///
    /// \return  False if the channel was not bound.
    bool Unbind(ChannelId ch);

    /// \brief Unbind all channels.
    void UnbindAll();

    /// \brief Get a channel's state.
    MuxChannelState GetState(ChannelId ch) const;

    /// \brief Get a channel's transport kind.
    ///
    /// \param  ch    The channel.
    /// \param  kind  The kind.
    ///
    /// \return  False if the channel is not bound.
    bool GetKind(ChannelId ch, TransportKind& kind) const;

    /// \brief Get the number of queued packets for a channel.
    size_t GetQueueDepth(ChannelId ch) const;

    /// \brief Get the number of data frames dropped before config.
    inline size_t dropped_frames() const
    {
      return dropped_frames_;
    }

    /// \brief Get the number of packets dropped on a full queue.
    inline size_t queue_overflows() const
    {
      return queue_overflows_;
    }

    /// \brief Get the queue limit.
    inline size_t max_queue_packets() const
    {
      return max_queue_packets_;
    }

    private:

    /// \brief Copy constructor.
    TransportMux(const TransportMux& other);

    /// \brief Copy operator.
    TransportMux& operator=(const TransportMux& other);

    /// \brief A channel's binding.
    struct MuxChannel
    {
      MuxChannel();

      /// The binding state.
      MuxChannelState       state;

      /// The transport kind.
      TransportKind         kind;

      /// The transport.  Not owned.
      TransportIf*          handle;

      /// The datagram send threshold, in bytes.
      size_t                threshold;

      /// Datagram packets waiting for buffer space.
      std::list<Bytes>      queue;
    };

    /// \brief Check that a channel can send.
    ///
    /// Sets err to MTC_TRANSPORT_FAILURE for a failed channel, or
    /// MTC_CHANNEL_NOT_READY for any other state but MUX_READY.
    bool CheckReady(ChannelId ch, MtcError& err) const;

    /// \brief Write a length prefixed message to a stream transport.
    bool WriteStream(ChannelId ch, MuxChannel& mc, const Bytes& msg,
                     MtcError& err);

    /// \brief Send a datagram now, or queue it.
    bool SendOrQueue(ChannelId ch, MuxChannel& mc, const Bytes& pkt,
                     MtcError& err);

    /// The channel registry.
    ChannelRegistry&  registry_;

    /// The FEC policy.
    FecPolicy&        fec_;

    /// The channel bindings, indexed by ChannelId.
    MuxChannel        channels_[NUM_CHANNELS];

    /// The per-channel queue limit.
    size_t            max_queue_packets_;

    /// Data frames dropped because config was not sent.
    size_t            dropped_frames_;

    /// Packets dropped on a full queue.
    size_t            queue_overflows_;

  }; // end class TransportMux

} // namespace confab

#endif // CONFAB_MTC_TRANSPORT_MUX_H
