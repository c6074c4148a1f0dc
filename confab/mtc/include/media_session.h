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

/// \brief The media session header file.
///
/// The publisher facing entry point of the media transport core.  Wires the
/// packet codec, FEC policy, channel registry, transport multiplexer and
/// reconnection controller together.

#ifndef CONFAB_MTC_MEDIA_SESSION_H
#define CONFAB_MTC_MEDIA_SESSION_H

#include "channel_registry.h"
#include "codec_normalizer.h"
#include "config_info.h"
#include "connector_if.h"
#include "control_message.h"
#include "erasure_coder_if.h"
#include "fec_policy.h"
#include "mtc_event_handler.h"
#include "mtc_types.h"
#include "packet_codec.h"
#include "reconnection_controller.h"
#include "timer.h"
#include "transport_if.h"
#include "transport_mux.h"

#include <list>
#include <string>


namespace confab
{

  /// \brief A publisher media session.
  ///
  /// Encoded chunks are only sent on channels whose config has been sent.
  /// Chunks on other channels are dropped and counted.  While the
  /// connection is being re-established every chunk is dropped.  Configs
  /// and control commands given before their channel is ready are held and
  /// sent once it becomes ready.
  ///
  /// The transports report their events through the TransportListenerIf
  /// methods.  After a reconnect, every open channel is bound to a fresh
  /// transport from the connector, its last config is resent, and a key
  /// frame is requested on video channels.
  ///
  /// All methods run on the event loop thread.
  class MediaSession : public FrameSenderIf,
                       public RebindHandlerIf,
                       public TransportListenerIf
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  timer      The event loop timer.
    /// \param  connector  Establishes the connection and creates channel
    ///                    transports.
    /// \param  handler    Receives session events.
    MediaSession(Timer& timer, ConnectorIf& connector,
                 MtcEventHandler& handler);

    /// \brief Destructor.  Tears the session down.
    virtual ~MediaSession();

    /// \brief Initialize from configuration.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  False if any component rejects its configuration.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Start the connection health monitor.
    ///
    /// \return  False if the monitor cannot be started.
    bool Start();

    /// \brief Install the erasure coder used for FEC.  Not owned.
    ///
    /// \param  coder  The coder, or NULL to send without FEC.
    inline void set_erasure_coder(ErasureCoderIf* coder)
    {
      fec_.set_erasure_coder(coder);
    }

    /// \brief Install a chunk normalizer on a channel.  Not owned.
    ///
    /// \param  ch          The channel.
    /// \param  normalizer  The normalizer, or NULL for none.
    ///
    /// \return  False if the channel is invalid.
    bool SetNormalizer(ChannelId ch, CodecNormalizerIf* normalizer);

    /// \brief Open a channel on a transport.
    ///
    /// \param  ch      The channel.
    /// \param  kind    The transport kind.
    /// \param  handle  The transport.  Owned by the connector.
    ///
    /// \return  True on success.
    bool OpenChannel(ChannelId ch, TransportKind kind, TransportIf* handle);

    /// \brief Send an encoded chunk.
    ///
    /// \param  ch     The channel.
    /// \param  chunk  The chunk.
    /// \param  err    Set to the first failure if a frame could not be
    ///                sent.  The remaining frames are still attempted.
    ///
    /// \return  True if every resulting frame was sent or queued, or was
    ///          held back by the channel's normalizer.
    bool SendChunk(ChannelId ch, const EncodedChunk& chunk, MtcError& err);

    /// \brief Send a channel's codec configuration.
    ///
    /// \param  ch   The channel.
    /// \param  cfg  The configuration.
    /// \param  err  Set on failure.
    ///
    /// \return  True if the config was sent, or held until the channel is
    ///          ready.
    bool SendConfig(ChannelId ch, const StreamConfig& cfg, MtcError& err);

    /// \brief Send an event on the control channel.
    ///
    /// \param  event_json  The event as JSON.
    /// \param  err         Set on failure.
    ///
    /// \return  True if the event was sent, or held until the control
    ///          channel is ready.
    bool SendEvent(const std::string& event_json, MtcError& err);

    /// \brief Send the publisher's device state on the control channel.
    ///
    /// \param  state  The state.
    /// \param  err    Set on failure.
    ///
    /// \return  True if the state was sent, or held until the control
    ///          channel is ready.
    bool SendPublisherState(const PublisherState& state, MtcError& err);

    /// \brief Wait for a channel to become ready, bounded by
    /// "registry.ready_timeout_ms".
    ///
    /// \param  ch      The channel.
    /// \param  waiter  Receives the result.  Must outlive the wait.
    ///
    /// \return  False if the wait could not be started.
    bool WaitForReady(ChannelId ch, ReadyWaiterIf* waiter);

    /// \brief Close a channel and its transport.
    ///
    /// \param  ch  The channel.
    ///
    /// \return  False if the channel was not open.
    bool CloseChannel(ChannelId ch);

    /// \brief Stop reconnecting and close every channel.  Does nothing if
    /// already torn down.
    void Teardown();

    // FrameSenderIf.
    virtual bool SendFrame(ChannelId ch, uint8_t frame_type,
                           const uint8_t* payload, size_t len,
                           MtcError& err);

    // RebindHandlerIf.
    virtual bool RebindChannels();

    // TransportListenerIf.
    virtual void ProcessOpen(ChannelId ch);
    virtual void ProcessBufferedAmountLow(ChannelId ch);
    virtual void ProcessTransportError(ChannelId ch,
                                       const std::string& reason);

    /// \brief Check if a channel can carry traffic.
    ///
    /// \param  ch  The channel.
    ///
    /// \return  True if the channel is ready in the registry and the mux.
    bool IsChannelReady(ChannelId ch) const;

    inline const ChannelRegistry& registry() const
    {
      return registry_;
    }

    inline const TransportMux& mux() const
    {
      return mux_;
    }

    inline const PacketCodec& codec() const
    {
      return codec_;
    }

    inline const FecPolicy& fec() const
    {
      return fec_;
    }

    inline ReconnectionController& reconnection()
    {
      return reconn_;
    }

    /// \brief Get the number of chunks dropped.
    inline size_t dropped_chunks() const
    {
      return dropped_chunks_;
    }

    /// \brief Get the number of control commands held for the control
    /// channel.
    inline size_t pending_command_count() const
    {
      return pending_commands_.size();
    }

    private:

    /// \brief Copy constructor.
    MediaSession(const MediaSession& other);

    /// \brief Copy operator.
    MediaSession& operator=(const MediaSession& other);

    /// \brief Mark a channel ready, and send what was held for it.
    void OnChannelReady(ChannelId ch);

    /// \brief Send a control command, or hold it.
    bool SendCommand(const std::string& json, MtcError& err);

    /// \brief Send the held control commands.
    void FlushPendingCommands();

    /// \brief Frame and send one chunk.
    bool SendOneChunk(ChannelId ch, const EncodedChunk& chunk,
                      MtcError& err);

    /// \brief Report a send failure, and start reconnecting on a transport
    /// failure.
    void HandleSendFailure(ChannelId ch, MtcError err);

    /// The connector.
    ConnectorIf&            connector_;

    /// The event handler.
    MtcEventHandler&        handler_;

    /// The connection's packet codec.
    PacketCodec             codec_;

    /// The FEC policy.
    FecPolicy               fec_;

    /// The channel registry.
    ChannelRegistry         registry_;

    /// The transport multiplexer.
    TransportMux            mux_;

    /// The reconnection controller.
    ReconnectionController  reconn_;

    /// The per-channel normalizers.  Not owned.
    CodecNormalizerIf*      normalizers_[NUM_CHANNELS];

    /// The transport kind each channel was opened on.
    TransportKind           kinds_[NUM_CHANNELS];

    /// Control commands held until the control channel is ready.
    std::list<std::string>  pending_commands_;

    /// The ready wait timeout.
    uint32_t                ready_timeout_ms_;

    /// The relative timestamp of the most recent media frame.
    uint32_t                last_media_ts_ms_;

    /// Chunks dropped before config, during reconnection, or on error.
    size_t                  dropped_chunks_;

    /// Set once torn down, cleared when a channel is opened.
    bool                    torn_down_;

  }; // end class MediaSession

} // namespace confab

#endif // CONFAB_MTC_MEDIA_SESSION_H
