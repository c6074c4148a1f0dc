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

/// \brief The connection collaborator interfaces header file.

#ifndef CONFAB_MTC_CONNECTOR_IF_H
#define CONFAB_MTC_CONNECTOR_IF_H

#include "mtc_types.h"
#include "transport_if.h"


namespace confab
{

  /// \brief Establishes the underlying connection and the per-channel
  /// transport handles.
  ///
  /// The handshake (SDP exchange, certificate pinning) is entirely the
  /// connector's business.
  class ConnectorIf
  {
    public:

    /// \brief Destructor.
    virtual ~ConnectorIf() { }

    /// \brief Run the transport specific connect sequence.
    ///
    /// \return  True if the connection is established.
    virtual bool Connect() = 0;

    /// \brief Probe connectivity.  Polled by the health monitor.
    ///
    /// \return  True if the connection is healthy.
    virtual bool IsHealthy() = 0;

    /// \brief Get the transport handle for a channel on the current
    /// connection.
    ///
    /// May return the existing handle if it survived the reconnection.
    ///
    /// \param  ch    The channel.
    /// \param  kind  The transport kind.
    ///
    /// \return  The handle, or NULL on failure.  Owned by the connector.
    virtual TransportIf* CreateChannelTransport(ChannelId ch,
                                                TransportKind kind) = 0;

  }; // end class ConnectorIf

  /// \brief Re-binds every open channel after the connection has been
  /// re-established.
  class RebindHandlerIf
  {
    public:

    /// \brief Destructor.
    virtual ~RebindHandlerIf() { }

    /// \brief Re-bind all channels, resend their configs and request
    /// keyframes.
    ///
    /// \return  True if every channel was re-bound.
    virtual bool RebindChannels() = 0;

  }; // end class RebindHandlerIf

  /// \brief Frames and transmits one frame on a channel.
  ///
  /// Lets the channel registry transmit CONFIG frames without knowing the
  /// codec, FEC policy or multiplexer.
  class FrameSenderIf
  {
    public:

    /// \brief Destructor.
    virtual ~FrameSenderIf() { }

    /// \brief Send a frame.
    ///
    /// \param  ch          The channel.
    /// \param  frame_type  The frame type.
    /// \param  payload     The payload.
    /// \param  len         The payload length in bytes.
    /// \param  err         The error code on failure.
    ///
    /// \return  True if the frame was handed to the transport or queued.
    virtual bool SendFrame(ChannelId ch, uint8_t frame_type,
                           const uint8_t* payload, size_t len,
                           MtcError& err) = 0;

  }; // end class FrameSenderIf

} // namespace confab

#endif // CONFAB_MTC_CONNECTOR_IF_H
