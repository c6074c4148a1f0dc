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

/// \brief The channel transport interfaces header file.
///
/// A channel is carried either by one bidirectional byte stream of a
/// reliable ordered transport, or by one negotiated data channel of a
/// datagram transport.  The two differ in their flow control: a stream
/// write blocks until buffer space is available, while a data channel
/// exposes its buffered amount and signals when it drops below a
/// threshold.

#ifndef CONFAB_MTC_TRANSPORT_IF_H
#define CONFAB_MTC_TRANSPORT_IF_H

#include "mtc_types.h"

#include <string>


namespace confab
{

  /// \brief A channel transport handle.
  ///
  /// Handles are owned by the connector that created them.
  class TransportIf
  {
    public:

    /// \brief Destructor.
    virtual ~TransportIf() { }

    /// \brief Get the transport kind.
    virtual TransportKind kind() const = 0;

    /// \brief Check if the handle can still carry data.
    virtual bool IsOpen() const = 0;

    /// \brief Close the handle.  Closing twice is a no-op.
    virtual void Close() = 0;

  }; // end class TransportIf

  /// \brief One bidirectional byte stream of a reliable ordered transport.
  class StreamTransportIf : public TransportIf
  {
    public:

    /// \brief Destructor.
    virtual ~StreamTransportIf() { }

    /// \brief Get the transport kind.
    virtual TransportKind kind() const
    {
      return STREAM_TRANSPORT;
    }

    /// \brief Write bytes to the stream.
    ///
    /// Blocks the caller until the bytes are accepted by the transport.
    ///
    /// \param  buf  The bytes.
    /// \param  len  The number of bytes.
    ///
    /// \return  True on success, false on a transport error.
    virtual bool Write(const uint8_t* buf, size_t len) = 0;

  }; // end class StreamTransportIf

  /// \brief One negotiated data channel of a datagram transport.
  class DatagramTransportIf : public TransportIf
  {
    public:

    /// \brief Destructor.
    virtual ~DatagramTransportIf() { }

    /// \brief Get the transport kind.
    virtual TransportKind kind() const
    {
      return DATAGRAM_TRANSPORT;
    }

    /// \brief Get the number of bytes queued in the transport but not yet
    /// sent.
    virtual size_t GetBufferedAmount() const = 0;

    /// \brief Set the buffered amount below which a low-buffer
    /// notification fires.
    virtual void SetBufferedAmountLowThreshold(size_t threshold) = 0;

    /// \brief Get the low-buffer threshold.
    virtual size_t GetBufferedAmountLowThreshold() const = 0;

    /// \brief Send one packet.  Never blocks.
    ///
    /// \param  buf  The packet.
    /// \param  len  The packet length in bytes.
    ///
    /// \return  True on success, false on a transport error.
    virtual bool Send(const uint8_t* buf, size_t len) = 0;

  }; // end class DatagramTransportIf

  /// \brief Receives transport notifications for the channels of a
  /// session.
  class TransportListenerIf
  {
    public:

    /// \brief Destructor.
    virtual ~TransportListenerIf() { }

    /// \brief The channel's transport finished opening or negotiation.
    ///
    /// \param  ch  The channel.
    virtual void ProcessOpen(ChannelId ch) = 0;

    /// \brief The channel's buffered amount dropped below its threshold.
    ///
    /// \param  ch  The channel.
    virtual void ProcessBufferedAmountLow(ChannelId ch) = 0;

    /// \brief The channel's transport failed.
    ///
    /// \param  ch      The channel.
    /// \param  reason  A description of the failure.
    virtual void ProcessTransportError(ChannelId ch,
                                       const std::string& reason) = 0;

  }; // end class TransportListenerIf

} // namespace confab

#endif // CONFAB_MTC_TRANSPORT_IF_H
