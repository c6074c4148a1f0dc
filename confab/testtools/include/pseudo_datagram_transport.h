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

/// \brief A datagram transport with a settable buffered amount that
/// records the packets sent on it.

#ifndef CONFAB_TESTTOOLS_PSEUDO_DATAGRAM_TRANSPORT_H
#define CONFAB_TESTTOOLS_PSEUDO_DATAGRAM_TRANSPORT_H

#include "mtc_types.h"
#include "transport_if.h"

#include <list>


namespace confab
{
  class PseudoDatagramTransport : public DatagramTransportIf
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  open  Whether the transport starts open.
    explicit PseudoDatagramTransport(bool open = true);

    /// \brief Destructor.
    virtual ~PseudoDatagramTransport();

    // Standard DatagramTransportIf interface.

    virtual bool IsOpen() const;

    virtual void Close();

    virtual size_t GetBufferedAmount() const;

    virtual void SetBufferedAmountLowThreshold(size_t threshold);

    virtual size_t GetBufferedAmountLowThreshold() const;

    /// \brief Record the packet, unless sends are set to fail or the
    /// transport is closed.  When grow_buffered is set, the packet length
    /// is added to the buffered amount.
    virtual bool Send(const uint8_t* buf, size_t len);

    // Packets passed to Send().
    std::list<Bytes>  sent_packets;

    // The reported buffered amount.
    size_t            buffered_amount;

    // The threshold set by the multiplexer.
    size_t            low_threshold;

    // Number of Close() calls.
    size_t            close_count;

    // Is the transport open.
    bool              is_open;

    // Should Send() fail.
    bool              fail_sends;

    // Should Send() grow the buffered amount.
    bool              grow_buffered;

    private:

    /// \brief Copy constructor.
    PseudoDatagramTransport(const PseudoDatagramTransport& other);

    /// \brief Copy operator.
    PseudoDatagramTransport& operator=(const PseudoDatagramTransport& other);

  }; // end class PseudoDatagramTransport
} // namespace confab

#endif // CONFAB_TESTTOOLS_PSEUDO_DATAGRAM_TRANSPORT_H
