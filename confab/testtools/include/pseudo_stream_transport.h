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

/// \brief A stream transport that records what is written to it.

#ifndef CONFAB_TESTTOOLS_PSEUDO_STREAM_TRANSPORT_H
#define CONFAB_TESTTOOLS_PSEUDO_STREAM_TRANSPORT_H

#include "mtc_types.h"
#include "transport_if.h"

#include <list>


namespace confab
{
  class PseudoStreamTransport : public StreamTransportIf
  {
    public:

    /// \brief Constructor.  The transport starts open.
    PseudoStreamTransport();

    /// \brief Destructor.
    virtual ~PseudoStreamTransport();

    // Standard StreamTransportIf interface.

    virtual bool IsOpen() const;

    virtual void Close();

    /// \brief Record the bytes, unless writes are set to fail or the
    /// transport is closed.
    virtual bool Write(const uint8_t* buf, size_t len);

    /// \brief Split the written bytes into length-prefixed messages.
    ///
    /// \param  msgs  The messages, without their length prefixes.
    ///
    /// \return  False if the written bytes end inside a message.
    bool GetMessages(std::list<Bytes>& msgs) const;

    /// \brief Forget everything written.
    void ClearWritten();

    // All bytes written.
    Bytes   written;

    // Number of Write() calls.
    size_t  write_count;

    // Number of Close() calls.
    size_t  close_count;

    // Is the transport open.
    bool    is_open;

    // Should Write() fail.
    bool    fail_writes;

    private:

    /// \brief Copy constructor.
    PseudoStreamTransport(const PseudoStreamTransport& other);

    /// \brief Copy operator.
    PseudoStreamTransport& operator=(const PseudoStreamTransport& other);

  }; // end class PseudoStreamTransport
} // namespace confab

#endif // CONFAB_TESTTOOLS_PSEUDO_STREAM_TRANSPORT_H
