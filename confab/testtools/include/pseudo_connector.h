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

/// \brief A connector with scripted connect and health results.

#ifndef CONFAB_TESTTOOLS_PSEUDO_CONNECTOR_H
#define CONFAB_TESTTOOLS_PSEUDO_CONNECTOR_H

#include "connector_if.h"
#include "mtc_types.h"
#include "transport_if.h"

#include <deque>


namespace confab
{
  class PseudoConnector : public ConnectorIf
  {
    public:

    /// \brief Constructor.  Connects succeed and the connection is healthy.
    PseudoConnector();

    /// \brief Destructor.
    virtual ~PseudoConnector();

    /// \brief Return the next scripted result, or connect_result once the
    /// script is empty.
    virtual bool Connect();

    virtual bool IsHealthy();

    /// \brief Return the transport set for the channel.
    virtual TransportIf* CreateChannelTransport(ChannelId ch,
                                                TransportKind kind);

    // Scripted Connect() results, consumed front first.
    std::deque<bool>  connect_script;

    // The Connect() result once the script is empty.
    bool              connect_result;

    // The IsHealthy() result.
    bool              healthy;

    // Number of Connect() calls.
    size_t            connect_count;

    // Number of IsHealthy() calls.
    size_t            health_count;

    // Number of CreateChannelTransport() calls.
    size_t            create_count;

    // The transports to return, indexed by channel.  Not owned.
    TransportIf*      transports[NUM_CHANNELS];

    private:

    /// \brief Copy constructor.
    PseudoConnector(const PseudoConnector& other);

    /// \brief Copy operator.
    PseudoConnector& operator=(const PseudoConnector& other);

  }; // end class PseudoConnector
} // namespace confab

#endif // CONFAB_TESTTOOLS_PSEUDO_CONNECTOR_H
