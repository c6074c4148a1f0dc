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

#include "pseudo_connector.h"

#include "log.h"
#include "unused.h"


using ::confab::PseudoConnector;
using ::confab::TransportIf;


namespace
{
  const char* UNUSED(kClassName) = "PseudoConnector";
}

//============================================================================
PseudoConnector::PseudoConnector()
    : connect_script(), connect_result(true), healthy(true),
      connect_count(0), health_count(0), create_count(0)
{
  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    transports[i] = NULL;
  }
}

//============================================================================
PseudoConnector::~PseudoConnector()
{
}

//============================================================================
bool PseudoConnector::Connect()
{
  ++connect_count;

  if (connect_script.empty())
  {
    return connect_result;
  }

  bool  result = connect_script.front();

  connect_script.pop_front();

  return result;
}

//============================================================================
bool PseudoConnector::IsHealthy()
{
  ++health_count;

  return healthy;
}

//============================================================================
TransportIf* PseudoConnector::CreateChannelTransport(ChannelId ch,
                                                     TransportKind kind)
{
  ++create_count;

  if (!IsValidChannel(ch) || (transports[ch] == NULL) ||
      (transports[ch]->kind() != kind))
  {
    LogD(kClassName, __func__, "No %s transport for channel %s.\n",
         TransportKindToString(kind), ChannelName(ch));
    return NULL;
  }

  return transports[ch];
}
