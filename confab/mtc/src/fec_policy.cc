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

#include "fec_policy.h"

#include "log.h"
#include "packet_codec.h"
#include "unused.h"

#include <inttypes.h>


using ::confab::Bytes;
using ::confab::FecDescriptor;
using ::confab::FecPlan;
using ::confab::FecPolicy;
using ::confab::MtcError;
using ::confab::PacketCodec;
using ::std::list;
using ::std::vector;


namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName)     = "FecPolicy";

  /// The number of chunks a payload is nominally split into.
  const size_t  kMinChunks             = 5;

  /// The MTU bounds, in bytes.
  const size_t  kMinMtu                = 100;
  const size_t  kMaxMtu                = 512;

  /// The redundancy bounds, in repair symbols.
  const size_t  kMinRedundancy         = 1;
  const size_t  kMaxRedundancy         = 10;

  /// The fixed redundancy for CONFIG frames.
  const size_t  kConfigRedundancy      = 3;

  /// The redundancy ratio, in percent of the source symbols.
  const size_t  kRedundancyPercent     = 10;
}

//============================================================================
FecPolicy::FecPolicy()
    : coder_(NULL), fec_frames_(0), regular_frames_(0)
{
}

//============================================================================
FecPolicy::~FecPolicy()
{
  coder_ = NULL;
}

//============================================================================
bool FecPolicy::Plan(size_t len, uint8_t frame_type, FecPlan& plan) const
{
  if (len == 0)
  {
    LogW(kClassName, __func__, "Cannot plan FEC for an empty payload.\n");
    return false;
  }

  size_t  mtu = ((len + kMinChunks - 1) / kMinChunks);

  if (mtu < kMinMtu)
  {
    mtu = kMinMtu;
  }
  else if (mtu > kMaxMtu)
  {
    mtu = kMaxMtu;
  }

  plan.mtu           = mtu;
  plan.chunk_size    = (mtu - kFecHeaderSize);
  plan.total_symbols = ((len + plan.chunk_size - 1) / plan.chunk_size);

  size_t  redundancy = (((plan.total_symbols * kRedundancyPercent) + 99) /
                        100);

  if (redundancy < kMinRedundancy)
  {
    redundancy = kMinRedundancy;
  }
  else if (redundancy > kMaxRedundancy)
  {
    redundancy = kMaxRedundancy;
  }

  if (frame_type == FRAME_CONFIG)
  {
    redundancy = kConfigRedundancy;
  }

  plan.redundancy = redundancy;

  return true;
}

//============================================================================
bool FecPolicy::AppliesTo(uint8_t frame_type)
{
  return ((frame_type != FRAME_AUDIO) &&
          (frame_type != FRAME_EVENT) &&
          (frame_type != FRAME_PUBLISHER_COMMAND));
}

//============================================================================
bool FecPolicy::Protect(const Bytes& packet, uint32_t seq, uint8_t frame_type,
                        list<Bytes>& wire_pkts, MtcError& err)
{
  uint8_t  pkt_type = static_cast<uint8_t>(PacketTypeFor(frame_type));

  err = MTC_NO_ERROR;

  if ((!AppliesTo(frame_type)) || (coder_ == NULL))
  {
    if (AppliesTo(frame_type))
    {
      LogW(kClassName, __func__, "No erasure coder, sending seq %" PRIu32
           " unprotected.\n", seq);
    }

    Bytes  wire_pkt;

    if (!PacketCodec::EncodeRegular(seq, pkt_type,
                                    (packet.empty() ? NULL : &packet[0]),
                                    packet.size(), wire_pkt))
    {
      err = MTC_FEC_PLANNING_ERROR;
      return false;
    }

    wire_pkts.push_back(wire_pkt);
    ++regular_frames_;

    return true;
  }

  FecPlan  plan;

  if (!Plan(packet.size(), frame_type, plan))
  {
    err = MTC_FEC_PLANNING_ERROR;
    return false;
  }

  vector<Bytes>  symbols;
  FecDescriptor  desc;

  if ((!coder_->Encode(&packet[0], packet.size(), plan.chunk_size,
                       plan.redundancy, symbols, desc)) ||
      symbols.empty())
  {
    LogE(kClassName, __func__, "Erasure coder failed for seq %" PRIu32
         " (%zu bytes).\n", seq, packet.size());
    err = MTC_FEC_PLANNING_ERROR;
    return false;
  }

  LogD(kClassName, __func__, "seq %" PRIu32 ": len %zu mtu %zu chunk %zu "
       "symbols %zu redundancy %zu -> %zu packets.\n", seq, packet.size(),
       plan.mtu, plan.chunk_size, plan.total_symbols, plan.redundancy,
       symbols.size());

  for (vector<Bytes>::const_iterator it = symbols.begin();
       it != symbols.end(); ++it)
  {
    Bytes  wire_pkt;

    if (!PacketCodec::EncodeFec(seq, pkt_type, desc,
                                (it->empty() ? NULL : &(*it)[0]),
                                it->size(), wire_pkt))
    {
      err = MTC_FEC_PLANNING_ERROR;
      return false;
    }

    wire_pkts.push_back(wire_pkt);
  }

  ++fec_frames_;

  return true;
}
