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

/// \brief The FEC policy header file.

#ifndef CONFAB_MTC_FEC_POLICY_H
#define CONFAB_MTC_FEC_POLICY_H

#include "erasure_coder_if.h"
#include "mtc_types.h"

#include <list>


namespace confab
{

  /// \brief The sizing decision for one protected frame.
  struct FecPlan
  {
    FecPlan()
        : mtu(0), chunk_size(0), total_symbols(0), redundancy(0)
    { }

    /// The wire packet size budget, in bytes.
    size_t  mtu;

    /// The symbol size, mtu less the FEC header, in bytes.
    size_t  chunk_size;

    /// The number of source symbols.
    size_t  total_symbols;

    /// The number of repair symbols.
    size_t  redundancy;
  };

  /// \brief Decides whether and how a frame is protected with FEC on the
  /// datagram transport.
  ///
  /// The plan for a payload of len bytes is:
  ///
  ///   mtu           = clamp(ceil(len / 5), 100, 512)
  ///   chunk_size    = mtu - 20
  ///   total_symbols = ceil(len / chunk_size)
  ///   redundancy    = clamp(ceil(total_symbols * 0.1), 1, 10)
  ///
  /// except that CONFIG frames always get a redundancy of 3.
  class FecPolicy
  {
    public:

    /// \brief Constructor.
    FecPolicy();

    /// \brief Destructor.
    virtual ~FecPolicy();

    /// \brief Compute the plan for a payload.
    ///
    /// \param  len         The payload length in bytes.
    /// \param  frame_type  The frame type.
    /// \param  plan        The computed plan.
    ///
    /// \return  False for an empty payload.
    bool Plan(size_t len, uint8_t frame_type, FecPlan& plan) const;

    /// \brief Check whether FEC applies to a frame type.
    ///
    /// Audio, events and publisher commands are never protected.
    ///
    /// \param  frame_type  The frame type.
    ///
    /// \return  True if the frame type is protected.
    static bool AppliesTo(uint8_t frame_type);

    /// \brief Install the erasure coding engine.  Not owned.
    inline void set_erasure_coder(ErasureCoderIf* coder)
    {
      coder_ = coder;
    }

    /// \brief Check if an erasure coding engine is installed.
    inline bool HasErasureCoder() const
    {
      return (coder_ != NULL);
    }

    /// \brief Wrap an encoded standard frame for the datagram transport.
    ///
    /// Protected frame types become one FEC wrapped packet per symbol.
    /// Other frame types, or any frame when no engine is installed, become
    /// a single regular wrapped packet.
    ///
    /// \param  packet      The encoded standard frame.
    /// \param  seq         The frame sequence number.
    /// \param  frame_type  The frame type.
    /// \param  wire_pkts   The wire packets, appended in transmit order.
    /// \param  err         The error code on failure.
    ///
    /// \return  True on success.
    bool Protect(const Bytes& packet, uint32_t seq, uint8_t frame_type,
                 std::list<Bytes>& wire_pkts, MtcError& err);

    /// \brief Get the number of frames protected with FEC.
    inline size_t fec_frames() const
    {
      return fec_frames_;
    }

    /// \brief Get the number of frames sent as regular wrapped packets.
    inline size_t regular_frames() const
    {
      return regular_frames_;
    }

    private:

    /// \brief Copy constructor.
    FecPolicy(const FecPolicy& other);

    /// \brief Copy operator.
    FecPolicy& operator=(const FecPolicy& other);

    /// The erasure coding engine.  Not owned.
    ErasureCoderIf*  coder_;

    /// The number of frames protected with FEC.
    size_t           fec_frames_;

    /// The number of frames sent as regular wrapped packets.
    size_t           regular_frames_;

  }; // end class FecPolicy

} // namespace confab

#endif // CONFAB_MTC_FEC_POLICY_H
