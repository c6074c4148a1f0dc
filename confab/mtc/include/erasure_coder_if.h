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

/// \brief The erasure coder interface header file.

#ifndef CONFAB_MTC_ERASURE_CODER_IF_H
#define CONFAB_MTC_ERASURE_CODER_IF_H

#include "mtc_types.h"
#include "packet_codec.h"

#include <vector>


namespace confab
{

  /// \brief The interface to an external erasure coding engine.
  ///
  /// The engine splits a payload into source symbols of at most chunk_size
  /// bytes and generates repair symbols.  Only the sizing policy lives in
  /// the transport core.
  class ErasureCoderIf
  {
    public:

    /// \brief Destructor.
    virtual ~ErasureCoderIf() { }

    /// \brief Generate the source and repair symbols for a payload.
    ///
    /// \param  data            The payload.
    /// \param  len             The payload length in bytes.
    /// \param  chunk_size      The largest symbol size in bytes.
    /// \param  repair_symbols  The number of repair symbols per source
    ///                         block.
    /// \param  symbols         The generated symbols, in transmit order.
    /// \param  desc            The decoder descriptor for the payload.
    ///
    /// \return  True on success.
    virtual bool Encode(const uint8_t* data, size_t len, size_t chunk_size,
                        size_t repair_symbols, std::vector<Bytes>& symbols,
                        FecDescriptor& desc) = 0;

  }; // end class ErasureCoderIf

} // namespace confab

#endif // CONFAB_MTC_ERASURE_CODER_IF_H
