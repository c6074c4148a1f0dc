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

/// \brief An erasure coder that produces deterministic symbols.
///
/// Source symbols are the payload split into chunk_size pieces, the last
/// one zero padded.  Each repair symbol is the XOR of all source symbols.

#ifndef CONFAB_TESTTOOLS_PSEUDO_ERASURE_CODER_H
#define CONFAB_TESTTOOLS_PSEUDO_ERASURE_CODER_H

#include "erasure_coder_if.h"
#include "mtc_types.h"
#include "packet_codec.h"

#include <vector>


namespace confab
{
  class PseudoErasureCoder : public ErasureCoderIf
  {
    public:

    /// \brief Constructor.
    PseudoErasureCoder();

    /// \brief Destructor.
    virtual ~PseudoErasureCoder();

    virtual bool Encode(const uint8_t* data, size_t len, size_t chunk_size,
                        size_t repair_symbols, std::vector<Bytes>& symbols,
                        FecDescriptor& desc);

    // Number of Encode() calls.
    size_t  encode_count;

    // The chunk size of the last call.
    size_t  last_chunk_size;

    // The repair symbol count of the last call.
    size_t  last_repair_symbols;

    // Should Encode() fail.
    bool    fail;

    private:

    /// \brief Copy constructor.
    PseudoErasureCoder(const PseudoErasureCoder& other);

    /// \brief Copy operator.
    PseudoErasureCoder& operator=(const PseudoErasureCoder& other);

  }; // end class PseudoErasureCoder
} // namespace confab

#endif // CONFAB_TESTTOOLS_PSEUDO_ERASURE_CODER_H
