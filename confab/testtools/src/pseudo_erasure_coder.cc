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

#include "pseudo_erasure_coder.h"

#include "log.h"
#include "unused.h"


using ::confab::Bytes;
using ::confab::FecDescriptor;
using ::confab::PseudoErasureCoder;
using ::std::vector;


namespace
{
  const char* UNUSED(kClassName) = "PseudoErasureCoder";
}

//============================================================================
PseudoErasureCoder::PseudoErasureCoder()
    : encode_count(0), last_chunk_size(0), last_repair_symbols(0),
      fail(false)
{
}

//============================================================================
PseudoErasureCoder::~PseudoErasureCoder()
{
}

//============================================================================
bool PseudoErasureCoder::Encode(const uint8_t* data, size_t len,
                                size_t chunk_size, size_t repair_symbols,
                                vector<Bytes>& symbols, FecDescriptor& desc)
{
  ++encode_count;
  last_chunk_size     = chunk_size;
  last_repair_symbols = repair_symbols;

  if (fail || (data == NULL) || (len == 0) || (chunk_size == 0))
  {
    return false;
  }

  Bytes  parity(chunk_size, 0);

  for (size_t offset = 0; offset < len; offset += chunk_size)
  {
    size_t  n = ((len - offset) < chunk_size) ? (len - offset) : chunk_size;
    Bytes   symbol(data + offset, data + offset + n);

    symbol.resize(chunk_size, 0);

    for (size_t i = 0; i < chunk_size; ++i)
    {
      parity[i] ^= symbol[i];
    }

    symbols.push_back(symbol);
  }

  for (size_t i = 0; i < repair_symbols; ++i)
  {
    symbols.push_back(parity);
  }

  desc.transfer_length = len;
  desc.symbol_size     = static_cast<uint16_t>(chunk_size);
  desc.source_blocks   = 1;
  desc.sub_blocks      = 1;
  desc.alignment       = 4;

  LogD(kClassName, __func__, "%zu bytes -> %zu symbols.\n", len,
       symbols.size());

  return true;
}
