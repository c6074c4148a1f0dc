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

#include "pseudo_stream_transport.h"

#include "length_delimited_reader.h"
#include "log.h"
#include "unused.h"


using ::confab::Bytes;
using ::confab::LengthDelimitedReader;
using ::confab::PseudoStreamTransport;
using ::std::list;


namespace
{
  const char* UNUSED(kClassName) = "PseudoStreamTransport";
}

//============================================================================
PseudoStreamTransport::PseudoStreamTransport()
    : written(), write_count(0), close_count(0), is_open(true),
      fail_writes(false)
{
}

//============================================================================
PseudoStreamTransport::~PseudoStreamTransport()
{
}

//============================================================================
bool PseudoStreamTransport::IsOpen() const
{
  return is_open;
}

//============================================================================
void PseudoStreamTransport::Close()
{
  is_open = false;
  ++close_count;
}

//============================================================================
bool PseudoStreamTransport::Write(const uint8_t* buf, size_t len)
{
  ++write_count;

  if (fail_writes || !is_open)
  {
    LogD(kClassName, __func__, "Failing write of %zu bytes.\n", len);
    return false;
  }

  written.insert(written.end(), buf, buf + len);

  return true;
}

//============================================================================
bool PseudoStreamTransport::GetMessages(list<Bytes>& msgs) const
{
  LengthDelimitedReader  reader;
  Bytes                  msg;

  if (!written.empty())
  {
    reader.Append(&written[0], written.size());
  }

  while (reader.GetNextMessage(msg))
  {
    msgs.push_back(msg);
  }

  return (reader.buffered_bytes() == 0);
}

//============================================================================
void PseudoStreamTransport::ClearWritten()
{
  written.clear();
}
