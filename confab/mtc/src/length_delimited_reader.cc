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

#include "length_delimited_reader.h"

#include "log.h"
#include "unused.h"

#include <inttypes.h>


using ::confab::Bytes;
using ::confab::LengthDelimitedReader;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "LengthDelimitedReader";
}

//============================================================================
LengthDelimitedReader::LengthDelimitedReader(uint32_t max_msg_len)
    : max_msg_len_(max_msg_len),
      buf_(),
      error_(false),
      eos_(false)
{
}

//============================================================================
LengthDelimitedReader::~LengthDelimitedReader()
{
  // Nothing to destroy.
}

//============================================================================
bool LengthDelimitedReader::Append(const uint8_t* buf, size_t len)
{
  if (error_ || eos_)
  {
    LogW(kClassName, __func__, "Dropping %zu bytes, reader is %s.\n", len,
         (error_ ? "in error" : "at end of stream"));
    return false;
  }

  if ((buf == NULL) || (len == 0))
  {
    return true;
  }

  buf_.insert(buf_.end(), buf, buf + len);

  return true;
}

//============================================================================
bool LengthDelimitedReader::GetNextMessage(Bytes& msg)
{
  if (error_ || (buf_.size() < kLengthPrefixSize))
  {
    return false;
  }

  uint32_t  msg_len = ((static_cast<uint32_t>(buf_[0]) << 24) |
                       (static_cast<uint32_t>(buf_[1]) << 16) |
                       (static_cast<uint32_t>(buf_[2]) << 8) |
                       static_cast<uint32_t>(buf_[3]));

  if (msg_len > max_msg_len_)
  {
    LogE(kClassName, __func__, "Message length %" PRIu32 " exceeds maximum "
         "%" PRIu32 ".\n", msg_len, max_msg_len_);
    error_ = true;
    return false;
  }

  if ((buf_.size() - kLengthPrefixSize) < msg_len)
  {
    return false;
  }

  Bytes::iterator  start = buf_.begin() + kLengthPrefixSize;
  Bytes::iterator  end   = start + msg_len;

  msg.assign(start, end);
  buf_.erase(buf_.begin(), end);

  return true;
}

//============================================================================
bool LengthDelimitedReader::EndOfStream()
{
  eos_ = true;

  if (!buf_.empty())
  {
    LogW(kClassName, __func__, "Stream ended with an incomplete message, "
         "%zu bytes buffered.\n", buf_.size());
    return false;
  }

  return true;
}

//============================================================================
void LengthDelimitedReader::Reset()
{
  buf_.clear();
  error_ = false;
  eos_   = false;
}
