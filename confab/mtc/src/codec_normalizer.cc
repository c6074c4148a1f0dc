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

#include "codec_normalizer.h"

#include "log.h"
#include "unused.h"

#include <cstring>


using ::confab::Bytes;
using ::confab::EncodedChunk;
using ::confab::OggOpusNormalizer;
using ::std::list;


namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName)  = "OggOpusNormalizer";

  /// The Ogg page capture pattern.
  const char*   kOggMagic           = "OggS";

  /// The Opus identification header signature.
  const char*   kOpusHeadMagic      = "OpusHead";

  /// The offset of the Ogg header type byte.
  const size_t  kHeaderTypeOffset   = 5;

  /// The beginning of stream flag in the header type byte.
  const uint8_t kBosFlag            = 0x02;

  /// The offset of a single segment page's payload.
  const size_t  kPayloadOffset      = 28;
}

//============================================================================
OggOpusNormalizer::OggOpusNormalizer(size_t max_pending)
    : max_pending_(max_pending),
      pending_(),
      has_header_(false),
      header_(),
      dropped_count_(0)
{
}

//============================================================================
OggOpusNormalizer::~OggOpusNormalizer()
{
  // Nothing to destroy.
}

//============================================================================
void OggOpusNormalizer::Normalize(const EncodedChunk& chunk,
                                  list<EncodedChunk>& out)
{
  if (!IsOggPage(chunk.data))
  {
    ++dropped_count_;
    LogW(kClassName, __func__, "Dropping %zu byte chunk, not an Ogg "
         "page.\n", chunk.data.size());
    return;
  }

  if (has_header_)
  {
    out.push_back(chunk);
    return;
  }

  if (!IsOpusHeadPage(chunk.data))
  {
    if ((max_pending_ > 0) && (pending_.size() >= max_pending_))
    {
      pending_.pop_front();
      ++dropped_count_;
      LogW(kClassName, __func__, "Too many pages before OpusHead, dropping "
           "the oldest.\n");
    }

    pending_.push_back(chunk);
    return;
  }

  has_header_ = true;
  header_     = chunk.data;

  LogI(kClassName, __func__, "OpusHead page seen (%zu bytes), releasing "
       "%zu withheld pages.\n", header_.size(), pending_.size());

  out.push_back(chunk);
  out.splice(out.end(), pending_);
}

//============================================================================
void OggOpusNormalizer::Reset()
{
  pending_.clear();
  has_header_ = false;
  header_.clear();
}

//============================================================================
bool OggOpusNormalizer::IsOggPage(const Bytes& data)
{
  size_t  magic_len = ::strlen(kOggMagic);

  return ((data.size() >= magic_len) &&
          (::memcmp(&data[0], kOggMagic, magic_len) == 0));
}

//============================================================================
bool OggOpusNormalizer::IsOpusHeadPage(const Bytes& data)
{
  size_t  magic_len = ::strlen(kOpusHeadMagic);

  if (!IsOggPage(data) || (data.size() < (kPayloadOffset + magic_len)))
  {
    return false;
  }

  if ((data[kHeaderTypeOffset] & kBosFlag) == 0)
  {
    return false;
  }

  return (::memcmp(&data[kPayloadOffset], kOpusHeadMagic, magic_len) == 0);
}
