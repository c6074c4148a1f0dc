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

#include <cppunit/extensions/HelperMacros.h>

#include "codec_normalizer.h"
#include "log.h"
#include "mtc_types.h"

#include <cstring>
#include <list>

using ::confab::Bytes;
using ::confab::EncodedChunk;
using ::confab::Log;
using ::confab::OggOpusNormalizer;
using ::std::list;


namespace
{
  /// Build an Ogg page with a header type and a payload.
  Bytes MakePage(uint8_t header_type, const char* payload)
  {
    Bytes  page(28, 0);

    ::memcpy(&page[0], "OggS", 4);
    page[5] = header_type;
    page.insert(page.end(), payload, payload + ::strlen(payload));

    return page;
  }

  /// Build a chunk from a page.
  EncodedChunk MakeChunk(const Bytes& page, int64_t ts_us)
  {
    return EncodedChunk(page, ts_us, true);
  }
}

//============================================================================
class CodecNormalizerTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(CodecNormalizerTest);

  CPPUNIT_TEST(TestPageDetection);
  CPPUNIT_TEST(TestHeaderFirst);
  CPPUNIT_TEST(TestWithheldPages);
  CPPUNIT_TEST(TestNonOggDropped);
  CPPUNIT_TEST(TestPendingLimit);
  CPPUNIT_TEST(TestReset);

  CPPUNIT_TEST_SUITE_END();

  public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");
  }

  //==========================================================================
  void tearDown()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestPageDetection()
  {
    Bytes  head  = MakePage(0x02, "OpusHead\x01\x01");
    Bytes  tags  = MakePage(0x00, "OpusTags");
    Bytes  nobos = MakePage(0x00, "OpusHead");
    Bytes  junk(40, 0x4F);
    Bytes  tiny(3, 0x4F);

    CPPUNIT_ASSERT(OggOpusNormalizer::IsOggPage(head));
    CPPUNIT_ASSERT(OggOpusNormalizer::IsOggPage(tags));
    CPPUNIT_ASSERT(!OggOpusNormalizer::IsOggPage(junk));
    CPPUNIT_ASSERT(!OggOpusNormalizer::IsOggPage(tiny));
    CPPUNIT_ASSERT(!OggOpusNormalizer::IsOggPage(Bytes()));

    CPPUNIT_ASSERT(OggOpusNormalizer::IsOpusHeadPage(head));
    CPPUNIT_ASSERT(!OggOpusNormalizer::IsOpusHeadPage(tags));
    CPPUNIT_ASSERT(!OggOpusNormalizer::IsOpusHeadPage(nobos));

    // Too short to carry the magic.
    Bytes  cut(head.begin(), head.begin() + 30);

    CPPUNIT_ASSERT(!OggOpusNormalizer::IsOpusHeadPage(cut));
  }

  //==========================================================================
  void TestHeaderFirst()
  {
    OggOpusNormalizer   norm;
    list<EncodedChunk>  out;
    Bytes               head  = MakePage(0x02, "OpusHead");
    Bytes               audio = MakePage(0x00, "frame");

    norm.Normalize(MakeChunk(head, 0), out);
    CPPUNIT_ASSERT(out.size() == 1);
    CPPUNIT_ASSERT(norm.HasHeader());
    CPPUNIT_ASSERT(norm.header() == head);

    norm.Normalize(MakeChunk(audio, 20000), out);
    CPPUNIT_ASSERT(out.size() == 2);
    CPPUNIT_ASSERT(out.back().data == audio);
    CPPUNIT_ASSERT(out.back().timestamp_us == 20000);
    CPPUNIT_ASSERT(norm.pending_count() == 0);
  }

  //==========================================================================
  void TestWithheldPages()
  {
    OggOpusNormalizer   norm;
    list<EncodedChunk>  out;
    Bytes               head = MakePage(0x02, "OpusHead");
    Bytes               tags = MakePage(0x00, "OpusTags");
    Bytes               a1   = MakePage(0x00, "a1");

    norm.Normalize(MakeChunk(tags, 1), out);
    norm.Normalize(MakeChunk(a1, 2), out);
    CPPUNIT_ASSERT(out.empty());
    CPPUNIT_ASSERT(norm.pending_count() == 2);
    CPPUNIT_ASSERT(!norm.HasHeader());

    // The header goes first, then the withheld pages in order.
    norm.Normalize(MakeChunk(head, 3), out);
    CPPUNIT_ASSERT(out.size() == 3);
    CPPUNIT_ASSERT(norm.pending_count() == 0);

    list<EncodedChunk>::const_iterator  it = out.begin();

    CPPUNIT_ASSERT(it->data == head);
    ++it;
    CPPUNIT_ASSERT(it->data == tags);
    CPPUNIT_ASSERT(it->timestamp_us == 1);
    ++it;
    CPPUNIT_ASSERT(it->data == a1);
  }

  //==========================================================================
  void TestNonOggDropped()
  {
    OggOpusNormalizer   norm;
    list<EncodedChunk>  out;
    Bytes               raw(50, 0x11);

    norm.Normalize(MakeChunk(raw, 0), out);
    norm.Normalize(MakeChunk(Bytes(), 0), out);
    CPPUNIT_ASSERT(out.empty());
    CPPUNIT_ASSERT(norm.pending_count() == 0);
    CPPUNIT_ASSERT(norm.dropped_count() == 2);

    norm.Normalize(MakeChunk(MakePage(0x02, "OpusHead"), 0), out);
    norm.Normalize(MakeChunk(raw, 0), out);
    CPPUNIT_ASSERT(out.size() == 1);
    CPPUNIT_ASSERT(norm.dropped_count() == 3);
  }

  //==========================================================================
  void TestPendingLimit()
  {
    OggOpusNormalizer   norm(2);
    list<EncodedChunk>  out;

    norm.Normalize(MakeChunk(MakePage(0x00, "p1"), 1), out);
    norm.Normalize(MakeChunk(MakePage(0x00, "p2"), 2), out);
    norm.Normalize(MakeChunk(MakePage(0x00, "p3"), 3), out);
    CPPUNIT_ASSERT(norm.pending_count() == 2);
    CPPUNIT_ASSERT(norm.dropped_count() == 1);

    norm.Normalize(MakeChunk(MakePage(0x02, "OpusHead"), 4), out);
    CPPUNIT_ASSERT(out.size() == 3);
    CPPUNIT_ASSERT(out.front().timestamp_us == 4);
    CPPUNIT_ASSERT(out.back().timestamp_us == 3);
  }

  //==========================================================================
  void TestReset()
  {
    OggOpusNormalizer   norm;
    list<EncodedChunk>  out;

    norm.Normalize(MakeChunk(MakePage(0x00, "early"), 1), out);
    norm.Normalize(MakeChunk(MakePage(0x02, "OpusHead"), 2), out);
    CPPUNIT_ASSERT(norm.HasHeader());

    norm.Reset();
    CPPUNIT_ASSERT(!norm.HasHeader());
    CPPUNIT_ASSERT(norm.header().empty());

    // A new stream waits for its own header again.
    out.clear();
    norm.Normalize(MakeChunk(MakePage(0x00, "late"), 3), out);
    CPPUNIT_ASSERT(out.empty());
    CPPUNIT_ASSERT(norm.pending_count() == 1);
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(CodecNormalizerTest);
