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

#include "length_delimited_reader.h"
#include "log.h"
#include "mtc_types.h"

#include <cstring>

using ::confab::Bytes;
using ::confab::LengthDelimitedReader;
using ::confab::Log;


namespace
{
  /// Append a length prefixed message to a buffer.
  void AddMessage(const char* text, Bytes& out)
  {
    uint32_t  len = static_cast<uint32_t>(::strlen(text));

    out.push_back(static_cast<uint8_t>(len >> 24));
    out.push_back(static_cast<uint8_t>(len >> 16));
    out.push_back(static_cast<uint8_t>(len >> 8));
    out.push_back(static_cast<uint8_t>(len));
    out.insert(out.end(), text, text + len);
  }
}

//============================================================================
class LengthDelimitedReaderTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(LengthDelimitedReaderTest);

  CPPUNIT_TEST(TestWholeMessages);
  CPPUNIT_TEST(TestByteAtATime);
  CPPUNIT_TEST(TestEmptyMessage);
  CPPUNIT_TEST(TestOversizeMessage);
  CPPUNIT_TEST(TestEndOfStream);
  CPPUNIT_TEST(TestTruncatedStream);

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
  void TestWholeMessages()
  {
    LengthDelimitedReader  reader;
    Bytes                  wire;
    Bytes                  msg;

    AddMessage("first", wire);
    AddMessage("second message", wire);

    CPPUNIT_ASSERT(reader.Append(&wire[0], wire.size()));
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(msg == Bytes(wire.begin() + 4, wire.begin() + 9));
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(msg.size() == 14);
    CPPUNIT_ASSERT(::memcmp(&msg[0], "second message", 14) == 0);
    CPPUNIT_ASSERT(!reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(reader.buffered_bytes() == 0);
    CPPUNIT_ASSERT(!reader.HasError());
  }

  //==========================================================================
  void TestByteAtATime()
  {
    LengthDelimitedReader  reader;
    Bytes                  wire;
    Bytes                  msg;
    size_t                 count = 0;

    AddMessage("{\"type\":\"StreamConfig\"}", wire);
    AddMessage("xyz", wire);

    for (size_t i = 0; i < wire.size(); ++i)
    {
      CPPUNIT_ASSERT(reader.Append(&wire[i], 1));

      while (reader.GetNextMessage(msg))
      {
        ++count;

        // The first message completes exactly at its last byte.
        if (count == 1)
        {
          CPPUNIT_ASSERT(i == 26);
        }
      }
    }

    CPPUNIT_ASSERT(count == 2);
    CPPUNIT_ASSERT(msg.size() == 3);
    CPPUNIT_ASSERT(reader.EndOfStream());
  }

  //==========================================================================
  void TestEmptyMessage()
  {
    LengthDelimitedReader  reader;
    Bytes                  wire;
    Bytes                  msg(3, 0x01);

    AddMessage("", wire);

    CPPUNIT_ASSERT(reader.Append(&wire[0], wire.size()));
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(msg.empty());

    // Empty appends are accepted and do nothing.
    CPPUNIT_ASSERT(reader.Append(NULL, 0));
    CPPUNIT_ASSERT(reader.buffered_bytes() == 0);
  }

  //==========================================================================
  void TestOversizeMessage()
  {
    LengthDelimitedReader  reader(16);
    Bytes                  wire;
    Bytes                  msg;

    AddMessage("0123456789abcdef", wire);
    AddMessage("0123456789abcdefg", wire);

    CPPUNIT_ASSERT(reader.Append(&wire[0], wire.size()));

    // Exactly the maximum is allowed.
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(msg.size() == 16);

    CPPUNIT_ASSERT(!reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(reader.HasError());

    // An errored reader refuses input until reset.
    CPPUNIT_ASSERT(!reader.Append(&wire[0], 4));

    reader.Reset();
    CPPUNIT_ASSERT(!reader.HasError());
    CPPUNIT_ASSERT(reader.buffered_bytes() == 0);
    CPPUNIT_ASSERT(reader.Append(&wire[0], 20));
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
  }

  //==========================================================================
  void TestEndOfStream()
  {
    LengthDelimitedReader  reader;
    Bytes                  wire;
    Bytes                  msg;

    AddMessage("done", wire);

    CPPUNIT_ASSERT(reader.Append(&wire[0], wire.size()));
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(reader.EndOfStream());
    CPPUNIT_ASSERT(!reader.IsTruncated());

    // No input after the end of the stream.
    CPPUNIT_ASSERT(!reader.Append(&wire[0], wire.size()));
  }

  //==========================================================================
  void TestTruncatedStream()
  {
    LengthDelimitedReader  reader;
    Bytes                  wire;
    Bytes                  msg;

    AddMessage("complete", wire);
    AddMessage("cut short", wire);

    CPPUNIT_ASSERT(reader.Append(&wire[0], wire.size() - 3));
    CPPUNIT_ASSERT(reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(!reader.GetNextMessage(msg));
    CPPUNIT_ASSERT(reader.buffered_bytes() == 10);

    CPPUNIT_ASSERT(!reader.EndOfStream());
    CPPUNIT_ASSERT(reader.IsTruncated());
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(LengthDelimitedReaderTest);
