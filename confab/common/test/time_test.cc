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

#include "itime.h"
#include "log.h"

#include <unistd.h>


using ::confab::Log;
using ::confab::Time;
using ::std::string;


//============================================================================
class TimeTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(TimeTest);

  CPPUNIT_TEST(TestConstructors);
  CPPUNIT_TEST(TestFromMsecAndUsec);
  CPPUNIT_TEST(TestNegativeTimes);
  CPPUNIT_TEST(TestArithmetic);
  CPPUNIT_TEST(TestComparisons);
  CPPUNIT_TEST(TestInfinite);
  CPPUNIT_TEST(TestMonotonic);
  CPPUNIT_TEST(TestToString);

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
  void TestConstructors()
  {
    Time  t1;
    CPPUNIT_ASSERT(t1.GetTimeInUsec() == 0);
    CPPUNIT_ASSERT(t1.IsZero());

    struct timeval  tv = {5000, 345678};
    Time            t2(tv);
    CPPUNIT_ASSERT(t2.GetTimeInUsec() == 5000345678LL);

    Time  t3(t2);
    CPPUNIT_ASSERT(t3 == t2);

    // Nanoseconds round to the nearest microsecond.
    struct timespec  ts = {999, 123456};
    Time             t4(ts);
    CPPUNIT_ASSERT(t4.GetTimeInUsec() == 999000123LL);

    Time  t5(static_cast<time_t>(3), static_cast<suseconds_t>(250000));
    CPPUNIT_ASSERT(t5.GetTimeInMsec() == 3250);
  }

  //==========================================================================
  void TestFromMsecAndUsec()
  {
    CPPUNIT_ASSERT(Time::FromMsec(1500).GetTimeInUsec() == 1500000);
    CPPUNIT_ASSERT(Time::FromUsec(2000001).GetTimeInMsec() == 2000);
    CPPUNIT_ASSERT(Time::FromMsec(0).IsZero());
  }

  //==========================================================================
  void TestNegativeTimes()
  {
    Time  t = Time::FromMsec(-1500);

    CPPUNIT_ASSERT(t.GetTimeInMsec() == -1500);
    CPPUNIT_ASSERT(t.GetTimeInUsec() == -1500000);
    CPPUNIT_ASSERT(t < Time());
  }

  //==========================================================================
  void TestArithmetic()
  {
    Time  a = Time::FromMsec(700);
    Time  b = Time::FromMsec(600);

    CPPUNIT_ASSERT((a + b).GetTimeInMsec() == 1300);
    CPPUNIT_ASSERT((a - b).GetTimeInMsec() == 100);
    CPPUNIT_ASSERT((b - a).GetTimeInMsec() == -100);

    a += b;
    CPPUNIT_ASSERT(a.GetTimeInMsec() == 1300);

    a.Zero();
    CPPUNIT_ASSERT(a.IsZero());
  }

  //==========================================================================
  void TestComparisons()
  {
    Time  a = Time::FromMsec(10);
    Time  b = Time::FromMsec(20);

    CPPUNIT_ASSERT(a < b);
    CPPUNIT_ASSERT(a <= b);
    CPPUNIT_ASSERT(b > a);
    CPPUNIT_ASSERT(b >= a);
    CPPUNIT_ASSERT(a != b);
    CPPUNIT_ASSERT(Time::Max(a, b) == b);
    CPPUNIT_ASSERT(Time::Min(a, b) == a);
  }

  //==========================================================================
  void TestInfinite()
  {
    Time  inf = Time::Infinite();

    CPPUNIT_ASSERT(inf.IsInfinite());
    CPPUNIT_ASSERT(!Time::FromMsec(1000000).IsInfinite());
    CPPUNIT_ASSERT(Time::FromMsec(1000000) < inf);
  }

  //==========================================================================
  void TestMonotonic()
  {
    Time  t1 = Time::Now();

    ::usleep(2000);

    Time  t2 = Time::Now();

    CPPUNIT_ASSERT(t2 > t1);
    CPPUNIT_ASSERT((t2 - t1).GetTimeInUsec() >= 2000);
    CPPUNIT_ASSERT(Time::GetNowInUsec() >= t2.GetTimeInUsec());
  }

  //==========================================================================
  void TestToString()
  {
    CPPUNIT_ASSERT(Time::FromUsec(3000042).ToString() == "3.000042s");
    CPPUNIT_ASSERT(Time::FromMsec(-1500).ToString() == "-1.500000s");
    CPPUNIT_ASSERT(Time().ToString() == "0.000000s");
  }

}; // end class TimeTest

CPPUNIT_TEST_SUITE_REGISTRATION(TimeTest);
