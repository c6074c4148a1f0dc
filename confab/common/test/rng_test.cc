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

#include "log.h"
#include "rng.h"

using ::confab::Log;
using ::confab::RNG;


//============================================================================
class RNGTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(RNGTest);

  CPPUNIT_TEST(TestSeededSequence);
  CPPUNIT_TEST(TestGetUint);
  CPPUNIT_TEST(TestGetDouble);
  CPPUNIT_TEST(TestGetUniformSigned);

  CPPUNIT_TEST_SUITE_END();

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("");
  }

  //==========================================================================
  void tearDown()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestSeededSequence()
  {
    RNG  rng1(1234);
    RNG  rng2(1234);

    CPPUNIT_ASSERT(rng1.seed() == 1234);

    for (int i = 0; i < 100; ++i)
    {
      CPPUNIT_ASSERT(rng1.GetUint(1000) == rng2.GetUint(1000));
    }

    // Reseeding restarts the sequence.
    CPPUNIT_ASSERT(rng1.SetSeed(99));
    CPPUNIT_ASSERT(rng2.SetSeed(99));
    CPPUNIT_ASSERT(rng1.seed() == 99);
    CPPUNIT_ASSERT(rng1.GetDouble(0.0, 1.0) == rng2.GetDouble(0.0, 1.0));
  }

  //==========================================================================
  void TestGetUint()
  {
    RNG   rng(42);
    bool  seen[10] = { false };

    for (int i = 0; i < 1000; ++i)
    {
      uint32_t  v = rng.GetUint(10);

      CPPUNIT_ASSERT(v < 10);
      seen[v] = true;
    }

    for (int i = 0; i < 10; ++i)
    {
      CPPUNIT_ASSERT(seen[i]);
    }

    CPPUNIT_ASSERT(rng.GetUint(1) == 0);
    CPPUNIT_ASSERT(rng.GetUint(0) == 0);
  }

  //==========================================================================
  void TestGetDouble()
  {
    RNG  rng(42);

    for (int i = 0; i < 1000; ++i)
    {
      double  v = rng.GetDouble(-2.5, 2.5);

      CPPUNIT_ASSERT((v >= -2.5) && (v < 2.5));
    }

    // An empty range yields its lower bound.
    CPPUNIT_ASSERT(rng.GetDouble(3.0, 3.0) == 3.0);
    CPPUNIT_ASSERT(rng.GetDouble(4.0, 1.0) == 4.0);
  }

  //==========================================================================
  void TestGetUniformSigned()
  {
    RNG   rng(7);
    bool  saw_neg = false;
    bool  saw_pos = false;

    for (int i = 0; i < 1000; ++i)
    {
      double  v = rng.GetUniformSigned();

      CPPUNIT_ASSERT((v >= -1.0) && (v < 1.0));
      saw_neg = (saw_neg || (v < 0.0));
      saw_pos = (saw_pos || (v > 0.0));
    }

    CPPUNIT_ASSERT(saw_neg && saw_pos);
  }

}; // end class RNGTest

CPPUNIT_TEST_SUITE_REGISTRATION(RNGTest);
