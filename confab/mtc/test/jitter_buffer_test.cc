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

#include "config_info.h"
#include "itime.h"
#include "jitter_buffer.h"
#include "log.h"
#include "mtc_types.h"
#include "pseudo_timer.h"
#include "recording_frame_writer.h"

using ::confab::ConfigInfo;
using ::confab::JitterBuffer;
using ::confab::Log;
using ::confab::MediaFrame;
using ::confab::PseudoTimer;
using ::confab::RecordingFrameWriter;
using ::confab::Time;


namespace
{
  /// Make a frame with a sequence number.
  MediaFrame MakeFrame(uint32_t seq)
  {
    MediaFrame  frame;

    frame.seq          = seq;
    frame.timestamp_ms = (seq * 33);
    frame.frame_type   = confab::FRAME_CAM_720P_DELTA;
    frame.payload.assign(4, static_cast<uint8_t>(seq));

    return frame;
  }
}

//============================================================================
class JitterBufferTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(JitterBufferTest);

  CPPUNIT_TEST(TestDefaults);
  CPPUNIT_TEST(TestConfigure);
  CPPUNIT_TEST(TestInitialize);
  CPPUNIT_TEST(TestFastDrain);
  CPPUNIT_TEST(TestDrainRates);
  CPPUNIT_TEST(TestOverflowDropsOldest);
  CPPUNIT_TEST(TestShrinkOnConfigure);
  CPPUNIT_TEST(TestStartStop);
  CPPUNIT_TEST(TestEmptyTick);
  CPPUNIT_TEST(TestFlush);

  CPPUNIT_TEST_SUITE_END();

  private:

  PseudoTimer*           timer_;
  RecordingFrameWriter*  writer_;
  JitterBuffer*          jb_;

  public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    timer_  = new PseudoTimer();
    writer_ = new RecordingFrameWriter();
    jb_     = new JitterBuffer(*timer_, *writer_);
  }

  //==========================================================================
  void tearDown()
  {
    delete jb_;
    jb_     = NULL;
    delete writer_;
    writer_ = NULL;
    delete timer_;
    timer_  = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestDefaults()
  {
    CPPUNIT_ASSERT(jb_->target_fps() == 30);
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 33);
    CPPUNIT_ASSERT(jb_->target_depth() == 5);
    CPPUNIT_ASSERT(jb_->max_depth() == 30);
    CPPUNIT_ASSERT(jb_->depth() == 0);
    CPPUNIT_ASSERT(!jb_->IsRunning());
  }

  //==========================================================================
  void TestConfigure()
  {
    CPPUNIT_ASSERT(jb_->Configure(20));
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 50);
    CPPUNIT_ASSERT(jb_->target_depth() == 3);
    CPPUNIT_ASSERT(jb_->max_depth() == 20);

    CPPUNIT_ASSERT(jb_->Configure(60));
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 17);
    CPPUNIT_ASSERT(jb_->target_depth() == 9);

    // Low rates keep a minimum target depth.
    CPPUNIT_ASSERT(jb_->Configure(5));
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 200);
    CPPUNIT_ASSERT(jb_->target_depth() == 2);

    CPPUNIT_ASSERT(jb_->Configure(1));
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 1000);
    CPPUNIT_ASSERT(jb_->target_depth() == 2);
    CPPUNIT_ASSERT(jb_->max_depth() == 1);

    CPPUNIT_ASSERT(!jb_->Configure(0));
    CPPUNIT_ASSERT(jb_->target_fps() == 1);
  }

  //==========================================================================
  void TestInitialize()
  {
    ConfigInfo  ci;

    CPPUNIT_ASSERT(jb_->Initialize(ci));
    CPPUNIT_ASSERT(jb_->target_fps() == 30);

    ci.Add("jitter.target_fps", "24");
    CPPUNIT_ASSERT(jb_->Initialize(ci));
    CPPUNIT_ASSERT(jb_->target_fps() == 24);
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 42);

    ci.Add("jitter.target_fps", "0");
    CPPUNIT_ASSERT(!jb_->Initialize(ci));
    CPPUNIT_ASSERT(jb_->target_fps() == 24);
  }

  //==========================================================================
  void TestFastDrain()
  {
    Time  delta;

    CPPUNIT_ASSERT(jb_->Configure(20));

    for (uint32_t i = 0; i < 15; ++i)
    {
      jb_->Push(MakeFrame(i));
    }

    CPPUNIT_ASSERT(jb_->depth() == 15);
    CPPUNIT_ASSERT(jb_->Start());
    CPPUNIT_ASSERT(timer_->GetNextDelta(delta));
    CPPUNIT_ASSERT(delta == Time::FromMsec(50));

    CPPUNIT_ASSERT(timer_->FireNext());
    CPPUNIT_ASSERT(writer_->frames.size() == 1);
    CPPUNIT_ASSERT(writer_->frames[0].seq == 0);
    CPPUNIT_ASSERT(jb_->depth() == 14);

    // Far above the target depth, so the next tick comes quickly.
    CPPUNIT_ASSERT(timer_->GetNextDelta(delta));
    CPPUNIT_ASSERT(delta == Time::FromMsec(5));
  }

  //==========================================================================
  void TestDrainRates()
  {
    CPPUNIT_ASSERT(jb_->Configure(20));

    for (uint32_t i = 0; i < 7; ++i)
    {
      jb_->Push(MakeFrame(i));
    }

    // Above twice the target of three.
    CPPUNIT_ASSERT(jb_->NextTickDelayMs() == 5);

    CPPUNIT_ASSERT(jb_->Tick());
    CPPUNIT_ASSERT(jb_->depth() == 6);
    CPPUNIT_ASSERT(jb_->NextTickDelayMs() == 25);

    CPPUNIT_ASSERT(jb_->Tick());
    CPPUNIT_ASSERT(jb_->Tick());
    CPPUNIT_ASSERT(jb_->depth() == 4);
    CPPUNIT_ASSERT(jb_->NextTickDelayMs() == 25);

    CPPUNIT_ASSERT(jb_->Tick());
    CPPUNIT_ASSERT(jb_->depth() == 3);
    CPPUNIT_ASSERT(jb_->NextTickDelayMs() == 50);

    // The half interval never goes below the fast drain delay.
    CPPUNIT_ASSERT(jb_->Configure(120));
    CPPUNIT_ASSERT(jb_->tick_interval_ms() == 8);

    while (jb_->depth() < 20)
    {
      jb_->Push(MakeFrame(100));
    }

    CPPUNIT_ASSERT(jb_->target_depth() == 18);
    CPPUNIT_ASSERT(jb_->NextTickDelayMs() == 5);

    // The frames leave in arrival order.
    for (size_t i = 0; i < writer_->frames.size(); ++i)
    {
      CPPUNIT_ASSERT(writer_->frames[i].seq == i);
    }
  }

  //==========================================================================
  void TestOverflowDropsOldest()
  {
    CPPUNIT_ASSERT(jb_->Configure(10));

    for (uint32_t i = 0; i < 13; ++i)
    {
      jb_->Push(MakeFrame(i));
    }

    CPPUNIT_ASSERT(jb_->depth() == 10);
    CPPUNIT_ASSERT(jb_->overflow_count() == 3);
    CPPUNIT_ASSERT(writer_->overflows.size() == 3);
    CPPUNIT_ASSERT(writer_->overflows[0] == 1);

    CPPUNIT_ASSERT(jb_->Tick());
    CPPUNIT_ASSERT(writer_->frames[0].seq == 3);
  }

  //==========================================================================
  void TestShrinkOnConfigure()
  {
    for (uint32_t i = 0; i < 25; ++i)
    {
      jb_->Push(MakeFrame(i));
    }

    CPPUNIT_ASSERT(jb_->overflow_count() == 0);

    CPPUNIT_ASSERT(jb_->Configure(15));
    CPPUNIT_ASSERT(jb_->depth() == 15);
    CPPUNIT_ASSERT(jb_->overflow_count() == 10);
    CPPUNIT_ASSERT(writer_->overflows.size() == 1);
    CPPUNIT_ASSERT(writer_->overflows[0] == 10);

    CPPUNIT_ASSERT(jb_->Tick());
    CPPUNIT_ASSERT(writer_->frames[0].seq == 10);
  }

  //==========================================================================
  void TestStartStop()
  {
    CPPUNIT_ASSERT(jb_->Start());
    CPPUNIT_ASSERT(jb_->Start());
    CPPUNIT_ASSERT(jb_->IsRunning());
    CPPUNIT_ASSERT(timer_->NumPending() == 1);

    jb_->Push(MakeFrame(1));
    jb_->Push(MakeFrame(2));

    timer_->Advance(Time::FromMsec(70));
    CPPUNIT_ASSERT(writer_->frames.size() == 2);
    CPPUNIT_ASSERT(jb_->emitted_count() == 2);

    jb_->Stop();
    jb_->Stop();
    CPPUNIT_ASSERT(!jb_->IsRunning());
    CPPUNIT_ASSERT(timer_->NumPending() == 0);

    jb_->Push(MakeFrame(3));
    timer_->Advance(Time::FromMsec(1000));
    CPPUNIT_ASSERT(writer_->frames.size() == 2);
    CPPUNIT_ASSERT(jb_->depth() == 1);

    CPPUNIT_ASSERT(jb_->Start());
    timer_->Advance(Time::FromMsec(33));
    CPPUNIT_ASSERT(writer_->frames.size() == 3);
  }

  //==========================================================================
  void TestEmptyTick()
  {
    CPPUNIT_ASSERT(!jb_->Tick());
    CPPUNIT_ASSERT(jb_->Start());

    // Ticking an empty buffer keeps the timer going.
    timer_->Advance(Time::FromMsec(100));
    CPPUNIT_ASSERT(writer_->frames.empty());
    CPPUNIT_ASSERT(jb_->IsRunning());
    CPPUNIT_ASSERT(timer_->NumPending() == 1);
  }

  //==========================================================================
  void TestFlush()
  {
    jb_->Push(MakeFrame(1));
    jb_->Push(MakeFrame(2));
    jb_->Flush();

    CPPUNIT_ASSERT(jb_->depth() == 0);
    CPPUNIT_ASSERT(!jb_->Tick());
    CPPUNIT_ASSERT(jb_->overflow_count() == 0);
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(JitterBufferTest);
