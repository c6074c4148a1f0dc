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

#include "callback.h"
#include "itime.h"
#include "log.h"
#include "timer.h"

#include <new>
#include <unistd.h>

using ::confab::CallbackOneArg;
using ::confab::Log;
using ::confab::Time;
using ::confab::Timer;


#define NUM_TIMERS 16


/// Class for receiving the callbacks.
class TimerTarget
{

 public:

  TimerTarget(Timer& t)
      : timer(t), handle(), cb_cnt(0), cb_order()
  { }

  virtual ~TimerTarget()
  { }

  void CallbackMethod(int arg1)
  {
    // The handle of an expired timer is no longer set.
    CPPUNIT_ASSERT(timer.CancelTimer(handle[arg1]) == false);

    cb_order[cb_cnt] = arg1;
    ++cb_cnt;
  }

  void RestartMethod(int arg1)
  {
    cb_order[cb_cnt] = arg1;
    ++cb_cnt;

    if (arg1 < 2)
    {
      CallbackOneArg<TimerTarget, int>  cb(this, &TimerTarget::RestartMethod,
                                           (arg1 + 2));

      CPPUNIT_ASSERT(timer.StartTimer(Time::FromMsec(20), &cb,
                                      handle[arg1 + 2]));
    }
  }

  Timer&         timer;
  Timer::Handle  handle[NUM_TIMERS];
  int            cb_cnt;
  int            cb_order[NUM_TIMERS];
};

//============================================================================
class TimerTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(TimerTest);

  CPPUNIT_TEST(TestStartAndCancelTimers);
  CPPUNIT_TEST(TestStartTimersInCallback);
  CPPUNIT_TEST(TestModifyTimer);
  CPPUNIT_TEST(TestCancelAllTimers);
  CPPUNIT_TEST(TestNextExpirationTime);

  CPPUNIT_TEST_SUITE_END();

  Timer*        timer;
  TimerTarget*  target;

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    timer  = new (std::nothrow) Timer();
    target = new (std::nothrow) TimerTarget(*timer);
  }

  //==========================================================================
  void tearDown()
  {
    CallbackOneArg<TimerTarget, int>::EmptyPool();
    delete target;
    delete timer;
    target = NULL;
    timer  = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void RunTimers(int expected_cnt)
  {
    for (int i = 0; (i < 200) && (target->cb_cnt < expected_cnt); ++i)
    {
      ::usleep(5000);
      timer->DoCallbacks();
    }
  }

  //==========================================================================
  void TestStartAndCancelTimers()
  {
    {
      // Expire in the order 2 0 3 1.
      CallbackOneArg<TimerTarget, int>  cb0(target,
                                            &TimerTarget::CallbackMethod, 0);
      CallbackOneArg<TimerTarget, int>  cb1(target,
                                            &TimerTarget::CallbackMethod, 1);
      CallbackOneArg<TimerTarget, int>  cb2(target,
                                            &TimerTarget::CallbackMethod, 2);
      CallbackOneArg<TimerTarget, int>  cb3(target,
                                            &TimerTarget::CallbackMethod, 3);
      CallbackOneArg<TimerTarget, int>  cb4(target,
                                            &TimerTarget::CallbackMethod, 4);

      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(40), &cb0,
                                       target->handle[0]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(120), &cb1,
                                       target->handle[1]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(10), &cb2,
                                       target->handle[2]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(80), &cb3,
                                       target->handle[3]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(60), &cb4,
                                       target->handle[4]));

      // The callback objects go out of scope here.
    }

    CPPUNIT_ASSERT(timer->IsTimerSet(target->handle[4]));
    CPPUNIT_ASSERT(timer->CancelTimer(target->handle[4]));
    CPPUNIT_ASSERT(!timer->IsTimerSet(target->handle[4]));
    CPPUNIT_ASSERT(!timer->CancelTimer(target->handle[4]));

    RunTimers(4);

    CPPUNIT_ASSERT(target->cb_cnt == 4);
    CPPUNIT_ASSERT(target->cb_order[0] == 2);
    CPPUNIT_ASSERT(target->cb_order[1] == 0);
    CPPUNIT_ASSERT(target->cb_order[2] == 3);
    CPPUNIT_ASSERT(target->cb_order[3] == 1);
  }

  //==========================================================================
  void TestStartTimersInCallback()
  {
    {
      CallbackOneArg<TimerTarget, int>  cb0(target,
                                            &TimerTarget::RestartMethod, 0);
      CallbackOneArg<TimerTarget, int>  cb1(target,
                                            &TimerTarget::RestartMethod, 1);

      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(10), &cb0,
                                       target->handle[0]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(15), &cb1,
                                       target->handle[1]));
    }

    RunTimers(4);

    CPPUNIT_ASSERT(target->cb_cnt == 4);
    CPPUNIT_ASSERT(target->cb_order[0] == 0);
    CPPUNIT_ASSERT(target->cb_order[1] == 1);
    CPPUNIT_ASSERT(target->cb_order[2] == 2);
    CPPUNIT_ASSERT(target->cb_order[3] == 3);
  }

  //==========================================================================
  void TestModifyTimer()
  {
    {
      CallbackOneArg<TimerTarget, int>  cb0(target,
                                            &TimerTarget::CallbackMethod, 0);
      CallbackOneArg<TimerTarget, int>  cb1(target,
                                            &TimerTarget::CallbackMethod, 1);

      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(10), &cb0,
                                       target->handle[0]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(50), &cb1,
                                       target->handle[1]));
    }

    // Push timer 0 out past timer 1.
    CPPUNIT_ASSERT(timer->ModifyTimer(Time::FromMsec(100),
                                      target->handle[0]));

    RunTimers(2);

    CPPUNIT_ASSERT(target->cb_cnt == 2);
    CPPUNIT_ASSERT(target->cb_order[0] == 1);
    CPPUNIT_ASSERT(target->cb_order[1] == 0);

    // An expired handle cannot be modified.
    CPPUNIT_ASSERT(!timer->ModifyTimer(Time::FromMsec(10),
                                       target->handle[0]));
  }

  //==========================================================================
  void TestCancelAllTimers()
  {
    {
      CallbackOneArg<TimerTarget, int>  cb0(target,
                                            &TimerTarget::CallbackMethod, 0);
      CallbackOneArg<TimerTarget, int>  cb1(target,
                                            &TimerTarget::CallbackMethod, 1);

      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(5), &cb0,
                                       target->handle[0]));
      CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(5), &cb1,
                                       target->handle[1]));
    }

    timer->CancelAllTimers();

    CPPUNIT_ASSERT(!timer->IsTimerSet(target->handle[0]));
    CPPUNIT_ASSERT(!timer->IsTimerSet(target->handle[1]));

    ::usleep(20000);
    timer->DoCallbacks();

    CPPUNIT_ASSERT(target->cb_cnt == 0);
  }

  //==========================================================================
  void TestNextExpirationTime()
  {
    Time  max_wait = Time::FromMsec(500);

    CPPUNIT_ASSERT(timer->GetNextExpirationTime(max_wait) == max_wait);

    CallbackOneArg<TimerTarget, int>  cb0(target,
                                          &TimerTarget::CallbackMethod, 0);

    CPPUNIT_ASSERT(timer->StartTimer(Time::FromMsec(100), &cb0,
                                     target->handle[0]));

    Time  wait = timer->GetNextExpirationTime(max_wait);

    CPPUNIT_ASSERT(wait <= Time::FromMsec(100));
    CPPUNIT_ASSERT(wait > Time::FromMsec(50));

    CPPUNIT_ASSERT(timer->GetNextExpirationTime(Time::FromMsec(20)) ==
                   Time::FromMsec(20));
  }

}; // end class TimerTest

CPPUNIT_TEST_SUITE_REGISTRATION(TimerTest);
