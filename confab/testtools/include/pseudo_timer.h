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

/// \brief A Timer that runs on a virtual clock.
///
/// Timers never fire on their own.  Tests advance the virtual clock, which
/// fires the expired callbacks in expiration order.

#ifndef CONFAB_TESTTOOLS_PSEUDO_TIMER_H
#define CONFAB_TESTTOOLS_PSEUDO_TIMER_H

#include "itime.h"
#include "timer.h"

#include <list>


namespace confab
{
  class PseudoTimer : public Timer
  {
    public:

    /// \brief Constructor.  The virtual clock starts at zero.
    PseudoTimer();

    /// \brief Destructor.
    virtual ~PseudoTimer();

    // Standard Timer interface, on the virtual clock.

    virtual bool StartTimer(const Time& delta_time, CallbackInterface* cb,
                            Handle& handle);

    virtual bool ModifyTimer(const Time& delta_time, Handle& handle);

    virtual bool CancelTimer(Handle& handle);

    virtual void CancelAllTimers();

    virtual bool IsTimerSet(const Handle& handle) const;

    virtual Time GetNextExpirationTime(
      const Time& max_wait = Time::FromMsec(1000));

    /// \brief Fire every timer that has expired at the current virtual
    /// time.
    virtual void DoCallbacks();

    /// \brief Advance the virtual clock to the earliest timer and fire it.
    ///
    /// \return  False if no timer is set.
    bool FireNext();

    /// \brief Advance the virtual clock, firing timers as they expire.
    ///
    /// \param  delta_time  The amount to advance.
    void Advance(const Time& delta_time);

    /// \brief Get the duration the earliest timer was started with.
    ///
    /// \param  delta_time  The duration.
    ///
    /// \return  False if no timer is set.
    bool GetNextDelta(Time& delta_time) const;

    /// \brief Get the number of timers set.
    inline size_t NumPending() const
    {
      return events_.size();
    }

    /// \brief Get the virtual time.
    inline const Time& now() const
    {
      return now_;
    }

    // Number of timers started.
    size_t  start_count;

    private:

    /// \brief Copy constructor.
    PseudoTimer(const PseudoTimer& other);

    /// \brief Copy operator.
    PseudoTimer& operator=(const PseudoTimer& other);

    /// A pending timer.
    struct PseudoEvent
    {
      uint32_t            id;
      Time                event_time;
      Time                delta_time;
      CallbackInterface*  cb;
    };

    /// \brief Find the earliest pending timer.
    std::list<PseudoEvent>::iterator FindNext();

    /// \brief Find a timer by handle id.
    std::list<PseudoEvent>::iterator Find(uint32_t id);

    // The pending timers, in start order.
    std::list<PseudoEvent>  events_;

    // The next handle id.
    uint32_t                next_id_;

    // The virtual time.
    Time                    now_;

  }; // end class PseudoTimer
} // namespace confab

#endif // CONFAB_TESTTOOLS_PSEUDO_TIMER_H
