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

/// \brief The CONFAB timer header file.
///
/// Provides an event-loop driven timer service.  Timers never fire on their
/// own thread: the owner of the event loop asks GetNextExpirationTime() how
/// long it may wait, and calls DoCallbacks() when it wakes up.

#ifndef CONFAB_COMMON_TIMER_H
#define CONFAB_COMMON_TIMER_H

#include "callback.h"
#include "itime.h"

#include <stdint.h>


namespace confab
{

  /// \brief The timer service.
  ///
  /// Each timer is identified by a Handle owned by the caller.  A handle is
  /// invalidated when its timer fires or is cancelled, so a callback may
  /// safely start a new timer using the same handle.
  ///
  /// The methods are virtual so that tests can substitute a timer that is
  /// fired manually.
  class Timer
  {

  private:

    struct TimerElem;

  public:

    /// \brief A handle for a single timer.
    class Handle
    {

    public:

      /// \brief Constructor, an unset handle.
      Handle() : id_(0), elem_(NULL)
      { }

      /// \brief Destructor.
      virtual ~Handle()
      { }

      /// \brief Forget the timer this handle refers to.
      ///
      /// Does not cancel the timer.
      inline void Clear()
      {
        id_   = 0;
        elem_ = NULL;
      }

    private:

      friend class Timer;

      /// The handle identifier, zero when unset.
      uint32_t    id_;

      /// The timer element, if any.
      TimerElem*  elem_;

    }; // end class Handle

    /// \brief Constructor.
    Timer();

    /// \brief Destructor.  Cancels all outstanding timers.
    virtual ~Timer();

    /// \brief Start a timer.
    ///
    /// The callback object is cloned, so the caller's object may go out of
    /// scope.
    ///
    /// \param  delta_time  The time from now until the timer expires.
    /// \param  cb          The callback to perform on expiration.
    /// \param  handle      The handle that will refer to the timer.
    ///
    /// \return  True on success, false otherwise.
    virtual bool StartTimer(const Time& delta_time, CallbackInterface* cb,
                            Handle& handle);

    /// \brief Change the expiration time of a timer.
    ///
    /// \param  delta_time  The new time from now until the timer expires.
    /// \param  handle      The timer handle.
    ///
    /// \return  True if the timer was still set and was modified.
    virtual bool ModifyTimer(const Time& delta_time, Handle& handle);

    /// \brief Cancel a timer.
    ///
    /// \param  handle  The timer handle.  Always cleared on return.
    ///
    /// \return  True if the timer was set and is now cancelled, false if it
    ///          had already expired or been cancelled.
    virtual bool CancelTimer(Handle& handle);

    /// \brief Cancel all timers.
    virtual void CancelAllTimers();

    /// \brief Check if a timer is still set.
    ///
    /// \param  handle  The timer handle.
    ///
    /// \return  True if the timer has neither expired nor been cancelled.
    virtual bool IsTimerSet(const Handle& handle) const;

    /// \brief Get the time until the next timer expires.
    ///
    /// \param  max_wait  The maximum time to return.
    ///
    /// \return  The time until the next expiration, limited to max_wait.
    virtual Time GetNextExpirationTime(
      const Time& max_wait = Time::FromMsec(1000));

    /// \brief Perform the callbacks for all of the expired timers.
    virtual void DoCallbacks();

  protected:

    /// \brief Assign a handle, for timer implementations that do not keep
    /// timer elements.
    ///
    /// \param  handle  The handle to assign.
    /// \param  id      The non-zero identifier.
    static inline void AssignHandle(Handle& handle, uint32_t id)
    {
      handle.id_   = id;
      handle.elem_ = NULL;
    }

    /// \brief Get the identifier of a handle.
    ///
    /// \param  handle  The handle.
    ///
    /// \return  The identifier, zero when unset.
    static inline uint32_t HandleId(const Handle& handle)
    {
      return handle.id_;
    }

  private:

    /// \brief A timer event, kept in an unsorted doubly linked list.
    struct TimerElem
    {
      TimerElem(uint32_t id, const Time& t)
          : handle_id(id), event_time(t), cb(NULL), next(NULL), prev(NULL)
      { }

      uint32_t            handle_id;
      Time                event_time;
      CallbackInterface*  cb;
      TimerElem*          next;
      TimerElem*          prev;
    };

    /// \brief Copy constructor.
    Timer(const Timer& other);

    /// \brief Copy operator.
    Timer& operator=(const Timer& other);

    /// \brief Unlink an element from the event list and return it to the
    /// pool, releasing its callback.
    void ReleaseElem(TimerElem* te);

    /// \brief Find the event that expires next.
    ///
    /// \return  True if there is an event.
    bool FindNextEvent();

    /// The next handle identifier to assign, never zero.
    uint32_t    next_handle_;

    /// The head of the event list.
    TimerElem*  events_head_;

    /// The tail of the event list.
    TimerElem*  events_tail_;

    /// The cached next event, or NULL if it must be searched for.
    TimerElem*  next_event_;

    /// The pool of unused elements.
    TimerElem*  pool_;

  }; // end class Timer

} // namespace confab

#endif // CONFAB_COMMON_TIMER_H
