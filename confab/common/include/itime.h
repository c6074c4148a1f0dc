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

/// \brief The CONFAB time header file.
///
/// Provides a monotonic time value with microsecond resolution, used for
/// timer deadlines, backoff delays, and packet timestamps.

#ifndef CONFAB_COMMON_ITIME_H
#define CONFAB_COMMON_ITIME_H

#include <string>

#include <stdint.h>
#include <sys/time.h>
#include <time.h>

namespace confab
{

  /// \brief A time value or time interval.
  ///
  /// Stored as a signed count of microseconds.  Current times come from the
  /// monotonic clock, so they are only meaningful relative to one another.
  /// Sums involving Infinite() stay infinite.
  class Time
  {
    public:

    /// \brief Default constructor, a zero time.
    inline Time() : usec_(0) {}

    /// \brief Copy constructor.
    ///
    /// \param  other_time  The time to copy.
    inline Time(const Time& other_time) : usec_(other_time.usec_) {}

    /// \brief Constructor from a timeval.
    ///
    /// \param  t_val  The time value.
    explicit Time(const timeval& t_val);

    /// \brief Constructor from a timespec, rounded to microseconds.
    ///
    /// \param  t_spec  The time value.
    explicit Time(const timespec& t_spec);

    /// \brief Constructor from seconds and microseconds.
    ///
    /// \param  seconds       The seconds.
    /// \param  microseconds  The microseconds.
    explicit Time(time_t seconds, suseconds_t microseconds);

    /// \brief Destructor.
    virtual ~Time() {}

    /// \brief Create a time from milliseconds.
    ///
    /// \param  milliseconds  The time in milliseconds.  May be negative.
    ///
    /// \return  The time.
    static Time FromMsec(int64_t milliseconds);

    /// \brief Create a time from microseconds.
    ///
    /// \param  microseconds  The time in microseconds.  May be negative.
    ///
    /// \return  The time.
    static Time FromUsec(int64_t microseconds);

    /// \brief Get the current monotonic time.
    ///
    /// \return  The current time.
    static Time Now();

    /// \brief Get a time later than any other.
    ///
    /// \return  The infinite time.
    static Time Infinite();

    /// \brief Get the later of two times.
    static Time Max(const Time& t1, const Time& t2);

    /// \brief Get the earlier of two times.
    static Time Min(const Time& t1, const Time& t2);

    /// \brief Format the time as seconds with six decimals, e.g. "1.500000s".
    ///
    /// \return  The formatted time.
    std::string ToString() const;

    /// \brief Get the current monotonic time in microseconds.
    ///
    /// \return  The current time, or 0 if the clock cannot be read.
    static int64_t GetNowInUsec();

    /// \brief Set the time to zero.
    inline void Zero()
    {
      usec_ = 0;
    }

    /// \brief Set the time to the current monotonic time.
    ///
    /// \return  False if the clock cannot be read.
    bool GetNow();

    Time operator+(const Time& time_to_add) const;

    Time& operator+=(const Time& time_to_add);

    Time operator-(const Time& time_to_remove) const;

    inline bool operator<(const Time& other) const
    {
      return (usec_ < other.usec_);
    }

    inline bool operator>(const Time& other) const
    {
      return (usec_ > other.usec_);
    }

    inline bool operator<=(const Time& other) const
    {
      return (usec_ <= other.usec_);
    }

    inline bool operator>=(const Time& other) const
    {
      return (usec_ >= other.usec_);
    }

    inline bool operator==(const Time& other) const
    {
      return (usec_ == other.usec_);
    }

    inline bool operator!=(const Time& other) const
    {
      return (usec_ != other.usec_);
    }

    inline Time& operator=(const Time& time_to_assign)
    {
      usec_ = time_to_assign.usec_;
      return *this;
    }

    inline bool IsZero() const
    {
      return (usec_ == 0);
    }

    bool IsInfinite() const;

    /// \brief Get the time in milliseconds, truncated toward zero.
    ///
    /// \return  The time in milliseconds.
    inline int64_t GetTimeInMsec() const
    {
      return (usec_ / 1000);
    }

    /// \brief Get the time in microseconds.
    ///
    /// \return  The time in microseconds.
    inline int64_t GetTimeInUsec() const
    {
      return usec_;
    }

    private:

    /// The time in microseconds.
    int64_t  usec_;

  }; // end class Time

} // namespace confab

#endif // CONFAB_COMMON_ITIME_H
