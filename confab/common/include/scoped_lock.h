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

#ifndef CONFAB_COMMON_SCOPED_LOCK_H
#define CONFAB_COMMON_SCOPED_LOCK_H

///
/// Provides a common facility for managing mutexes.
///

#include <pthread.h>

namespace confab
{
  ///
  /// Locks a mutex for the lifetime of the object.  The following
  /// illustrates how this class is used:
  ///
  /// \code
  /// bool ChannelRegistry::NextSequence(ChannelId ch, uint32_t& seq)
  /// {
  ///   ScopedLock  lock(&mutex_);
  ///
  ///   //
  ///   // Operate on the shared channel table here.
  ///   //
  /// }
  /// \endcode
  ///
  class ScopedLock
  {
    public:

    ///
    /// Constructor.  Locks the mutex.
    ///
    /// \param  mutex  Pointer to the mutex that the ScopedLock object will
    ///                operate on.
    ///
    explicit ScopedLock(pthread_mutex_t* mutex);

    ///
    /// Destructor.  Unlocks the mutex.
    ///
    virtual ~ScopedLock();

    private:

    ///
    /// Default constructor.
    ///
    ScopedLock();

    ///
    /// Copy constructor.
    ///
    ScopedLock(const ScopedLock& other);

    ///
    /// Assignment operator.
    ///
    ScopedLock& operator=(const ScopedLock& other);

    ///
    /// The mutex that the scope lock operates on.
    ///
    pthread_mutex_t*  mutex_;

  }; // end class ScopedLock
} // namespace confab

#endif // CONFAB_COMMON_SCOPED_LOCK_H
