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

/// \brief The CONFAB callback header file.
///
/// Timer callbacks on class methods taking zero or one argument.

#ifndef CONFAB_COMMON_CALLBACK_H
#define CONFAB_COMMON_CALLBACK_H

#include <stdlib.h>


namespace confab
{

  /// \brief The interface the Timer service calls through.
  class CallbackInterface
  {

   public:

    /// \brief Destructor.
    virtual ~CallbackInterface()
    { }

    /// \brief Call the stored method on the stored object.
    virtual void PerformCallback() = 0;

    /// \brief Get a copy that outlives the caller's callback object.
    ///
    /// The service that stores the copy calls ReleaseClone() on it when it
    /// is done with it.
    ///
    /// \return  The copy.
    virtual CallbackInterface* Clone() = 0;

    /// \brief Give back a copy obtained from Clone().
    virtual void ReleaseClone() = 0;

  }; // end class CallbackInterface


  /// \brief Clone management shared by the callback templates.
  ///
  /// Released copies go onto a free list per concrete callback type and are
  /// handed out again by later Clone() calls.  The owner of the callback
  /// type calls EmptyPool() when the free list is no longer needed, after
  /// every timer holding a copy has been canceled or has fired.
  ///
  /// \tparam  D  The concrete callback type.
  template<class D>
  class PooledCallback : public CallbackInterface
  {

   public:

    /// \brief Destructor.
    virtual ~PooledCallback()
    { }

    virtual CallbackInterface* Clone()
    {
      const D&  self = *static_cast<D*>(this);
      D*        copy = free_list_;

      if (copy == NULL)
      {
        copy = new D(self);
      }
      else
      {
        free_list_ = static_cast<PooledCallback<D>*>(copy)->next_free_;
        *copy      = self;
      }

      static_cast<PooledCallback<D>*>(copy)->next_free_ = NULL;

      return copy;
    }

    virtual void ReleaseClone()
    {
      next_free_ = free_list_;
      free_list_ = static_cast<D*>(this);
    }

    /// \brief Delete every released copy of this callback type.
    static void EmptyPool()
    {
      while (free_list_ != NULL)
      {
        D*  cb     = free_list_;
        free_list_ = static_cast<PooledCallback<D>*>(cb)->next_free_;
        delete cb;
      }
    }

   protected:

    /// \brief Constructor.
    PooledCallback()
        : next_free_(NULL)
    { }

   private:

    /// The next released copy, while this object is on the free list.
    D*         next_free_;

    /// The released copies of this callback type.
    static D*  free_list_;

  }; // end class PooledCallback

  template<class D>
  D* PooledCallback<D>::free_list_ = NULL;


  /// \brief A callback on a method without arguments.
  ///
  /// \code
  /// CallbackNoArg<JitterBuffer>  cb(this, &JitterBuffer::TickTimeout);
  /// timer_.StartTimer(delta, &cb, tick_handle_);
  /// \endcode
  ///
  /// \tparam  T  The class receiving the callback.
  template<class T>
  class CallbackNoArg : public PooledCallback< CallbackNoArg<T> >
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  instance  The object receiving the callback.
    /// \param  method    The method to call.
    CallbackNoArg(T* instance, void (T::*method)())
        : instance_(instance), method_(method)
    { }

    /// \brief Destructor.
    virtual ~CallbackNoArg()
    { }

    virtual void PerformCallback()
    {
      (instance_->*method_)();
    }

   private:

    /// The object receiving the callback.
    T*    instance_;

    /// The method to call.
    void  (T::*method_)();

  }; // end class CallbackNoArg


  /// \brief A callback on a method with one argument.
  ///
  /// The argument is stored by value, so A1 must not be a reference type.
  ///
  /// \tparam  T   The class receiving the callback.
  /// \tparam  A1  The argument type.
  template<class T, class A1>
  class CallbackOneArg : public PooledCallback< CallbackOneArg<T, A1> >
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  instance  The object receiving the callback.
    /// \param  method    The method to call.
    /// \param  arg1      The argument passed to the method.
    CallbackOneArg(T* instance, void (T::*method)(A1 arg1), A1 arg1)
        : instance_(instance), method_(method), arg1_(arg1)
    { }

    /// \brief Destructor.
    virtual ~CallbackOneArg()
    { }

    virtual void PerformCallback()
    {
      (instance_->*method_)(arg1_);
    }

   private:

    /// The object receiving the callback.
    T*    instance_;

    /// The method to call.
    void  (T::*method_)(A1 arg1);

    /// The stored argument.
    A1    arg1_;

  }; // end class CallbackOneArg

} // namespace confab

#endif // CONFAB_COMMON_CALLBACK_H
