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

/// \brief The jitter buffer header file.
///
/// Converts bursty frame arrival into output at a steady cadence.

#ifndef CONFAB_MTC_JITTER_BUFFER_H
#define CONFAB_MTC_JITTER_BUFFER_H

#include "config_info.h"
#include "mtc_types.h"
#include "timer.h"

#include <deque>


namespace confab
{

  /// \brief The receiver of frames leaving a jitter buffer.
  class FrameWriterIf
  {
    public:

    /// \brief Destructor.
    virtual ~FrameWriterIf() { }

    /// \brief Write one frame.
    ///
    /// \param  frame  The frame.
    virtual void WriteFrame(const MediaFrame& frame) = 0;

    /// \brief Note that frames were dropped because the buffer was full.
    ///
    /// \param  dropped  The number of frames dropped.
    virtual void ProcessBufferOverflow(size_t dropped)
    {
      return;
    }

  }; // end class FrameWriterIf

  /// \brief An adaptive rate playback buffer.
  ///
  /// For a target frame rate fps:
  ///
  /// \verbatim
  ///   tick interval = round(1000 / fps) ms
  ///   target depth  = max(2, ceil(fps * 0.15)) frames
  ///   max depth     = fps frames
  /// \endverbatim
  ///
  /// Each tick writes at most one frame, never repeating one.  The next
  /// tick is 5 ms away while more than twice the target depth is queued,
  /// max(5, interval / 2) ms away while more than the target depth is
  /// queued, and one interval away otherwise.  Pushing past the max depth
  /// drops the oldest frame.
  ///
  /// Runs on the event loop thread.
  class JitterBuffer
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  timer   The timer that drives the ticks.
    /// \param  writer  Receives the frames.
    JitterBuffer(Timer& timer, FrameWriterIf& writer);

    /// \brief Destructor.
    virtual ~JitterBuffer();

    /// \brief Initialize from configuration.
    ///
    /// \param  ci  The configuration.  Reads "jitter.target_fps".
    ///
    /// \return  False if the frame rate is zero.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Set the target frame rate.
    ///
    /// Frames beyond the new max depth are dropped, oldest first.
    ///
    /// \param  target_fps  The frame rate.  Must be positive.
    ///
    /// \return  False if target_fps is zero.
    bool Configure(uint32_t target_fps);

    /// \brief Add a frame at the tail.
    ///
    /// \param  frame  The frame.
    void Push(const MediaFrame& frame);

    /// \brief Start the ticks.  Does nothing if already started.
    ///
    /// \return  False if the tick timer cannot be started.
    bool Start();

    /// \brief Stop the ticks.  Does nothing if already stopped.
    void Stop();

    /// \brief Discard all queued frames.
    void Flush();

    /// \brief Write the head frame, if any.
    ///
    /// \return  True if a frame was written.
    bool Tick();

    /// \brief Get the delay until the next tick for the current depth.
    ///
    /// \return  The delay in milliseconds.
    uint32_t NextTickDelayMs() const;

    inline size_t depth() const
    {
      return frames_.size();
    }

    inline uint32_t target_fps() const
    {
      return target_fps_;
    }

    inline uint32_t tick_interval_ms() const
    {
      return tick_interval_ms_;
    }

    inline size_t target_depth() const
    {
      return target_depth_;
    }

    inline size_t max_depth() const
    {
      return max_depth_;
    }

    /// \brief Get the number of frames dropped on overflow.
    inline size_t overflow_count() const
    {
      return overflow_count_;
    }

    /// \brief Get the number of frames written.
    inline size_t emitted_count() const
    {
      return emitted_count_;
    }

    inline bool IsRunning() const
    {
      return running_;
    }

    private:

    /// \brief Copy constructor.
    JitterBuffer(const JitterBuffer& other);

    /// \brief Copy operator.
    JitterBuffer& operator=(const JitterBuffer& other);

    /// \brief Tick, then schedule the next tick.  Called by the timer.
    void TickTimeout();

    /// \brief Start the tick timer.
    bool StartTickTimer(uint32_t delay_ms);

    /// \brief Drop frames from the head until the max depth is respected.
    void TrimToMaxDepth();

    /// The timer.
    Timer&                  timer_;

    /// The frame writer.
    FrameWriterIf&          writer_;

    /// The queued frames, oldest first.
    std::deque<MediaFrame>  frames_;

    uint32_t                target_fps_;
    uint32_t                tick_interval_ms_;
    size_t                  target_depth_;
    size_t                  max_depth_;

    size_t                  overflow_count_;
    size_t                  emitted_count_;

    /// Set while ticks are scheduled.
    bool                    running_;

    /// The tick timer.
    Timer::Handle           tick_handle_;

  }; // end class JitterBuffer

} // namespace confab

#endif // CONFAB_MTC_JITTER_BUFFER_H
