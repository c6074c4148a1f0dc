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

#include "jitter_buffer.h"

#include "log.h"
#include "unused.h"

#include <inttypes.h>


using ::confab::CallbackNoArg;
using ::confab::ConfigInfo;
using ::confab::JitterBuffer;
using ::confab::MediaFrame;
using ::confab::Time;


namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)    = "JitterBuffer";

  /// The default target frame rate.
  const uint32_t  kDefaultTargetFps     = 30;

  /// The fast drain tick delay.
  const uint32_t  kFastDrainDelayMs     = 5;

  /// The smallest target depth.
  const size_t    kMinTargetDepth       = 2;
}

//============================================================================
JitterBuffer::JitterBuffer(Timer& timer, FrameWriterIf& writer)
    : timer_(timer),
      writer_(writer),
      frames_(),
      target_fps_(0),
      tick_interval_ms_(0),
      target_depth_(0),
      max_depth_(0),
      overflow_count_(0),
      emitted_count_(0),
      running_(false),
      tick_handle_()
{
  Configure(kDefaultTargetFps);
}

//============================================================================
JitterBuffer::~JitterBuffer()
{
  Stop();

  CallbackNoArg<JitterBuffer>::EmptyPool();
}

//============================================================================
bool JitterBuffer::Initialize(const ConfigInfo& ci)
{
  uint32_t  fps = ci.GetUint("jitter.target_fps", kDefaultTargetFps);

  if (!Configure(fps))
  {
    return false;
  }

  LogC(kClassName, __func__, "jitter.target_fps: %" PRIu32 "\n",
       target_fps_);

  return true;
}

//============================================================================
bool JitterBuffer::Configure(uint32_t target_fps)
{
  if (target_fps == 0)
  {
    LogE(kClassName, __func__, "Target frame rate must be positive.\n");
    return false;
  }

  target_fps_       = target_fps;
  tick_interval_ms_ = ((1000 + (target_fps / 2)) / target_fps);
  target_depth_     = ((static_cast<size_t>(target_fps) * 15) + 99) / 100;
  max_depth_        = target_fps;

  if (target_depth_ < kMinTargetDepth)
  {
    target_depth_ = kMinTargetDepth;
  }

  LogD(kClassName, __func__, "%" PRIu32 " fps: tick %" PRIu32 " ms, target "
       "depth %zu, max depth %zu.\n", target_fps_, tick_interval_ms_,
       target_depth_, max_depth_);

  TrimToMaxDepth();

  return true;
}

//============================================================================
void JitterBuffer::Push(const MediaFrame& frame)
{
  frames_.push_back(frame);

  TrimToMaxDepth();
}

//============================================================================
bool JitterBuffer::Start()
{
  if (running_)
  {
    return true;
  }

  if (!StartTickTimer(tick_interval_ms_))
  {
    return false;
  }

  running_ = true;

  return true;
}

//============================================================================
void JitterBuffer::Stop()
{
  if (!running_)
  {
    return;
  }

  timer_.CancelTimer(tick_handle_);
  running_ = false;
}

//============================================================================
void JitterBuffer::Flush()
{
  if (!frames_.empty())
  {
    LogD(kClassName, __func__, "Discarding %zu frames.\n", frames_.size());
  }

  frames_.clear();
}

//============================================================================
bool JitterBuffer::Tick()
{
  if (frames_.empty())
  {
    return false;
  }

  MediaFrame  frame = frames_.front();

  frames_.pop_front();
  ++emitted_count_;

  writer_.WriteFrame(frame);

  return true;
}

//============================================================================
uint32_t JitterBuffer::NextTickDelayMs() const
{
  size_t  backlog = frames_.size();

  if (backlog > (2 * target_depth_))
  {
    return kFastDrainDelayMs;
  }

  if (backlog > target_depth_)
  {
    uint32_t  half = (tick_interval_ms_ / 2);

    return ((half > kFastDrainDelayMs) ? half : kFastDrainDelayMs);
  }

  return tick_interval_ms_;
}

//============================================================================
void JitterBuffer::TickTimeout()
{
  tick_handle_.Clear();

  if (!running_)
  {
    return;
  }

  Tick();

  // The writer may have stopped the buffer.
  if (running_ && !StartTickTimer(NextTickDelayMs()))
  {
    running_ = false;
  }
}

//============================================================================
bool JitterBuffer::StartTickTimer(uint32_t delay_ms)
{
  CallbackNoArg<JitterBuffer>  cb(this, &JitterBuffer::TickTimeout);

  if (!timer_.StartTimer(Time::FromMsec(delay_ms), &cb, tick_handle_))
  {
    LogE(kClassName, __func__, "Cannot start tick timer.\n");
    return false;
  }

  return true;
}

//============================================================================
void JitterBuffer::TrimToMaxDepth()
{
  size_t  dropped = 0;

  while (frames_.size() > max_depth_)
  {
    frames_.pop_front();
    ++dropped;
  }

  if (dropped > 0)
  {
    overflow_count_ += dropped;

    LogD(kClassName, __func__, "Buffer overflow, dropped %zu oldest "
         "frames.\n", dropped);

    writer_.ProcessBufferOverflow(dropped);
  }
}
