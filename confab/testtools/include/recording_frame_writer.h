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

/// \brief Frame receivers that record what they are given.

#ifndef CONFAB_TESTTOOLS_RECORDING_FRAME_WRITER_H
#define CONFAB_TESTTOOLS_RECORDING_FRAME_WRITER_H

#include "control_message.h"
#include "jitter_buffer.h"
#include "mtc_types.h"
#include "stream_receiver.h"

#include <string>
#include <utility>
#include <vector>


namespace confab
{
  /// \brief Records the frames written by a jitter buffer.
  class RecordingFrameWriter : public FrameWriterIf
  {
    public:

    /// \brief Constructor.
    RecordingFrameWriter();

    /// \brief Destructor.
    virtual ~RecordingFrameWriter();

    virtual void WriteFrame(const MediaFrame& frame);

    virtual void ProcessBufferOverflow(size_t dropped);

    // The frames written, in order.
    std::vector<MediaFrame>  frames;

    // The dropped counts of each overflow.
    std::vector<size_t>      overflows;

    private:

    /// \brief Copy constructor.
    RecordingFrameWriter(const RecordingFrameWriter& other);

    /// \brief Copy operator.
    RecordingFrameWriter& operator=(const RecordingFrameWriter& other);

  }; // end class RecordingFrameWriter

  /// \brief Records the messages dispatched by a stream receiver.
  class RecordingReceiverHandler : public ReceiverHandlerIf
  {
    public:

    /// \brief Constructor.
    RecordingReceiverHandler();

    /// \brief Destructor.
    virtual ~RecordingReceiverHandler();

    virtual void ProcessStreamConfig(const StreamConfig& cfg);

    virtual void ProcessServerEvent(const std::string& type,
                                    const std::string& json);

    /// \brief Record the frame, then stop stop_receiver if it is set.
    virtual void ProcessMediaFrame(const MediaFrame& frame);

    std::vector<StreamConfig>                         configs;
    std::vector<std::pair<std::string, std::string> > events;
    std::vector<MediaFrame>                           frames;

    // A receiver to stop from within ProcessMediaFrame().  Not owned.
    StreamReceiver*                                   stop_receiver;

    private:

    /// \brief Copy constructor.
    RecordingReceiverHandler(const RecordingReceiverHandler& other);

    /// \brief Copy operator.
    RecordingReceiverHandler& operator=(
      const RecordingReceiverHandler& other);

  }; // end class RecordingReceiverHandler
} // namespace confab

#endif // CONFAB_TESTTOOLS_RECORDING_FRAME_WRITER_H
