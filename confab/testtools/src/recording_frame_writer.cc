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

#include "recording_frame_writer.h"


using ::confab::MediaFrame;
using ::confab::RecordingFrameWriter;
using ::confab::RecordingReceiverHandler;
using ::confab::StreamConfig;
using ::std::make_pair;
using ::std::string;


//============================================================================
RecordingFrameWriter::RecordingFrameWriter()
    : frames(), overflows()
{
}

//============================================================================
RecordingFrameWriter::~RecordingFrameWriter()
{
}

//============================================================================
void RecordingFrameWriter::WriteFrame(const MediaFrame& frame)
{
  frames.push_back(frame);
}

//============================================================================
void RecordingFrameWriter::ProcessBufferOverflow(size_t dropped)
{
  overflows.push_back(dropped);
}

//============================================================================
RecordingReceiverHandler::RecordingReceiverHandler()
    : configs(), events(), frames(), stop_receiver(NULL)
{
}

//============================================================================
RecordingReceiverHandler::~RecordingReceiverHandler()
{
}

//============================================================================
void RecordingReceiverHandler::ProcessStreamConfig(const StreamConfig& cfg)
{
  configs.push_back(cfg);
}

//============================================================================
void RecordingReceiverHandler::ProcessServerEvent(const string& type,
                                                  const string& json)
{
  events.push_back(make_pair(type, json));
}

//============================================================================
void RecordingReceiverHandler::ProcessMediaFrame(const MediaFrame& frame)
{
  frames.push_back(frame);

  if (stop_receiver != NULL)
  {
    stop_receiver->Stop();
  }
}
