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

/// \brief The stream receiver header file.
///
/// The receive side of a subscriber stream: reassembles length-prefixed
/// messages and dispatches them as server JSON or media frames.

#ifndef CONFAB_MTC_STREAM_RECEIVER_H
#define CONFAB_MTC_STREAM_RECEIVER_H

#include "control_message.h"
#include "length_delimited_reader.h"
#include "mtc_types.h"
#include "packet_codec.h"

#include <string>


namespace confab
{

  /// \brief The receiver of dispatched stream messages.
  class ReceiverHandlerIf
  {
    public:

    /// \brief Destructor.
    virtual ~ReceiverHandlerIf() { }

    /// \brief Process a codec configuration, either sent alone or as part
    /// of a DecoderConfigs announcement.
    ///
    /// \param  cfg  The configuration.
    virtual void ProcessStreamConfig(const StreamConfig& cfg) = 0;

    /// \brief Process any other JSON message from the server.
    ///
    /// \param  type  The message's "type".
    /// \param  json  The message.
    virtual void ProcessServerEvent(const std::string& type,
                                    const std::string& json) = 0;

    /// \brief Process a media frame.
    ///
    /// \param  frame  The frame.
    virtual void ProcessMediaFrame(const MediaFrame& frame) = 0;

  }; // end class ReceiverHandlerIf

  /// \brief The receiver states.
  enum ReceiverState
  {
    RECV_READING = 0,
    RECV_DISPATCHING,
    RECV_STOPPED
  };

  /// \brief The stream receive state machine.
  ///
  /// Bytes are accepted in RECV_READING.  Once they complete one or more
  /// messages the receiver moves to RECV_DISPATCHING, hands each message to
  /// the handler, and returns to RECV_READING.  Stop() moves it to
  /// RECV_STOPPED, which ends dispatching at the next message boundary,
  /// even when called from within the handler.
  ///
  /// Messages that start with '{' are JSON.  All others are standard
  /// frames.  Video delta frames are dropped until the first video key
  /// frame is received.
  class StreamReceiver
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  handler  The message handler.
    explicit StreamReceiver(ReceiverHandlerIf& handler);

    /// \brief Destructor.
    virtual ~StreamReceiver();

    /// \brief Process bytes read from the stream.
    ///
    /// \param  buf  The bytes.
    /// \param  len  The number of bytes.
    ///
    /// \return  False if the receiver is stopped, or the stream can no
    ///          longer be framed.
    bool ProcessBytes(const uint8_t* buf, size_t len);

    /// \brief Process the end of the stream.  The receiver stops.
    ///
    /// \return  False if the stream ended inside a message.
    bool ProcessEndOfStream();

    /// \brief Stop dispatching.  Does nothing if already stopped.
    void Stop();

    /// \brief Clear all buffered bytes and the key frame gate, and resume
    /// reading.
    void Reset();

    inline ReceiverState state() const
    {
      return state_;
    }

    /// \brief Check if a video key frame has been received.
    inline bool keyframe_received() const
    {
      return keyframe_received_;
    }

    /// \brief Get the number of messages dispatched.
    inline size_t message_count() const
    {
      return message_count_;
    }

    /// \brief Get the number of delta frames dropped before the first
    /// key frame.
    inline size_t gated_frames() const
    {
      return gated_frames_;
    }

    /// \brief Get the number of undecodable messages.
    inline size_t decode_errors() const
    {
      return decode_errors_;
    }

    private:

    /// \brief Copy constructor.
    StreamReceiver(const StreamReceiver& other);

    /// \brief Copy operator.
    StreamReceiver& operator=(const StreamReceiver& other);

    /// \brief Dispatch a JSON message.
    void DispatchJson(const Bytes& msg);

    /// \brief Dispatch a standard frame.
    void DispatchFrame(const Bytes& msg);

    /// The message handler.
    ReceiverHandlerIf&     handler_;

    /// The message reassembler.
    LengthDelimitedReader  reader_;

    /// The frame decoder.
    PacketCodec            codec_;

    /// The state.
    ReceiverState          state_;

    /// Set once a video key frame has been received.
    bool                   keyframe_received_;

    size_t                 message_count_;
    size_t                 gated_frames_;
    size_t                 decode_errors_;

  }; // end class StreamReceiver

} // namespace confab

#endif // CONFAB_MTC_STREAM_RECEIVER_H
