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

/// \brief The length delimited reader header file.
///
/// Reassembles length(4, big-endian) + payload messages from stream
/// transport bytes that arrive with arbitrary read boundaries.

#ifndef CONFAB_MTC_LENGTH_DELIMITED_READER_H
#define CONFAB_MTC_LENGTH_DELIMITED_READER_H

#include "mtc_types.h"


namespace confab
{

  /// \brief Reassembles length-prefixed messages.
  ///
  /// Bytes are appended as they are read.  Complete messages are removed
  /// with GetNextMessage().  A length larger than the configured maximum
  /// puts the reader into an error state, since the stream can no longer
  /// be framed.
  class LengthDelimitedReader
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  max_msg_len  The largest acceptable message, in bytes.
    explicit LengthDelimitedReader(
      uint32_t max_msg_len = kMaxControlMessageSize);

    /// \brief Destructor.
    virtual ~LengthDelimitedReader();

    /// \brief Append bytes read from the stream.
    ///
    /// \param  buf  The bytes.
    /// \param  len  The number of bytes.
    ///
    /// \return  False if the reader is in the error state or has seen the
    ///          end of the stream.
    bool Append(const uint8_t* buf, size_t len);

    /// \brief Remove the next complete message.
    ///
    /// \param  msg  The message payload, without the length prefix.
    ///
    /// \return  True if a message was returned.  False if no complete
    ///          message is buffered, or if the reader is in the error state.
    bool GetNextMessage(Bytes& msg);

    /// \brief Note the end of the stream.
    ///
    /// \return  False if a partial message remains buffered.
    bool EndOfStream();

    /// \brief Check if the reader saw an oversize length prefix.
    inline bool HasError() const
    {
      return error_;
    }

    /// \brief Check if the stream ended in the middle of a message.
    inline bool IsTruncated() const
    {
      return (eos_ && (!buf_.empty()));
    }

    /// \brief Get the number of buffered bytes.
    inline size_t buffered_bytes() const
    {
      return buf_.size();
    }

    /// \brief Discard all buffered bytes and clear the error and end of
    /// stream state.
    void Reset();

    private:

    /// \brief Copy constructor.
    LengthDelimitedReader(const LengthDelimitedReader& other);

    /// \brief Copy operator.
    LengthDelimitedReader& operator=(const LengthDelimitedReader& other);

    /// The largest acceptable message.
    uint32_t  max_msg_len_;

    /// The buffered stream bytes.
    Bytes     buf_;

    /// Set when an oversize length prefix is seen.
    bool      error_;

    /// Set at the end of the stream.
    bool      eos_;

  }; // end class LengthDelimitedReader

} // namespace confab

#endif // CONFAB_MTC_LENGTH_DELIMITED_READER_H
