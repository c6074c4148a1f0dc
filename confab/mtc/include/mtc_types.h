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

/// \brief The media transport core types header file.
///
/// Channel catalog, wire frame and packet types, states, error codes and
/// the small value types passed between the transport core components.

#ifndef CONFAB_MTC_MTC_TYPES_H
#define CONFAB_MTC_MTC_TYPES_H

#include <string>
#include <vector>

#include <stdint.h>
#include <stddef.h>


namespace confab
{

  /// A byte buffer.
  typedef std::vector<uint8_t>  Bytes;

  /// The standard frame header size: seq(4), timestamp(4), frame type(1).
  const size_t    kStandardHeaderSize     = 9;

  /// The FEC wrapped header size: seq(4), marker(1), packet type(1), and a
  /// 14 byte erasure decoder descriptor.
  const size_t    kFecHeaderSize          = 20;

  /// The regular (non-FEC) wrapped header size: seq(4), marker(1), packet
  /// type(1).
  const size_t    kRegularHeaderSize      = 6;

  /// The stream transport message length prefix size.
  const size_t    kLengthPrefixSize       = 4;

  /// The marker byte of an FEC wrapped packet.
  const uint8_t   kFecMarker              = 0xFF;

  /// The marker byte of a regular wrapped packet.
  const uint8_t   kRegularMarker          = 0x00;

  /// The largest length-prefixed message accepted on a stream transport.
  const uint32_t  kMaxControlMessageSize  = (1024 * 1024);

  /// Datagram transport buffered amount thresholds, in bytes.
  const size_t    kBufferedAmountLow      = 16384;
  const size_t    kBufferedAmountMedium   = 32768;
  const size_t    kBufferedAmountHigh     = 65536;

  /// The frame types carried in the standard frame header.
  enum FrameType
  {
    FRAME_CAM_360P_KEY       = 0,
    FRAME_CAM_360P_DELTA     = 1,
    FRAME_CAM_720P_KEY       = 2,
    FRAME_CAM_720P_DELTA     = 3,
    FRAME_SCREEN_SHARE_KEY   = 4,
    FRAME_SCREEN_SHARE_DELTA = 5,
    FRAME_AUDIO              = 6,
    FRAME_LIVESTREAM_KEY     = 10,
    FRAME_LIVESTREAM_DELTA   = 11,
    FRAME_CONFIG             = 0xFD,
    FRAME_EVENT              = 0xFE,
    FRAME_PUBLISHER_COMMAND  = 0xFF
  };

  /// The packet types carried in the datagram transport wrapper headers.
  enum PacketType
  {
    PKT_VIDEO             = 0x00,
    PKT_AUDIO             = 0x01,
    PKT_CONFIG            = 0xFD,
    PKT_EVENT             = 0xFE,
    PKT_PUBLISHER_COMMAND = 0xFF
  };

  /// The logical channels of a session.
  enum ChannelId
  {
    CH_MEETING_CONTROL    = 0,
    CH_MICROPHONE         = 1,
    CH_CAMERA_360P        = 2,
    CH_CAMERA_720P        = 3,
    CH_SCREEN_SHARE_720P  = 4,
    CH_SCREEN_SHARE_1080P = 5,
    CH_SCREEN_SHARE_AUDIO = 6,
    CH_LIVESTREAM_720P    = 7,
    CH_LIVESTREAM_AUDIO   = 8,
    NUM_CHANNELS          = 9
  };

  /// The kind of media a channel carries.
  enum MediaKind
  {
    MEDIA_CONTROL = 0,
    MEDIA_AUDIO,
    MEDIA_VIDEO
  };

  /// The registry's view of a channel.
  enum ChannelState
  {
    CHANNEL_PENDING = 0,
    CHANNEL_READY,
    CHANNEL_CLOSED
  };

  /// The multiplexer's view of a channel binding.
  enum MuxChannelState
  {
    MUX_UNBOUND = 0,
    MUX_OPENING,
    MUX_READY,
    MUX_CLOSING,
    MUX_FAILED
  };

  /// The two transport kinds.
  enum TransportKind
  {
    STREAM_TRANSPORT = 0,
    DATAGRAM_TRANSPORT
  };

  /// The reconnection controller states.
  enum ReconnState
  {
    RECONN_STABLE = 0,
    RECONN_RECONNECTING,
    RECONN_FAILED
  };

  /// The transport core error codes.
  enum MtcError
  {
    MTC_NO_ERROR = 0,
    MTC_DECODE_ERROR,
    MTC_CHANNEL_NOT_READY,
    MTC_TRANSPORT_FAILURE,
    MTC_RECONNECTION_EXHAUSTED,
    MTC_FEC_PLANNING_ERROR,
    MTC_TIMEOUT
  };

  /// \brief An encoded chunk from the capture and encode pipeline.
  struct EncodedChunk
  {
    EncodedChunk()
        : data(), timestamp_us(0), keyframe(false)
    { }

    EncodedChunk(const Bytes& d, int64_t ts_us, bool key)
        : data(d), timestamp_us(ts_us), keyframe(key)
    { }

    /// The encoded bytes.
    Bytes    data;

    /// The capture timestamp, in microseconds.
    int64_t  timestamp_us;

    /// True for a video keyframe.
    bool     keyframe;
  };

  /// \brief A decoded standard frame.
  struct MediaFrame
  {
    MediaFrame()
        : seq(0), timestamp_ms(0), frame_type(0), payload()
    { }

    uint32_t  seq;
    uint32_t  timestamp_ms;
    uint8_t   frame_type;
    Bytes     payload;
  };

  /// \brief Get the wire name of a channel.
  ///
  /// \param  ch  The channel.
  ///
  /// \return  The name, or "unknown".
  const char* ChannelName(ChannelId ch);

  /// \brief Look up a channel by its wire name.
  ///
  /// \param  name  The wire name.
  /// \param  ch    Set to the channel on success.
  ///
  /// \return  True if the name is in the catalog.
  bool ChannelIdFromName(const std::string& name, ChannelId& ch);

  /// \brief Check that a channel value is in the catalog.
  inline bool IsValidChannel(int ch)
  {
    return ((ch >= 0) && (ch < NUM_CHANNELS));
  }

  /// \brief Get the negotiated data channel id of a channel.
  uint16_t DataChannelId(ChannelId ch);

  /// \brief Get the datagram transport buffered amount low threshold of a
  /// channel.
  size_t BufferedAmountThreshold(ChannelId ch);

  /// \brief Get the media kind of a channel.
  MediaKind ChannelMediaKind(ChannelId ch);

  /// \brief Only the control channel requires ordered delivery.
  inline bool IsOrderedChannel(ChannelId ch)
  {
    return (ch == CH_MEETING_CONTROL);
  }

  /// \brief Map a chunk on a channel to its frame type.
  ///
  /// Audio channels always map to FRAME_AUDIO, and the control channel to
  /// FRAME_EVENT.  Video channels map to their key or delta type.
  ///
  /// \param  ch        The channel.
  /// \param  keyframe  True for a video keyframe.
  ///
  /// \return  The frame type.
  FrameType FrameTypeFor(ChannelId ch, bool keyframe);

  /// \brief Map a frame type to the packet type of the datagram wrappers.
  PacketType PacketTypeFor(uint8_t frame_type);

  /// \brief Check for a video keyframe type.
  bool IsKeyFrame(uint8_t frame_type);

  /// \brief Check for any video frame type.
  bool IsVideoFrame(uint8_t frame_type);

  /// \brief Check for a frame type subject to the config-sent gate.
  ///
  /// Audio, video and event frames are data frames.  CONFIG and publisher
  /// commands are not.
  bool IsDataFrame(uint8_t frame_type);

  /// \brief Get a printable error name.
  const char* ErrorToString(MtcError err);

  /// \brief Get a printable transport kind name.
  const char* TransportKindToString(TransportKind kind);

} // namespace confab

#endif // CONFAB_MTC_MTC_TYPES_H
