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

#include "mtc_types.h"

#include "log.h"
#include "unused.h"


using ::confab::ChannelId;
using ::confab::FrameType;
using ::confab::MediaKind;
using ::confab::MtcError;
using ::confab::PacketType;
using ::confab::TransportKind;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "MtcTypes";

  /// \brief A channel catalog entry.
  struct ChannelInfo
  {
    ChannelId               id;
    const char*             name;
    uint16_t                dc_id;
    MediaKind               media;
    size_t                  threshold;
    ::confab::FrameType     key_type;
    ::confab::FrameType     delta_type;
  };

  /// The channel catalog, indexed by ChannelId.
  const ChannelInfo  kChannels[confab::NUM_CHANNELS] =
  {
    { confab::CH_MEETING_CONTROL, "meeting_control", 0,
      confab::MEDIA_CONTROL, confab::kBufferedAmountMedium,
      confab::FRAME_EVENT, confab::FRAME_EVENT },
    { confab::CH_MICROPHONE, "mic_48k", 1,
      confab::MEDIA_AUDIO, confab::kBufferedAmountLow,
      confab::FRAME_AUDIO, confab::FRAME_AUDIO },
    { confab::CH_CAMERA_360P, "video_360p", 2,
      confab::MEDIA_VIDEO, confab::kBufferedAmountLow,
      confab::FRAME_CAM_360P_KEY, confab::FRAME_CAM_360P_DELTA },
    { confab::CH_CAMERA_720P, "video_720p", 3,
      confab::MEDIA_VIDEO, confab::kBufferedAmountMedium,
      confab::FRAME_CAM_720P_KEY, confab::FRAME_CAM_720P_DELTA },
    { confab::CH_SCREEN_SHARE_720P, "screen_share_720p", 4,
      confab::MEDIA_VIDEO, confab::kBufferedAmountMedium,
      confab::FRAME_SCREEN_SHARE_KEY, confab::FRAME_SCREEN_SHARE_DELTA },
    { confab::CH_SCREEN_SHARE_1080P, "screen_share_1080p", 5,
      confab::MEDIA_VIDEO, confab::kBufferedAmountHigh,
      confab::FRAME_SCREEN_SHARE_KEY, confab::FRAME_SCREEN_SHARE_DELTA },
    { confab::CH_SCREEN_SHARE_AUDIO, "screen_share_audio", 6,
      confab::MEDIA_AUDIO, confab::kBufferedAmountMedium,
      confab::FRAME_AUDIO, confab::FRAME_AUDIO },
    { confab::CH_LIVESTREAM_720P, "livestream_720p", 7,
      confab::MEDIA_VIDEO, confab::kBufferedAmountMedium,
      confab::FRAME_LIVESTREAM_KEY, confab::FRAME_LIVESTREAM_DELTA },
    { confab::CH_LIVESTREAM_AUDIO, "livestream_audio", 8,
      confab::MEDIA_AUDIO, confab::kBufferedAmountMedium,
      confab::FRAME_AUDIO, confab::FRAME_AUDIO }
  };
}

namespace confab
{

//============================================================================
const char* ChannelName(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return "unknown";
  }

  return kChannels[ch].name;
}

//============================================================================
bool ChannelIdFromName(const string& name, ChannelId& ch)
{
  for (int i = 0; i < NUM_CHANNELS; ++i)
  {
    if (name == kChannels[i].name)
    {
      ch = kChannels[i].id;
      return true;
    }
  }

  return false;
}

//============================================================================
uint16_t DataChannelId(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    LogW(kClassName, __func__, "Invalid channel %d.\n", static_cast<int>(ch));
    return 0;
  }

  return kChannels[ch].dc_id;
}

//============================================================================
size_t BufferedAmountThreshold(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return kBufferedAmountMedium;
  }

  return kChannels[ch].threshold;
}

//============================================================================
MediaKind ChannelMediaKind(ChannelId ch)
{
  if (!IsValidChannel(ch))
  {
    return MEDIA_CONTROL;
  }

  return kChannels[ch].media;
}

//============================================================================
FrameType FrameTypeFor(ChannelId ch, bool keyframe)
{
  if (!IsValidChannel(ch))
  {
    LogW(kClassName, __func__, "Invalid channel %d.\n", static_cast<int>(ch));
    return FRAME_EVENT;
  }

  return (keyframe ? kChannels[ch].key_type : kChannels[ch].delta_type);
}

//============================================================================
PacketType PacketTypeFor(uint8_t frame_type)
{
  switch (frame_type)
  {
    case FRAME_AUDIO:
      return PKT_AUDIO;

    case FRAME_CONFIG:
      return PKT_CONFIG;

    case FRAME_EVENT:
      return PKT_EVENT;

    case FRAME_PUBLISHER_COMMAND:
      return PKT_PUBLISHER_COMMAND;

    default:
      return PKT_VIDEO;
  }
}

//============================================================================
bool IsKeyFrame(uint8_t frame_type)
{
  return ((frame_type == FRAME_CAM_360P_KEY) ||
          (frame_type == FRAME_CAM_720P_KEY) ||
          (frame_type == FRAME_SCREEN_SHARE_KEY) ||
          (frame_type == FRAME_LIVESTREAM_KEY));
}

//============================================================================
bool IsVideoFrame(uint8_t frame_type)
{
  return ((frame_type <= FRAME_SCREEN_SHARE_DELTA) ||
          (frame_type == FRAME_LIVESTREAM_KEY) ||
          (frame_type == FRAME_LIVESTREAM_DELTA));
}

//============================================================================
bool IsDataFrame(uint8_t frame_type)
{
  return ((frame_type != FRAME_CONFIG) &&
          (frame_type != FRAME_PUBLISHER_COMMAND));
}

//============================================================================
const char* ErrorToString(MtcError err)
{
  switch (err)
  {
    case MTC_NO_ERROR:
      return "NoError";

    case MTC_DECODE_ERROR:
      return "DecodeError";

    case MTC_CHANNEL_NOT_READY:
      return "ChannelNotReady";

    case MTC_TRANSPORT_FAILURE:
      return "TransportFailure";

    case MTC_RECONNECTION_EXHAUSTED:
      return "ReconnectionExhausted";

    case MTC_FEC_PLANNING_ERROR:
      return "FecPlanningError";

    case MTC_TIMEOUT:
      return "Timeout";
  }

  return "Unknown";
}

//============================================================================
const char* TransportKindToString(TransportKind kind)
{
  return ((kind == STREAM_TRANSPORT) ? "stream" : "datagram");
}

} // namespace confab
