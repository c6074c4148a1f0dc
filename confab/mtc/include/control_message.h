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

/// \brief The control message header file.
///
/// Builds and parses the JSON carried by CONFIG, EVENT and publisher
/// command messages, and the server's decoder config announcements.
///
/// Publisher commands have the form
///
/// \verbatim
///   {"type":"<command>","data":<data>}
/// \endverbatim
///
/// with "data" omitted when the command has none.  A stream config is
///
/// \verbatim
///   {"type":"StreamConfig","channelName":"video_720p","mediaType":"video",
///    "config":{"codec":"avc1.640c34","codedWidth":1280,"codedHeight":720,
///              "frameRate":30,"quality":"720p","description":"<base64>"}}
/// \endverbatim
///
/// and is sent inside a "media_config" command as a JSON string.

#ifndef CONFAB_MTC_CONTROL_MESSAGE_H
#define CONFAB_MTC_CONTROL_MESSAGE_H

#include "mtc_types.h"

#include <list>
#include <string>


namespace confab
{

  /// \brief A channel's codec configuration.
  struct StreamConfig
  {
    StreamConfig()
        : channel_name(), media(MEDIA_VIDEO), codec(), coded_width(0),
          coded_height(0), frame_rate(0), quality(), sample_rate(0),
          number_of_channels(0), description(), has_description(false)
    { }

    /// The channel wire name.
    std::string  channel_name;

    /// MEDIA_VIDEO or MEDIA_AUDIO.
    MediaKind    media;

    /// The codec string.
    std::string  codec;

    /// Video only.
    uint32_t     coded_width;
    uint32_t     coded_height;
    uint32_t     frame_rate;

    /// Video only.  Omitted when empty.
    std::string  quality;

    /// Audio only.
    uint32_t     sample_rate;
    uint32_t     number_of_channels;

    /// The decoder description, sent as base64 or null.
    Bytes        description;
    bool         has_description;
  };

  /// \brief The publisher's device state.
  struct PublisherState
  {
    PublisherState()
        : has_mic(false), has_camera(false), is_mic_on(false),
          is_camera_on(false)
    { }

    bool  has_mic;
    bool  has_camera;
    bool  is_mic_on;
    bool  is_camera_on;
  };

  /// \brief Static builders and parsers for control JSON.
  class ControlMessage
  {
    public:

    /// \brief Build a StreamConfig message.
    ///
    /// \param  cfg   The config.
    /// \param  json  The message.
    ///
    /// \return  False if the media kind is not audio or video.
    static bool BuildStreamConfig(const StreamConfig& cfg, std::string& json);

    /// \brief Parse a StreamConfig message.
    ///
    /// \param  json  The message.
    /// \param  cfg   The parsed config.
    ///
    /// \return  False if the message is malformed, is not a StreamConfig,
    ///          or carries a description that is not valid base64.
    static bool ParseStreamConfig(const std::string& json, StreamConfig& cfg);

    /// \brief Parse a DecoderConfigs announcement.
    ///
    /// The announcement maps stream keys to StreamConfig messages encoded
    /// as JSON strings.  Malformed entries are skipped.
    ///
    /// \param  json     The message.
    /// \param  configs  The parsed configs.
    ///
    /// \return  False if the message is not a DecoderConfigs object.
    static bool ParseDecoderConfigs(const std::string& json,
                                    std::list<StreamConfig>& configs);

    /// \brief Build a publisher command.
    ///
    /// \param  type       The command type.
    /// \param  data_json  The command data as JSON, or empty for none.
    /// \param  json       The command.
    ///
    /// \return  False if data_json is not valid JSON.
    static bool BuildCommand(const std::string& type,
                             const std::string& data_json,
                             std::string& json);

    /// \brief Build a "media_config" command carrying a StreamConfig.
    static bool BuildMediaConfig(const StreamConfig& cfg, std::string& json);

    /// \brief Build the "init_channel_stream" command sent first on each
    /// publisher stream.
    static bool BuildInitChannelStream(ChannelId ch, std::string& json);

    /// \brief Build a "publisher_state" command.
    static bool BuildPublisherState(const PublisherState& state,
                                    std::string& json);

    /// \brief Build an "event" command.
    ///
    /// \param  event_json  The event as JSON, or empty for none.
    /// \param  json        The command.
    static bool BuildEvent(const std::string& event_json, std::string& json);

    /// \brief Build a subscriber's "init_channel_stream" command.
    ///
    /// \param  stream_type  The subscription type, e.g. "camera".
    /// \param  quality      The requested video channel.
    /// \param  json         The command.
    static bool BuildSubscriberInit(const std::string& stream_type,
                                    ChannelId quality, std::string& json);

    /// \brief Get the "type" of a JSON message.
    ///
    /// \param  json  The message.
    /// \param  type  The type.
    ///
    /// \return  False if the message is not an object with a string type.
    static bool ParseMessageType(const std::string& json, std::string& type);

  }; // end class ControlMessage

} // namespace confab

#endif // CONFAB_MTC_CONTROL_MESSAGE_H
