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

#include "control_message.h"

#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"


using ::confab::ChannelId;
using ::confab::ControlMessage;
using ::confab::PublisherState;
using ::confab::StreamConfig;
using ::confab::StringUtils;
using ::rapidjson::Document;
using ::rapidjson::StringBuffer;
using ::rapidjson::Value;
using ::rapidjson::Writer;
using ::std::list;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ControlMessage";

  /// The StreamConfig message type.
  const char*  kStreamConfigType   = "StreamConfig";

  /// The DecoderConfigs message type.
  const char*  kDecoderConfigsType = "DecoderConfigs";

  /// \brief Get an optional unsigned member of a JSON object.
  ///
  /// Non-integral numbers are rounded.
  ///
  /// \param  obj    The object.
  /// \param  name   The member name.
  /// \param  value  Set to the member value if it is present.
  ///
  /// \return  False if the member is present but is not a non-negative
  ///          number.
  bool GetOptionalUint(const Value& obj, const char* name, uint32_t& value)
  {
    if (!obj.HasMember(name) || obj[name].IsNull())
    {
      return true;
    }

    const Value&  member = obj[name];

    if (member.IsUint())
    {
      value = member.GetUint();
      return true;
    }

    if (member.IsNumber() && (member.GetDouble() >= 0.0) &&
        (member.GetDouble() <= 4294967295.0))
    {
      value = static_cast<uint32_t>(member.GetDouble() + 0.5);
      return true;
    }

    return false;
  }
}

//============================================================================
bool ControlMessage::BuildStreamConfig(const StreamConfig& cfg, string& json)
{
  if ((cfg.media != MEDIA_VIDEO) && (cfg.media != MEDIA_AUDIO))
  {
    LogE(kClassName, __func__, "Invalid media kind %d for channel %s.\n",
         static_cast<int>(cfg.media), cfg.channel_name.c_str());
    return false;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("type");
  writer.String(kStreamConfigType);

  writer.Key("channelName");
  writer.String(cfg.channel_name.c_str());

  writer.Key("mediaType");
  writer.String(cfg.media == MEDIA_VIDEO ? "video" : "audio");

  writer.Key("config");
  writer.StartObject();

  writer.Key("codec");
  writer.String(cfg.codec.c_str());

  if (cfg.media == MEDIA_VIDEO)
  {
    writer.Key("codedWidth");
    writer.Uint(cfg.coded_width);
    writer.Key("codedHeight");
    writer.Uint(cfg.coded_height);
    writer.Key("frameRate");
    writer.Uint(cfg.frame_rate);

    if (!cfg.quality.empty())
    {
      writer.Key("quality");
      writer.String(cfg.quality.c_str());
    }
  }
  else
  {
    writer.Key("sampleRate");
    writer.Uint(cfg.sample_rate);
    writer.Key("numberOfChannels");
    writer.Uint(cfg.number_of_channels);
  }

  writer.Key("description");

  if (cfg.has_description)
  {
    string  b64 = StringUtils::Base64Encode(
      (cfg.description.empty() ? NULL : &cfg.description[0]),
      cfg.description.size());

    writer.String(b64.c_str());
  }
  else
  {
    writer.Null();
  }

  writer.EndObject();
  writer.EndObject();

  json = str_buf.GetString();

  return true;
}

//============================================================================
bool ControlMessage::ParseStreamConfig(const string& json, StreamConfig& cfg)
{
  Document  doc;

  if (doc.Parse(json.c_str()).HasParseError() || !doc.IsObject())
  {
    LogW(kClassName, __func__, "Stream config is not a JSON object.\n");
    return false;
  }

  if (!doc.HasMember("type") || !doc["type"].IsString() ||
      (string(doc["type"].GetString()) != kStreamConfigType))
  {
    LogW(kClassName, __func__, "Message is not a StreamConfig.\n");
    return false;
  }

  if (!doc.HasMember("channelName") || !doc["channelName"].IsString() ||
      !doc.HasMember("mediaType") || !doc["mediaType"].IsString() ||
      !doc.HasMember("config") || !doc["config"].IsObject())
  {
    LogW(kClassName, __func__, "StreamConfig is missing channelName, "
         "mediaType or config.\n");
    return false;
  }

  StreamConfig  result;
  string        media_type = doc["mediaType"].GetString();

  result.channel_name = doc["channelName"].GetString();

  if (media_type == "video")
  {
    result.media = MEDIA_VIDEO;
  }
  else if (media_type == "audio")
  {
    result.media = MEDIA_AUDIO;
  }
  else
  {
    LogW(kClassName, __func__, "Unknown media type %s for channel %s.\n",
         media_type.c_str(), result.channel_name.c_str());
    return false;
  }

  const Value&  config = doc["config"];

  if (!config.HasMember("codec") || !config["codec"].IsString())
  {
    LogW(kClassName, __func__, "StreamConfig for channel %s has no "
         "codec.\n", result.channel_name.c_str());
    return false;
  }

  result.codec = config["codec"].GetString();

  bool  numbers_ok = true;

  if (result.media == MEDIA_VIDEO)
  {
    numbers_ok = (GetOptionalUint(config, "codedWidth", result.coded_width) &&
                  GetOptionalUint(config, "codedHeight",
                                  result.coded_height) &&
                  GetOptionalUint(config, "frameRate", result.frame_rate));

    if (config.HasMember("quality") && config["quality"].IsString())
    {
      result.quality = config["quality"].GetString();
    }
  }
  else
  {
    numbers_ok = (GetOptionalUint(config, "sampleRate",
                                  result.sample_rate) &&
                  GetOptionalUint(config, "numberOfChannels",
                                  result.number_of_channels));
  }

  if (!numbers_ok)
  {
    LogW(kClassName, __func__, "StreamConfig for channel %s has a "
         "malformed numeric field.\n", result.channel_name.c_str());
    return false;
  }

  if (config.HasMember("description") && config["description"].IsString())
  {
    if (!StringUtils::Base64Decode(config["description"].GetString(),
                                   result.description))
    {
      LogW(kClassName, __func__, "StreamConfig for channel %s has an "
           "invalid description.\n", result.channel_name.c_str());
      return false;
    }

    result.has_description = true;
  }

  cfg = result;

  return true;
}

//============================================================================
bool ControlMessage::ParseDecoderConfigs(const string& json,
                                         list<StreamConfig>& configs)
{
  Document  doc;

  if (doc.Parse(json.c_str()).HasParseError() || !doc.IsObject())
  {
    LogW(kClassName, __func__, "DecoderConfigs is not a JSON object.\n");
    return false;
  }

  if (!doc.HasMember("type") || !doc["type"].IsString() ||
      (string(doc["type"].GetString()) != kDecoderConfigsType))
  {
    LogW(kClassName, __func__, "Message is not a DecoderConfigs.\n");
    return false;
  }

  for (Value::ConstMemberIterator it = doc.MemberBegin();
       it != doc.MemberEnd(); ++it)
  {
    string  key = it->name.GetString();

    if ((key == "type") || !it->value.IsString())
    {
      continue;
    }

    StreamConfig  cfg;

    if (!ParseStreamConfig(it->value.GetString(), cfg))
    {
      LogD(kClassName, __func__, "Skipping decoder config %s.\n",
           key.c_str());
      continue;
    }

    configs.push_back(cfg);
  }

  return true;
}

//============================================================================
bool ControlMessage::BuildCommand(const string& type, const string& data_json,
                                  string& json)
{
  Document  data;

  if ((!data_json.empty()) && data.Parse(data_json.c_str()).HasParseError())
  {
    LogE(kClassName, __func__, "Data for command %s is not valid JSON.\n",
         type.c_str());
    return false;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("type");
  writer.String(type.c_str());

  if (!data_json.empty())
  {
    writer.Key("data");
    data.Accept(writer);
  }

  writer.EndObject();

  json = str_buf.GetString();

  return true;
}

//============================================================================
bool ControlMessage::BuildMediaConfig(const StreamConfig& cfg, string& json)
{
  string  cfg_json;

  if (!BuildStreamConfig(cfg, cfg_json))
  {
    return false;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("type");
  writer.String("media_config");

  writer.Key("data");
  writer.String(cfg_json.c_str());

  writer.EndObject();

  json = str_buf.GetString();

  return true;
}

//============================================================================
bool ControlMessage::BuildInitChannelStream(ChannelId ch, string& json)
{
  if (!IsValidChannel(ch))
  {
    LogE(kClassName, __func__, "Invalid channel %d.\n",
         static_cast<int>(ch));
    return false;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("type");
  writer.String("init_channel_stream");

  writer.Key("data");
  writer.StartObject();
  writer.Key("channel");
  writer.String(ChannelName(ch));
  writer.EndObject();

  writer.EndObject();

  json = str_buf.GetString();

  return true;
}

//============================================================================
bool ControlMessage::BuildPublisherState(const PublisherState& state,
                                         string& json)
{
  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("type");
  writer.String("publisher_state");

  writer.Key("data");
  writer.StartObject();
  writer.Key("has_mic");
  writer.Bool(state.has_mic);
  writer.Key("has_camera");
  writer.Bool(state.has_camera);
  writer.Key("is_mic_on");
  writer.Bool(state.is_mic_on);
  writer.Key("is_camera_on");
  writer.Bool(state.is_camera_on);
  writer.EndObject();

  writer.EndObject();

  json = str_buf.GetString();

  return true;
}

//============================================================================
bool ControlMessage::BuildEvent(const string& event_json, string& json)
{
  return BuildCommand("event", event_json, json);
}

//============================================================================
bool ControlMessage::BuildSubscriberInit(const string& stream_type,
                                         ChannelId quality, string& json)
{
  if (ChannelMediaKind(quality) != MEDIA_VIDEO)
  {
    LogE(kClassName, __func__, "Channel %s is not a video channel.\n",
         ChannelName(quality));
    return false;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();

  writer.Key("type");
  writer.String("init_channel_stream");

  writer.Key("data");
  writer.StartObject();
  writer.Key("stream_type");
  writer.String(stream_type.c_str());
  writer.Key("audio");
  writer.Bool(true);
  writer.Key("video");
  writer.Bool(true);
  writer.Key("quality");
  writer.String(ChannelName(quality));
  writer.EndObject();

  writer.EndObject();

  json = str_buf.GetString();

  return true;
}

//============================================================================
bool ControlMessage::ParseMessageType(const string& json, string& type)
{
  Document  doc;

  if (doc.Parse(json.c_str()).HasParseError() || !doc.IsObject())
  {
    return false;
  }

  if (!doc.HasMember("type") || !doc["type"].IsString())
  {
    return false;
  }

  type = doc["type"].GetString();

  return true;
}
