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

#include <cppunit/extensions/HelperMacros.h>

#include "control_message.h"
#include "log.h"
#include "mtc_types.h"

#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <list>
#include <string>

using ::confab::Bytes;
using ::confab::ControlMessage;
using ::confab::Log;
using ::confab::PublisherState;
using ::confab::StreamConfig;
using ::rapidjson::Document;
using ::std::list;
using ::std::string;


//============================================================================
class ControlMessageTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(ControlMessageTest);

  CPPUNIT_TEST(TestVideoStreamConfig);
  CPPUNIT_TEST(TestAudioStreamConfig);
  CPPUNIT_TEST(TestParseStreamConfigErrors);
  CPPUNIT_TEST(TestParseDecoderConfigs);
  CPPUNIT_TEST(TestBuildCommand);
  CPPUNIT_TEST(TestMediaConfig);
  CPPUNIT_TEST(TestInitChannelStream);
  CPPUNIT_TEST(TestPublisherState);
  CPPUNIT_TEST(TestSubscriberInit);
  CPPUNIT_TEST(TestParseMessageType);

  CPPUNIT_TEST_SUITE_END();

  public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");
  }

  //==========================================================================
  void tearDown()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestVideoStreamConfig()
  {
    StreamConfig  cfg;
    StreamConfig  parsed;
    string        json;
    Document      doc;

    cfg.channel_name    = "video_720p";
    cfg.media           = confab::MEDIA_VIDEO;
    cfg.codec           = "avc1.640c34";
    cfg.coded_width     = 1280;
    cfg.coded_height    = 720;
    cfg.frame_rate      = 30;
    cfg.quality         = "high";
    cfg.description.push_back(0x01);
    cfg.description.push_back(0x64);
    cfg.description.push_back(0x00);
    cfg.has_description = true;

    CPPUNIT_ASSERT(ControlMessage::BuildStreamConfig(cfg, json));

    CPPUNIT_ASSERT(!doc.Parse(json.c_str()).HasParseError());
    CPPUNIT_ASSERT(string(doc["type"].GetString()) == "StreamConfig");
    CPPUNIT_ASSERT(string(doc["channelName"].GetString()) == "video_720p");
    CPPUNIT_ASSERT(string(doc["mediaType"].GetString()) == "video");
    CPPUNIT_ASSERT(doc["config"]["codedWidth"].GetUint() == 1280);
    CPPUNIT_ASSERT(string(doc["config"]["description"].GetString()) ==
                   "AWQA");
    CPPUNIT_ASSERT(!doc["config"].HasMember("sampleRate"));

    CPPUNIT_ASSERT(ControlMessage::ParseStreamConfig(json, parsed));
    CPPUNIT_ASSERT(parsed.channel_name == cfg.channel_name);
    CPPUNIT_ASSERT(parsed.media == confab::MEDIA_VIDEO);
    CPPUNIT_ASSERT(parsed.codec == cfg.codec);
    CPPUNIT_ASSERT(parsed.coded_width == 1280);
    CPPUNIT_ASSERT(parsed.coded_height == 720);
    CPPUNIT_ASSERT(parsed.frame_rate == 30);
    CPPUNIT_ASSERT(parsed.quality == "high");
    CPPUNIT_ASSERT(parsed.has_description);
    CPPUNIT_ASSERT(parsed.description == cfg.description);
  }

  //==========================================================================
  void TestAudioStreamConfig()
  {
    StreamConfig  cfg;
    StreamConfig  parsed;
    string        json;
    Document      doc;

    cfg.channel_name       = "mic_48k";
    cfg.media              = confab::MEDIA_AUDIO;
    cfg.codec              = "opus";
    cfg.sample_rate        = 48000;
    cfg.number_of_channels = 1;

    CPPUNIT_ASSERT(ControlMessage::BuildStreamConfig(cfg, json));

    CPPUNIT_ASSERT(!doc.Parse(json.c_str()).HasParseError());
    CPPUNIT_ASSERT(string(doc["mediaType"].GetString()) == "audio");
    CPPUNIT_ASSERT(doc["config"]["sampleRate"].GetUint() == 48000);
    CPPUNIT_ASSERT(doc["config"]["description"].IsNull());
    CPPUNIT_ASSERT(!doc["config"].HasMember("codedWidth"));

    CPPUNIT_ASSERT(ControlMessage::ParseStreamConfig(json, parsed));
    CPPUNIT_ASSERT(parsed.media == confab::MEDIA_AUDIO);
    CPPUNIT_ASSERT(parsed.sample_rate == 48000);
    CPPUNIT_ASSERT(parsed.number_of_channels == 1);
    CPPUNIT_ASSERT(!parsed.has_description);

    // Control is not a media kind.
    cfg.media = confab::MEDIA_CONTROL;
    CPPUNIT_ASSERT(!ControlMessage::BuildStreamConfig(cfg, json));
  }

  //==========================================================================
  void TestParseStreamConfigErrors()
  {
    StreamConfig  cfg;

    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig("not json", cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig("[1,2]", cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig(
                     "{\"type\":\"Other\"}", cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig(
                     "{\"type\":\"StreamConfig\",\"channelName\":\"a\"}",
                     cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig(
                     "{\"type\":\"StreamConfig\",\"channelName\":\"a\","
                     "\"mediaType\":\"text\",\"config\":{\"codec\":\"x\"}}",
                     cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig(
                     "{\"type\":\"StreamConfig\",\"channelName\":\"a\","
                     "\"mediaType\":\"video\",\"config\":{}}", cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig(
                     "{\"type\":\"StreamConfig\",\"channelName\":\"a\","
                     "\"mediaType\":\"video\",\"config\":{\"codec\":\"x\","
                     "\"codedWidth\":\"wide\"}}", cfg));
    CPPUNIT_ASSERT(!ControlMessage::ParseStreamConfig(
                     "{\"type\":\"StreamConfig\",\"channelName\":\"a\","
                     "\"mediaType\":\"video\",\"config\":{\"codec\":\"x\","
                     "\"codedWidth\":-4}}", cfg));

    // Fractional numbers are rounded and missing numbers default to zero.
    CPPUNIT_ASSERT(ControlMessage::ParseStreamConfig(
                     "{\"type\":\"StreamConfig\",\"channelName\":\"a\","
                     "\"mediaType\":\"video\",\"config\":{\"codec\":\"x\","
                     "\"frameRate\":29.97,\"codedWidth\":null}}", cfg));
    CPPUNIT_ASSERT(cfg.frame_rate == 30);
    CPPUNIT_ASSERT(cfg.coded_width == 0);
  }

  //==========================================================================
  void TestParseDecoderConfigs()
  {
    StreamConfig        video;
    StreamConfig        audio;
    string              video_json;
    string              audio_json;
    list<StreamConfig>  configs;

    video.channel_name = "video_360p";
    video.codec        = "vp8";
    audio.channel_name = "mic_48k";
    audio.media        = confab::MEDIA_AUDIO;
    audio.codec        = "opus";

    CPPUNIT_ASSERT(ControlMessage::BuildStreamConfig(video, video_json));
    CPPUNIT_ASSERT(ControlMessage::BuildStreamConfig(audio, audio_json));

    Document  doc;

    doc.SetObject();

    Document::AllocatorType&  alloc = doc.GetAllocator();

    doc.AddMember("type", "DecoderConfigs", alloc);
    doc.AddMember("video_360p",
                  rapidjson::Value(video_json.c_str(), alloc).Move(), alloc);
    doc.AddMember("mic_48k",
                  rapidjson::Value(audio_json.c_str(), alloc).Move(), alloc);
    doc.AddMember("broken", "{\"type\":1}", alloc);
    doc.AddMember("count", 2, alloc);

    rapidjson::StringBuffer                      buf;
    rapidjson::Writer<rapidjson::StringBuffer>   writer(buf);

    doc.Accept(writer);

    CPPUNIT_ASSERT(ControlMessage::ParseDecoderConfigs(buf.GetString(),
                                                       configs));
    CPPUNIT_ASSERT(configs.size() == 2);
    CPPUNIT_ASSERT(configs.front().channel_name == "video_360p");
    CPPUNIT_ASSERT(configs.front().codec == "vp8");
    CPPUNIT_ASSERT(configs.back().media == confab::MEDIA_AUDIO);

    configs.clear();
    CPPUNIT_ASSERT(!ControlMessage::ParseDecoderConfigs(
                     "{\"type\":\"StreamConfig\"}", configs));
    CPPUNIT_ASSERT(!ControlMessage::ParseDecoderConfigs("{", configs));
    CPPUNIT_ASSERT(configs.empty());
  }

  //==========================================================================
  void TestBuildCommand()
  {
    string  json;

    CPPUNIT_ASSERT(ControlMessage::BuildCommand("request_keyframe", "",
                                                json));
    CPPUNIT_ASSERT(json == "{\"type\":\"request_keyframe\"}");

    CPPUNIT_ASSERT(ControlMessage::BuildCommand("raise_hand",
                                                "{ \"user\" : \"u1\" }",
                                                json));
    CPPUNIT_ASSERT(json ==
                   "{\"type\":\"raise_hand\",\"data\":{\"user\":\"u1\"}}");

    CPPUNIT_ASSERT(!ControlMessage::BuildCommand("bad", "{oops", json));

    CPPUNIT_ASSERT(ControlMessage::BuildEvent("{\"kind\":\"mute\"}", json));
    CPPUNIT_ASSERT(json == "{\"type\":\"event\",\"data\":{\"kind\":\"mute\"}}");
  }

  //==========================================================================
  void TestMediaConfig()
  {
    StreamConfig  cfg;
    StreamConfig  parsed;
    string        json;
    Document      doc;

    cfg.channel_name = "screen_share_720p";
    cfg.codec        = "vp09.00.10.08";
    cfg.coded_width  = 1280;
    cfg.coded_height = 720;
    cfg.frame_rate   = 15;

    CPPUNIT_ASSERT(ControlMessage::BuildMediaConfig(cfg, json));
    CPPUNIT_ASSERT(!doc.Parse(json.c_str()).HasParseError());
    CPPUNIT_ASSERT(string(doc["type"].GetString()) == "media_config");

    // The stream config travels as a string.
    CPPUNIT_ASSERT(doc["data"].IsString());
    CPPUNIT_ASSERT(ControlMessage::ParseStreamConfig(doc["data"].GetString(),
                                                     parsed));
    CPPUNIT_ASSERT(parsed.channel_name == "screen_share_720p");
    CPPUNIT_ASSERT(parsed.frame_rate == 15);
  }

  //==========================================================================
  void TestInitChannelStream()
  {
    string  json;

    CPPUNIT_ASSERT(ControlMessage::BuildInitChannelStream(
                     confab::CH_CAMERA_720P, json));
    CPPUNIT_ASSERT(json == "{\"type\":\"init_channel_stream\",\"data\":"
                   "{\"channel\":\"video_720p\"}}");

    CPPUNIT_ASSERT(!ControlMessage::BuildInitChannelStream(
                     static_cast<confab::ChannelId>(99), json));
  }

  //==========================================================================
  void TestPublisherState()
  {
    PublisherState  state;
    string          json;

    state.has_mic   = true;
    state.is_mic_on = true;

    CPPUNIT_ASSERT(ControlMessage::BuildPublisherState(state, json));
    CPPUNIT_ASSERT(json == "{\"type\":\"publisher_state\",\"data\":"
                   "{\"has_mic\":true,\"has_camera\":false,"
                   "\"is_mic_on\":true,\"is_camera_on\":false}}");
  }

  //==========================================================================
  void TestSubscriberInit()
  {
    string    json;
    Document  doc;

    CPPUNIT_ASSERT(ControlMessage::BuildSubscriberInit(
                     "camera", confab::CH_CAMERA_360P, json));
    CPPUNIT_ASSERT(!doc.Parse(json.c_str()).HasParseError());
    CPPUNIT_ASSERT(string(doc["type"].GetString()) == "init_channel_stream");
    CPPUNIT_ASSERT(string(doc["data"]["stream_type"].GetString()) ==
                   "camera");
    CPPUNIT_ASSERT(doc["data"]["audio"].GetBool());
    CPPUNIT_ASSERT(doc["data"]["video"].GetBool());
    CPPUNIT_ASSERT(string(doc["data"]["quality"].GetString()) ==
                   "video_360p");

    CPPUNIT_ASSERT(!ControlMessage::BuildSubscriberInit(
                     "camera", confab::CH_MICROPHONE, json));
    CPPUNIT_ASSERT(!ControlMessage::BuildSubscriberInit(
                     "camera", confab::CH_MEETING_CONTROL, json));
  }

  //==========================================================================
  void TestParseMessageType()
  {
    string  type;

    CPPUNIT_ASSERT(ControlMessage::ParseMessageType(
                     "{\"type\":\"DecoderConfigs\"}", type));
    CPPUNIT_ASSERT(type == "DecoderConfigs");

    CPPUNIT_ASSERT(!ControlMessage::ParseMessageType("{\"kind\":1}", type));
    CPPUNIT_ASSERT(!ControlMessage::ParseMessageType("{\"type\":7}", type));
    CPPUNIT_ASSERT(!ControlMessage::ParseMessageType("\"text\"", type));
    CPPUNIT_ASSERT(!ControlMessage::ParseMessageType("", type));
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(ControlMessageTest);
