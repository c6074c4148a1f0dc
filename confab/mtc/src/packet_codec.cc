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

#include "packet_codec.h"

#include "log.h"
#include "unused.h"

#include <cstring>
#include <inttypes.h>
#include <arpa/inet.h>


using ::confab::Bytes;
using ::confab::FecDescriptor;
using ::confab::FecPacket;
using ::confab::MediaFrame;
using ::confab::PacketCodec;
using ::confab::RegularPacket;


namespace
{
  /// Class name for logging.
  const char*    UNUSED(kClassName) = "PacketCodec";

  /// The largest relative timestamp, in milliseconds.
  const int64_t  kMaxTimestampMs    = 0xFFFFFFFFLL;
}

//============================================================================
PacketCodec::PacketCodec()
    : has_base_ts_(false), base_ts_us_(0), decode_errors_(0)
{
}

//============================================================================
PacketCodec::~PacketCodec()
{
  // Nothing to destroy.
}

//============================================================================
bool PacketCodec::EncodeStandard(const uint8_t* payload, size_t len,
                                 int64_t timestamp_us, uint8_t frame_type,
                                 uint32_t seq, Bytes& out)
{
  if ((payload == NULL) && (len > 0))
  {
    LogE(kClassName, __func__, "NULL payload with length %zu.\n", len);
    return false;
  }

  return EncodeStandardRaw(payload, len, NormalizeTimestamp(timestamp_us),
                           frame_type, seq, out);
}

//============================================================================
bool PacketCodec::EncodeStandardRaw(const uint8_t* payload, size_t len,
                                    uint32_t timestamp_ms, uint8_t frame_type,
                                    uint32_t seq, Bytes& out)
{
  if ((payload == NULL) && (len > 0))
  {
    LogE(kClassName, __func__, "NULL payload with length %zu.\n", len);
    return false;
  }

  out.clear();
  out.reserve(kStandardHeaderSize + len);

  WriteUint32(seq, out);
  WriteUint32(timestamp_ms, out);
  WriteUint8(frame_type, out);

  if (len > 0)
  {
    out.insert(out.end(), payload, (payload + len));
  }

  return true;
}

//============================================================================
bool PacketCodec::DecodeStandard(const uint8_t* buf, size_t len,
                                 MediaFrame& frame)
{
  size_t  offset = 0;

  if ((buf == NULL) ||
      (!ReadUint32(buf, len, offset, frame.seq)) ||
      (!ReadUint32(buf, len, offset, frame.timestamp_ms)) ||
      (!ReadUint8(buf, len, offset, frame.frame_type)))
  {
    ++decode_errors_;
    LogW(kClassName, __func__, "Standard frame too short (%zu bytes).\n",
         len);
    return false;
  }

  frame.payload.assign((buf + offset), (buf + len));

  return true;
}

//============================================================================
bool PacketCodec::EncodeFec(uint32_t seq, uint8_t packet_type,
                            const FecDescriptor& desc, const uint8_t* symbol,
                            size_t len, Bytes& out)
{
  if ((symbol == NULL) && (len > 0))
  {
    LogE(kClassName, __func__, "NULL symbol with length %zu.\n", len);
    return false;
  }

  out.clear();
  out.reserve(kFecHeaderSize + len);

  WriteUint32(seq, out);
  WriteUint8(kFecMarker, out);
  WriteUint8(packet_type, out);
  WriteUint64(desc.transfer_length, out);
  WriteUint16(desc.symbol_size, out);
  WriteUint8(desc.source_blocks, out);
  WriteUint16(desc.sub_blocks, out);
  WriteUint8(desc.alignment, out);

  if (len > 0)
  {
    out.insert(out.end(), symbol, (symbol + len));
  }

  return true;
}

//============================================================================
bool PacketCodec::DecodeFec(const uint8_t* buf, size_t len, FecPacket& pkt)
{
  size_t   offset = 0;
  uint8_t  marker = 0;

  if ((buf == NULL) ||
      (!ReadUint32(buf, len, offset, pkt.seq)) ||
      (!ReadUint8(buf, len, offset, marker)) ||
      (!ReadUint8(buf, len, offset, pkt.packet_type)) ||
      (!ReadUint64(buf, len, offset, pkt.descriptor.transfer_length)) ||
      (!ReadUint16(buf, len, offset, pkt.descriptor.symbol_size)) ||
      (!ReadUint8(buf, len, offset, pkt.descriptor.source_blocks)) ||
      (!ReadUint16(buf, len, offset, pkt.descriptor.sub_blocks)) ||
      (!ReadUint8(buf, len, offset, pkt.descriptor.alignment)))
  {
    ++decode_errors_;
    LogW(kClassName, __func__, "FEC packet too short (%zu bytes).\n", len);
    return false;
  }

  if (marker != kFecMarker)
  {
    ++decode_errors_;
    LogW(kClassName, __func__, "Unexpected marker 0x%02x for seq %" PRIu32
         ".\n", marker, pkt.seq);
    return false;
  }

  pkt.symbol.assign((buf + offset), (buf + len));

  return true;
}

//============================================================================
bool PacketCodec::EncodeRegular(uint32_t seq, uint8_t packet_type,
                                const uint8_t* payload, size_t len,
                                Bytes& out)
{
  if ((payload == NULL) && (len > 0))
  {
    LogE(kClassName, __func__, "NULL payload with length %zu.\n", len);
    return false;
  }

  out.clear();
  out.reserve(kRegularHeaderSize + len);

  WriteUint32(seq, out);
  WriteUint8(kRegularMarker, out);
  WriteUint8(packet_type, out);

  if (len > 0)
  {
    out.insert(out.end(), payload, (payload + len));
  }

  return true;
}

//============================================================================
bool PacketCodec::DecodeRegular(const uint8_t* buf, size_t len,
                                RegularPacket& pkt)
{
  size_t   offset = 0;
  uint8_t  marker = 0;

  if ((buf == NULL) ||
      (!ReadUint32(buf, len, offset, pkt.seq)) ||
      (!ReadUint8(buf, len, offset, marker)) ||
      (!ReadUint8(buf, len, offset, pkt.packet_type)))
  {
    ++decode_errors_;
    LogW(kClassName, __func__, "Regular packet too short (%zu bytes).\n",
         len);
    return false;
  }

  if (marker != kRegularMarker)
  {
    ++decode_errors_;
    LogW(kClassName, __func__, "Unexpected marker 0x%02x for seq %" PRIu32
         ".\n", marker, pkt.seq);
    return false;
  }

  pkt.payload.assign((buf + offset), (buf + len));

  return true;
}

//============================================================================
bool PacketCodec::PeekFecMarker(const uint8_t* buf, size_t len, bool& is_fec)
{
  if ((buf == NULL) || (len < kRegularHeaderSize))
  {
    return false;
  }

  if (buf[4] == kFecMarker)
  {
    is_fec = true;
    return (len >= kFecHeaderSize);
  }

  if (buf[4] == kRegularMarker)
  {
    is_fec = false;
    return true;
  }

  return false;
}

//============================================================================
uint32_t PacketCodec::NormalizeTimestamp(int64_t timestamp_us)
{
  if (!has_base_ts_)
  {
    base_ts_us_  = timestamp_us;
    has_base_ts_ = true;

    LogD(kClassName, __func__, "Base timestamp set to %" PRId64 " us.\n",
         base_ts_us_);
  }

  int64_t  rel_us = (timestamp_us - base_ts_us_);

  if (rel_us <= 0)
  {
    return 0;
  }

  int64_t  rel_ms = (rel_us / 1000);

  if (rel_ms > kMaxTimestampMs)
  {
    return static_cast<uint32_t>(kMaxTimestampMs);
  }

  return static_cast<uint32_t>(rel_ms);
}

//============================================================================
void PacketCodec::WriteUint8(uint8_t value, Bytes& out)
{
  out.push_back(value);
}

//============================================================================
void PacketCodec::WriteUint16(uint16_t value, Bytes& out)
{
  uint16_t  value_nbo = htons(value);
  uint8_t   tmp[sizeof(value_nbo)];

  ::memcpy(tmp, &value_nbo, sizeof(value_nbo));
  out.insert(out.end(), tmp, (tmp + sizeof(tmp)));
}

//============================================================================
void PacketCodec::WriteUint32(uint32_t value, Bytes& out)
{
  uint32_t  value_nbo = htonl(value);
  uint8_t   tmp[sizeof(value_nbo)];

  ::memcpy(tmp, &value_nbo, sizeof(value_nbo));
  out.insert(out.end(), tmp, (tmp + sizeof(tmp)));
}

//============================================================================
void PacketCodec::WriteUint64(uint64_t value, Bytes& out)
{
  WriteUint32(static_cast<uint32_t>(value >> 32), out);
  WriteUint32(static_cast<uint32_t>(value & 0xFFFFFFFFULL), out);
}

//============================================================================
bool PacketCodec::ReadUint8(const uint8_t* buf, size_t len, size_t& offset,
                            uint8_t& result)
{
  if ((offset + sizeof(result)) > len)
  {
    return false;
  }

  result  = buf[offset];
  offset += sizeof(result);

  return true;
}

//============================================================================
bool PacketCodec::ReadUint16(const uint8_t* buf, size_t len, size_t& offset,
                             uint16_t& result)
{
  uint16_t  result_nbo = 0;

  if ((offset + sizeof(result_nbo)) > len)
  {
    return false;
  }

  ::memcpy(&result_nbo, (buf + offset), sizeof(result_nbo));

  result  = ntohs(result_nbo);
  offset += sizeof(result_nbo);

  return true;
}

//============================================================================
bool PacketCodec::ReadUint32(const uint8_t* buf, size_t len, size_t& offset,
                             uint32_t& result)
{
  uint32_t  result_nbo = 0;

  if ((offset + sizeof(result_nbo)) > len)
  {
    return false;
  }

  ::memcpy(&result_nbo, (buf + offset), sizeof(result_nbo));

  result  = ntohl(result_nbo);
  offset += sizeof(result_nbo);

  return true;
}

//============================================================================
bool PacketCodec::ReadUint64(const uint8_t* buf, size_t len, size_t& offset,
                             uint64_t& result)
{
  uint32_t  high = 0;
  uint32_t  low  = 0;

  if ((offset + sizeof(result)) > len)
  {
    return false;
  }

  if ((!ReadUint32(buf, len, offset, high)) ||
      (!ReadUint32(buf, len, offset, low)))
  {
    return false;
  }

  result = ((static_cast<uint64_t>(high) << 32) | low);

  return true;
}
