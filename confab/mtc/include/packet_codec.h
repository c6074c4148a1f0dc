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

/// \brief The packet codec header file.
///
/// Encodes and decodes the three wire header variants shared by both
/// transports.  All multi-byte integers are big-endian.
///
/// Standard frame (both transports):
///
/// \verbatim
///  0                   1                   2                   3
///  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |                        Sequence Number                        |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |                     Timestamp (msec)                          |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |  Frame Type   |  Payload ...
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// \endverbatim
///
/// FEC wrapped packet (datagram transport):
///
/// \verbatim
///  0                   1                   2                   3
///  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |                        Sequence Number                        |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |  Marker=0xFF  |  Packet Type  |                               |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+                               +
/// |                      Transfer Length (64 bits)                |
/// +                               +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |                               |          Symbol Size          |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// | Source Blocks |          Sub-Blocks           |   Alignment   |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |  Symbol ...
/// +-+-+-+-+-+-+-+-+
/// \endverbatim
///
/// Regular wrapped packet (datagram transport):
///
/// \verbatim
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |                        Sequence Number                        |
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// |  Marker=0x00  |  Packet Type  |  Payload ...
/// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
/// \endverbatim

#ifndef CONFAB_MTC_PACKET_CODEC_H
#define CONFAB_MTC_PACKET_CODEC_H

#include "mtc_types.h"

#include <stdint.h>
#include <stddef.h>


namespace confab
{

  /// \brief The erasure decoder descriptor carried in every FEC wrapped
  /// packet.
  struct FecDescriptor
  {
    FecDescriptor()
        : transfer_length(0), symbol_size(0), source_blocks(0),
          sub_blocks(0), alignment(0)
    { }

    uint64_t  transfer_length;
    uint16_t  symbol_size;
    uint8_t   source_blocks;
    uint16_t  sub_blocks;
    uint8_t   alignment;
  };

  /// \brief A decoded FEC wrapped packet.
  struct FecPacket
  {
    FecPacket()
        : seq(0), packet_type(0), descriptor(), symbol()
    { }

    uint32_t       seq;
    uint8_t        packet_type;
    FecDescriptor  descriptor;
    Bytes          symbol;
  };

  /// \brief A decoded regular wrapped packet.
  struct RegularPacket
  {
    RegularPacket()
        : seq(0), packet_type(0), payload()
    { }

    uint32_t  seq;
    uint8_t   packet_type;
    Bytes     payload;
  };

  /// \brief Encodes and decodes wire packets.
  ///
  /// One instance is owned per connection.  The first standard frame
  /// encoded fixes the base timestamp, and every later timestamp is sent
  /// relative to it in milliseconds.  The base is cleared explicitly when
  /// the connection is re-established.
  ///
  /// Decode failures return false and are counted.  They never affect
  /// the connection.
  class PacketCodec
  {
    public:

    /// \brief Constructor.
    PacketCodec();

    /// \brief Destructor.
    virtual ~PacketCodec();

    /// \brief Encode a standard frame.
    ///
    /// \param  payload       The frame payload.  May be NULL if len is 0.
    /// \param  len           The payload length in bytes.
    /// \param  timestamp_us  The raw timestamp in microseconds.
    /// \param  frame_type    The frame type.
    /// \param  seq           The channel sequence number.
    /// \param  out           The encoded packet.
    ///
    /// \return  True on success.
    bool EncodeStandard(const uint8_t* payload, size_t len,
                        int64_t timestamp_us, uint8_t frame_type,
                        uint32_t seq, Bytes& out);

    /// \brief Encode a standard frame with an already relative timestamp.
    ///
    /// Leaves the base timestamp untouched.  Used for control frames, which
    /// carry the relative time of the last media frame on the connection.
    ///
    /// \param  payload       The frame payload.  May be NULL if len is 0.
    /// \param  len           The payload length in bytes.
    /// \param  timestamp_ms  The relative timestamp in milliseconds.
    /// \param  frame_type    The frame type.
    /// \param  seq           The channel sequence number.
    /// \param  out           The encoded packet.
    ///
    /// \return  True on success.
    static bool EncodeStandardRaw(const uint8_t* payload, size_t len,
                                  uint32_t timestamp_ms, uint8_t frame_type,
                                  uint32_t seq, Bytes& out);

    /// \brief Decode a standard frame.
    ///
    /// \param  buf    The packet.
    /// \param  len    The packet length in bytes.
    /// \param  frame  The decoded frame.
    ///
    /// \return  True on success, false if the packet is too short.
    bool DecodeStandard(const uint8_t* buf, size_t len, MediaFrame& frame);

    /// \brief Encode an FEC wrapped packet around one erasure symbol.
    ///
    /// \param  seq          The sequence number of the protected frame.
    /// \param  packet_type  The packet type.
    /// \param  desc         The erasure decoder descriptor.
    /// \param  symbol       The symbol.
    /// \param  len          The symbol length in bytes.
    /// \param  out          The encoded packet.
    ///
    /// \return  True on success.
    static bool EncodeFec(uint32_t seq, uint8_t packet_type,
                          const FecDescriptor& desc, const uint8_t* symbol,
                          size_t len, Bytes& out);

    /// \brief Decode an FEC wrapped packet.
    ///
    /// \param  buf  The packet.
    /// \param  len  The packet length in bytes.
    /// \param  pkt  The decoded packet.
    ///
    /// \return  True on success, false if the packet is too short or is
    ///          not marked as FEC.
    bool DecodeFec(const uint8_t* buf, size_t len, FecPacket& pkt);

    /// \brief Encode a regular wrapped packet.
    ///
    /// \param  seq          The sequence number of the frame.
    /// \param  packet_type  The packet type.
    /// \param  payload      The wrapped packet, normally a standard frame.
    /// \param  len          The payload length in bytes.
    /// \param  out          The encoded packet.
    ///
    /// \return  True on success.
    static bool EncodeRegular(uint32_t seq, uint8_t packet_type,
                              const uint8_t* payload, size_t len,
                              Bytes& out);

    /// \brief Decode a regular wrapped packet.
    ///
    /// \param  buf  The packet.
    /// \param  len  The packet length in bytes.
    /// \param  pkt  The decoded packet.
    ///
    /// \return  True on success, false if the packet is too short or is
    ///          not marked as regular.
    bool DecodeRegular(const uint8_t* buf, size_t len, RegularPacket& pkt);

    /// \brief Check the marker byte of a datagram transport packet.
    ///
    /// \param  buf     The packet.
    /// \param  len     The packet length in bytes.
    /// \param  is_fec  Set to true for an FEC wrapped packet.
    ///
    /// \return  True if the marker is present and valid.
    static bool PeekFecMarker(const uint8_t* buf, size_t len, bool& is_fec);

    /// \brief Convert a raw timestamp to the relative wire timestamp.
    ///
    /// The first call fixes the base timestamp.
    ///
    /// \param  timestamp_us  The raw timestamp in microseconds.
    ///
    /// \return  The relative timestamp in milliseconds, clamped into
    ///          [0, 2^32 - 1].
    uint32_t NormalizeTimestamp(int64_t timestamp_us);

    /// \brief Forget the base timestamp.
    inline void ResetBaseTimestamp()
    {
      has_base_ts_ = false;
      base_ts_us_  = 0;
    }

    /// \brief Check if the base timestamp has been fixed.
    inline bool HasBaseTimestamp() const
    {
      return has_base_ts_;
    }

    /// \brief Get the base timestamp, in microseconds.
    inline int64_t base_timestamp_us() const
    {
      return base_ts_us_;
    }

    /// \brief Get the number of packets that failed to decode.
    inline size_t decode_errors() const
    {
      return decode_errors_;
    }

    private:

    /// \brief Copy constructor.
    PacketCodec(const PacketCodec& other);

    /// \brief Copy operator.
    PacketCodec& operator=(const PacketCodec& other);

    /// \brief Append integers in network byte order.
    static void WriteUint8(uint8_t value, Bytes& out);
    static void WriteUint16(uint16_t value, Bytes& out);
    static void WriteUint32(uint32_t value, Bytes& out);
    static void WriteUint64(uint64_t value, Bytes& out);

    /// \brief Read integers in network byte order, advancing offset.
    ///
    /// \return  False if the buffer is too short.
    static bool ReadUint8(const uint8_t* buf, size_t len, size_t& offset,
                          uint8_t& result);
    static bool ReadUint16(const uint8_t* buf, size_t len, size_t& offset,
                           uint16_t& result);
    static bool ReadUint32(const uint8_t* buf, size_t len, size_t& offset,
                           uint32_t& result);
    static bool ReadUint64(const uint8_t* buf, size_t len, size_t& offset,
                           uint64_t& result);

    /// True once the base timestamp has been fixed.
    bool     has_base_ts_;

    /// The base timestamp, in microseconds.
    int64_t  base_ts_us_;

    /// The number of decode failures.
    size_t   decode_errors_;

  }; // end class PacketCodec

} // namespace confab

#endif // CONFAB_MTC_PACKET_CODEC_H
