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

/// \brief The codec normalizer header file.
///
/// Per-channel hooks that adjust encoded chunks before they are framed.

#ifndef CONFAB_MTC_CODEC_NORMALIZER_H
#define CONFAB_MTC_CODEC_NORMALIZER_H

#include "mtc_types.h"

#include <list>


namespace confab
{

  /// \brief The interface for per-codec chunk normalization.
  class CodecNormalizerIf
  {
    public:

    /// \brief Destructor.
    virtual ~CodecNormalizerIf() { }

    /// \brief Normalize one chunk.
    ///
    /// \param  chunk  The chunk from the encoder.
    /// \param  out    The chunks to send, in order.  May be empty, or hold
    ///                previously withheld chunks.
    virtual void Normalize(const EncodedChunk& chunk,
                           std::list<EncodedChunk>& out) = 0;

    /// \brief Discard any withheld state.
    virtual void Reset() = 0;

  }; // end class CodecNormalizerIf

  /// \brief Withholds Ogg Opus pages until the OpusHead page is seen.
  ///
  /// An encoder may emit pages before the beginning of stream page that
  /// carries the OpusHead header.  Those pages are withheld.  When the
  /// header page arrives it is released first, followed by the withheld
  /// pages in arrival order.  After that, pages pass through unchanged.
  /// Chunks that are not Ogg pages are dropped.
  class OggOpusNormalizer : public CodecNormalizerIf
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  max_pending  The most pages withheld.  Beyond this the
    ///                      oldest withheld page is dropped.
    explicit OggOpusNormalizer(size_t max_pending = 64);

    /// \brief Destructor.
    virtual ~OggOpusNormalizer();

    virtual void Normalize(const EncodedChunk& chunk,
                           std::list<EncodedChunk>& out);

    virtual void Reset();

    /// \brief Check for an Ogg page.
    ///
    /// \param  data  The chunk data.
    ///
    /// \return  True if the data starts with "OggS".
    static bool IsOggPage(const Bytes& data);

    /// \brief Check for the OpusHead beginning of stream page.
    ///
    /// \param  data  The chunk data.
    ///
    /// \return  True if the data is an Ogg page with the BOS flag set and
    ///          "OpusHead" at the start of its payload.
    static bool IsOpusHeadPage(const Bytes& data);

    /// \brief Check if the header page has been seen.
    inline bool HasHeader() const
    {
      return has_header_;
    }

    /// \brief Get the header page.  Empty until HasHeader() is true.
    inline const Bytes& header() const
    {
      return header_;
    }

    /// \brief Get the number of withheld pages.
    inline size_t pending_count() const
    {
      return pending_.size();
    }

    /// \brief Get the number of chunks dropped.
    inline size_t dropped_count() const
    {
      return dropped_count_;
    }

    private:

    /// \brief Copy constructor.
    OggOpusNormalizer(const OggOpusNormalizer& other);

    /// \brief Copy operator.
    OggOpusNormalizer& operator=(const OggOpusNormalizer& other);

    /// The most pages withheld.
    size_t                   max_pending_;

    /// The withheld pages.
    std::list<EncodedChunk>  pending_;

    /// Set once the header page is seen.
    bool                     has_header_;

    /// The header page.
    Bytes                    header_;

    /// Chunks dropped, either not Ogg or withheld too long.
    size_t                   dropped_count_;

  }; // end class OggOpusNormalizer

} // namespace confab

#endif // CONFAB_MTC_CODEC_NORMALIZER_H
