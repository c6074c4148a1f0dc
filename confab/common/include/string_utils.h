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

/// \brief The CONFAB string utilities header file.

#ifndef CONFAB_COMMON_STRING_UTILS_H
#define CONFAB_COMMON_STRING_UTILS_H

#include <string>
#include <vector>

#include <climits>
#include <stdint.h>

namespace confab
{
  /// \brief Static string conversion helpers.
  class StringUtils
  {
    public:

    /// \brief Convert a string to a bool.
    ///
    /// Accepts "true"/"false" (case insensitive) and "1"/"0".
    ///
    /// \param  str            The string.
    /// \param  default_value  The value returned if str is not recognized.
    ///
    /// \return  The bool value.
    static bool GetBool(const std::string& str,
                        const bool default_value = true);

    /// \brief Convert a string to an int.
    ///
    /// \param  str            The string.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The int value.
    static int GetInt(const std::string& str,
                      const int default_value = INT_MAX);

    /// \brief Convert a string to an unsigned int.
    ///
    /// Negative numbers are conversion errors.
    ///
    /// \param  str            The string.
    /// \param  default_value  The value returned on a conversion error.
    ///
    /// \return  The unsigned int value.
    static unsigned int GetUint(const std::string& str,
                                const unsigned int default_value = UINT_MAX);

    /// \brief Encode binary data as standard (RFC 4648) base64 with
    /// padding.
    ///
    /// \param  data  The data.
    /// \param  len   The data length, in bytes.
    ///
    /// \return  The base64 string.
    static std::string Base64Encode(const uint8_t* data, size_t len);

    /// \brief Decode standard base64.
    ///
    /// Padding is optional.  Whitespace and any other character outside the
    /// base64 alphabet is an error.
    ///
    /// \param  str  The base64 string.
    /// \param  out  The decoded data.
    ///
    /// \return  True on success, false if str is not valid base64.
    static bool Base64Decode(const std::string& str,
                             std::vector<uint8_t>& out);

  }; // end class StringUtils

} // namespace confab

#endif // CONFAB_COMMON_STRING_UTILS_H
