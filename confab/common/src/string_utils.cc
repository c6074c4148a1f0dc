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

#include "string_utils.h"

#include "log.h"
#include "unused.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <strings.h>

using ::confab::StringUtils;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "StringUtils";

  /// The base64 alphabet.
  const char   kBase64Chars[]     =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  /// \brief Map a base64 character to its 6-bit value.
  ///
  /// \return  The value, or -1 if c is not in the alphabet.
  int Base64Value(char c)
  {
    if ((c >= 'A') && (c <= 'Z'))
    {
      return (c - 'A');
    }
    if ((c >= 'a') && (c <= 'z'))
    {
      return (c - 'a' + 26);
    }
    if ((c >= '0') && (c <= '9'))
    {
      return (c - '0' + 52);
    }
    if (c == '+')
    {
      return 62;
    }
    if (c == '/')
    {
      return 63;
    }
    return -1;
  }
}

//============================================================================
bool StringUtils::GetBool(const string& str, const bool default_value)
{
  bool  rv = default_value;

  if (::strncasecmp(str.c_str(), "true", 4) == 0)
  {
    rv = true;
  }
  else if (::strncasecmp(str.c_str(), "false", 5) == 0)
  {
    rv = false;
  }
  else if (str == "0")
  {
    rv = false;
  }
  else if (str == "1")
  {
    rv = true;
  }

  return rv;
}

//============================================================================
int StringUtils::GetInt(const string& str, const int default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  errno = 0;

  long  val = ::strtol(str_ptr, &end_ptr, 10);

  if ((errno != 0) || (end_ptr == str_ptr) || (val > INT_MAX) ||
      (val < INT_MIN))
  {
    LogE(kClassName, __func__, "Error converting string %s to int.\n",
         str_ptr);
    return default_value;
  }

  return static_cast<int>(val);
}

//============================================================================
unsigned int StringUtils::GetUint(const string& str,
                                  const unsigned int default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  // strtoul() silently negates a leading minus sign.
  if (::strchr(str_ptr, '-') != NULL)
  {
    LogE(kClassName, __func__, "Error converting negative string %s to "
         "unsigned int.\n", str_ptr);
    return default_value;
  }

  errno = 0;

  unsigned long  val = ::strtoul(str_ptr, &end_ptr, 10);

  if ((errno != 0) || (end_ptr == str_ptr) || (val > UINT_MAX))
  {
    LogE(kClassName, __func__, "Error converting string %s to unsigned "
         "int.\n", str_ptr);
    return default_value;
  }

  return static_cast<unsigned int>(val);
}

//============================================================================
string StringUtils::Base64Encode(const uint8_t* data, size_t len)
{
  string  result;

  result.reserve(((len + 2) / 3) * 4);

  size_t  i = 0;

  for (; (i + 2) < len; i += 3)
  {
    uint32_t  triple = ((static_cast<uint32_t>(data[i]) << 16) |
                        (static_cast<uint32_t>(data[i + 1]) << 8) |
                        static_cast<uint32_t>(data[i + 2]));

    result.push_back(kBase64Chars[(triple >> 18) & 0x3f]);
    result.push_back(kBase64Chars[(triple >> 12) & 0x3f]);
    result.push_back(kBase64Chars[(triple >> 6) & 0x3f]);
    result.push_back(kBase64Chars[triple & 0x3f]);
  }

  size_t  remaining = (len - i);

  if (remaining == 1)
  {
    uint32_t  triple = (static_cast<uint32_t>(data[i]) << 16);

    result.push_back(kBase64Chars[(triple >> 18) & 0x3f]);
    result.push_back(kBase64Chars[(triple >> 12) & 0x3f]);
    result.append("==");
  }
  else if (remaining == 2)
  {
    uint32_t  triple = ((static_cast<uint32_t>(data[i]) << 16) |
                        (static_cast<uint32_t>(data[i + 1]) << 8));

    result.push_back(kBase64Chars[(triple >> 18) & 0x3f]);
    result.push_back(kBase64Chars[(triple >> 12) & 0x3f]);
    result.push_back(kBase64Chars[(triple >> 6) & 0x3f]);
    result.push_back('=');
  }

  return result;
}

//============================================================================
bool StringUtils::Base64Decode(const string& str, vector<uint8_t>& out)
{
  out.clear();

  // Strip up to two padding characters.
  size_t  len = str.size();

  for (int pad = 0; (pad < 2) && (len > 0) && (str[len - 1] == '='); ++pad)
  {
    --len;
  }

  // A single trailing character cannot carry a whole byte.
  if ((len % 4) == 1)
  {
    LogW(kClassName, __func__, "Invalid base64 length %zu.\n", str.size());
    return false;
  }

  out.reserve((len * 3) / 4);

  uint32_t  accum = 0;
  int       bits  = 0;

  for (size_t i = 0; i < len; ++i)
  {
    int  value = Base64Value(str[i]);

    if (value < 0)
    {
      LogW(kClassName, __func__, "Invalid base64 character at offset "
           "%zu.\n", i);
      out.clear();
      return false;
    }

    accum  = ((accum << 6) | static_cast<uint32_t>(value));
    bits  += 6;

    if (bits >= 8)
    {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((accum >> bits) & 0xff));
    }
  }

  return true;
}
