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

#include "config_info.h"

#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cstdio>
#include <cstring>
#include <libgen.h>


using ::confab::ConfigInfo;
using ::confab::StringUtils;
using ::std::map;
using ::std::string;


namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName) = "ConfigInfo";

  /// The longest configuration file line.
  const size_t  kMaxLineLen        = 1024;
}

//============================================================================
ConfigInfo::ConfigInfo()
    : config_items_()
{
}

//============================================================================
ConfigInfo::~ConfigInfo()
{
  // Nothing to destroy.
}

//============================================================================
void ConfigInfo::Add(const string& key, const string& value)
{
  if (key.empty() || value.empty())
  {
    LogE(kClassName, __func__, "Bad argument. Missing key or value.\n");
    return;
  }

  config_items_[key] = value;
}

//============================================================================
bool ConfigInfo::LoadFromFile(const string& file_name)
{
  if (file_name.empty())
  {
    LogE(kClassName, __func__, "No configuration file specified.\n");
    return false;
  }

  FILE*  input_file = ::fopen(file_name.c_str(), "r");

  if (input_file == NULL)
  {
    LogE(kClassName, __func__, "Unable to open configuration file %s.\n",
         file_name.c_str());
    return false;
  }

  char  line[kMaxLineLen];
  char  tok_a[kMaxLineLen];
  char  tok_b[kMaxLineLen];
  bool  rv = true;

  while (::fgets(line, sizeof(line), input_file) != NULL)
  {
    size_t  line_len = ::strlen(line);

    if ((line_len > 0) && (line[line_len - 1] == '\n'))
    {
      line[line_len - 1] = '\0';
    }

    tok_a[0] = '\0';
    tok_b[0] = '\0';

    int  num_toks = ::sscanf(line, "%1023s %1023s", tok_a, tok_b);

    // Skip blank lines and comments.
    if ((num_toks < 1) || (tok_a[0] == '#'))
    {
      continue;
    }

    if (num_toks < 2)
    {
      LogW(kClassName, __func__, "Key %s in file %s has no value, "
           "ignoring.\n", tok_a, file_name.c_str());
      continue;
    }

    if (::strcmp(tok_a, "include") != 0)
    {
      Add(tok_a, tok_b);
      continue;
    }

    // Relative includes are relative to the including file.
    string  file_to_load;

    if (tok_b[0] == '/')
    {
      file_to_load = tok_b;
    }
    else
    {
      string  dir_name_buf(file_name);

      file_to_load.append(::dirname(&dir_name_buf[0]));
      file_to_load.append("/");
      file_to_load.append(tok_b);
    }

    if (!LoadFromFile(file_to_load))
    {
      LogE(kClassName, __func__, "Error loading file %s included from "
           "%s.\n", file_to_load.c_str(), file_name.c_str());
      rv = false;
      break;
    }
  }

  ::fclose(input_file);

  return rv;
}

//============================================================================
string ConfigInfo::ToString() const
{
  string                               result;
  map<string, string>::const_iterator  it;

  for (it = config_items_.begin(); it != config_items_.end(); ++it)
  {
    result.append(it->first);
    result.append(" ");
    result.append(it->second);
    result.append("\n");
  }

  return result;
}

//============================================================================
string ConfigInfo::Get(const string& key, const string& default_value,
                       bool log_customizations) const
{
  map<string, string>::const_iterator  it = config_items_.find(key);

  if (it == config_items_.end())
  {
    return default_value;
  }

  if (log_customizations && (!default_value.empty()) &&
      (it->second != default_value))
  {
    LogC(kClassName, __func__, "CUSTOMIZATION Key %s mismatch: value is %s, "
         "default is %s.\n", key.c_str(), it->second.c_str(),
         default_value.c_str());
  }

  return it->second;
}

//============================================================================
bool ConfigInfo::GetBool(const string& key, const bool default_value,
                         bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  bool  to_return = StringUtils::GetBool(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__, "CUSTOMIZATION Key %s mismatch: value is %c, "
         "default is %c.\n", key.c_str(), (to_return ? 'T' : 'F'),
         (default_value ? 'T' : 'F'));
  }

  return to_return;
}

//============================================================================
int ConfigInfo::GetInt(const string& key, const int default_value,
                       bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  int  to_return = StringUtils::GetInt(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__, "CUSTOMIZATION Key %s mismatch: value is %d, "
         "default is %d.\n", key.c_str(), to_return, default_value);
  }

  return to_return;
}

//============================================================================
unsigned int ConfigInfo::GetUint(const string& key,
                                 const unsigned int default_value,
                                 bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  unsigned int  to_return = StringUtils::GetUint(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__, "CUSTOMIZATION Key %s mismatch: value is %u, "
         "default is %u.\n", key.c_str(), to_return, default_value);
  }

  return to_return;
}
