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

/// \brief The CONFAB configuration information header file.
///
/// Key/value configuration, loaded from files of "key value" lines.  Lines
/// starting with '#' are comments, and "include <file>" loads another file
/// relative to the including one.

#ifndef CONFAB_COMMON_CONFIG_INFO_H
#define CONFAB_COMMON_CONFIG_INFO_H

#include <map>
#include <string>

#define LOG_CUSTOMIZATIONS true


namespace confab
{

  /// \brief A collection of configuration items.
  ///
  /// Values that differ from the supplied defaults are logged at the Config
  /// level, so that every deployment records its customizations.
  class ConfigInfo
  {
    public:

    /// \brief Constructor.
    ConfigInfo();

    /// \brief Destructor.
    virtual ~ConfigInfo();

    /// \brief Add a configuration item, replacing any existing value.
    ///
    /// \param  key    The key.  Must not be empty.
    /// \param  value  The value.  Must not be empty.
    void Add(const std::string& key, const std::string& value);

    /// \brief Load configuration items from a file.
    ///
    /// \param  file_name  The file name.
    ///
    /// \return  True on success, false if the file, or a file it includes,
    ///          could not be read.
    bool LoadFromFile(const std::string& file_name);

    /// \brief Get all of the configuration items, one "key value" per line.
    ///
    /// \return  The configuration items.
    std::string ToString() const;

    /// \brief Get a string value.
    ///
    /// \param  key                 The key.
    /// \param  default_value       The value returned if the key is absent.
    /// \param  log_customizations  If true, log a non-default value.
    ///
    /// \return  The value.
    std::string Get(const std::string& key,
                    const std::string& default_value = "",
                    bool log_customizations = LOG_CUSTOMIZATIONS) const;

    /// \brief Get a bool value.
    ///
    /// \param  key                 The key.
    /// \param  default_value       The value returned if the key is absent.
    /// \param  log_customizations  If true, log a non-default value.
    ///
    /// \return  The value.
    bool GetBool(const std::string& key, const bool default_value,
                 bool log_customizations = LOG_CUSTOMIZATIONS) const;

    /// \brief Get an int value.
    ///
    /// \param  key                 The key.
    /// \param  default_value       The value returned if the key is absent
    ///                             or malformed.
    /// \param  log_customizations  If true, log a non-default value.
    ///
    /// \return  The value.
    int GetInt(const std::string& key, const int default_value,
               bool log_customizations = LOG_CUSTOMIZATIONS) const;

    /// \brief Get an unsigned int value.
    ///
    /// \param  key                 The key.
    /// \param  default_value       The value returned if the key is absent
    ///                             or malformed.
    /// \param  log_customizations  If true, log a non-default value.
    ///
    /// \return  The value.
    unsigned int GetUint(const std::string& key,
                         const unsigned int default_value,
                         bool log_customizations = LOG_CUSTOMIZATIONS) const;

    /// \brief Remove all configuration items.
    inline void Reset()
    {
      config_items_.clear();
    }

    private:

    /// \brief Copy constructor.
    ConfigInfo(const ConfigInfo& other);

    /// \brief Copy operator.
    ConfigInfo& operator=(const ConfigInfo& other);

    /// The configuration items.
    std::map<std::string, std::string>  config_items_;

  }; // end class ConfigInfo

} // namespace confab

#endif // CONFAB_COMMON_CONFIG_INFO_H
