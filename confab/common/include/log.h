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

/// \brief The CONFAB logging header file.
///
/// Provides the media transport core with an efficient, flexible logging
/// capability.  May be directed to stdout, stderr, or a file.  The logging
/// levels to be output are dynamically selectable, both globally and per
/// class name.

#ifndef CONFAB_COMMON_LOG_H
#define CONFAB_COMMON_LOG_H

#include <map>
#include <string>
#include <cstdarg>
#include <cstdio>

#include <sys/time.h>
#include <stdint.h>
#include <pthread.h>

// Macros for the actual logging functions.  Use these, not the InternalLog()
// method.  The end letter of the macro name is the level of the message
// (Config, Fatal, Error, Warning, Information, Analysis, and Debug).
//
// \param  const char* cn      The class name string.
// \param  const char* mn      The method name string, normally __func__.
// \param  const char* format  The printf-style format string.

#define LogC(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_CONFIG, "C", cn, mn, format, \
                           ##__VA_ARGS__)

#define LogF(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_FATAL, "F", cn, mn, format,  \
                           ##__VA_ARGS__)

#define LogE(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_ERROR, "E", cn, mn, format,  \
                           ##__VA_ARGS__)

#define LogW(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_WARNING, "W", cn, mn, format, \
                           ##__VA_ARGS__)

#define LogI(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_INFO, "I", cn, mn, format,   \
                           ##__VA_ARGS__)

#define LogA(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_ANALYSIS, "A", cn, mn,       \
                           format, ##__VA_ARGS__)

#ifdef DEBUG

#define LogD(cn, mn, format, ...)                                        \
  confab::Log::InternalLog(confab::Log::LOG_DEBUG, "D", cn, mn, format,  \
                           ##__VA_ARGS__)

#else

#define LogD(cn, mn, format, ...)      /* */

#endif // DEBUG

#define WouldLogE(cn) confab::Log::WouldLog(confab::Log::LOG_ERROR, cn)

#define WouldLogW(cn) confab::Log::WouldLog(confab::Log::LOG_WARNING, cn)

#define WouldLogI(cn) confab::Log::WouldLog(confab::Log::LOG_INFO, cn)

#define WouldLogA(cn) confab::Log::WouldLog(confab::Log::LOG_ANALYSIS, cn)

#ifdef DEBUG
#define WouldLogD(cn) confab::Log::WouldLog(confab::Log::LOG_DEBUG, cn)
#else
#define WouldLogD(cn) false
#endif // DEBUG


namespace confab
{

  /// \brief A class for logging messages to stdout, stderr, or a file.
  ///
  /// Each log statement may be at one of seven levels:
  ///
  /// "C" = Config:   Startup configuration settings, can't be masked.
  /// "F" = Fatal:    Programming errors, execution stops immediately.
  /// "E" = Error:    Serious errors, e.g. a channel transport failed.
  /// "W" = Warning:  The session continues, e.g. a packet was dropped.
  /// "I" = Info:     Major events, e.g. a reconnection succeeded.
  /// "A" = Analysis: Subsystem events, e.g. a channel became ready.
  /// "D" = Debug:    Per-packet tracing.
  ///
  /// The general format of the generated log message is:
  ///
  ///   \<time\> \<level\> [\<class\>::\<method\>] \<message\>
  ///
  /// Debug messages are only compiled in with the "-D DEBUG" flag.
  class Log
  {

  public:

    /// The logging levels.  Used in the InternalLog() method.
    enum Level
    {
      LOG_FATAL    = 0x01,
      LOG_ERROR    = 0x02,
      LOG_WARNING  = 0x04,
      LOG_INFO     = 0x08,
      LOG_ANALYSIS = 0x10,
      LOG_DEBUG    = 0x20,
      LOG_ALL      = 0x3f,
      LOG_CONFIG   = 0xff
    };

    /// \brief Set the default logging levels.
    ///
    /// By default, only the "FEWI" levels are logged.
    ///
    /// \param  levels  Any of the letters "FEWIAD" (case independent) in
    ///                 any combination, or else "ALL" or "NONE".
    static void SetDefaultLevel(const std::string& levels);

    /// \brief Get the current default logging levels, e.g. "FEWI".
    ///
    /// \return  The default logging levels in string form.
    static std::string GetDefaultLevel();

    /// \brief Set the logging level for a particular class.
    ///
    /// \param  class_name  The class name.
    /// \param  levels      The levels, in the same form as
    ///                     SetDefaultLevel().
    static void SetClassLevel(const std::string& class_name,
                              const std::string& levels);

    /// \brief Send the logging to stdout.
    static void SetOutputToStdOut();

    /// \brief Send the logging to stderr.
    static void SetOutputToStdErr();

    /// \brief Send the logging to an output file.
    ///
    /// \param  file_name  The output file name.
    /// \param  append     If true, the output file will be appended to.
    ///
    /// \return  Returns true on success, false otherwise.
    static bool SetOutputFile(const std::string& file_name, bool append);

    /// \brief Get the name of the current output file.
    ///
    /// \return  The output file name, or an empty string if logging is not
    ///          going to a file.
    static std::string GetOutputFileName();

    /// \brief Check if a log message would be written for a level and
    /// class name.
    ///
    /// \param  level  The logging level for the message.
    /// \param  cn     The class name.
    ///
    /// \return  Returns true if the log message would be written.
    static bool WouldLog(Level level, const char* cn);

    /// \brief Log a message.
    ///
    /// Only to be used through the LogC() through LogD() macros.
    ///
    /// \param  level   The logging level for the message.
    /// \param  ln      The level name.
    /// \param  cn      The class name.
    /// \param  mn      The method name.
    /// \param  format  The printf-style format string.
    static void InternalLog(Level level, const char* ln, const char* cn,
                            const char* mn, const char* format, ...)
      __attribute__((format(printf, 5, 6)));

    /// \brief Change the config logging active setting.
    ///
    /// \param  config_active  If false, LogC() produces no output.
    ///
    /// \return  Returns the previous setting.
    static bool SetConfigLoggingActive(bool config_active);

    /// \brief Flush any logging output buffers.
    static void Flush();

    /// \brief Prepare the logging for application shutdown.
    ///
    /// Flushes the output and closes any logging output file.  Call
    /// <B>ONCE</B> before the process exits.
    static void Destroy();

  private:

    /// \brief The default constructor.
    Log() { }

    /// \brief The destructor.
    virtual ~Log() { }

    /// \brief Copy constructor.
    Log(const Log& other);

    /// \brief Copy operator.
    Log& operator=(const Log& other);

    /// \brief Convert a logging level string into a mask.
    static int StringToMask(const std::string& levels);

    /// \brief Convert a logging level mask to a string.
    static void MaskToString(int mask, char* levels);

    /// \brief Set a new output file descriptor, closing the old one if it
    /// was a file.
    static void SetNewFileDescriptor(FILE* new_fd);

    /// The default logging level mask.
    static int                         mask_;

    /// A map of class names to logging masks.
    static std::map<std::string, int>  cmask_map_;

    /// The output file descriptor.
    static FILE*                       output_fd_;

    /// A flag recording if the start banner has been written.
    static bool                        start_time_set_;

    /// A lock to prevent logging contention.
    static pthread_mutex_t             mutex_;

    /// A flag recording if a LogC() call should output or not.
    static bool                        logc_active_;

    /// The name of the current output file (if set).
    static std::string                 output_file_name_;

  }; // class Log

} // namespace confab

#endif // CONFAB_COMMON_LOG_H
