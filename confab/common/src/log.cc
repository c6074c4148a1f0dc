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

/// \brief The CONFAB logging source file.

#include "log.h"

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <time.h>


using ::confab::Log;


//
// Static class members.
//

int                         Log::mask_             = (LOG_FATAL |
                                                      LOG_ERROR |
                                                      LOG_WARNING |
                                                      LOG_INFO);
std::map<std::string, int>  Log::cmask_map_;
FILE*                       Log::output_fd_        = stdout;
bool                        Log::start_time_set_   = false;
pthread_mutex_t             Log::mutex_            = PTHREAD_MUTEX_INITIALIZER;
bool                        Log::logc_active_      = true;
std::string                 Log::output_file_name_ = "";

//============================================================================
void Log::SetDefaultLevel(const std::string& levels)
{
  Log::mask_ = Log::StringToMask(levels);
}

//============================================================================
std::string Log::GetDefaultLevel()
{
  char  mask_str[8];

  Log::MaskToString(Log::mask_, mask_str);

  return std::string(mask_str);
}

//============================================================================
void Log::SetClassLevel(const std::string& class_name,
                        const std::string& levels)
{
  Log::cmask_map_[class_name] = Log::StringToMask(levels);
}

//============================================================================
void Log::SetOutputToStdOut()
{
  Log::output_file_name_.clear();
  Log::SetNewFileDescriptor(stdout);
}

//============================================================================
void Log::SetOutputToStdErr()
{
  Log::output_file_name_.clear();
  Log::SetNewFileDescriptor(stderr);
}

//============================================================================
bool Log::SetOutputFile(const std::string& file_name, bool append)
{
  FILE*  new_fd = fopen(file_name.c_str(), (append ? "a" : "w"));

  if (new_fd == NULL)
  {
    return false;
  }

  Log::output_file_name_ = file_name;
  Log::SetNewFileDescriptor(new_fd);

  return true;
}

//============================================================================
std::string Log::GetOutputFileName()
{
  return Log::output_file_name_;
}

//============================================================================
void Log::Flush()
{
  fflush(Log::output_fd_);
}

//============================================================================
bool Log::SetConfigLoggingActive(bool config_active)
{
  bool  old_setting = logc_active_;
  logc_active_      = config_active;
  return old_setting;
}

//============================================================================
bool Log::WouldLog(Level level, const char* cn)
{
#ifndef DEBUG
  if (level == LOG_DEBUG)
  {
    return false;
  }
#endif

  if (level == LOG_CONFIG)
  {
    return logc_active_;
  }

  int  mask = mask_;

  if ((!cmask_map_.empty()) && (cn != NULL))
  {
    std::map<std::string, int>::const_iterator  it =
      cmask_map_.find(std::string(cn));

    if (it != cmask_map_.end())
    {
      mask = it->second;
    }
  }

  return ((mask & level) != 0);
}

//============================================================================
void Log::InternalLog(Log::Level level, const char* ln, const char* cn,
                      const char* mn, const char* format, ...)
{
  va_list  args;
  va_start(args, format);

  if (WouldLog(level, cn))
  {
    // Absolute wall clock time, so that logs from both ends of a session
    // can be correlated.
    struct timeval  curr_time;
    gettimeofday(&curr_time, 0);

    int  err;
    if ((err = pthread_mutex_lock(&Log::mutex_)) != 0)
    {
      fprintf(stderr, "Log::InternalLog(): Error %d locking mutex.\n", err);
      va_end(args);
      return;
    }

    if (!Log::start_time_set_)
    {
      char  buf[40];

      ctime_r(&(curr_time.tv_sec), buf);

      size_t  len = strlen(buf);
      if ((len > 0) && (buf[len - 1] == '\n'))
      {
        buf[len - 1] = '\0';
      }

      fprintf(Log::output_fd_, "%ld.%06ld Logging Started at: %s\n",
              static_cast<long>(curr_time.tv_sec),
              static_cast<long>(curr_time.tv_usec), buf);
      fflush(Log::output_fd_);

      Log::start_time_set_ = true;
    }

    fprintf(Log::output_fd_, "%ld.%06ld %s [%s::%s] ",
            static_cast<long>(curr_time.tv_sec),
            static_cast<long>(curr_time.tv_usec), ln, cn, mn);
    vfprintf(Log::output_fd_, format, args);

    if ((err = pthread_mutex_unlock(&Log::mutex_)) != 0)
    {
      fprintf(stderr, "Log::InternalLog(): Error %d unlocking mutex.\n", err);
    }
  }

  va_end(args);

  // Fatal messages always abort, whether or not they were masked.
  if (level == LOG_FATAL)
  {
    fflush(Log::output_fd_);
    abort();
  }
}

//============================================================================
void Log::Destroy()
{
  if (Log::mask_ & LOG_INFO)
  {
    struct timeval  curr_time;
    gettimeofday(&curr_time, 0);

    fprintf(Log::output_fd_, "%ld.%06ld I [Log::Destroy] Application "
            "shutdown.\n", static_cast<long>(curr_time.tv_sec),
            static_cast<long>(curr_time.tv_usec));
  }

  Log::output_file_name_.clear();
  Log::SetNewFileDescriptor(stdout);
  fflush(Log::output_fd_);
}

//============================================================================
int Log::StringToMask(const std::string& levels)
{
  int          mask     = 0;
  const char*  mask_str = levels.c_str();

  if (strcasecmp(mask_str, "all") == 0)
  {
    return LOG_ALL;
  }

  if (strcasecmp(mask_str, "none") == 0)
  {
    return 0;
  }

  static const char  kLetters[] = "FEWIAD";
  static const int   kLevels[]  = { LOG_FATAL, LOG_ERROR, LOG_WARNING,
                                    LOG_INFO, LOG_ANALYSIS, LOG_DEBUG };

  for (size_t i = 0; i < (sizeof(kLevels) / sizeof(kLevels[0])); ++i)
  {
    if ((strchr(mask_str, kLetters[i]) != NULL) ||
        (strchr(mask_str, kLetters[i] + ('a' - 'A')) != NULL))
    {
      mask |= kLevels[i];
    }
  }

  return mask;
}

//============================================================================
void Log::MaskToString(int mask, char* levels)
{
  static const char  kLetters[] = "FEWIAD";
  static const int   kLevels[]  = { LOG_FATAL, LOG_ERROR, LOG_WARNING,
                                    LOG_INFO, LOG_ANALYSIS, LOG_DEBUG };
  int                i          = 0;

  for (size_t j = 0; j < (sizeof(kLevels) / sizeof(kLevels[0])); ++j)
  {
    if (mask & kLevels[j])
    {
      levels[i++] = kLetters[j];
    }
  }

  levels[i] = '\0';
}

//============================================================================
void Log::SetNewFileDescriptor(FILE* new_fd)
{
  FILE*  old_fd   = Log::output_fd_;
  Log::output_fd_ = new_fd;

  if ((old_fd != new_fd) && (old_fd != stdout) && (old_fd != stderr))
  {
    fflush(old_fd);
    fclose(old_fd);
  }
}
