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

#include "config_info.h"
#include "log.h"

#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>


using ::confab::ConfigInfo;
using ::confab::Log;


//============================================================================
class ConfigInfoTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(ConfigInfoTest);

  CPPUNIT_TEST(TestAddAndGet);
  CPPUNIT_TEST(TestLoadFromFile);
  CPPUNIT_TEST(TestLoadFromFileFailure);
  CPPUNIT_TEST(TestToString);
  CPPUNIT_TEST(TestGetBool);
  CPPUNIT_TEST(TestGetInt);
  CPPUNIT_TEST(TestGetUint);

  CPPUNIT_TEST_SUITE_END();

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("");
  }

  //==========================================================================
  void tearDown()
  {
    // Delete the configuration files this test generated.
    ::remove("confab_main_config.txt");
    ::remove("confab_cfg_xyzzy/reconnect_config.txt");
    ::rmdir("confab_cfg_xyzzy");
    ::remove("confab_bad_config.txt");

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void GenerateConfigFiles()
  {
    // confab_main_config.txt:
    //
    //   # Session settings.
    //   include confab_cfg_xyzzy/reconnect_config.txt
    //   jitter.target_fps 25
    //   log.level FEW
    //
    // confab_cfg_xyzzy/reconnect_config.txt:
    //
    //   reconnect.max_attempts 5
    //   reconnect.base_delay_ms 250

    ::mkdir("confab_cfg_xyzzy", 0777);

    FILE*  fd = ::fopen("confab_cfg_xyzzy/reconnect_config.txt", "w");

    if (fd != NULL)
    {
      ::fprintf(fd, "reconnect.max_attempts 5\n");
      ::fprintf(fd, "\n");
      ::fprintf(fd, "reconnect.base_delay_ms 250\n");
      ::fclose(fd);
    }

    fd = ::fopen("confab_main_config.txt", "w");

    if (fd != NULL)
    {
      ::fprintf(fd, "# Session settings.\n");
      ::fprintf(fd, "include confab_cfg_xyzzy/reconnect_config.txt\n");
      ::fprintf(fd, "jitter.target_fps 25\n");
      ::fprintf(fd, "log.level FEW\n");
      ::fclose(fd);
    }
  }

  //==========================================================================
  void TestAddAndGet()
  {
    ConfigInfo  ci;

    ci.Add("mux.max_queue_packets", "512");
    CPPUNIT_ASSERT(ci.Get("mux.max_queue_packets") == "512");
    CPPUNIT_ASSERT(ci.Get("missing.key", "dflt") == "dflt");

    // Adding an existing key replaces its value.
    ci.Add("mux.max_queue_packets", "256");
    CPPUNIT_ASSERT(ci.Get("mux.max_queue_packets") == "256");

    // Empty keys and values are rejected.
    ci.Add("", "1");
    ci.Add("empty.value", "");
    CPPUNIT_ASSERT(ci.Get("empty.value", "none") == "none");

    ci.Reset();
    CPPUNIT_ASSERT(ci.Get("mux.max_queue_packets", "x") == "x");
  }

  //==========================================================================
  void TestLoadFromFile()
  {
    GenerateConfigFiles();

    ConfigInfo  ci;

    CPPUNIT_ASSERT(ci.LoadFromFile("confab_main_config.txt"));
    CPPUNIT_ASSERT(ci.GetUint("jitter.target_fps", 30) == 25);
    CPPUNIT_ASSERT(ci.Get("log.level", "FEWI") == "FEW");
    CPPUNIT_ASSERT(ci.GetUint("reconnect.max_attempts", 3) == 5);
    CPPUNIT_ASSERT(ci.GetUint("reconnect.base_delay_ms", 1000) == 250);
    CPPUNIT_ASSERT(ci.Get("#") == "");
  }

  //==========================================================================
  void TestLoadFromFileFailure()
  {
    ConfigInfo  ci;

    CPPUNIT_ASSERT(!ci.LoadFromFile(""));
    CPPUNIT_ASSERT(!ci.LoadFromFile("confab_no_such_config_file.txt"));

    FILE*  fd = ::fopen("confab_bad_config.txt", "w");

    CPPUNIT_ASSERT(fd != NULL);
    ::fprintf(fd, "include confab_no_such_included_file.txt\n");
    ::fclose(fd);

    CPPUNIT_ASSERT(!ci.LoadFromFile("confab_bad_config.txt"));
  }

  //==========================================================================
  void TestToString()
  {
    ConfigInfo  ci;

    ci.Add("b.key", "2");
    ci.Add("a.key", "1");

    CPPUNIT_ASSERT(ci.ToString() == "a.key 1\nb.key 2\n");
  }

  //==========================================================================
  void TestGetBool()
  {
    ConfigInfo  ci;

    ci.Add("t1", "true");
    ci.Add("t2", "TRUE");
    ci.Add("t3", "1");
    ci.Add("f1", "false");
    ci.Add("f2", "0");
    ci.Add("junk", "maybe");

    CPPUNIT_ASSERT(ci.GetBool("t1", false));
    CPPUNIT_ASSERT(ci.GetBool("t2", false));
    CPPUNIT_ASSERT(ci.GetBool("t3", false));
    CPPUNIT_ASSERT(!ci.GetBool("f1", true));
    CPPUNIT_ASSERT(!ci.GetBool("f2", true));
    CPPUNIT_ASSERT(ci.GetBool("junk", true));
    CPPUNIT_ASSERT(!ci.GetBool("junk", false));
    CPPUNIT_ASSERT(ci.GetBool("missing", true));
  }

  //==========================================================================
  void TestGetInt()
  {
    ConfigInfo  ci;

    ci.Add("pos", "42");
    ci.Add("neg", "-17");
    ci.Add("bad", "abc");
    ci.Add("big", "99999999999");

    CPPUNIT_ASSERT(ci.GetInt("pos", 0) == 42);
    CPPUNIT_ASSERT(ci.GetInt("neg", 0) == -17);
    CPPUNIT_ASSERT(ci.GetInt("bad", 7) == 7);
    CPPUNIT_ASSERT(ci.GetInt("big", 7) == 7);
    CPPUNIT_ASSERT(ci.GetInt("missing", 3) == 3);
  }

  //==========================================================================
  void TestGetUint()
  {
    ConfigInfo  ci;

    ci.Add("pos", "10000");
    ci.Add("neg", "-1");
    ci.Add("bad", "x1");

    CPPUNIT_ASSERT(ci.GetUint("pos", 0) == 10000);
    CPPUNIT_ASSERT(ci.GetUint("neg", 5) == 5);
    CPPUNIT_ASSERT(ci.GetUint("bad", 5) == 5);
    CPPUNIT_ASSERT(ci.GetUint("missing", 1024) == 1024);
  }

}; // end class ConfigInfoTest

CPPUNIT_TEST_SUITE_REGISTRATION(ConfigInfoTest);
