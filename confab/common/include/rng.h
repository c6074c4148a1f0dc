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

/// \brief The CONFAB random number generator header file.
///
/// Each instance keeps its own random_r() state, so that independent users
/// (e.g. backoff jitter in two sessions) do not perturb each other.

#ifndef CONFAB_COMMON_RNG_H
#define CONFAB_COMMON_RNG_H

#include <cstdlib>
#include <stdint.h>

namespace confab
{

  /// \brief A random number generator.
  ///
  /// All values are drawn from half-open ranges.
  class RNG
  {

   public:

    /// \brief Constructor, seeded from the monotonic clock and process id.
    RNG();

    /// \brief Constructor with an explicit seed, for repeatable sequences.
    ///
    /// \param  seed  The seed.
    explicit RNG(uint32_t seed);

    /// \brief Destructor.
    virtual ~RNG();

    /// \brief Restart the sequence from a seed.
    ///
    /// \param  seed  The seed.
    ///
    /// \return  True on success.
    bool SetSeed(uint32_t seed);

    /// \brief Get a random integer in [0, limit).
    ///
    /// \param  limit  The exclusive upper bound.  Must be positive.
    ///
    /// \return  The random integer, or 0 if the limit is zero.
    uint32_t GetUint(uint32_t limit);

    /// \brief Get a random double in [lower, upper).
    ///
    /// \param  lower  The inclusive lower bound.
    /// \param  upper  The exclusive upper bound.  Must exceed lower.
    ///
    /// \return  The random double, or lower on error.
    double GetDouble(double lower, double upper);

    /// \brief Get a random double in [-1.0, 1.0).
    inline double GetUniformSigned()
    {
      return GetDouble(-1.0, 1.0);
    }

    /// \brief Get the seed in use.
    inline uint32_t seed() const
    {
      return seed_;
    }

  private:

    /// \brief Copy constructor.
    RNG(const RNG& rng);

    /// \brief Copy operator.
    void operator=(const RNG& rng);

    /// \brief Set up the random_r() state for a seed.
    ///
    /// \param  seed  The seed.
    void Init(uint32_t seed);

    /// \brief Get a fraction in [0.0, 1.0).
    ///
    /// \param  fraction  The fraction.
    ///
    /// \return  False if random_r() fails.
    bool NextFraction(double& fraction);

    /// The random_r() state array.
    char                 state_buf_[64];

    /// The random_r() state.
    struct random_data   state_;

    /// The seed.
    uint32_t             seed_;

  }; // class RNG

} // namespace confab

#endif // CONFAB_COMMON_RNG_H
