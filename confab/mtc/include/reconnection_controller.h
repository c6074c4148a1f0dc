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

/// \brief The reconnection controller header file.
///
/// Exponential backoff reconnection with a periodic health monitor.

#ifndef CONFAB_MTC_RECONNECTION_CONTROLLER_H
#define CONFAB_MTC_RECONNECTION_CONTROLLER_H

#include "config_info.h"
#include "connector_if.h"
#include "mtc_event_handler.h"
#include "mtc_types.h"
#include "rng.h"
#include "timer.h"

#include <string>


namespace confab
{

  /// \brief The reconnection controller.
  ///
  /// The controller moves between RECONN_STABLE, RECONN_RECONNECTING and
  /// RECONN_FAILED.  Entering RECONN_RECONNECTING increments the attempt
  /// count.  Once the count exceeds the maximum, the controller is
  /// RECONN_FAILED until Reset() is called.  Otherwise it waits
  ///
  /// \verbatim
  ///   d = min(base * 2^(attempt - 1), max)
  ///   floor(d + d * 0.2 * uniform(-1, 1)) ms
  /// \endverbatim
  ///
  /// on the timer, then runs the connector and the rebind handler.  Success
  /// returns to RECONN_STABLE with the attempt count cleared; failure
  /// re-enters RECONN_RECONNECTING.
  ///
  /// The health monitor polls the connector.  A healthy to unhealthy
  /// transition starts reconnecting unless a reconnection is already in
  /// progress.
  ///
  /// All methods, and the timer callbacks, run on the event loop thread.
  class ReconnectionController
  {
    public:

    /// \brief Constructor.
    ///
    /// \param  timer      The timer used for backoff and health polling.
    /// \param  connector  Re-establishes the connection.
    /// \param  rebinder   Re-binds the channels after a connect.
    /// \param  handler    Receives reconnection events.
    ReconnectionController(Timer& timer, ConnectorIf& connector,
                           RebindHandlerIf& rebinder,
                           MtcEventHandler& handler);

    /// \brief Destructor.
    virtual ~ReconnectionController();

    /// \brief Initialize from configuration.
    ///
    /// Reads "reconnect.max_attempts", "reconnect.base_delay_ms",
    /// "reconnect.max_delay_ms" and "reconnect.health_interval_ms".
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  False if the values are inconsistent.  The defaults remain
    ///          in effect.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Set the backoff limits.
    ///
    /// \param  max_attempts   The number of attempts before failing.
    /// \param  base_delay_ms  The first attempt's delay.
    /// \param  max_delay_ms   The largest delay.
    ///
    /// \return  False if base_delay_ms exceeds max_delay_ms, or
    ///          max_attempts is zero.
    bool SetLimits(uint32_t max_attempts, uint32_t base_delay_ms,
                   uint32_t max_delay_ms);

    /// \brief Start polling connection health.  Does nothing if already
    /// started.
    ///
    /// \return  False if the poll timer cannot be started.
    bool StartHealthMonitor();

    /// \brief Stop polling connection health.  Does nothing if already
    /// stopped.
    void StopHealthMonitor();

    /// \brief Start reconnecting.
    ///
    /// \param  reason  The cause, reported on terminal failure.
    ///
    /// \return  False if a reconnection is in progress or the controller
    ///          has failed.
    bool RequestReconnect(const std::string& reason);

    /// \brief Cancel any pending attempt and the health monitor.  A
    /// reconnection in progress is abandoned.
    void Stop();

    /// \brief Stop, and clear the attempt count and failed state.
    void Reset();

    /// \brief Get the delay for an attempt, before jitter.
    ///
    /// \param  attempt        The attempt, starting at 1.
    /// \param  base_delay_ms  The first attempt's delay.
    /// \param  max_delay_ms   The largest delay.
    ///
    /// \return  The delay in milliseconds.
    static uint32_t BaseBackoffDelayMs(uint32_t attempt,
                                       uint32_t base_delay_ms,
                                       uint32_t max_delay_ms);

    /// \brief Get the delay for an attempt, with jitter.
    ///
    /// \param  attempt  The attempt, starting at 1.
    ///
    /// \return  The delay in milliseconds.
    uint32_t ComputeDelayMs(uint32_t attempt);

    /// \brief Get the state.
    inline ReconnState state() const
    {
      return state_;
    }

    /// \brief Get the current attempt.  Zero when stable.
    inline uint32_t attempt() const
    {
      return attempt_;
    }

    /// \brief Get the most recent backoff delay.
    inline uint32_t last_delay_ms() const
    {
      return last_delay_ms_;
    }

    inline uint32_t max_attempts() const
    {
      return max_attempts_;
    }

    inline uint32_t base_delay_ms() const
    {
      return base_delay_ms_;
    }

    inline uint32_t max_delay_ms() const
    {
      return max_delay_ms_;
    }

    inline uint32_t health_interval_ms() const
    {
      return health_interval_ms_;
    }

    /// \brief Check if the health monitor is running.
    inline bool IsHealthMonitorRunning() const
    {
      return monitor_running_;
    }

    private:

    /// \brief Copy constructor.
    ReconnectionController(const ReconnectionController& other);

    /// \brief Copy operator.
    ReconnectionController& operator=(const ReconnectionController& other);

    /// \brief Count an attempt and start its backoff timer, or fail.
    void ScheduleAttempt();

    /// \brief Run one attempt.  Called by the backoff timer.
    void AttemptTimeout();

    /// \brief Poll the connection health.  Called by the monitor timer.
    void HealthCheckTimeout();

    /// \brief Start the health monitor timer.
    bool StartHealthTimer();

    /// The timer.
    Timer&            timer_;

    /// The connector.
    ConnectorIf&      connector_;

    /// The rebind handler.
    RebindHandlerIf&  rebinder_;

    /// The event handler.
    MtcEventHandler&  handler_;

    /// The jitter source.
    RNG               rng_;

    /// The state.
    ReconnState       state_;

    /// The current attempt.
    uint32_t          attempt_;

    uint32_t          max_attempts_;
    uint32_t          base_delay_ms_;
    uint32_t          max_delay_ms_;
    uint32_t          health_interval_ms_;

    /// The most recent backoff delay.
    uint32_t          last_delay_ms_;

    /// The most recent failure reason.
    std::string       last_reason_;

    /// The most recent health poll result.
    bool              healthy_;

    /// Set while the health monitor is running.
    bool              monitor_running_;

    /// The backoff timer.
    Timer::Handle     attempt_handle_;

    /// The health monitor timer.
    Timer::Handle     health_handle_;

  }; // end class ReconnectionController

} // namespace confab

#endif // CONFAB_MTC_RECONNECTION_CONTROLLER_H
