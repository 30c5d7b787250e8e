#pragma once

/**
 * @file Timer.h
 * @brief Elapsed-time measurement for log output
 *
 * @code
 * Timer timer(true);
 * // ... work ...
 * Log::Get()->debug("Opening: {:.2f} ms", timer.ElapsedMs());
 * @endcode
 */

#include <VolSeg/Core/Export.h>

#include <chrono>
#include <string>

namespace Vol::Seg::Platform {

/**
 * @brief Steady-clock stopwatch
 */
class VOLSEG_API Timer {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct and optionally start timer
     * @param autoStart If true, timer starts immediately
     */
    explicit Timer(bool autoStart = false);

    /// Start or restart the timer
    void Start();

    /// Stop the timer, freezing the elapsed time
    void Stop();

    bool IsRunning() const { return running_; }

    /// Elapsed time in milliseconds (up to now if running)
    double ElapsedMs() const;

    /// Elapsed time in seconds (up to now if running)
    double ElapsedSec() const;

private:
    Clock::time_point start_;
    Clock::time_point stop_;
    bool running_ = false;
};

/**
 * @brief Logs "<label>: <ms> ms" to the library logger at debug on scope exit
 *
 * Early returns and exceptions are timed too.
 */
class VOLSEG_API ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

private:
    std::string label_;
    Timer timer_;
};

} // namespace Vol::Seg::Platform
