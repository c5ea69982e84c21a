#pragma once

/**
 * @file Timer.h
 * @brief High-resolution timing utilities
 *
 * Usage:
 * @code
 * Timer timer(true);
 * // ... work ...
 * double seconds = timer.ElapsedSeconds();
 *
 * {
 *     ScopedTimer scoped("GenerateLut");
 *     // ... work ...
 * }  // Logs at debug level: "GenerateLut: 12.345 ms"
 * @endcode
 */

#include <LookForge/Core/Export.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace Look::Forge::Platform {

/**
 * @brief High-resolution timer (steady clock)
 */
class LOOKFORGE_API Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    /**
     * @brief Construct and optionally start timer
     * @param autoStart If true, timer starts immediately
     */
    explicit Timer(bool autoStart = false);

    /// Start or resume the timer
    void Start();

    /// Stop the timer, keeping the accumulated time
    void Stop();

    /// Reset timer to zero
    void Reset();

    bool IsRunning() const { return running_; }

    // =========================================================================
    // Elapsed Time Getters
    // =========================================================================

    Duration Elapsed() const;
    double ElapsedSeconds() const;
    double ElapsedMs() const;

private:
    TimePoint startTime_;
    Duration accumulated_{0};
    bool running_ = false;
};

/**
 * @brief RAII timer that logs elapsed time (debug level) on destruction
 */
class LOOKFORGE_API ScopedTimer {
public:
    explicit ScopedTimer(std::string name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

    /// Disable logging on destruction
    void Cancel() { active_ = false; }

private:
    std::string name_;
    Timer timer_;
    bool active_ = true;
};

} // namespace Look::Forge::Platform
