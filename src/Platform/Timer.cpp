/**
 * @file Timer.cpp
 * @brief Timer implementation
 */

#include <LookForge/Platform/Timer.h>
#include <LookForge/Platform/Logger.h>

#include <utility>

namespace Look::Forge::Platform {

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    if (!running_) {
        startTime_ = Clock::now();
        running_ = true;
    }
}

void Timer::Stop() {
    if (running_) {
        accumulated_ += std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
        running_ = false;
    }
}

void Timer::Reset() {
    accumulated_ = Duration{0};
    running_ = false;
}

Timer::Duration Timer::Elapsed() const {
    if (running_) {
        return accumulated_ + std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
    }
    return accumulated_;
}

double Timer::ElapsedSeconds() const {
    return Elapsed().count();
}

double Timer::ElapsedMs() const {
    return ElapsedSeconds() * 1000.0;
}

// ============================================================================
// ScopedTimer Implementation
// ============================================================================

ScopedTimer::ScopedTimer(std::string name)
    : name_(std::move(name))
    , timer_(true) {
}

ScopedTimer::~ScopedTimer() {
    if (active_) {
        Log::Debug("{}: {:.3f} ms", name_, timer_.ElapsedMs());
    }
}

} // namespace Look::Forge::Platform
