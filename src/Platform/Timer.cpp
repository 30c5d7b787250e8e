/**
 * @file Timer.cpp
 * @brief Stopwatch implementation
 */

#include <VolSeg/Platform/Timer.h>
#include <VolSeg/Core/Log.h>

#include <utility>

namespace Vol::Seg::Platform {

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    start_ = Clock::now();
    running_ = true;
}

void Timer::Stop() {
    if (running_) {
        stop_ = Clock::now();
        running_ = false;
    }
}

double Timer::ElapsedMs() const {
    return ElapsedSec() * 1000.0;
}

double Timer::ElapsedSec() const {
    Clock::time_point end = running_ ? Clock::now() : stop_;
    return std::chrono::duration<double>(end - start_).count();
}

ScopedTimer::ScopedTimer(std::string label)
    : label_(std::move(label)), timer_(true) {}

ScopedTimer::~ScopedTimer() {
    Log::Get()->debug("{}: {:.2f} ms", label_, timer_.ElapsedMs());
}

} // namespace Vol::Seg::Platform
