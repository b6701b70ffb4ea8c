#include <cadence/core/time.hpp>
#include <algorithm>
#include <cmath>

namespace cadence::core {

Time::Time()
    : m_last_time(Clock::now()) {
}

void Time::advance() {
    auto now = Clock::now();
    double raw = std::chrono::duration<double>(now - m_last_time).count();
    m_delta = std::max(raw, 0.0) * m_time_scale;
    m_elapsed += m_delta;
    m_last_time = now;
    m_frame_count++;
}

void Time::reset() {
    m_last_time = Clock::now();
    m_delta = 0.0;
    m_elapsed = 0.0;
    m_frame_count = 0;
}

void Time::set_time_scale(double scale) {
    m_time_scale = std::isfinite(scale) ? std::max(scale, 0.0) : 0.0;
}

} // namespace cadence::core
