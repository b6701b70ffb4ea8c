#pragma once

#include <chrono>
#include <cstdint>

namespace cadence::core {

// Simulation clock owned by the ECS and advanced once per tick.
// delta() is the scaled wall time between the two most recent advance() calls
// (or since construction/reset for the first one); elapsed() is the sum of all
// deltas so far. Both are in seconds and never negative.
class Time {
public:
    using Clock = std::chrono::steady_clock;

    Time();

    void advance();
    void reset();

    double delta() const { return m_delta; }
    double elapsed() const { return m_elapsed; }
    uint64_t frame_count() const { return m_frame_count; }

    // Scale applied to measured deltas, clamped to >= 0; NaN and infinity become 0
    double time_scale() const { return m_time_scale; }
    void set_time_scale(double scale);

private:
    Clock::time_point m_last_time;
    double m_delta = 0.0;
    double m_elapsed = 0.0;
    double m_time_scale = 1.0;
    uint64_t m_frame_count = 0;
};

} // namespace cadence::core
