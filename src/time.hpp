#ifndef PNET_TIME_HPP
#define PNET_TIME_HPP
#include <chrono>

// wall clock in seconds since construction or the last restart
class Stopwatch {
    typedef std::chrono::steady_clock clock_t;
    typedef std::chrono::time_point<clock_t> time_point_t;
    time_point_t m_start;
public:
    Stopwatch() {
        m_start = clock_t::now();
    }
    double getElapsedTime() const {
        auto dur = clock_t::now() - m_start;
        return static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count()) / 1e9;
    }
    double restart() {
        auto now = clock_t::now();
        auto dur = now - m_start;
        m_start = now;
        return static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count()) / 1e9;
    }
};

#endif// PNET_TIME_HPP
