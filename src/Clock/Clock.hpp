#pragma once

#include <chrono>
#include <functional>

using TimePoint = std::chrono::steady_clock::time_point;
using Clock = std::function<TimePoint()>;

inline Clock steadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}
