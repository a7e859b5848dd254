#pragma once

#include <chrono>
#include <format>
#include <string>

using namespace std::chrono_literals; // Support literals like `1s` or `500ms`

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::string FormatMillis(auto duration) {
    return std::format("{:.3f}ms", std::chrono::duration<float, std::milli>(duration).count());
}

inline std::string FormatElapsedMillis(TimePoint start) { return FormatMillis(Clock::now() - start); }
