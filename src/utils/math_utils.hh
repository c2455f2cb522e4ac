#pragma once
#include <algorithm>
#include <chrono>
#include <cmath>
#include <glm/glm.hpp>
#include <vector>

namespace TideSim
{
namespace MathUtils
{

// === CONSTANTS ===
constexpr float PI = 3.14159265359f;
constexpr float EPSILON = 1e-6f;

// === UTILITY FUNCTIONS ===

// Clamp value between min and max
template <typename T> inline T clamp(T value, T min_val, T max_val)
{
    return std::max(min_val, std::min(value, max_val));
}

// Clamp to [0, 1]
inline float saturate(float x)
{
    return clamp(x, 0.0f, 1.0f);
}

// === VECTOR OPERATIONS ===

// Squared distance
inline float distanceSquared(const glm::vec2 &a, const glm::vec2 &b)
{
    glm::vec2 diff = b - a;
    return glm::dot(diff, diff);
}

// Normalize vector with zero-check
inline glm::vec2 safeNormalize(const glm::vec2 &v, const glm::vec2 &fallback = glm::vec2(0.0f, 1.0f))
{
    float length = glm::length(v);
    return (length > EPSILON) ? v / length : fallback;
}

// Reflect vector around unit normal
inline glm::vec2 reflect(const glm::vec2 &incident, const glm::vec2 &normal)
{
    return incident - 2.0f * glm::dot(incident, normal) * normal;
}

// Counter-clockwise perpendicular
inline glm::vec2 perpendicular(const glm::vec2 &v)
{
    return glm::vec2(-v.y, v.x);
}

inline bool isFinite(const glm::vec2 &v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

// === TIMING UTILITIES ===

class Timer
{
  private:
    std::chrono::high_resolution_clock::time_point start_time;
    bool running;

  public:
    Timer() : running(false)
    {
    }

    void start()
    {
        start_time = std::chrono::high_resolution_clock::now();
        running = true;
    }

    float stop()
    {
        if (!running)
            return 0.0f;

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        running = false;

        return duration.count() / 1000.0f; // Return milliseconds
    }
};

// === STATISTICS UTILITIES ===

template <typename T> class MovingAverage
{
  private:
    std::vector<T> values;
    size_t max_size;
    size_t current_index;
    bool filled;
    T sum;

  public:
    MovingAverage(size_t size = 60) : max_size(size), current_index(0), filled(false), sum(T{})
    {
        values.resize(max_size);
    }

    void addValue(T value)
    {
        if (filled)
        {
            sum -= values[current_index];
        }

        values[current_index] = value;
        sum += value;

        current_index = (current_index + 1) % max_size;
        if (current_index == 0)
        {
            filled = true;
        }
    }

    T getAverage() const
    {
        if (!filled && current_index == 0)
            return T{};

        size_t count = filled ? max_size : current_index;
        return sum / static_cast<T>(count);
    }

    void clear()
    {
        current_index = 0;
        filled = false;
        sum = T{};
    }
};

} // namespace MathUtils
} // namespace TideSim
