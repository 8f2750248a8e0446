/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SMOOTHER_HPP
#define SMOOTHER_HPP

#include <cstddef>
#include <vector>

namespace Kickoff {

/**
 * @brief Rolling average over the last N samples
 *
 * The history starts filled with zero-valued samples, so the first N
 * averages ramp up from zero. T needs operator+= and operator/(float).
 */
template<typename T>
class Smoother {
public:
    explicit Smoother(size_t sampleCount = 10, const T& zero = T{})
        : m_history(sampleCount == 0 ? 1 : sampleCount, zero), m_zero(zero) {}

    const T& update(const T& sample) {
        m_history[m_next] = sample;
        m_next = (m_next + 1) % m_history.size();

        m_average = m_zero;
        for (const T& value : m_history) {
            m_average += value;
        }
        m_average = m_average / static_cast<float>(m_history.size());
        return m_average;
    }

    const T& getAverage() const { return m_average; }
    size_t getSampleCount() const { return m_history.size(); }

private:
    std::vector<T> m_history;
    T m_zero;
    T m_average{};
    size_t m_next{0};
};

} // namespace Kickoff

#endif // SMOOTHER_HPP
