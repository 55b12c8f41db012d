#pragma once

#include <QtGlobal>

// Consecutive load failures one navigation gesture tolerates, clamped to [minimum, maximum].
class MaxSkipAttempts
{
public:
    static constexpr int minimum = 1;
    static constexpr int maximum = 20;
    static constexpr int defaultValue = 5;

    constexpr MaxSkipAttempts() = default;
    explicit constexpr MaxSkipAttempts(int value)
        : m_value(value < minimum ? minimum : (value > maximum ? maximum : value))
    {
    }

    constexpr int value() const { return m_value; }
    constexpr bool isMinimum() const { return m_value <= minimum; }
    constexpr bool isMaximum() const { return m_value >= maximum; }

    constexpr bool operator==(const MaxSkipAttempts &other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const MaxSkipAttempts &other) const { return m_value != other.m_value; }

private:
    int m_value = defaultValue;
};
